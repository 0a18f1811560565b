#include "touchfish/process.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <stdexcept>
#include <sys/wait.h>
#include <unistd.h>

namespace touchfish {

namespace {

constexpr int kExecFailed = 127;

[[noreturn]] void exec_child(const std::vector<std::string> &argv, const EnvOverrides &env) {
  for (const auto &[key, value] : env)
    ::setenv(key.c_str(), value.c_str(), 1);

  std::vector<char *> args;
  args.reserve(argv.size() + 1);
  for (const auto &a : argv)
    args.push_back(const_cast<char *>(a.c_str()));
  args.push_back(nullptr);

  ::execvp(args[0], args.data());
  ::_exit(kExecFailed);
}

std::string drain(int fd) {
  std::string out;
  char buf[4096];
  for (;;) {
    const ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n > 0) {
      out.append(buf, static_cast<std::size_t>(n));
    } else if (n == 0) {
      break;
    } else if (errno != EINTR) {
      throw std::runtime_error(std::string("read from child failed: ") + std::strerror(errno));
    }
  }
  return out;
}

int wait_child(pid_t pid) {
  int status = 0;
  while (::waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR)
      throw std::runtime_error(std::string("waitpid failed: ") + std::strerror(errno));
  }
  if (WIFEXITED(status))
    return WEXITSTATUS(status);
  if (WIFSIGNALED(status))
    return 128 + WTERMSIG(status);
  return -1;
}

} // namespace

ProcessResult run_process(const std::vector<std::string> &argv, const EnvOverrides &env,
                          bool capture_stdout) {
  if (argv.empty())
    throw std::invalid_argument("run_process: empty argv");

  int pipefd[2] = {-1, -1};
  if (capture_stdout && ::pipe(pipefd) != 0)
    throw std::runtime_error(std::string("pipe() fail: ") + std::strerror(errno));

  const pid_t pid = ::fork();
  if (pid < 0) {
    if (capture_stdout) {
      ::close(pipefd[0]);
      ::close(pipefd[1]);
    }
    throw std::runtime_error(std::string("fork() fail: ") + std::strerror(errno));
  }

  if (pid == 0) {
    if (capture_stdout) {
      ::dup2(pipefd[1], STDOUT_FILENO);
      ::close(pipefd[0]);
      ::close(pipefd[1]);
      const int devnull = ::open("/dev/null", O_WRONLY);
      if (devnull >= 0) {
        ::dup2(devnull, STDERR_FILENO);
        ::close(devnull);
      }
    }
    exec_child(argv, env);
  }

  ProcessResult result;
  if (capture_stdout) {
    ::close(pipefd[1]);
    try {
      result.output = drain(pipefd[0]);
    } catch (...) {
      ::close(pipefd[0]);
      wait_child(pid);
      throw;
    }
    ::close(pipefd[0]);
  }
  result.exit_code = wait_child(pid);
  return result;
}

} // namespace touchfish
