#include "touchfish/object_store.hpp"

#include "touchfish/consts.hpp"
#include "touchfish/fs.hpp"

#include <algorithm>
#include <stdexcept>

namespace tfs = touchfish::fs;

namespace touchfish {

std::filesystem::path ObjectStore::path_for_oid(const oid &object_id) const {
  const std::string hex = to_hex(object_id);
  return gitdir_ / consts::kObjectsDir / hex.substr(0, consts::kFanoutDirHexLen) /
         hex.substr(consts::kFanoutDirHexLen);
}

bool ObjectStore::has_loose(std::string_view hex_oid) const {
  oid id{};
  return from_hex(hex_oid, id) && tfs::exists(path_for_oid(id));
}

Object ObjectStore::read(std::string_view hex_oid) const {
  oid id{};
  if (!from_hex(hex_oid, id)) {
    throw std::runtime_error("object_store: bad oid hex: " + std::string(hex_oid));
  }
  const auto store = tfs::z_decompress(tfs::read_file(path_for_oid(id)));
  if (sha1(store) != id) {
    throw std::runtime_error("object_store: hash mismatch for " + std::string(hex_oid));
  }

  auto it_space = std::ranges::find(store, static_cast<std::uint8_t>(' '));
  if (it_space == store.end()) {
    throw std::runtime_error("object_store: invalid header");
  }
  auto it_nul = std::find(it_space + 1, store.end(), static_cast<std::uint8_t>('\0'));
  if (it_nul == store.end()) {
    throw std::runtime_error("object_store: invalid header");
  }
  return Object{.type = std::string(store.begin(), it_space),
                .data = {it_nul + 1, store.end()}};
}

} // namespace touchfish
