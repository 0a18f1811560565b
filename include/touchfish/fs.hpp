#pragma once
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace touchfish::fs {

bool exists(const std::filesystem::path& p);
void ensure_parent_dir(const std::filesystem::path& p);

std::vector<std::uint8_t> read_file(const std::filesystem::path& p);
std::string read_text(const std::filesystem::path& p);
void write_file_atomic(const std::filesystem::path& p, std::span<const std::uint8_t> data);
void write_text_atomic(const std::filesystem::path& p, std::string_view text);

// Inflate a zlib stream (loose object files)
std::vector<std::uint8_t> z_decompress(std::span<const std::uint8_t> data);

} // namespace touchfish::fs
