#pragma once
#include "touchfish/hash.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace touchfish {

struct Object {
  std::string type;                  // "blob" | "tree" | "commit" | etc.
  std::vector<std::uint8_t> data;    // payload bytes (no header)
};

// Loose objects under <gitdir>/objects. Packed objects are not visible here.
class ObjectStore {
public:
  explicit ObjectStore(std::filesystem::path gitdir)
    : gitdir_(std::move(gitdir)) {}

  // Is there a loose object file for this 40-hex id?
  bool has_loose(std::string_view hex_oid) const;

  // Inflate, verify the SHA-1 against the id, split header from payload.
  Object read(std::string_view hex_oid) const;

  std::filesystem::path path_for_oid(const oid& object_id) const;

private:
  std::filesystem::path gitdir_;
};

} // namespace touchfish
