#pragma once

#include "sessionkit/common/result.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>

namespace sessionkit::common {

/// Flat view of a TOML subset: `[section]` headers and `key = value` lines.
/// Keys are stored as `section.key`; values keep their raw text.
struct TomlDocument {
  std::unordered_map<std::string, std::string> values;

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] bool get_bool(const std::string &key, bool fallback) const;
  [[nodiscard]] int get_int(const std::string &key, int fallback) const;
  [[nodiscard]] std::uint64_t get_u64(const std::string &key, std::uint64_t fallback) const;
};

[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);
[[nodiscard]] std::string quote_toml_string(const std::string &value);

} // namespace sessionkit::common
