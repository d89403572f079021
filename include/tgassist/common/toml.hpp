#pragma once

#include "tgassist/common/result.hpp"
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace tgassist::common {

struct TomlDocument {
  std::unordered_map<std::string, std::string> values;

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] bool get_bool(const std::string &key, bool fallback) const;
  [[nodiscard]] int get_int(const std::string &key, int fallback) const;
  [[nodiscard]] std::uint64_t get_u64(const std::string &key, std::uint64_t fallback) const;

  /// Integer arrays such as `allowed_chat_ids = [-100123, 42]`. Fails on any
  /// element that is not an integer instead of silently dropping it.
  [[nodiscard]] Result<std::vector<std::int64_t>> get_i64_array(const std::string &key) const;
};

[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);

} // namespace tgassist::common
