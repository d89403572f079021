#pragma once

#include "tgassist/common/result.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace tgassist::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

/// Parse a signed 64-bit integer; surrounding whitespace is allowed.
[[nodiscard]] Result<std::int64_t> parse_i64(const std::string &value);

/// Parse a comma separated list of integers ("1, -1002,3"). Empty entries are skipped.
[[nodiscard]] Result<std::vector<std::int64_t>> parse_id_list(const std::string &value);

/// Split on the first run of whitespace: {"@bot", "hello there"}.
[[nodiscard]] std::pair<std::string, std::string> split_first_word(const std::string &value);

} // namespace tgassist::common
