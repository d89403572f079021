#include "tgassist/common/strings.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <regex>

namespace tgassist::common {

std::string trim(const std::string &input) {
  auto first = std::find_if_not(input.begin(), input.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
  auto last = std::find_if_not(input.rbegin(), input.rend(), [](unsigned char c) {
    return std::isspace(c) != 0;
  }).base();

  if (first >= last) {
    return "";
  }
  return std::string(first, last);
}

bool starts_with(const std::string &value, const std::string &prefix) {
  return value.rfind(prefix, 0) == 0;
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

Result<std::filesystem::path> home_dir() {
  if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0') {
    return Result<std::filesystem::path>::success(std::filesystem::path(home));
  }
  return Result<std::filesystem::path>::failure("HOME is not set");
}

Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    return Result<std::filesystem::path>::failure("Failed to create directory: " +
                                                  path.string() + ": " + ec.message());
  }
  return Result<std::filesystem::path>::success(path);
}

std::string expand_path(std::string value) {
  if (value.empty()) {
    return value;
  }

  if (value[0] == '~') {
    if (auto home = home_dir(); home.ok()) {
      value.replace(0, 1, home.value().string());
    }
  }

  std::regex env_pattern(R"(\$\{?([A-Za-z_][A-Za-z0-9_]*)\}?)");
  std::smatch match;
  std::string expanded;
  std::string remaining = value;

  while (std::regex_search(remaining, match, env_pattern)) {
    expanded += match.prefix().str();
    const std::string var_name = match[1].str();
    if (const char *var = std::getenv(var_name.c_str()); var != nullptr) {
      expanded += var;
    }
    remaining = match.suffix().str();
  }

  expanded += remaining;
  return expanded;
}

Result<std::int64_t> parse_i64(const std::string &value) {
  const std::string normalized = trim(value);
  if (normalized.empty()) {
    return Result<std::int64_t>::failure("empty integer");
  }
  std::int64_t parsed = 0;
  const auto *first = normalized.data();
  const auto *last = first + normalized.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc() || ptr != last) {
    return Result<std::int64_t>::failure("invalid integer: " + normalized);
  }
  return Result<std::int64_t>::success(parsed);
}

Result<std::vector<std::int64_t>> parse_id_list(const std::string &value) {
  std::vector<std::int64_t> ids;
  std::size_t start = 0;
  while (start <= value.size()) {
    std::size_t comma = value.find(',', start);
    if (comma == std::string::npos) {
      comma = value.size();
    }
    const std::string item = trim(value.substr(start, comma - start));
    if (!item.empty()) {
      auto parsed = parse_i64(item);
      if (!parsed.ok()) {
        return Result<std::vector<std::int64_t>>::failure(parsed.error());
      }
      ids.push_back(parsed.value());
    }
    start = comma + 1;
  }
  return Result<std::vector<std::int64_t>>::success(std::move(ids));
}

std::pair<std::string, std::string> split_first_word(const std::string &value) {
  const std::string trimmed = trim(value);
  const auto space = std::find_if(trimmed.begin(), trimmed.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
  if (space == trimmed.end()) {
    return {trimmed, ""};
  }
  return {std::string(trimmed.begin(), space), trim(std::string(space, trimmed.end()))};
}

} // namespace tgassist::common
