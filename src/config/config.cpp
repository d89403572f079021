#include "tgassist/config/config.hpp"

#include "tgassist/common/strings.hpp"
#include "tgassist/common/toml.hpp"

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

namespace tgassist::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".tgassist";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("TGASSIST_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

std::string strip_env_quotes(const std::string &raw) {
  std::string value = common::trim(raw);
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    std::string out;
    out.reserve(value.size() - 2);
    bool escaped = false;
    for (std::size_t i = 1; i + 1 < value.size(); ++i) {
      const char ch = value[i];
      if (!escaped) {
        if (ch == '\\') {
          escaped = true;
          continue;
        }
        out.push_back(ch);
        continue;
      }
      switch (ch) {
      case 'n':
        out.push_back('\n');
        break;
      case 't':
        out.push_back('\t');
        break;
      default:
        out.push_back(ch);
        break;
      }
      escaped = false;
    }
    return out;
  }
  if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool is_valid_env_name(const std::string &name) {
  if (name.empty()) {
    return false;
  }
  if (!(std::isalpha(static_cast<unsigned char>(name.front())) != 0 || name.front() == '_')) {
    return false;
  }
  for (const char ch : name) {
    const auto uch = static_cast<unsigned char>(ch);
    if (!(std::isalnum(uch) != 0 || ch == '_')) {
      return false;
    }
  }
  return true;
}

void set_env_if_missing(const std::string &name, const std::string &value) {
  if (!is_valid_env_name(name)) {
    return;
  }
  if (const char *existing = std::getenv(name.c_str()); existing != nullptr && *existing != '\0') {
    return;
  }
  setenv(name.c_str(), value.c_str(), 0);
}

void load_dotenv_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return;
  }

  std::ifstream file(path);
  if (!file) {
    return;
  }

  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (common::starts_with(trimmed, "export ")) {
      trimmed = common::trim(trimmed.substr(7));
    }

    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }

    const std::string key = common::trim(trimmed.substr(0, eq));
    if (key.empty()) {
      continue;
    }
    set_env_if_missing(key, strip_env_quotes(trimmed.substr(eq + 1)));
  }
}

void load_dotenv_files() {
  std::vector<std::filesystem::path> candidates;
  if (const char *env_file = std::getenv("TGASSIST_ENV_FILE");
      env_file != nullptr && *env_file != '\0') {
    candidates.emplace_back(common::expand_path(env_file));
  }
  if (auto dir = config_dir(); dir.ok()) {
    candidates.push_back(dir.value() / ".env");
  }
  std::error_code ec;
  const auto cwd = std::filesystem::current_path(ec);
  if (!ec) {
    candidates.push_back(cwd / ".env");
  }

  for (const auto &candidate : candidates) {
    load_dotenv_file(candidate);
  }
}

std::optional<std::string> env_value(const char *name) {
  if (const char *value = std::getenv(name); value != nullptr && *value != '\0') {
    return std::string(value);
  }
  return std::nullopt;
}

common::Status load_assistant_section(Config &config, const common::TomlDocument &doc) {
  auto &assistant = config.assistant;
  assistant.api_endpoint = doc.get_string("assistant.api_endpoint", assistant.api_endpoint);
  assistant.credentials_path =
      doc.get_string("assistant.credentials_path", assistant.credentials_path);
  assistant.language_code = doc.get_string("assistant.language_code", assistant.language_code);
  assistant.device_model_id =
      expand_config_value(doc.get_string("assistant.device_model_id", assistant.device_model_id));
  assistant.device_id =
      expand_config_value(doc.get_string("assistant.device_id", assistant.device_id));

  if (doc.has("assistant.deadline_seconds")) {
    const int deadline = doc.get_int("assistant.deadline_seconds", -1);
    if (deadline < 0) {
      return common::Status::error("assistant.deadline_seconds must be a non-negative integer");
    }
    assistant.deadline_seconds = static_cast<std::uint32_t>(deadline);
  }
  return common::Status::success();
}

common::Status load_telegram_section(Config &config, const common::TomlDocument &doc) {
  auto &telegram = config.telegram;
  telegram.bot_token = expand_config_value(doc.get_string("telegram.bot_token", telegram.bot_token));
  telegram.api_base = doc.get_string("telegram.api_base", telegram.api_base);
  telegram.poll_timeout_seconds =
      doc.get_int("telegram.poll_timeout_seconds", telegram.poll_timeout_seconds);
  telegram.idle_sleep_ms = doc.get_int("telegram.idle_sleep_ms", telegram.idle_sleep_ms);

  auto chats = doc.get_i64_array("telegram.allowed_chat_ids");
  if (!chats.ok()) {
    return common::Status::error(chats.error());
  }
  telegram.allowed_chat_ids = std::move(chats.value());

  auto users = doc.get_i64_array("telegram.authorized_user_ids");
  if (!users.ok()) {
    return common::Status::error(users.error());
  }
  telegram.authorized_user_ids = std::move(users.value());
  return common::Status::success();
}

void load_router_section(Config &config, const common::TomlDocument &doc) {
  auto &router = config.router;
  router.unauthorized_reply = doc.get_string("router.unauthorized_reply", router.unauthorized_reply);
  router.failure_reply = doc.get_string("router.failure_reply", router.failure_reply);
  router.leave_unauthorized_groups =
      doc.get_bool("router.leave_unauthorized_groups", router.leave_unauthorized_groups);
  router.dispatch_workers = static_cast<std::uint32_t>(
      doc.get_u64("router.dispatch_workers", router.dispatch_workers));
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    std::filesystem::path candidate = *override_path;
    if (std::filesystem::is_directory(candidate, ec) || candidate.filename().empty()) {
      return common::ensure_dir(candidate);
    }

    auto parent = candidate.parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure("unable to resolve current directory");
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }

  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  return path.ok() && std::filesystem::exists(path.value());
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

common::Status apply_env_overrides(Config &config) {
  load_dotenv_files();

  if (auto token = env_value("BOT_TOKEN"); token.has_value()) {
    config.telegram.bot_token = *token;
  }
  if (auto model = env_value("DEVICE_MODEL_ID"); model.has_value()) {
    config.assistant.device_model_id = *model;
  }
  if (auto device = env_value("DEVICE_ID"); device.has_value()) {
    config.assistant.device_id = *device;
  }

  if (auto chats = env_value("ALLOWED_CHAT_IDS"); chats.has_value()) {
    auto parsed = common::parse_id_list(*chats);
    if (!parsed.ok()) {
      return common::Status::error("ALLOWED_CHAT_IDS: " + parsed.error());
    }
    config.telegram.allowed_chat_ids = std::move(parsed.value());
  }
  if (auto users = env_value("AUTHORIZED_USER_IDS"); users.has_value()) {
    auto parsed = common::parse_id_list(*users);
    if (!parsed.ok()) {
      return common::Status::error("AUTHORIZED_USER_IDS: " + parsed.error());
    }
    config.telegram.authorized_user_ids = std::move(parsed.value());
  }
  return common::Status::success();
}

common::Result<Config> load_config() {
  load_dotenv_files();

  Config config;

  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  if (std::filesystem::exists(path)) {
    std::ifstream file(path);
    if (!file) {
      return common::Result<Config>::failure("Unable to open config file: " + path.string());
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    const auto parsed = common::parse_toml(buffer.str());
    if (!parsed.ok()) {
      return common::Result<Config>::failure(parsed.error());
    }
    const auto &doc = parsed.value();

    if (auto status = load_assistant_section(config, doc); !status.ok()) {
      return common::Result<Config>::failure(status.error());
    }
    if (auto status = load_telegram_section(config, doc); !status.ok()) {
      return common::Result<Config>::failure(status.error());
    }
    load_router_section(config, doc);
    config.observability.backend =
        doc.get_string("observability.backend", config.observability.backend);
    config.observability.verbose =
        doc.get_bool("observability.verbose", config.observability.verbose);
  }

  config.assistant.credentials_path = common::expand_path(config.assistant.credentials_path);

  if (auto status = apply_env_overrides(config); !status.ok()) {
    return common::Result<Config>::failure(status.error());
  }
  return common::Result<Config>::success(std::move(config));
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using Warnings = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  if (common::trim(config.telegram.bot_token).empty()) {
    return Warnings::failure("telegram.bot_token is required (or set BOT_TOKEN)");
  }
  if (common::trim(config.assistant.device_model_id).empty()) {
    return Warnings::failure("assistant.device_model_id is required (or set DEVICE_MODEL_ID)");
  }
  if (common::trim(config.assistant.device_id).empty()) {
    return Warnings::failure("assistant.device_id is required (or set DEVICE_ID)");
  }
  if (common::trim(config.assistant.language_code).empty()) {
    return Warnings::failure("assistant.language_code must not be empty");
  }
  if (common::trim(config.assistant.api_endpoint).empty()) {
    return Warnings::failure("assistant.api_endpoint must not be empty");
  }
  if (config.assistant.deadline_seconds == 0) {
    return Warnings::failure("assistant.deadline_seconds must be greater than zero");
  }
  if (config.router.dispatch_workers == 0) {
    return Warnings::failure("router.dispatch_workers must be greater than zero");
  }
  if (config.telegram.poll_timeout_seconds < 0 || config.telegram.idle_sleep_ms < 0) {
    return Warnings::failure("telegram polling intervals must not be negative");
  }

  const std::string backend = common::to_lower(config.observability.backend);
  if (backend != "log" && backend != "none") {
    return Warnings::failure("Invalid observability.backend: " + config.observability.backend);
  }

  std::error_code ec;
  if (!std::filesystem::exists(config.assistant.credentials_path, ec)) {
    warnings.push_back("credentials file not found: " + config.assistant.credentials_path +
                       " (run google-oauthlib-tool to create it)");
  }
  if (config.telegram.allowed_chat_ids.empty() && config.telegram.authorized_user_ids.empty()) {
    warnings.push_back("no allowed chats or authorized users configured; every request will be "
                       "answered with the unauthorized reply");
  }
  if (common::trim(config.router.unauthorized_reply).empty()) {
    warnings.push_back("router.unauthorized_reply is empty; unauthorized users get no answer");
  }

  return Warnings::success(std::move(warnings));
}

} // namespace tgassist::config
