#include "tgassist/cli/commands.hpp"

#include "tgassist/channels/telegram/telegram.hpp"
#include "tgassist/common/strings.hpp"
#include "tgassist/config/config.hpp"
#include "tgassist/observability/factory.hpp"
#include "tgassist/observability/global.hpp"
#include "tgassist/runtime/app.hpp"

#include <chrono>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace tgassist::cli {

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void request_stop(int) { g_stop_requested = 1; }

std::string version_string() {
#ifdef TGASSIST_VERSION
  std::string version = TGASSIST_VERSION;
#else
  std::string version = "0.1.0";
#endif
#ifdef TGASSIST_GIT_COMMIT
  const std::string commit = TGASSIST_GIT_COMMIT;
  if (!commit.empty() && commit != "unknown") {
    version += " (" + commit + ")";
  }
#endif
  return "tgassist " + version;
}

/// Values given on the command line; they win over file and environment.
struct GlobalOverrides {
  std::optional<std::string> api_endpoint;
  std::optional<std::string> credentials_path;
  std::optional<std::string> language_code;
  std::optional<std::uint32_t> deadline_seconds;
  bool verbose = false;
};

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

/// Removes "--name value" or "--name=value" from args. Returns false on a
/// missing value; `found` tells whether the option was present at all.
bool take_option(std::vector<std::string> &args, const std::string &name, std::string &out_value,
                 bool &found, std::string &error) {
  found = false;
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      if (i + 1 >= args.size()) {
        error = "missing value for " + name;
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      found = true;
      return true;
    }
    if (common::starts_with(args[i], name + "=")) {
      out_value = args[i].substr(name.size() + 1);
      if (out_value.empty()) {
        error = "missing value for " + name;
        return false;
      }
      args.erase(args.begin() + static_cast<long>(i));
      found = true;
      return true;
    }
  }
  return true;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, GlobalOverrides &overrides,
                          std::string &error) {
  std::string value;
  bool found = false;

  if (!take_option(args, "--config", value, found, error)) {
    return false;
  }
  if (found) {
    config::set_config_path_override(value);
  }

  if (!take_option(args, "--api-endpoint", value, found, error)) {
    return false;
  }
  if (found) {
    overrides.api_endpoint = value;
  }

  if (!take_option(args, "--credentials-path", value, found, error)) {
    return false;
  }
  if (found) {
    overrides.credentials_path = common::expand_path(value);
  }

  if (!take_option(args, "--lang", value, found, error)) {
    return false;
  }
  if (found) {
    overrides.language_code = value;
  }

  if (!take_option(args, "--grpc-deadline", value, found, error)) {
    return false;
  }
  if (found) {
    auto seconds = common::parse_i64(value);
    if (!seconds.ok() || seconds.value() <= 0 || seconds.value() > 24 * 60 * 60) {
      error = "invalid --grpc-deadline: " + value;
      return false;
    }
    overrides.deadline_seconds = static_cast<std::uint32_t>(seconds.value());
  }

  const bool verbose_long = take_flag(args, "--verbose");
  const bool verbose_short = take_flag(args, "-v");
  overrides.verbose = verbose_long || verbose_short;
  return true;
}

void apply_overrides(config::Config &config, const GlobalOverrides &overrides) {
  if (overrides.api_endpoint.has_value()) {
    config.assistant.api_endpoint = *overrides.api_endpoint;
  }
  if (overrides.credentials_path.has_value()) {
    config.assistant.credentials_path = *overrides.credentials_path;
  }
  if (overrides.language_code.has_value()) {
    config.assistant.language_code = *overrides.language_code;
  }
  if (overrides.deadline_seconds.has_value()) {
    config.assistant.deadline_seconds = *overrides.deadline_seconds;
  }
  if (overrides.verbose) {
    config.observability.verbose = true;
  }
}

std::string join_tokens(const std::vector<std::string> &args) {
  std::ostringstream out;
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (i > 0) {
      out << ' ';
    }
    out << args[i];
  }
  return out.str();
}

std::string read_stdin_all() {
  std::ostringstream out;
  out << std::cin.rdbuf();
  return out.str();
}

/// Loads, overrides and validates the configuration; prints warnings. The
/// observer is installed so later steps can log through it.
std::optional<runtime::RuntimeContext> prepare_context(const GlobalOverrides &overrides) {
  auto context = runtime::RuntimeContext::from_disk();
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return std::nullopt;
  }
  apply_overrides(context.value().mutable_config(), overrides);

  auto validated = config::validate_config(context.value().config());
  if (!validated.ok()) {
    std::cerr << "invalid configuration: " << validated.error() << "\n";
    return std::nullopt;
  }
  for (const auto &warning : validated.value()) {
    std::cerr << "warning: " << warning << "\n";
  }

  observability::set_global_observer(observability::create_observer(context.value().config()));
  return std::move(context.value());
}

int run_bot(const GlobalOverrides &overrides) {
  auto context = prepare_context(overrides);
  if (!context.has_value()) {
    return 1;
  }

  auto transport = context->create_assist_transport();
  if (!transport.ok()) {
    std::cerr << transport.error() << "\n";
    return 1;
  }

  runtime::BotService bot(context->config(), transport.value(),
                          std::make_shared<channels::telegram::TelegramChannel>());
  auto started = bot.start();
  if (!started.ok()) {
    std::cerr << started.error() << "\n";
    return 1;
  }

  g_stop_requested = 0;
  std::signal(SIGINT, request_stop);
  std::signal(SIGTERM, request_stop);
  std::cout << "Bot running. Press Ctrl+C to stop.\n";
  while (g_stop_requested == 0 && bot.is_running()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }
  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);

  bot.stop();
  return 0;
}

int run_ask(const std::vector<std::string> &args, const GlobalOverrides &overrides) {
  std::string query = common::trim(join_tokens(args));
  if (query.empty()) {
    query = common::trim(read_stdin_all());
  }
  if (query.empty()) {
    std::cerr << "usage: tgassist ask <text...>\n";
    return 1;
  }

  auto context = prepare_context(overrides);
  if (!context.has_value()) {
    return 1;
  }
  auto transport = context->create_assist_transport();
  if (!transport.ok()) {
    std::cerr << transport.error() << "\n";
    return 1;
  }

  auto session = context->create_session(transport.value());
  auto result = session->ask(query);
  if (!result.ok()) {
    std::cerr << result.error().to_string() << "\n";
    return 1;
  }
  if (!result.value().has_value()) {
    std::cerr << "(the assistant did not reply with text)\n";
    return 0;
  }
  std::cout << *result.value() << "\n";
  return 0;
}

int run_check_config(const GlobalOverrides &overrides) {
  auto context = runtime::RuntimeContext::from_disk();
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return 1;
  }
  apply_overrides(context.value().mutable_config(), overrides);

  auto validated = config::validate_config(context.value().config());
  if (!validated.ok()) {
    std::cerr << "invalid configuration: " << validated.error() << "\n";
    return 1;
  }
  for (const auto &warning : validated.value()) {
    std::cout << "warning: " << warning << "\n";
  }

  const auto &cfg = context.value().config();
  const auto path = config::config_path();
  std::cout << "config:        " << (path.ok() ? path.value().string() : path.error())
            << (config::config_exists() ? "" : " (not found, using environment)") << "\n";
  std::cout << "endpoint:      " << cfg.assistant.api_endpoint << "\n";
  std::cout << "language:      " << cfg.assistant.language_code << "\n";
  std::cout << "device:        " << cfg.assistant.device_model_id << " / "
            << cfg.assistant.device_id << "\n";
  std::cout << "deadline:      " << cfg.assistant.deadline_seconds << "s\n";
  std::cout << "allowed chats: " << cfg.telegram.allowed_chat_ids.size() << "\n";
  std::cout << "authorized:    " << cfg.telegram.authorized_user_ids.size() << "\n";
  std::cout << "Configuration OK\n";
  return 0;
}

void print_help() {
  constexpr const char *RESET = "\033[0m";
  constexpr const char *BOLD = "\033[1m";
  constexpr const char *DIM = "\033[2m";
  constexpr const char *GREEN = "\033[32m";

  std::cout << "\n";
  std::cout << BOLD << "  tgassist" << RESET << DIM << "  Telegram bridge to the Google Assistant"
            << RESET << "\n";
  std::cout << DIM << "  " << version_string() << RESET << "\n\n";

  std::cout << BOLD << "  USAGE" << RESET << "\n";
  std::cout << DIM << "  $ " << RESET << "tgassist [options] [command]\n\n";

  std::cout << BOLD << "  COMMANDS" << RESET << "\n";
  std::cout << "  " << GREEN << "run" << RESET << DIM << "            Start the bot (default)" << RESET << "\n";
  std::cout << "  " << GREEN << "ask" << RESET << " TEXT" << DIM << "       Send one query and print the reply" << RESET << "\n";
  std::cout << "  " << GREEN << "check-config" << RESET << DIM << "   Validate the configuration" << RESET << "\n";
  std::cout << "  " << GREEN << "config-path" << RESET << DIM << "    Print the config file location" << RESET << "\n";
  std::cout << "  " << GREEN << "version" << RESET << DIM << "        Show version" << RESET << "\n\n";

  std::cout << BOLD << "  OPTIONS" << RESET << "\n";
  std::cout << "  --config PATH             Config file (or TGASSIST_CONFIG_PATH)\n";
  std::cout << "  --api-endpoint HOST       Assistant API endpoint\n";
  std::cout << "  --credentials-path PATH   OAuth2 credentials from google-oauthlib-tool\n";
  std::cout << "  --lang CODE               Conversation language, e.g. en-US\n";
  std::cout << "  --grpc-deadline SECONDS   Per-turn deadline\n";
  std::cout << "  -v, --verbose             Log traces and metrics\n";
  std::cout << "\n";
}

} // namespace

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc > 0 ? argc - 1 : 0, argc > 0 ? argv + 1 : argv);

  GlobalOverrides overrides;
  std::string global_error;
  if (!apply_global_options(args, overrides, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  const std::string subcommand = args.empty() ? "run" : args[0];
  if (!args.empty()) {
    args.erase(args.begin());
  }

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "check-config") {
    return run_check_config(overrides);
  }
  if (subcommand == "ask") {
    return run_ask(args, overrides);
  }
  if (subcommand == "run") {
    if (!args.empty()) {
      std::cerr << "unexpected argument: " << args[0] << "\n";
      return 1;
    }
    return run_bot(overrides);
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace tgassist::cli
