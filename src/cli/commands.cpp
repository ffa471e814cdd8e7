#include "sessionkit/cli/commands.hpp"

#include "sessionkit/common/context.hpp"
#include "sessionkit/common/fs.hpp"
#include "sessionkit/common/hex.hpp"
#include "sessionkit/config/config.hpp"
#include "sessionkit/observability/factory.hpp"
#include "sessionkit/observability/global.hpp"
#include "sessionkit/sessions/create.hpp"
#include "sessionkit/sessions/factory.hpp"
#include "sessionkit/sessions/sqlite_store.hpp"

#include <charconv>
#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace sessionkit::cli {

namespace {

std::string version_string() {
#ifdef SESSIONKIT_VERSION
  return std::string("sessionkit ") + SESSIONKIT_VERSION;
#else
  return "sessionkit 0.1.0";
#endif
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || args[i] == short_name) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::optional<int> parse_int(const std::string &text) {
  int value = 0;
  const auto *first = text.data();
  const auto *last = first + text.size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last || first == last) {
    return std::nullopt;
  }
  return value;
}

// Loads and validates config, installs the configured observer.
common::Result<config::Config> prepare() {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    return cfg;
  }
  auto validation = config::validate_config(cfg.value());
  if (!validation.ok()) {
    return common::Result<config::Config>::failure(validation.status());
  }
  for (const auto &warning : validation.value()) {
    std::cerr << "warning: " << warning << "\n";
  }
  observability::set_global_observer(observability::create_observer(cfg.value()));
  return cfg;
}

int fail(const std::string &message) {
  std::cerr << message << "\n";
  return 1;
}

int run_create(std::vector<std::string> args) {
  std::string metadata;
  std::string attempts_text;
  std::string timeout_text;
  take_option(args, "--metadata", "-m", metadata);
  const bool has_attempts = take_option(args, "--attempts", "-n", attempts_text);
  const bool has_timeout = take_option(args, "--timeout-ms", "-t", timeout_text);
  if (args.size() != 1) {
    return fail("usage: sessionkit create <user_id> [--metadata M] [--attempts N] "
                "[--timeout-ms T]");
  }

  auto cfg = prepare();
  if (!cfg.ok()) {
    return fail(cfg.error());
  }

  int max_attempts = cfg.value().sessions.max_generate_attempts;
  if (has_attempts) {
    const auto parsed = parse_int(attempts_text);
    if (!parsed.has_value()) {
      return fail("invalid --attempts value: " + attempts_text);
    }
    max_attempts = *parsed;
  }

  auto ctx = common::Context::background();
  if (has_timeout) {
    const auto parsed = parse_int(timeout_text);
    if (!parsed.has_value() || *parsed <= 0) {
      return fail("invalid --timeout-ms value: " + timeout_text);
    }
    ctx = ctx.with_timeout(std::chrono::milliseconds(*parsed));
  }

  auto store = sessions::create_session_store(cfg.value());
  if (!store.ok()) {
    return fail(store.error());
  }

  auto session = sessions::create_session(ctx, *store.value(), args[0], metadata, max_attempts);
  if (!session.ok()) {
    return fail("create failed (" + std::string(common::error_code_name(session.code())) +
                "): " + session.error());
  }
  std::cout << common::to_hex(session.value()) << "\n";
  return 0;
}

int run_get(std::vector<std::string> args) {
  if (args.size() != 1) {
    return fail("usage: sessionkit get <session_hex>");
  }

  auto id = common::from_hex(common::trim(args[0]));
  if (!id.ok()) {
    return fail("invalid session id: " + id.error());
  }

  auto cfg = prepare();
  if (!cfg.ok()) {
    return fail(cfg.error());
  }
  auto store = sessions::create_session_store(cfg.value());
  if (!store.ok()) {
    return fail(store.error());
  }

  auto record = store.value()->get(common::Context::background(), id.value());
  if (!record.ok()) {
    return fail("lookup failed: " + record.error());
  }
  if (record.value().empty()) {
    std::cout << "no session\n";
    return 0;
  }
  std::cout << "user_id: " << record.value().user_id << "\n";
  std::cout << "metadata: " << record.value().metadata << "\n";
  return 0;
}

int run_status() {
  auto cfg = prepare();
  if (!cfg.ok()) {
    return fail(cfg.error());
  }
  const auto &c = cfg.value();
  std::cout << "backend: " << c.storage.backend << "\n";
  std::cout << "entropy: " << c.entropy.source << "\n";
  std::cout << "id_bytes: " << c.sessions.id_bytes << "\n";

  if (common::to_lower(common::trim(c.storage.backend)) != "sqlite") {
    return 0;
  }

  auto generator = sessions::create_id_generator(c);
  if (!generator.ok()) {
    return fail(generator.error());
  }
  sessions::SqliteSessionStore store(common::expand_path(c.storage.path), generator.value());
  std::cout << "path: " << store.path().string() << "\n";
  std::cout << "healthy: " << (store.health_check() ? "yes" : "no") << "\n";
  auto total = store.count();
  if (!total.ok()) {
    return fail(total.error());
  }
  std::cout << "sessions: " << total.value() << "\n";
  return 0;
}

std::optional<std::string> config_value(const config::Config &cfg, const std::string &key) {
  if (key == "sessions.id_bytes") {
    return std::to_string(cfg.sessions.id_bytes);
  }
  if (key == "sessions.max_generate_attempts") {
    return std::to_string(cfg.sessions.max_generate_attempts);
  }
  if (key == "entropy.source") {
    return cfg.entropy.source;
  }
  if (key == "entropy.device") {
    return cfg.entropy.device;
  }
  if (key == "entropy.seed") {
    return std::to_string(cfg.entropy.seed);
  }
  if (key == "storage.backend") {
    return cfg.storage.backend;
  }
  if (key == "storage.path") {
    return cfg.storage.path;
  }
  if (key == "observability.backend") {
    return cfg.observability.backend;
  }
  if (key == "observability.verbose") {
    return std::string(cfg.observability.verbose ? "true" : "false");
  }
  return std::nullopt;
}

common::Status set_config_value(config::Config &cfg, const std::string &key,
                                const std::string &value) {
  auto invalid = [&]() {
    return common::Status::error(common::ErrorCode::InvalidArgument,
                                 "invalid value for " + key + ": " + value);
  };

  if (key == "sessions.id_bytes") {
    const auto parsed = parse_int(value);
    if (!parsed.has_value() || *parsed < 0) {
      return invalid();
    }
    cfg.sessions.id_bytes = static_cast<std::size_t>(*parsed);
  } else if (key == "sessions.max_generate_attempts") {
    const auto parsed = parse_int(value);
    if (!parsed.has_value()) {
      return invalid();
    }
    cfg.sessions.max_generate_attempts = *parsed;
  } else if (key == "entropy.source") {
    cfg.entropy.source = value;
  } else if (key == "entropy.device") {
    cfg.entropy.device = value;
  } else if (key == "entropy.seed") {
    const auto parsed = parse_int(value);
    if (!parsed.has_value() || *parsed < 0) {
      return invalid();
    }
    cfg.entropy.seed = static_cast<std::uint64_t>(*parsed);
  } else if (key == "storage.backend") {
    cfg.storage.backend = value;
  } else if (key == "storage.path") {
    cfg.storage.path = value;
  } else if (key == "observability.backend") {
    cfg.observability.backend = value;
  } else if (key == "observability.verbose") {
    if (value != "true" && value != "false") {
      return invalid();
    }
    cfg.observability.verbose = value == "true";
  } else {
    return common::Status::error(common::ErrorCode::InvalidArgument, "unknown key: " + key);
  }
  return common::Status::success();
}

int run_config(std::vector<std::string> args) {
  if (!args.empty() && args[0] == "path") {
    auto path = config::config_path();
    if (!path.ok()) {
      return fail(path.error());
    }
    std::cout << path.value().string() << "\n";
    return 0;
  }

  auto cfg = config::load_config();
  if (!cfg.ok()) {
    return fail(cfg.error());
  }

  if (args.empty() || args[0] == "show") {
    for (const char *key :
         {"sessions.id_bytes", "sessions.max_generate_attempts", "entropy.source",
          "entropy.device", "entropy.seed", "storage.backend", "storage.path",
          "observability.backend", "observability.verbose"}) {
      std::cout << key << " = " << config_value(cfg.value(), key).value_or("") << "\n";
    }
    return 0;
  }

  if (args[0] == "validate") {
    auto validation = config::validate_config(cfg.value());
    if (!validation.ok()) {
      return fail(validation.error());
    }
    for (const auto &warning : validation.value()) {
      std::cout << "warning: " << warning << "\n";
    }
    std::cout << "ok\n";
    return 0;
  }

  if (args[0] == "get") {
    if (args.size() < 2) {
      return fail("usage: sessionkit config get <key>");
    }
    const auto value = config_value(cfg.value(), args[1]);
    if (!value.has_value()) {
      return fail("unknown key: " + args[1]);
    }
    std::cout << *value << "\n";
    return 0;
  }

  if (args[0] == "set") {
    if (args.size() < 3) {
      return fail("usage: sessionkit config set <key> <value>");
    }
    if (auto status = set_config_value(cfg.value(), args[1], args[2]); !status.ok()) {
      return fail(status.error());
    }
    if (auto saved = config::save_config(cfg.value()); !saved.ok()) {
      return fail(saved.error());
    }
    return 0;
  }

  return fail("unknown config command");
}

} // namespace

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "usage: sessionkit [--config PATH] <command> [options]\n\n";
  std::cout << "commands:\n";
  std::cout << "  create <user_id> [-m METADATA] [-n ATTEMPTS] [-t TIMEOUT_MS]\n";
  std::cout << "                       Create a session and print its hex identifier\n";
  std::cout << "  get <session_hex>    Print the user and metadata bound to a session\n";
  std::cout << "  status               Show backend, entropy source and session count\n";
  std::cout << "  config [show|path|validate|get KEY|set KEY VALUE]\n";
  std::cout << "  version              Show version\n";
}

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    return fail(global_error);
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  int code = 1;
  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    code = 0;
  } else if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    code = 0;
  } else if (subcommand == "create") {
    code = run_create(std::move(args));
  } else if (subcommand == "get") {
    code = run_get(std::move(args));
  } else if (subcommand == "status") {
    code = run_status();
  } else if (subcommand == "config") {
    code = run_config(std::move(args));
  } else {
    std::cerr << "unknown command: " << subcommand << "\n";
    print_help();
  }

  if (auto *observer = observability::get_global_observer(); observer != nullptr) {
    observer->flush();
  }
  return code;
}

} // namespace sessionkit::cli
