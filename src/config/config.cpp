#include "sessionkit/config/config.hpp"

#include "sessionkit/common/fs.hpp"
#include "sessionkit/common/toml.hpp"

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace sessionkit::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".sessionkit";
constexpr const char *CONFIG_FILENAME = "config.toml";
constexpr std::size_t MAX_ID_BYTES = 4096;
constexpr std::size_t RECOMMENDED_MIN_ID_BYTES = 16;

std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("SESSIONKIT_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

const char *env_value(const char *name) {
  const char *value = std::getenv(name);
  if (value == nullptr || *value == '\0') {
    return nullptr;
  }
  return value;
}

template <typename T> std::optional<T> parse_number(const std::string &raw) {
  const std::string text = common::trim(raw);
  T parsed{};
  const auto *first = text.data();
  const auto *last = first + text.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc() || ptr != last || first == last) {
    return std::nullopt;
  }
  return parsed;
}

const char *bool_to_toml(const bool value) { return value ? "true" : "false"; }

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    return common::Result<std::filesystem::path>::success(override_path->parent_path());
  }
  auto home = common::home_dir();
  if (!home.ok()) {
    return home;
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    return common::Result<std::filesystem::path>::success(*override_path);
  }
  auto dir = config_dir();
  if (!dir.ok()) {
    return dir;
  }
  return common::Result<std::filesystem::path>::success(dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  return path.ok() && std::filesystem::exists(path.value());
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  g_config_path_override = std::move(path);
}

void clear_config_path_override() { g_config_path_override.reset(); }

std::optional<std::filesystem::path> config_path_override() { return g_config_path_override; }

void apply_env_overrides(Config &config) {
  if (const char *backend = env_value("SESSIONKIT_STORAGE_BACKEND"); backend != nullptr) {
    config.storage.backend = backend;
  }
  if (const char *path = env_value("SESSIONKIT_DB_PATH"); path != nullptr) {
    config.storage.path = path;
  }
  if (const char *source = env_value("SESSIONKIT_ENTROPY_SOURCE"); source != nullptr) {
    config.entropy.source = source;
  }
  if (const char *bytes = env_value("SESSIONKIT_ID_BYTES"); bytes != nullptr) {
    if (const auto parsed = parse_number<std::size_t>(bytes); parsed.has_value()) {
      config.sessions.id_bytes = *parsed;
    }
  }
  if (const char *attempts = env_value("SESSIONKIT_MAX_ATTEMPTS"); attempts != nullptr) {
    if (const auto parsed = parse_number<int>(attempts); parsed.has_value()) {
      config.sessions.max_generate_attempts = *parsed;
    }
  }
}

common::Result<Config> parse_config(const std::string &content) {
  const auto parsed = common::parse_toml(content);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.status().wrap("config"));
  }
  const auto &doc = parsed.value();

  Config config;
  config.sessions.id_bytes = static_cast<std::size_t>(
      doc.get_u64("sessions.id_bytes", config.sessions.id_bytes));
  config.sessions.max_generate_attempts =
      doc.get_int("sessions.max_generate_attempts", config.sessions.max_generate_attempts);

  config.entropy.source = doc.get_string("entropy.source", config.entropy.source);
  config.entropy.device = common::expand_path(doc.get_string("entropy.device", config.entropy.device));
  config.entropy.seed = doc.get_u64("entropy.seed", config.entropy.seed);

  config.storage.backend = doc.get_string("storage.backend", config.storage.backend);
  config.storage.path = doc.get_string("storage.path", config.storage.path);

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);
  config.observability.verbose =
      doc.get_bool("observability.verbose", config.observability.verbose);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.status());
  }

  const auto path = cfg_path_result.value();
  if (!std::filesystem::exists(path)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  std::ifstream file(path);
  if (!file) {
    return common::Result<Config>::failure(common::ErrorCode::NotConfigured,
                                           "Unable to open config file: " + path.string());
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  auto config = parse_config(buffer.str());
  if (!config.ok()) {
    return config;
  }

  apply_env_overrides(config.value());
  return config;
}

common::Status save_config(const Config &config) {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return cfg_path_result.status();
  }

  const std::filesystem::path path = cfg_path_result.value();
  if (auto status = common::ensure_parent_dir(path); !status.ok()) {
    return status;
  }
  const std::filesystem::path tmp_path = path.string() + ".tmp";

  {
    std::ofstream file(tmp_path, std::ios::trunc);
    if (!file) {
      return common::Status::error(common::ErrorCode::Storage,
                                   "Unable to write temporary config file");
    }

    file << "[sessions]\n";
    file << "id_bytes = " << config.sessions.id_bytes << "\n";
    file << "max_generate_attempts = " << config.sessions.max_generate_attempts << "\n";

    file << "\n[entropy]\n";
    file << "source = " << common::quote_toml_string(config.entropy.source) << "\n";
    file << "device = " << common::quote_toml_string(config.entropy.device) << "\n";
    file << "seed = " << config.entropy.seed << "\n";

    file << "\n[storage]\n";
    file << "backend = " << common::quote_toml_string(config.storage.backend) << "\n";
    file << "path = " << common::quote_toml_string(config.storage.path) << "\n";

    file << "\n[observability]\n";
    file << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";
    file << "verbose = " << bool_to_toml(config.observability.verbose) << "\n";

    if (!file) {
      return common::Status::error(common::ErrorCode::Storage,
                                   "Failed writing config file: " + tmp_path.string());
    }
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    return common::Status::error(common::ErrorCode::Storage,
                                 "Failed to replace config file: " + ec.message());
  }
  return common::Status::success();
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using R = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  if (config.sessions.id_bytes == 0 || config.sessions.id_bytes > MAX_ID_BYTES) {
    return R::failure(common::ErrorCode::InvalidArgument,
                      "sessions.id_bytes must be between 1 and " + std::to_string(MAX_ID_BYTES));
  }
  if (config.sessions.id_bytes < RECOMMENDED_MIN_ID_BYTES) {
    warnings.push_back("sessions.id_bytes below 16 makes identifiers easier to guess");
  }
  if (config.sessions.max_generate_attempts <= 0) {
    return R::failure(common::ErrorCode::InvalidArgument,
                      "sessions.max_generate_attempts must be positive");
  }

  const std::string source = common::to_lower(common::trim(config.entropy.source));
  if (source != "openssl" && source != "urandom" && source != "seeded") {
    return R::failure(common::ErrorCode::InvalidArgument,
                      "Invalid entropy.source: " + config.entropy.source);
  }
  if (source == "urandom" && common::trim(config.entropy.device).empty()) {
    return R::failure(common::ErrorCode::InvalidArgument,
                      "entropy.device is required for the urandom source");
  }
  if (source == "seeded") {
    warnings.push_back("entropy.source = seeded produces predictable identifiers");
  }

  const std::string backend = common::to_lower(common::trim(config.storage.backend));
  if (backend != "sqlite" && backend != "memory") {
    return R::failure(common::ErrorCode::InvalidArgument,
                      "Invalid storage.backend: " + config.storage.backend);
  }
  if (backend == "sqlite" && common::trim(config.storage.path).empty()) {
    return R::failure(common::ErrorCode::InvalidArgument,
                      "storage.path is required for the sqlite backend");
  }
  if (backend == "memory") {
    warnings.push_back("storage.backend = memory does not persist sessions across runs");
  }

  return R::success(std::move(warnings));
}

} // namespace sessionkit::config
