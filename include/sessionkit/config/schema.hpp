#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace sessionkit::config {

struct SessionsConfig {
  std::size_t id_bytes = 16;
  int max_generate_attempts = 5;
};

struct EntropyConfig {
  std::string source = "openssl";
  std::string device = "/dev/urandom";
  std::uint64_t seed = 0;
};

struct StorageConfig {
  std::string backend = "sqlite";
  std::string path = "~/.sessionkit/sessions.db";
};

struct ObservabilityConfig {
  std::string backend = "log";
  bool verbose = false;
};

struct Config {
  SessionsConfig sessions;
  EntropyConfig entropy;
  StorageConfig storage;
  ObservabilityConfig observability;
};

} // namespace sessionkit::config
