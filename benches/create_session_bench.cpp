#include "bench_common.hpp"

#include "sessionkit/entropy/openssl_source.hpp"
#include "sessionkit/sessions/create.hpp"
#include "sessionkit/sessions/id_generator.hpp"
#include "sessionkit/sessions/memory_store.hpp"
#include "sessionkit/sessions/sqlite_store.hpp"

#include <filesystem>
#include <memory>
#include <random>

void run_create_session_benchmark() {
  namespace c = sessionkit::common;
  namespace s = sessionkit::sessions;

  auto generator = std::make_shared<s::RandomSessionIdGenerator>(
      s::kRecommendedMinIdBytes, std::make_shared<sessionkit::entropy::OpenSslByteSource>());
  const auto ctx = c::Context::background();

  s::MemorySessionStore memory(generator);
  sessionkit::bench::run_bench("create_session_memory", 50000, [&] {
    if (!s::create_session(ctx, memory, "bench-user", "{}", 5).ok()) {
      std::cerr << "memory create failed\n";
    }
  });

  std::mt19937_64 rng{std::random_device{}()};
  const auto db_path = std::filesystem::temp_directory_path() /
                       ("sessionkit-bench-" + std::to_string(rng()) + ".db");
  {
    s::SqliteSessionStore sqlite(db_path, generator);
    sessionkit::bench::run_bench("create_session_sqlite", 2000, [&] {
      if (!s::create_session(ctx, sqlite, "bench-user", "{}", 5).ok()) {
        std::cerr << "sqlite create failed\n";
      }
    });
  }

  std::error_code ec;
  std::filesystem::remove(db_path, ec);
  std::filesystem::remove(db_path.string() + "-wal", ec);
  std::filesystem::remove(db_path.string() + "-shm", ec);
}
