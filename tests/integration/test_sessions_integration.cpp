#include "test_framework.hpp"

#include "helpers/test_helpers.hpp"
#include "sessionkit/common/hex.hpp"
#include "sessionkit/config/schema.hpp"
#include "sessionkit/entropy/openssl_source.hpp"
#include "sessionkit/entropy/seeded_source.hpp"
#include "sessionkit/sessions/create.hpp"
#include "sessionkit/sessions/factory.hpp"
#include "sessionkit/sessions/id_generator.hpp"
#include "sessionkit/sessions/memory_store.hpp"
#include "sessionkit/sessions/sqlite_store.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

void register_sessions_integration_tests(std::vector<sessionkit::tests::TestCase> &tests) {
  using sessionkit::tests::require;
  namespace c = sessionkit::common;
  namespace e = sessionkit::entropy;
  namespace s = sessionkit::sessions;
  namespace t = sessionkit::testing;

  tests.push_back({"integration_collide_twice_then_store", [] {
                     const auto a = s::SessionId(16, 0xA1);
                     const auto b = s::SessionId(16, 0xB2);
                     const auto fresh = s::SessionId(16, 0xC3);
                     auto generator = std::make_shared<s::RandomSessionIdGenerator>(
                         16, std::make_shared<t::ScriptedByteSource>(
                                 std::vector<std::vector<unsigned char>>{a, b, a, b, fresh}));
                     s::MemorySessionStore memory(generator);
                     t::CountingStorer storer(memory);
                     const auto ctx = c::Context::background();

                     require(s::create_session(ctx, storer, "first", "", 5).ok(), "seed a");
                     require(s::create_session(ctx, storer, "second", "", 5).ok(), "seed b");
                     const std::size_t before = storer.calls();

                     auto id = s::create_session(ctx, storer, "dave", "plan=pro", 5);
                     require(id.ok(), id.error());
                     require(id.value() == fresh, "third candidate should be stored");
                     require(storer.calls() - before == 3, "expected exactly three attempts");

                     auto record = storer.get(ctx, id.value());
                     require(record.ok(), record.error());
                     require(record.value().user_id == "dave", "user id mismatch");
                     require(record.value().metadata == "plan=pro", "metadata mismatch");
                   }});

  tests.push_back({"integration_exhausted_id_space_reports_collision", [] {
                     auto generator = std::make_shared<s::RandomSessionIdGenerator>(
                         1, std::make_shared<e::SeededByteSource>(2024));
                     s::MemorySessionStore store(generator);
                     const auto ctx = c::Context::background();

                     for (int i = 0; i < 256; ++i) {
                       auto id = s::create_session(ctx, store, "user" + std::to_string(i), "",
                                                   1'000'000);
                       require(id.ok(), "slot " + std::to_string(i) + ": " + id.error());
                     }
                     require(store.size() == 256, "every one-byte id should be taken");

                     auto overflow = s::create_session(ctx, store, "late", "", 500);
                     require(overflow.is(c::ErrorCode::Collision),
                             "a full id space should surface as a collision");
                   }});

  tests.push_back({"integration_concurrent_creates_memory", [] {
                     auto generator = std::make_shared<s::RandomSessionIdGenerator>(
                         16, std::make_shared<e::OpenSslByteSource>());
                     s::MemorySessionStore store(generator);
                     constexpr int threads = 8;
                     constexpr int per_thread = 50;

                     std::mutex ids_mutex;
                     std::set<s::SessionId> ids;
                     std::atomic<int> failures{0};
                     std::vector<std::thread> workers;
                     for (int w = 0; w < threads; ++w) {
                       workers.emplace_back([&, w] {
                         for (int i = 0; i < per_thread; ++i) {
                           auto id = s::create_session(c::Context::background(), store,
                                                       "worker" + std::to_string(w), "", 5);
                           if (!id.ok()) {
                             ++failures;
                             continue;
                           }
                           std::lock_guard<std::mutex> lock(ids_mutex);
                           ids.insert(id.value());
                         }
                       });
                     }
                     for (auto &worker : workers) {
                       worker.join();
                     }

                     require(failures.load() == 0, "no create should fail");
                     require(ids.size() == static_cast<std::size_t>(threads * per_thread),
                             "ids should be unique");
                     require(store.size() == static_cast<std::size_t>(threads * per_thread),
                             "store size mismatch");
                   }});

  tests.push_back({"integration_concurrent_creates_sqlite", [] {
                     t::TempDir dir;
                     sessionkit::config::Config config;
                     config.storage.backend = "sqlite";
                     config.storage.path = (dir.path() / "concurrent.db").string();
                     auto store = s::create_session_store(config);
                     require(store.ok(), store.error());
                     require(store.value()->name() == "sqlite", "factory should build sqlite");

                     std::atomic<int> failures{0};
                     std::vector<std::thread> workers;
                     for (int w = 0; w < 4; ++w) {
                       workers.emplace_back([&] {
                         for (int i = 0; i < 25; ++i) {
                           if (!s::create_session(c::Context::background(), *store.value(), "u",
                                                  "", 5)
                                    .ok()) {
                             ++failures;
                           }
                         }
                       });
                     }
                     for (auto &worker : workers) {
                       worker.join();
                     }
                     require(failures.load() == 0, "no create should fail");

                     auto *sqlite = dynamic_cast<s::SqliteSessionStore *>(store.value().get());
                     require(sqlite != nullptr, "expected a sqlite store");
                     auto total = sqlite->count();
                     require(total.ok() && total.value() == 100, "expected 100 rows");
                   }});

  tests.push_back({"integration_factory_rejects_unknown_names", [] {
                     sessionkit::config::Config config;
                     config.storage.backend = "etcd";
                     require(s::create_session_store(config).is(c::ErrorCode::InvalidArgument),
                             "unknown backend");

                     config = sessionkit::config::Config{};
                     config.entropy.source = "lava-lamp";
                     require(s::create_session_store(config).is(c::ErrorCode::InvalidArgument),
                             "unknown entropy source");
                   }});

  tests.push_back({"integration_factory_memory_with_urandom", [] {
                     sessionkit::config::Config config;
                     config.storage.backend = "memory";
                     config.entropy.source = "urandom";
                     config.sessions.id_bytes = 24;
                     auto store = s::create_session_store(config);
                     require(store.ok(), store.error());

                     const auto ctx = c::Context::background();
                     auto id = s::create_session(ctx, *store.value(), "erin", "m", 3);
                     require(id.ok(), id.error());
                     require(c::to_hex(id.value()).size() == 48, "24 bytes should be 48 hex chars");
                     auto record = store.value()->get(ctx, id.value());
                     require(record.ok() && record.value().user_id == "erin", "lookup mismatch");
                   }});
}
