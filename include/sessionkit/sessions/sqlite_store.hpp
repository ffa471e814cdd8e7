#pragma once

#include "sessionkit/sessions/id_generator.hpp"
#include "sessionkit/sessions/storer.hpp"

#include <filesystem>
#include <memory>
#include <mutex>
#include <sqlite3.h>

namespace sessionkit::sessions {

/// Storer backed by a SQLite table whose primary key is the identifier, so a
/// repeated candidate fails the insert even across processes sharing the file.
/// Pass ":memory:" for a private in-memory database.
class SqliteSessionStore final : public ISessionStorer {
public:
  SqliteSessionStore(std::filesystem::path db_path,
                     std::shared_ptr<ISessionIdGenerator> generator);
  ~SqliteSessionStore() override;

  SqliteSessionStore(const SqliteSessionStore &) = delete;
  SqliteSessionStore &operator=(const SqliteSessionStore &) = delete;

  [[nodiscard]] common::Result<SessionId> generate_and_store(const common::Context &ctx,
                                                             const std::string &user_id,
                                                             const std::string &metadata) override;
  [[nodiscard]] common::Result<SessionRecord> get(const common::Context &ctx,
                                                  const SessionId &session) override;
  [[nodiscard]] std::string_view name() const override { return "sqlite"; }

  [[nodiscard]] common::Result<std::size_t> count();
  [[nodiscard]] bool health_check();
  [[nodiscard]] const std::filesystem::path &path() const { return db_path_; }

private:
  [[nodiscard]] common::Status init_schema();
  [[nodiscard]] common::Status ready() const;

  std::filesystem::path db_path_;
  std::shared_ptr<ISessionIdGenerator> generator_;
  sqlite3 *db_ = nullptr;
  std::string open_error_;
  std::mutex mutex_;
};

} // namespace sessionkit::sessions
