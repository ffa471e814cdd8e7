#include "sessionkit/sessions/sqlite_store.hpp"

#include "sessionkit/common/fs.hpp"
#include "sessionkit/observability/global.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace sessionkit::sessions {

namespace {

constexpr int BUSY_TIMEOUT_MS = 5000;

std::string now_rfc3339() {
  const auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  gmtime_r(&t, &tm);

  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
  return out.str();
}

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string msg = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(common::ErrorCode::Storage, msg);
  }
  return common::Status::success();
}

// A zero-length blob bound with sqlite3_bind_blob becomes NULL, which a
// non-integer primary key accepts more than once.
int bind_id(sqlite3_stmt *stmt, const int index, const SessionId &id) {
  if (id.empty()) {
    return sqlite3_bind_zeroblob(stmt, index, 0);
  }
  return sqlite3_bind_blob(stmt, index, id.data(), static_cast<int>(id.size()), SQLITE_TRANSIENT);
}

// Extended result codes are enabled on the connection, so `rc` carries the
// constraint kind.
bool is_duplicate_key(const int rc) {
  return rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE;
}

std::string column_text(sqlite3_stmt *stmt, const int column) {
  const auto *text = sqlite3_column_text(stmt, column);
  if (text == nullptr) {
    return "";
  }
  return std::string(reinterpret_cast<const char *>(text),
                     static_cast<std::size_t>(sqlite3_column_bytes(stmt, column)));
}

} // namespace

SqliteSessionStore::SqliteSessionStore(std::filesystem::path db_path,
                                       std::shared_ptr<ISessionIdGenerator> generator)
    : db_path_(std::move(db_path)), generator_(std::move(generator)) {
  if (db_path_ != ":memory:") {
    if (auto status = common::ensure_parent_dir(db_path_); !status.ok()) {
      open_error_ = status.error();
      return;
    }
  }

  if (sqlite3_open(db_path_.string().c_str(), &db_) != SQLITE_OK) {
    open_error_ = db_ == nullptr ? "sqlite3_open failed" : sqlite3_errmsg(db_);
    sqlite3_close(db_);
    db_ = nullptr;
    return;
  }
  sqlite3_busy_timeout(db_, BUSY_TIMEOUT_MS);
  sqlite3_extended_result_codes(db_, 1);

  if (auto status = init_schema(); !status.ok()) {
    open_error_ = status.error();
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

SqliteSessionStore::~SqliteSessionStore() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status SqliteSessionStore::init_schema() {
  if (db_path_ != ":memory:") {
    if (auto status = exec_sql(db_, "PRAGMA journal_mode=WAL;"); !status.ok()) {
      return status;
    }
  }

  return exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS sessions (
  id BLOB NOT NULL PRIMARY KEY,
  user_id TEXT NOT NULL,
  metadata TEXT NOT NULL,
  created_at TEXT NOT NULL
);
)");
}

common::Status SqliteSessionStore::ready() const {
  if (db_ == nullptr) {
    return common::Status::error(common::ErrorCode::Storage,
                                 "session database unavailable: " + db_path_.string() +
                                     (open_error_.empty() ? "" : ": " + open_error_));
  }
  return common::Status::success();
}

common::Result<SessionId> SqliteSessionStore::generate_and_store(const common::Context &ctx,
                                                                 const std::string &user_id,
                                                                 const std::string &metadata) {
  using R = common::Result<SessionId>;
  if (auto status = ctx.status(); !status.ok()) {
    return R::failure(status);
  }
  if (auto status = ready(); !status.ok()) {
    return R::failure(status);
  }
  if (generator_ == nullptr) {
    return R::failure(common::ErrorCode::NotConfigured, "sqlite store has no id generator");
  }

  auto candidate = generator_->generate();
  if (!candidate.ok()) {
    return candidate;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  sqlite3_stmt *stmt = nullptr;
  const char *sql =
      "INSERT INTO sessions(id, user_id, metadata, created_at) VALUES(?1, ?2, ?3, ?4)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return R::failure(common::ErrorCode::Storage, sqlite3_errmsg(db_));
  }

  const std::string now = now_rfc3339();
  if (bind_id(stmt, 1, candidate.value()) != SQLITE_OK ||
      sqlite3_bind_text(stmt, 2, user_id.data(), static_cast<int>(user_id.size()),
                        SQLITE_TRANSIENT) != SQLITE_OK ||
      sqlite3_bind_text(stmt, 3, metadata.data(), static_cast<int>(metadata.size()),
                        SQLITE_TRANSIENT) != SQLITE_OK ||
      sqlite3_bind_text(stmt, 4, now.c_str(), -1, SQLITE_TRANSIENT) != SQLITE_OK) {
    const std::string msg = sqlite3_errmsg(db_);
    sqlite3_finalize(stmt);
    return R::failure(common::ErrorCode::Storage, msg);
  }

  const int rc = sqlite3_step(stmt);
  const std::string msg = rc == SQLITE_DONE ? "" : sqlite3_errmsg(db_);
  sqlite3_finalize(stmt);
  if (rc == SQLITE_DONE) {
    return candidate;
  }
  if (is_duplicate_key(rc)) {
    return R::failure(common::ErrorCode::Collision, kCollisionMessage);
  }
  return R::failure(common::ErrorCode::Storage, msg);
}

common::Result<SessionRecord> SqliteSessionStore::get(const common::Context &ctx,
                                                      const SessionId &session) {
  using R = common::Result<SessionRecord>;
  if (auto status = ctx.status(); !status.ok()) {
    return R::failure(status);
  }
  if (auto status = ready(); !status.ok()) {
    return R::failure(status);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  sqlite3_stmt *stmt = nullptr;
  const char *sql = "SELECT user_id, metadata FROM sessions WHERE id = ?1";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return R::failure(common::ErrorCode::Storage, sqlite3_errmsg(db_));
  }
  if (bind_id(stmt, 1, session) != SQLITE_OK) {
    const std::string msg = sqlite3_errmsg(db_);
    sqlite3_finalize(stmt);
    return R::failure(common::ErrorCode::Storage, msg);
  }

  SessionRecord record;
  const int rc = sqlite3_step(stmt);
  if (rc == SQLITE_ROW) {
    record.user_id = column_text(stmt, 0);
    record.metadata = column_text(stmt, 1);
  }
  const std::string msg = rc == SQLITE_ROW || rc == SQLITE_DONE ? "" : sqlite3_errmsg(db_);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
    return R::failure(common::ErrorCode::Storage, msg);
  }

  observability::record_session_lookup(std::string(name()), rc == SQLITE_ROW);
  return R::success(std::move(record));
}

common::Result<std::size_t> SqliteSessionStore::count() {
  using R = common::Result<std::size_t>;
  if (auto status = ready(); !status.ok()) {
    return R::failure(status);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM sessions", -1, &stmt, nullptr) != SQLITE_OK) {
    return R::failure(common::ErrorCode::Storage, sqlite3_errmsg(db_));
  }

  std::size_t total = 0;
  const int rc = sqlite3_step(stmt);
  if (rc != SQLITE_ROW) {
    const std::string msg = sqlite3_errmsg(db_);
    sqlite3_finalize(stmt);
    return R::failure(common::ErrorCode::Storage, msg);
  }
  total = static_cast<std::size_t>(sqlite3_column_int64(stmt, 0));
  sqlite3_finalize(stmt);
  return R::success(total);
}

bool SqliteSessionStore::health_check() {
  if (db_ == nullptr) {
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  return exec_sql(db_, "SELECT 1;").ok();
}

} // namespace sessionkit::sessions
