#include "sessionkit/sessions/memory_store.hpp"

#include "sessionkit/observability/global.hpp"

namespace sessionkit::sessions {

namespace {

std::string to_key(const SessionId &id) { return std::string(id.begin(), id.end()); }

} // namespace

MemorySessionStore::MemorySessionStore(std::shared_ptr<ISessionIdGenerator> generator)
    : generator_(std::move(generator)) {}

common::Result<SessionId> MemorySessionStore::generate_and_store(const common::Context &ctx,
                                                                 const std::string &user_id,
                                                                 const std::string &metadata) {
  if (auto status = ctx.status(); !status.ok()) {
    return common::Result<SessionId>::failure(status);
  }
  if (generator_ == nullptr) {
    return common::Result<SessionId>::failure(common::ErrorCode::NotConfigured,
                                              "memory store has no id generator");
  }

  auto candidate = generator_->generate();
  if (!candidate.ok()) {
    return candidate;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  const auto [it, inserted] = records_.try_emplace(
      to_key(candidate.value()), SessionRecord{.user_id = user_id, .metadata = metadata});
  if (!inserted) {
    return common::Result<SessionId>::failure(common::ErrorCode::Collision, kCollisionMessage);
  }
  return candidate;
}

common::Result<SessionRecord> MemorySessionStore::get(const common::Context &ctx,
                                                      const SessionId &session) {
  if (auto status = ctx.status(); !status.ok()) {
    return common::Result<SessionRecord>::failure(status);
  }

  SessionRecord record;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (const auto it = records_.find(to_key(session)); it != records_.end()) {
      record = it->second;
    }
  }
  observability::record_session_lookup(std::string(name()), !record.empty());
  return common::Result<SessionRecord>::success(std::move(record));
}

std::size_t MemorySessionStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.size();
}

} // namespace sessionkit::sessions
