#pragma once

#include "sessionkit/sessions/id_generator.hpp"
#include "sessionkit/sessions/storer.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace sessionkit::sessions {

/// Process-local storer backed by a hash map. Contents are lost on destruction.
class MemorySessionStore final : public ISessionStorer {
public:
  explicit MemorySessionStore(std::shared_ptr<ISessionIdGenerator> generator);

  [[nodiscard]] common::Result<SessionId> generate_and_store(const common::Context &ctx,
                                                             const std::string &user_id,
                                                             const std::string &metadata) override;
  [[nodiscard]] common::Result<SessionRecord> get(const common::Context &ctx,
                                                  const SessionId &session) override;
  [[nodiscard]] std::string_view name() const override { return "memory"; }

  [[nodiscard]] std::size_t size() const;

private:
  std::shared_ptr<ISessionIdGenerator> generator_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, SessionRecord> records_;
};

} // namespace sessionkit::sessions
