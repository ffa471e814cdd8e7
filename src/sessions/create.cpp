#include "sessionkit/sessions/create.hpp"

#include "sessionkit/observability/global.hpp"

#include <chrono>

namespace sessionkit::sessions {

common::Result<SessionId> create_session(const common::Context &ctx, ISessionStorer &storer,
                                         const std::string &user_id,
                                         const std::string &metadata, const int max_attempts) {
  const auto started = std::chrono::steady_clock::now();
  const std::string backend(storer.name());

  for (int attempt = 0; attempt < max_attempts; ++attempt) {
    auto result = storer.generate_and_store(ctx, user_id, metadata);
    if (result.is(common::ErrorCode::Collision)) {
      observability::record_session_collision(backend, static_cast<std::uint32_t>(attempt + 1));
      continue;
    }

    const auto attempts = static_cast<std::uint32_t>(attempt + 1);
    observability::record_metric(observability::CreateAttemptsMetric{.attempts = attempts});
    if (result.ok()) {
      observability::record_session_created(backend, result.value().size(), attempts);
      observability::record_metric(observability::CreateLatencyMetric{
          .latency = std::chrono::duration_cast<std::chrono::microseconds>(
              std::chrono::steady_clock::now() - started)});
    } else {
      observability::record_error("sessions.create", result.error());
    }
    return result;
  }

  observability::record_error("sessions.create",
                              "gave up after " + std::to_string(max_attempts > 0 ? max_attempts : 0) +
                                  " colliding attempts");
  return common::Result<SessionId>::failure(common::ErrorCode::Collision, kCollisionMessage);
}

} // namespace sessionkit::sessions
