#pragma once

#include "sessionkit/common/context.hpp"
#include "sessionkit/common/result.hpp"
#include "sessionkit/sessions/session.hpp"

#include <string>
#include <string_view>

namespace sessionkit::sessions {

/// Backend contract for session persistence.
///
/// Implementations must be safe for concurrent use and must make the
/// create-if-absent step of generate_and_store atomic.
class ISessionStorer {
public:
  virtual ~ISessionStorer() = default;

  /// Mints a candidate identifier (normally through an ISessionIdGenerator) and
  /// stores `id -> (user_id, metadata)`.
  ///
  /// Fails with ErrorCode::Collision if and only if the candidate already exists.
  /// Every other failure must use a different code.
  [[nodiscard]] virtual common::Result<SessionId>
  generate_and_store(const common::Context &ctx, const std::string &user_id,
                     const std::string &metadata) = 0;

  /// Resolves an identifier produced by generate_and_store. An unknown
  /// identifier is not an error: the record comes back with both fields empty.
  /// Failures are reserved for real problems such as an unavailable backend.
  [[nodiscard]] virtual common::Result<SessionRecord> get(const common::Context &ctx,
                                                          const SessionId &session) = 0;

  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace sessionkit::sessions
