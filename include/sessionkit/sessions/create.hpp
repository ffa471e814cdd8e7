#pragma once

#include "sessionkit/common/context.hpp"
#include "sessionkit/common/result.hpp"
#include "sessionkit/sessions/session.hpp"
#include "sessionkit/sessions/storer.hpp"

#include <string>

namespace sessionkit::sessions {

/// Creates a session, retrying generate_and_store up to `max_attempts` times
/// while the storer reports a collision.
///
/// Any other outcome, success or failure, is returned as-is from the attempt
/// that produced it. When every attempt collides, or `max_attempts <= 0`, the
/// result is a Collision failure with no identifier. `ctx` is only forwarded to
/// the storer.
[[nodiscard]] common::Result<SessionId> create_session(const common::Context &ctx,
                                                       ISessionStorer &storer,
                                                       const std::string &user_id,
                                                       const std::string &metadata,
                                                       int max_attempts);

} // namespace sessionkit::sessions
