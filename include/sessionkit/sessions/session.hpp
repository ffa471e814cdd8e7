#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace sessionkit::sessions {

/// Opaque identifier. Uniqueness inside one storage backend is the only invariant.
using SessionId = std::vector<unsigned char>;

/// 128 bits; shorter identifiers are easier to guess.
constexpr std::size_t kRecommendedMinIdBytes = 16;

constexpr const char *kCollisionMessage =
    "unable to store session, existing session ID already exists";

struct SessionRecord {
  std::string user_id;
  std::string metadata;

  /// Lookups of unknown identifiers yield an empty record rather than an error.
  [[nodiscard]] bool empty() const { return user_id.empty() && metadata.empty(); }
};

} // namespace sessionkit::sessions
