#pragma once

#include "sessionkit/common/result.hpp"

#include <cstddef>
#include <string_view>

namespace sessionkit::entropy {

/// Fills caller buffers with bytes. Implementations may be stateful and must be
/// safe to call from several threads.
class IByteSource {
public:
  virtual ~IByteSource() = default;

  /// Writes exactly `size` bytes to `data` or fails with ErrorCode::Source. On
  /// failure the buffer contents are unspecified.
  [[nodiscard]] virtual common::Status fill(unsigned char *data, std::size_t size) = 0;
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace sessionkit::entropy
