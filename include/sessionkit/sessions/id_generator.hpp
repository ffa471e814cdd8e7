#pragma once

#include "sessionkit/common/result.hpp"
#include "sessionkit/entropy/byte_source.hpp"
#include "sessionkit/sessions/session.hpp"

#include <memory>

namespace sessionkit::sessions {

class ISessionIdGenerator {
public:
  virtual ~ISessionIdGenerator() = default;

  [[nodiscard]] virtual common::Result<SessionId> generate() = 0;
  [[nodiscard]] virtual std::size_t id_bytes() const = 0;
};

/// Draws fixed-length identifiers from a byte source. Source failures are
/// returned unchanged and the partial buffer is dropped.
class RandomSessionIdGenerator final : public ISessionIdGenerator {
public:
  RandomSessionIdGenerator(std::size_t bytes, std::shared_ptr<entropy::IByteSource> source);

  [[nodiscard]] common::Result<SessionId> generate() override;
  [[nodiscard]] std::size_t id_bytes() const override { return bytes_; }

private:
  std::size_t bytes_;
  std::shared_ptr<entropy::IByteSource> source_;
};

} // namespace sessionkit::sessions
