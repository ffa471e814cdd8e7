#pragma once

#include "sessionkit/entropy/byte_source.hpp"

#include <cstdint>
#include <mutex>
#include <random>

namespace sessionkit::entropy {

/// Deterministic mt19937_64 stream. Not suitable for production identifiers.
class SeededByteSource final : public IByteSource {
public:
  explicit SeededByteSource(std::uint64_t seed);

  [[nodiscard]] common::Status fill(unsigned char *data, std::size_t size) override;
  [[nodiscard]] std::string_view name() const override { return "seeded"; }

private:
  std::mt19937_64 engine_;
  std::mutex mutex_;
};

} // namespace sessionkit::entropy
