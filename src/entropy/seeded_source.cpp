#include "sessionkit/entropy/seeded_source.hpp"

namespace sessionkit::entropy {

SeededByteSource::SeededByteSource(const std::uint64_t seed) : engine_(seed) {}

common::Status SeededByteSource::fill(unsigned char *data, const std::size_t size) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (std::size_t i = 0; i < size; i += 8) {
    std::uint64_t word = engine_();
    for (std::size_t j = i; j < size && j < i + 8; ++j) {
      data[j] = static_cast<unsigned char>(word & 0xffU);
      word >>= 8;
    }
  }
  return common::Status::success();
}

} // namespace sessionkit::entropy
