#pragma once

#include "sessionkit/entropy/byte_source.hpp"

#include <filesystem>
#include <fstream>
#include <mutex>

namespace sessionkit::entropy {

/// Reads bytes from a device or file, `/dev/urandom` by default. Reaching end of
/// file before the buffer is full is a short read and fails the call.
class FileByteSource final : public IByteSource {
public:
  explicit FileByteSource(std::filesystem::path path = "/dev/urandom");

  [[nodiscard]] common::Status fill(unsigned char *data, std::size_t size) override;
  [[nodiscard]] std::string_view name() const override { return "file"; }
  [[nodiscard]] const std::filesystem::path &path() const { return path_; }

private:
  std::filesystem::path path_;
  std::ifstream stream_;
  std::mutex mutex_;
};

} // namespace sessionkit::entropy
