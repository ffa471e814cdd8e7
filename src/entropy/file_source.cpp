#include "sessionkit/entropy/file_source.hpp"

#include <string>

namespace sessionkit::entropy {

FileByteSource::FileByteSource(std::filesystem::path path)
    : path_(std::move(path)), stream_(path_, std::ios::binary) {}

common::Status FileByteSource::fill(unsigned char *data, const std::size_t size) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!stream_.is_open()) {
    return common::Status::error(common::ErrorCode::Source,
                                 "unable to open entropy source: " + path_.string());
  }
  if (size == 0) {
    return common::Status::success();
  }

  stream_.read(reinterpret_cast<char *>(data), static_cast<std::streamsize>(size));
  const auto got = static_cast<std::size_t>(stream_.gcount());
  if (got != size) {
    stream_.clear();
    return common::Status::error(common::ErrorCode::Source,
                                 "short read from " + path_.string() + ": wanted " +
                                     std::to_string(size) + " bytes, got " +
                                     std::to_string(got));
  }
  return common::Status::success();
}

} // namespace sessionkit::entropy
