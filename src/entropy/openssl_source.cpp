#include "sessionkit/entropy/openssl_source.hpp"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <algorithm>
#include <climits>
#include <string>

namespace sessionkit::entropy {

namespace {

std::string last_openssl_error() {
  const unsigned long code = ERR_get_error();
  if (code == 0) {
    return "RAND_bytes failed";
  }
  char buffer[256];
  ERR_error_string_n(code, buffer, sizeof(buffer));
  return buffer;
}

} // namespace

common::Status OpenSslByteSource::fill(unsigned char *data, const std::size_t size) {
  std::size_t offset = 0;
  while (offset < size) {
    const auto chunk = static_cast<int>(std::min<std::size_t>(size - offset, INT_MAX));
    if (RAND_bytes(data + offset, chunk) != 1) {
      return common::Status::error(common::ErrorCode::Source,
                                   "openssl entropy: " + last_openssl_error());
    }
    offset += static_cast<std::size_t>(chunk);
  }
  return common::Status::success();
}

} // namespace sessionkit::entropy
