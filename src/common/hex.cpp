#include "sessionkit/common/hex.hpp"

#include <iomanip>
#include <sstream>

namespace sessionkit::common {

namespace {

int hex_value(const char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  return -1;
}

} // namespace

std::string to_hex(const std::vector<unsigned char> &bytes) {
  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (const auto byte : bytes) {
    stream << std::setw(2) << static_cast<int>(byte);
  }
  return stream.str();
}

Result<std::vector<unsigned char>> from_hex(const std::string &text) {
  using R = Result<std::vector<unsigned char>>;
  if (text.size() % 2 != 0) {
    return R::failure(ErrorCode::InvalidArgument, "hex string has odd length");
  }

  std::vector<unsigned char> out;
  out.reserve(text.size() / 2);
  for (std::size_t i = 0; i < text.size(); i += 2) {
    const int hi = hex_value(text[i]);
    const int lo = hex_value(text[i + 1]);
    if (hi < 0 || lo < 0) {
      return R::failure(ErrorCode::InvalidArgument,
                        "invalid hex character at offset " + std::to_string(hi < 0 ? i : i + 1));
    }
    out.push_back(static_cast<unsigned char>((hi << 4) | lo));
  }
  return R::success(std::move(out));
}

} // namespace sessionkit::common
