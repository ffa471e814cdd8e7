#pragma once

#include "sessionkit/common/result.hpp"

#include <string>
#include <vector>

namespace sessionkit::common {

[[nodiscard]] std::string to_hex(const std::vector<unsigned char> &bytes);

/// Accepts upper- or lowercase digits. Odd length or a non-hex character is an
/// InvalidArgument failure.
[[nodiscard]] Result<std::vector<unsigned char>> from_hex(const std::string &text);

} // namespace sessionkit::common
