#pragma once

#include "sessionkit/entropy/byte_source.hpp"

namespace sessionkit::entropy {

class OpenSslByteSource final : public IByteSource {
public:
  [[nodiscard]] common::Status fill(unsigned char *data, std::size_t size) override;
  [[nodiscard]] std::string_view name() const override { return "openssl"; }
};

} // namespace sessionkit::entropy
