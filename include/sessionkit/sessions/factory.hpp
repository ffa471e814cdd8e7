#pragma once

#include "sessionkit/common/result.hpp"
#include "sessionkit/config/schema.hpp"
#include "sessionkit/entropy/byte_source.hpp"
#include "sessionkit/sessions/id_generator.hpp"
#include "sessionkit/sessions/storer.hpp"

#include <memory>

namespace sessionkit::sessions {

[[nodiscard]] common::Result<std::shared_ptr<entropy::IByteSource>>
create_byte_source(const config::EntropyConfig &config);

[[nodiscard]] common::Result<std::shared_ptr<ISessionIdGenerator>>
create_id_generator(const config::Config &config);

[[nodiscard]] common::Result<std::unique_ptr<ISessionStorer>>
create_session_store(const config::Config &config);

} // namespace sessionkit::sessions
