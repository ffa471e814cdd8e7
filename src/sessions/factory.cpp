#include "sessionkit/sessions/factory.hpp"

#include "sessionkit/common/fs.hpp"
#include "sessionkit/entropy/file_source.hpp"
#include "sessionkit/entropy/openssl_source.hpp"
#include "sessionkit/entropy/seeded_source.hpp"
#include "sessionkit/sessions/memory_store.hpp"
#include "sessionkit/sessions/sqlite_store.hpp"

namespace sessionkit::sessions {

common::Result<std::shared_ptr<entropy::IByteSource>>
create_byte_source(const config::EntropyConfig &config) {
  using R = common::Result<std::shared_ptr<entropy::IByteSource>>;
  const std::string source = common::to_lower(common::trim(config.source));

  if (source.empty() || source == "openssl") {
    return R::success(std::make_shared<entropy::OpenSslByteSource>());
  }
  if (source == "urandom") {
    return R::success(
        std::make_shared<entropy::FileByteSource>(common::expand_path(config.device)));
  }
  if (source == "seeded") {
    return R::success(std::make_shared<entropy::SeededByteSource>(config.seed));
  }
  return R::failure(common::ErrorCode::InvalidArgument, "Unknown entropy source: " + config.source);
}

common::Result<std::shared_ptr<ISessionIdGenerator>>
create_id_generator(const config::Config &config) {
  using R = common::Result<std::shared_ptr<ISessionIdGenerator>>;
  auto source = create_byte_source(config.entropy);
  if (!source.ok()) {
    return R::failure(source.status());
  }
  return R::success(
      std::make_shared<RandomSessionIdGenerator>(config.sessions.id_bytes, source.value()));
}

common::Result<std::unique_ptr<ISessionStorer>> create_session_store(const config::Config &config) {
  using R = common::Result<std::unique_ptr<ISessionStorer>>;
  auto generator = create_id_generator(config);
  if (!generator.ok()) {
    return R::failure(generator.status());
  }

  const std::string backend = common::to_lower(common::trim(config.storage.backend));
  if (backend == "memory") {
    return R::success(std::make_unique<MemorySessionStore>(generator.value()));
  }
  if (backend.empty() || backend == "sqlite") {
    return R::success(std::make_unique<SqliteSessionStore>(
        common::expand_path(config.storage.path), generator.value()));
  }
  return R::failure(common::ErrorCode::InvalidArgument,
                    "Unknown storage backend: " + config.storage.backend);
}

} // namespace sessionkit::sessions
