#include "sessionkit/sessions/id_generator.hpp"

namespace sessionkit::sessions {

RandomSessionIdGenerator::RandomSessionIdGenerator(const std::size_t bytes,
                                                   std::shared_ptr<entropy::IByteSource> source)
    : bytes_(bytes), source_(std::move(source)) {}

common::Result<SessionId> RandomSessionIdGenerator::generate() {
  if (source_ == nullptr) {
    return common::Result<SessionId>::failure(common::ErrorCode::NotConfigured,
                                              "session id generator has no byte source");
  }

  SessionId id(bytes_);
  if (auto status = source_->fill(id.data(), id.size()); !status.ok()) {
    return common::Result<SessionId>::failure(status);
  }
  return common::Result<SessionId>::success(std::move(id));
}

} // namespace sessionkit::sessions
