#include "test_helpers.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <random>

namespace sessionkit::testing {

ScriptedByteSource::ScriptedByteSource(std::vector<std::vector<unsigned char>> chunks)
    : chunks_(std::move(chunks)) {}

common::Status ScriptedByteSource::fill(unsigned char *data, const std::size_t size) {
  std::lock_guard<std::mutex> lock(mutex_);
  ++fills_;
  if (next_ >= chunks_.size()) {
    return common::Status::error(common::ErrorCode::Source, "scripted source exhausted");
  }
  const auto &chunk = chunks_[next_++];
  if (chunk.size() != size) {
    return common::Status::error(common::ErrorCode::Source, "scripted chunk size mismatch");
  }
  std::copy(chunk.begin(), chunk.end(), data);
  return common::Status::success();
}

common::Status FailingByteSource::fill(unsigned char *data, const std::size_t size) {
  // Scribble over the buffer so a caller that keeps it would be noticed.
  std::fill(data, data + size, static_cast<unsigned char>(0xAA));
  return common::Status::error(common::ErrorCode::Source, message_);
}

StubStorer::StubStorer(Behavior behavior) : behavior_(std::move(behavior)) {}

common::Result<sessions::SessionId> StubStorer::generate_and_store(const common::Context &,
                                                                   const std::string &,
                                                                   const std::string &) {
  const std::size_t call = ++calls_;
  return behavior_(call);
}

common::Result<sessions::SessionRecord> StubStorer::get(const common::Context &,
                                                        const sessions::SessionId &session) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (const auto it = records_.find(session); it != records_.end()) {
    return common::Result<sessions::SessionRecord>::success(it->second);
  }
  return common::Result<sessions::SessionRecord>::success(sessions::SessionRecord{});
}

void StubStorer::put(const sessions::SessionId &id, sessions::SessionRecord record) {
  std::lock_guard<std::mutex> lock(mutex_);
  records_[id] = std::move(record);
}

common::Result<sessions::SessionId> CountingStorer::generate_and_store(const common::Context &ctx,
                                                                       const std::string &user_id,
                                                                       const std::string &metadata) {
  ++calls_;
  return inner_.generate_and_store(ctx, user_id, metadata);
}

common::Result<sessions::SessionRecord> CountingStorer::get(const common::Context &ctx,
                                                            const sessions::SessionId &session) {
  return inner_.get(ctx, session);
}

void CapturingObserver::record_event(const observability::ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);
  out_->events.push_back(event);
}

void CapturingObserver::record_metric(const observability::ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(mutex_);
  out_->metrics.push_back(metric);
}

TempDir::TempDir() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() / ("sessionkit-test-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
}

TempDir::~TempDir() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

void TempDir::write_file(const std::string &name, const std::string &content) const {
  const auto file_path = path_ / name;
  std::filesystem::create_directories(file_path.parent_path());
  std::ofstream file(file_path, std::ios::binary | std::ios::trunc);
  file << content;
}

EnvGuard::EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
  if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
    old_value = existing;
  }
  if (value.has_value()) {
    setenv(key.c_str(), value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

EnvGuard::~EnvGuard() {
  if (old_value.has_value()) {
    setenv(key.c_str(), old_value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

sessions::SessionId bytes(std::initializer_list<unsigned char> values) {
  return sessions::SessionId(values);
}

} // namespace sessionkit::testing
