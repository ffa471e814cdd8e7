#pragma once

#include "sessionkit/entropy/byte_source.hpp"
#include "sessionkit/observability/observer.hpp"
#include "sessionkit/sessions/storer.hpp"

#include <atomic>
#include <filesystem>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sessionkit::testing {

/// Hands out the queued chunks in order, one per fill. A size mismatch or an
/// exhausted queue fails with ErrorCode::Source.
class ScriptedByteSource final : public entropy::IByteSource {
public:
  explicit ScriptedByteSource(std::vector<std::vector<unsigned char>> chunks);

  [[nodiscard]] common::Status fill(unsigned char *data, std::size_t size) override;
  [[nodiscard]] std::string_view name() const override { return "scripted"; }
  [[nodiscard]] std::size_t fills() const { return fills_; }

private:
  std::vector<std::vector<unsigned char>> chunks_;
  std::size_t next_ = 0;
  std::size_t fills_ = 0;
  std::mutex mutex_;
};

class FailingByteSource final : public entropy::IByteSource {
public:
  explicit FailingByteSource(std::string message) : message_(std::move(message)) {}

  [[nodiscard]] common::Status fill(unsigned char *data, std::size_t size) override;
  [[nodiscard]] std::string_view name() const override { return "failing"; }

private:
  std::string message_;
};

/// Storer whose generate_and_store outcome is decided by a callback taking the
/// 1-based call number. get answers from records added with put().
class StubStorer final : public sessions::ISessionStorer {
public:
  using Behavior = std::function<common::Result<sessions::SessionId>(std::size_t call)>;

  explicit StubStorer(Behavior behavior);

  [[nodiscard]] common::Result<sessions::SessionId>
  generate_and_store(const common::Context &ctx, const std::string &user_id,
                     const std::string &metadata) override;
  [[nodiscard]] common::Result<sessions::SessionRecord> get(const common::Context &ctx,
                                                            const sessions::SessionId &session) override;
  [[nodiscard]] std::string_view name() const override { return "stub"; }

  void put(const sessions::SessionId &id, sessions::SessionRecord record);
  [[nodiscard]] std::size_t calls() const { return calls_.load(); }

private:
  Behavior behavior_;
  std::atomic<std::size_t> calls_{0};
  std::mutex mutex_;
  std::map<sessions::SessionId, sessions::SessionRecord> records_;
};

/// Forwards to another storer and counts generate_and_store calls.
class CountingStorer final : public sessions::ISessionStorer {
public:
  explicit CountingStorer(sessions::ISessionStorer &inner) : inner_(inner) {}

  [[nodiscard]] common::Result<sessions::SessionId>
  generate_and_store(const common::Context &ctx, const std::string &user_id,
                     const std::string &metadata) override;
  [[nodiscard]] common::Result<sessions::SessionRecord> get(const common::Context &ctx,
                                                            const sessions::SessionId &session) override;
  [[nodiscard]] std::string_view name() const override { return inner_.name(); }

  [[nodiscard]] std::size_t calls() const { return calls_.load(); }

private:
  sessions::ISessionStorer &inner_;
  std::atomic<std::size_t> calls_{0};
};

class CapturingObserver final : public observability::IObserver {
public:
  struct Captured {
    std::vector<observability::ObserverEvent> events;
    std::vector<observability::ObserverMetric> metrics;
  };

  explicit CapturingObserver(Captured *out) : out_(out) {}

  void record_event(const observability::ObserverEvent &event) override;
  void record_metric(const observability::ObserverMetric &metric) override;
  [[nodiscard]] std::string_view name() const override { return "capturing"; }

private:
  Captured *out_ = nullptr;
  std::mutex mutex_;
};

class TempDir {
public:
  TempDir();
  ~TempDir();

  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  void write_file(const std::string &name, const std::string &content) const;

private:
  std::filesystem::path path_;
};

struct EnvGuard {
  std::string key;
  std::optional<std::string> old_value;

  EnvGuard(std::string key_, std::optional<std::string> value);
  ~EnvGuard();
};

[[nodiscard]] sessions::SessionId bytes(std::initializer_list<unsigned char> values);

} // namespace sessionkit::testing
