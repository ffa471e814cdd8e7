#pragma once

#include "sessionkit/common/result.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

namespace sessionkit::common {

/// Cancellation and deadline token handed to storage calls.
///
/// Copies share state. A derived context is cancelled when it or any ancestor is
/// cancelled, and its deadline is never later than its parent's. Cancelling a
/// derived context leaves the parent untouched.
class Context {
public:
  using Clock = std::chrono::steady_clock;

  [[nodiscard]] static Context background();

  [[nodiscard]] Context with_cancel() const;
  [[nodiscard]] Context with_timeout(Clock::duration timeout) const;
  [[nodiscard]] Context with_deadline(Clock::time_point deadline) const;

  void cancel() const;

  [[nodiscard]] bool done() const;
  [[nodiscard]] std::optional<Clock::time_point> deadline() const;

  /// Success while the context is live, otherwise Cancelled or DeadlineExceeded.
  [[nodiscard]] Status status() const;

private:
  struct State {
    std::atomic<bool> cancelled{false};
    std::optional<Clock::time_point> deadline;
    std::shared_ptr<const State> parent;
  };

  explicit Context(std::shared_ptr<State> state) : state_(std::move(state)) {}

  [[nodiscard]] bool cancelled() const;

  std::shared_ptr<State> state_;
};

} // namespace sessionkit::common
