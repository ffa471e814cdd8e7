#include "sessionkit/common/context.hpp"

namespace sessionkit::common {

Context Context::background() { return Context(std::make_shared<State>()); }

Context Context::with_cancel() const {
  auto child = std::make_shared<State>();
  child->deadline = state_->deadline;
  child->parent = state_;
  return Context(std::move(child));
}

Context Context::with_timeout(const Clock::duration timeout) const {
  return with_deadline(Clock::now() + timeout);
}

Context Context::with_deadline(const Clock::time_point deadline) const {
  auto child = std::make_shared<State>();
  child->deadline = state_->deadline.has_value() && *state_->deadline < deadline
                        ? *state_->deadline
                        : deadline;
  child->parent = state_;
  return Context(std::move(child));
}

void Context::cancel() const { state_->cancelled.store(true, std::memory_order_release); }

bool Context::cancelled() const {
  for (const State *state = state_.get(); state != nullptr; state = state->parent.get()) {
    if (state->cancelled.load(std::memory_order_acquire)) {
      return true;
    }
  }
  return false;
}

bool Context::done() const { return !status().ok(); }

std::optional<Context::Clock::time_point> Context::deadline() const { return state_->deadline; }

Status Context::status() const {
  if (cancelled()) {
    return Status::error(ErrorCode::Cancelled, "context cancelled");
  }
  if (state_->deadline.has_value() && Clock::now() >= *state_->deadline) {
    return Status::error(ErrorCode::DeadlineExceeded, "context deadline exceeded");
  }
  return Status::success();
}

} // namespace sessionkit::common
