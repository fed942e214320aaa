#include "cachekit/context.hpp"

#include <algorithm>
#include <atomic>

namespace cachekit {

struct Context::State {
  std::shared_ptr<State> parent;
  std::atomic<bool> canceled{false};
  std::optional<TimePoint> deadline;
};

Context Context::with_cancel() const {
  auto s = std::make_shared<State>();
  s->parent = state_;
  return Context(std::move(s));
}

Context Context::with_timeout(Duration timeout) const {
  return with_deadline(Clock::now() + timeout);
}

Context Context::with_deadline(TimePoint deadline) const {
  auto s = std::make_shared<State>();
  s->parent = state_;
  s->deadline = deadline;
  return Context(std::move(s));
}

void Context::cancel() const {
  if (state_)
    state_->canceled.store(true, std::memory_order_release);
}

ErrorCode Context::err() const {
  const auto now = Clock::now();
  for (auto s = state_.get(); s != nullptr; s = s->parent.get()) {
    if (s->canceled.load(std::memory_order_acquire))
      return ErrorCode::Canceled;
    if (s->deadline.has_value() && now >= *s->deadline)
      return ErrorCode::DeadlineExceeded;
  }
  return ErrorCode::None;
}

std::optional<TimePoint> Context::deadline() const {
  std::optional<TimePoint> out;
  for (auto s = state_.get(); s != nullptr; s = s->parent.get()) {
    if (!s->deadline.has_value())
      continue;
    out = out.has_value() ? std::min(*out, *s->deadline) : *s->deadline;
  }
  return out;
}

bool Context::check(std::string_view op, const std::string &key,
                    Error *err) const {
  const auto code = this->err();
  if (code == ErrorCode::None)
    return true;
  if (err)
    *err = make_error(code, op, key);
  return false;
}

} // namespace cachekit
