#pragma once

#include "cachekit/error.hpp"
#include "cachekit/types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace cachekit {

// Cancellation and deadline signal passed to every cache operation.
// Copies share state; a derived context is done when it or any of its
// ancestors is canceled or past its deadline.
class Context {
public:
  Context() = default;

  static Context background() { return Context(); }

  Context with_cancel() const;
  Context with_timeout(Duration timeout) const;
  Context with_deadline(TimePoint deadline) const;

  // No effect on a background context.
  void cancel() const;

  bool done() const { return err() != ErrorCode::None; }
  ErrorCode err() const;
  std::optional<TimePoint> deadline() const;

  // Fills *err and returns false when the context is already done.
  bool check(std::string_view op, const std::string &key = {},
             Error *err = nullptr) const;

private:
  struct State;
  explicit Context(std::shared_ptr<State> state) : state_(std::move(state)) {}

  std::shared_ptr<State> state_;
};

} // namespace cachekit
