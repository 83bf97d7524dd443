#pragma once

#include <chrono>
#include <memory>
#include <mutex>

#include "internal/util/time.hpp"

namespace workledger::testing {

// Clock the tests advance by hand; copies share the same time.
class ManualClock {
 public:
  ManualClock() : state_(std::make_shared<State>()) {
    state_->now = util::FromUnixMillis(1'700'000'000'000ull);
  }

  util::TimePoint Now() const {
    std::lock_guard lock(state_->mutex);
    return state_->now;
  }

  void Advance(std::chrono::milliseconds delta) {
    std::lock_guard lock(state_->mutex);
    state_->now += delta;
  }

  util::ClockFn Fn() const {
    auto state = state_;
    return [state] {
      std::lock_guard lock(state->mutex);
      return state->now;
    };
  }

 private:
  struct State {
    std::mutex      mutex;
    util::TimePoint now;
  };
  std::shared_ptr<State> state_;
};

} // namespace workledger::testing
