#include "portico/upstream/circuit_breaker.h"

#include <kj/debug.h>

namespace portico::upstream {

CircuitBreaker::CircuitBreaker(kj::StringPtr name, CircuitBreakerConfig config,
                               const kj::MonotonicClock& clock)
    : name_(kj::heapString(name)), config_(config), clock_(clock) {
  KJ_REQUIRE(config_.failure_threshold > 0, "circuit breaker threshold must be positive", name);
}

bool CircuitBreaker::allow_request() {
  PendingEvents events;
  bool allowed = true;
  {
    auto lock = guarded_.lockExclusive();
    stats_.total_requests++;
    if (lock->state == CircuitState::Open) {
      auto now = clock_.now();
      if (now >= lock->next_attempt) {
        transition(*lock, CircuitState::HalfOpen, now, events);
      } else {
        stats_.rejected_requests++;
        allowed = false;
      }
    }
  }
  publish(events);
  return allowed;
}

void CircuitBreaker::record_success() {
  PendingEvents events;
  {
    auto lock = guarded_.lockExclusive();
    stats_.successful_requests++;
    auto now = clock_.now();
    if (lock->state == CircuitState::HalfOpen) {
      lock->half_open_successes++;
      if (lock->half_open_successes >= (config_.failure_threshold + 1) / 2) {
        transition(*lock, CircuitState::Closed, now, events);
      }
    } else if (lock->state == CircuitState::Closed) {
      prune_failures(*lock, now);
    }
  }
  publish(events);
}

void CircuitBreaker::record_failure() {
  PendingEvents events;
  {
    auto lock = guarded_.lockExclusive();
    stats_.failed_requests++;
    auto now = clock_.now();
    lock->failures.add(now);
    prune_failures(*lock, now);

    if (lock->state == CircuitState::HalfOpen) {
      transition(*lock, CircuitState::Open, now, events);
    } else if (lock->state == CircuitState::Closed &&
               lock->failures.size() >= config_.failure_threshold) {
      transition(*lock, CircuitState::Open, now, events);
    }

    events.add(CircuitEvent{CircuitEvent::Kind::Failure, lock->state, lock->state,
                            lock->failures.size()});
  }
  publish(events);
}

void CircuitBreaker::open() {
  PendingEvents events;
  {
    auto lock = guarded_.lockExclusive();
    transition(*lock, CircuitState::Open, clock_.now(), events);
  }
  publish(events);
}

void CircuitBreaker::close() {
  PendingEvents events;
  {
    auto lock = guarded_.lockExclusive();
    transition(*lock, CircuitState::Closed, clock_.now(), events);
  }
  publish(events);
}

void CircuitBreaker::reset() {
  PendingEvents events;
  {
    auto lock = guarded_.lockExclusive();
    CircuitState from = lock->state;
    *lock = BreakerState{};
    events.add(CircuitEvent{CircuitEvent::Kind::Reset, from, CircuitState::Closed, 0});
  }
  publish(events);
}

CircuitState CircuitBreaker::state() const {
  return guarded_.lockShared()->state;
}

CircuitSnapshot CircuitBreaker::snapshot() const {
  auto lock = guarded_.lockShared();
  auto now = clock_.now();
  std::size_t failures = 0;
  for (auto t : lock->failures) {
    if (now - t < config_.monitoring_period) {
      ++failures;
    }
  }

  CircuitSnapshot result{lock->state, failures, lock->half_open_successes, kj::none};
  if (lock->state == CircuitState::Open) {
    result.next_attempt_in = lock->next_attempt > now ? lock->next_attempt - now : 0 * kj::SECONDS;
  }
  return result;
}

kj::Duration CircuitBreaker::retry_after() const {
  auto lock = guarded_.lockShared();
  if (lock->state != CircuitState::Open) {
    return 0 * kj::SECONDS;
  }
  auto now = clock_.now();
  return lock->next_attempt > now ? lock->next_attempt - now : 0 * kj::SECONDS;
}

void CircuitBreaker::prune_failures(BreakerState& state, kj::TimePoint now) const {
  size_t keep_from = 0;
  while (keep_from < state.failures.size() &&
         now - state.failures[keep_from] >= config_.monitoring_period) {
    ++keep_from;
  }
  if (keep_from == 0) {
    return;
  }
  kj::Vector<kj::TimePoint> kept(state.failures.size() - keep_from);
  for (size_t i = keep_from; i < state.failures.size(); ++i) {
    kept.add(state.failures[i]);
  }
  state.failures = kj::mv(kept);
}

void CircuitBreaker::transition(BreakerState& state, CircuitState to, kj::TimePoint now,
                                PendingEvents& events) {
  CircuitState from = state.state;
  state.state = to;
  stats_.state_transitions++;

  CircuitEvent::Kind kind = CircuitEvent::Kind::Closed;
  switch (to) {
  case CircuitState::Open:
    state.next_attempt = now + config_.timeout;
    kind = CircuitEvent::Kind::Opened;
    KJ_LOG(WARNING, "circuit opened", name_, state.failures.size());
    break;
  case CircuitState::HalfOpen:
    state.half_open_successes = 0;
    kind = CircuitEvent::Kind::HalfOpened;
    KJ_LOG(INFO, "circuit half-open", name_);
    break;
  case CircuitState::Closed:
    state.failures.clear();
    state.half_open_successes = 0;
    state.next_attempt = kj::origin<kj::TimePoint>();
    kind = CircuitEvent::Kind::Closed;
    KJ_LOG(INFO, "circuit closed", name_);
    break;
  }

  events.add(CircuitEvent{kind, from, to, state.failures.size()});
}

void CircuitBreaker::publish(PendingEvents& events) {
  for (auto& event : events) {
    listeners_.notify(event);
  }
}

kj::Exception CircuitBreaker::open_error() const {
  return core::make_error(core::ErrorKind::CircuitOpen,
                          kj::str("circuit breaker is OPEN for ", name_), retry_after());
}

} // namespace portico::upstream
