#pragma once

#include "portico/core/error.h"
#include "portico/core/listeners.h"

#include <atomic>
#include <cstdint>
#include <kj/async.h>
#include <kj/common.h>
#include <kj/function.h>
#include <kj/mutex.h>
#include <kj/string.h>
#include <kj/time.h>
#include <kj/vector.h>

namespace portico::upstream {

enum class CircuitState {
  Closed,   // Normal operation
  Open,     // Tripped, calls are rejected
  HalfOpen, // Probing whether the backend recovered
};

[[nodiscard]] inline kj::StringPtr to_string(CircuitState state) {
  switch (state) {
  case CircuitState::Closed:
    return "CLOSED"_kj;
  case CircuitState::Open:
    return "OPEN"_kj;
  case CircuitState::HalfOpen:
    return "HALF_OPEN"_kj;
  }
  return "UNKNOWN"_kj;
}

struct CircuitBreakerConfig {
  /// Failures inside the monitoring window that trip the breaker.
  std::size_t failure_threshold = 5;
  /// Time spent OPEN before a trial call is admitted.
  kj::Duration timeout = 60 * kj::SECONDS;
  /// Trailing window in which failures are counted.
  kj::Duration monitoring_period = 60 * kj::SECONDS;
};

struct CircuitEvent {
  enum class Kind { Opened, HalfOpened, Closed, Failure, Reset };

  Kind kind;
  CircuitState from;
  CircuitState to;
  std::size_t failures; // failures inside the window after the change
};

struct CircuitBreakerStats {
  std::atomic<uint64_t> total_requests{0};
  std::atomic<uint64_t> successful_requests{0};
  std::atomic<uint64_t> failed_requests{0};
  std::atomic<uint64_t> rejected_requests{0};
  std::atomic<uint64_t> state_transitions{0};
};

/**
 * @brief Point-in-time view of a breaker
 */
struct CircuitSnapshot {
  CircuitState state;
  std::size_t failures;
  std::size_t half_open_successes;
  /// Remaining OPEN time; kj::none unless OPEN.
  kj::Maybe<kj::Duration> next_attempt_in;
};

/**
 * @brief Failure isolation for one call flow
 *
 * CLOSED trips to OPEN once failure_threshold failures fall inside the monitoring window.
 * OPEN becomes HALF_OPEN lazily at the first admission check after the timeout.
 * HALF_OPEN closes after ceil(threshold / 2) successes and reopens on any failure.
 *
 * State changes are applied under the breaker's lock; listeners are notified afterwards,
 * outside the lock.
 */
class CircuitBreaker final {
public:
  explicit CircuitBreaker(kj::StringPtr name, CircuitBreakerConfig config = {},
                          const kj::MonotonicClock& clock = kj::systemPreciseMonotonicClock());

  /// Admission check. Performs the OPEN -> HALF_OPEN transition when the timeout elapsed.
  [[nodiscard]] bool allow_request();

  void record_success();
  void record_failure();

  /**
   * @brief Run @p operation under breaker protection
   *
   * Rejects with ErrorKind::CircuitOpen without invoking the operation when the call is not
   * admissible. Failures tagged as admission rejections do not count against the breaker.
   * The breaker must outlive the returned promise.
   */
  template <typename T> kj::Promise<T> execute(kj::Function<kj::Promise<T>()> operation);

  // Manual control
  void open();
  void close();
  void reset();

  [[nodiscard]] CircuitState state() const;
  [[nodiscard]] CircuitSnapshot snapshot() const;

  /// Time until the next trial call is admitted, zero unless OPEN.
  [[nodiscard]] kj::Duration retry_after() const;

  core::ListenerId subscribe(kj::Function<void(const CircuitEvent&)> listener) {
    return listeners_.subscribe(kj::mv(listener));
  }
  bool unsubscribe(core::ListenerId id) {
    return listeners_.unsubscribe(id);
  }

  [[nodiscard]] kj::StringPtr name() const noexcept {
    return name_;
  }
  [[nodiscard]] const CircuitBreakerConfig& config() const noexcept {
    return config_;
  }
  [[nodiscard]] const CircuitBreakerStats& stats() const noexcept {
    return stats_;
  }

private:
  struct BreakerState {
    CircuitState state{CircuitState::Closed};
    kj::Vector<kj::TimePoint> failures;
    std::size_t half_open_successes{0};
    kj::TimePoint next_attempt{kj::origin<kj::TimePoint>()};
  };

  using PendingEvents = kj::Vector<CircuitEvent>;

  void prune_failures(BreakerState& state, kj::TimePoint now) const;
  void transition(BreakerState& state, CircuitState to, kj::TimePoint now, PendingEvents& events);
  void publish(PendingEvents& events);
  kj::Exception open_error() const;

  kj::String name_;
  CircuitBreakerConfig config_;
  const kj::MonotonicClock& clock_;
  kj::MutexGuarded<BreakerState> guarded_;
  CircuitBreakerStats stats_;
  core::ListenerSet<CircuitEvent> listeners_;
};

template <typename T>
kj::Promise<T> CircuitBreaker::execute(kj::Function<kj::Promise<T>()> operation) {
  if (!allow_request()) {
    return kj::Promise<T>(open_error());
  }
  return operation().then(
      [this](auto&&... value) -> T {
        record_success();
        return T(kj::fwd<decltype(value)>(value)...);
      },
      [this](kj::Exception&& e) -> T {
        KJ_IF_SOME(kind, core::error_kind(e)) {
          if (core::is_admission_rejection(kind)) {
            kj::throwFatalException(kj::mv(e));
          }
        }
        record_failure();
        kj::throwFatalException(kj::mv(e));
      });
}

} // namespace portico::upstream
