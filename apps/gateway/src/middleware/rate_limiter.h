#pragma once

#include <cstdint>
#include <kj/async.h>
#include <kj/common.h>
#include <kj/map.h>
#include <kj/memory.h>
#include <kj/mutex.h>
#include <kj/string.h>
#include <kj/time.h>
#include <kj/timer.h>
#include <kj/vector.h>

namespace portico::gateway {

struct RateLimiterConfig {
  /// Requests admitted per key and window.
  uint max_requests = 100;
  kj::Duration window = 60 * kj::SECONDS;
  /// Independent lock domains for the bucket map.
  size_t shards = 16;
};

/**
 * Outcome of one admission check.
 */
struct RateLimitDecision {
  bool allowed;
  uint limit;
  uint remaining;
  kj::Date reset_at;
  /// Set on rejection: time until the current window ends.
  kj::Maybe<kj::Duration> retry_after;
};

struct BucketStats {
  uint count;
  uint remaining;
  kj::Date reset_at;
};

/**
 * Fixed-window request limiter keyed by an arbitrary string (client IP by default).
 *
 * A bucket is created on first use and replaced, not incremented, once its window has
 * elapsed. Requests straddling a window boundary can therefore see up to twice the rate.
 *
 * Buckets are spread over independently locked shards; the create-or-reset-then-increment
 * step for one key happens under its shard lock, as does sweeping, so a sweep never drops a
 * bucket that is being checked.
 */
class RateLimiter {
public:
  explicit RateLimiter(RateLimiterConfig config = {},
                       const kj::Clock& clock = kj::systemPreciseCalendarClock());

  RateLimiter(const RateLimiter&) = delete;
  RateLimiter& operator=(const RateLimiter&) = delete;

  RateLimitDecision check(kj::StringPtr key);

  /// Current bucket for @p key; kj::none when absent or its window has elapsed.
  [[nodiscard]] kj::Maybe<BucketStats> stats(kj::StringPtr key) const;

  bool reset(kj::StringPtr key);
  void reset_all();

  /// Remove buckets whose window has elapsed. @return number removed
  size_t sweep_expired();

  [[nodiscard]] size_t bucket_count() const;

  /**
   * Sweep every @p interval until the returned promise is dropped.
   */
  kj::Promise<void> run_sweeper(kj::Timer& timer, kj::Duration interval);

  [[nodiscard]] const RateLimiterConfig& config() const {
    return config_;
  }

private:
  struct Bucket {
    uint count;
    kj::Date reset_at;
  };

  struct Shard {
    kj::MutexGuarded<kj::HashMap<kj::String, Bucket>> buckets;
  };

  Shard& shard_for(kj::StringPtr key) const;

  RateLimiterConfig config_;
  const kj::Clock& clock_;
  kj::Vector<kj::Own<Shard>> shards_;
};

} // namespace portico::gateway
