#include "middleware/rate_limiter.h"

#include <kj/debug.h>
#include <kj/hash.h>

namespace portico::gateway {

RateLimiter::RateLimiter(RateLimiterConfig config, const kj::Clock& clock)
    : config_(kj::mv(config)), clock_(clock) {
  KJ_REQUIRE(config_.window > 0 * kj::SECONDS, "rate limit window must be positive");
  if (config_.shards == 0) {
    config_.shards = 1;
  }
  shards_.reserve(config_.shards);
  for (size_t i = 0; i < config_.shards; ++i) {
    shards_.add(kj::heap<Shard>());
  }
}

RateLimiter::Shard& RateLimiter::shard_for(kj::StringPtr key) const {
  return *shards_[kj::hashCode(key) % shards_.size()];
}

RateLimitDecision RateLimiter::check(kj::StringPtr key) {
  auto now = clock_.now();
  auto lock = shard_for(key).buckets.lockExclusive();

  auto& bucket = lock->findOrCreate(key, [&]() {
    return kj::HashMap<kj::String, Bucket>::Entry{kj::str(key), Bucket{0, now + config_.window}};
  });
  if (bucket.reset_at <= now) {
    bucket = Bucket{0, now + config_.window};
  }

  if (bucket.count < config_.max_requests) {
    ++bucket.count;
    return RateLimitDecision{true, config_.max_requests, config_.max_requests - bucket.count,
                             bucket.reset_at, kj::none};
  }

  return RateLimitDecision{false, config_.max_requests, 0, bucket.reset_at,
                           bucket.reset_at - now};
}

kj::Maybe<BucketStats> RateLimiter::stats(kj::StringPtr key) const {
  auto now = clock_.now();
  auto lock = shard_for(key).buckets.lockShared();
  KJ_IF_SOME(bucket, lock->find(key)) {
    if (bucket.reset_at <= now) {
      return kj::none;
    }
    return BucketStats{bucket.count, config_.max_requests - bucket.count, bucket.reset_at};
  }
  return kj::none;
}

bool RateLimiter::reset(kj::StringPtr key) {
  return shard_for(key).buckets.lockExclusive()->erase(key);
}

void RateLimiter::reset_all() {
  for (auto& shard : shards_) {
    shard->buckets.lockExclusive()->clear();
  }
}

size_t RateLimiter::sweep_expired() {
  auto now = clock_.now();
  size_t removed = 0;
  for (auto& shard : shards_) {
    auto lock = shard->buckets.lockExclusive();
    removed += lock->eraseAll(
        [now](const kj::String&, const Bucket& bucket) { return bucket.reset_at <= now; });
  }
  return removed;
}

size_t RateLimiter::bucket_count() const {
  size_t total = 0;
  for (auto& shard : shards_) {
    total += shard->buckets.lockShared()->size();
  }
  return total;
}

kj::Promise<void> RateLimiter::run_sweeper(kj::Timer& timer, kj::Duration interval) {
  for (;;) {
    co_await timer.afterDelay(interval);
    auto removed = sweep_expired();
    if (removed > 0) {
      KJ_LOG(DBG, "Swept expired rate limit buckets", removed, bucket_count());
    }
  }
}

} // namespace portico::gateway
