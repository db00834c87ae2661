#pragma once

#include "middleware.h"
#include "middleware/rate_limiter.h"
#include "portico/core/metrics.h"

#include <kj/function.h>
#include <kj/memory.h>
#include <kj/string.h>

namespace portico::gateway {

struct RateLimitOptions {
  /// Bucket key for a request; the client IP when unset.
  kj::Maybe<kj::Function<kj::String(const RequestContext&)>> key_extractor;
  /// Requests for which this returns true bypass the limiter entirely.
  kj::Maybe<kj::Function<bool(const RequestContext&)>> skip;
  uint status_code = 429;
  kj::String message = kj::str("Too many requests");
};

/**
 * Rate limiting middleware.
 *
 * Sets X-RateLimit-Limit, X-RateLimit-Remaining and X-RateLimit-Reset on every checked
 * request. Rejected requests are answered here with Retry-After and never reach the router.
 */
class RateLimitMiddleware final : public Middleware {
public:
  RateLimitMiddleware(kj::Own<RateLimiter> limiter, core::MetricsRegistry& metrics,
                      RateLimitOptions options = {});

  kj::Promise<void> process(RequestContext& ctx, kj::Function<kj::Promise<void>()> next) override;

  kj::StringPtr name() const override {
    return "rate_limit"_kj;
  }

  RateLimiter& limiter() {
    return *limiter_;
  }

private:
  kj::String key_for(const RequestContext& ctx);

  kj::Own<RateLimiter> limiter_;
  RateLimitOptions options_;
  core::Counter& rejected_;
};

} // namespace portico::gateway
