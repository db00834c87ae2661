#pragma once

#include "middleware.h"
#include "portico/core/metrics.h"
#include "portico/upstream/circuit_breaker.h"

#include <kj/memory.h>

namespace portico::gateway {

/**
 * Guards everything after it in the chain with one circuit breaker.
 *
 * While the breaker rejects, requests are answered 503 with Retry-After. A response status
 * of 500 or above, or a thrown failure, counts against the breaker; admission rejections
 * raised further down the chain do not.
 */
class CircuitBreakerMiddleware final : public Middleware {
public:
  CircuitBreakerMiddleware(kj::Own<upstream::CircuitBreaker> breaker,
                           core::MetricsRegistry& metrics);

  kj::Promise<void> process(RequestContext& ctx, kj::Function<kj::Promise<void>()> next) override;

  kj::StringPtr name() const override {
    return "circuit_breaker"_kj;
  }

  upstream::CircuitBreaker& breaker() {
    return *breaker_;
  }

private:
  kj::Own<upstream::CircuitBreaker> breaker_;
  core::Counter& rejected_;
};

} // namespace portico::gateway
