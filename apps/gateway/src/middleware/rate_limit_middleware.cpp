#include "middleware/rate_limit_middleware.h"

#include "util/http_utils.h"

#include <kj/debug.h>

namespace portico::gateway {

RateLimitMiddleware::RateLimitMiddleware(kj::Own<RateLimiter> limiter,
                                         core::MetricsRegistry& metrics, RateLimitOptions options)
    : limiter_(kj::mv(limiter)), options_(kj::mv(options)),
      rejected_(metrics.register_counter("portico_rate_limited_total",
                                         "Requests rejected by the rate limiter")) {}

kj::String RateLimitMiddleware::key_for(const RequestContext& ctx) {
  KJ_IF_SOME(extractor, options_.key_extractor) {
    return extractor(ctx);
  }
  return kj::str(ctx.clientIP);
}

kj::Promise<void> RateLimitMiddleware::process(RequestContext& ctx,
                                               kj::Function<kj::Promise<void>()> next) {
  KJ_IF_SOME(skip, options_.skip) {
    if (skip(ctx)) {
      return next();
    }
  }

  auto key = key_for(ctx);
  auto decision = limiter_->check(key);

  ctx.response.addHeader("X-RateLimit-Limit"_kj, kj::str(decision.limit));
  ctx.response.addHeader("X-RateLimit-Remaining"_kj, kj::str(decision.remaining));
  ctx.response.addHeader("X-RateLimit-Reset"_kj,
                         kj::str(util::ceilSeconds(decision.reset_at - kj::UNIX_EPOCH)));

  if (decision.allowed) {
    return next();
  }

  rejected_.increment();
  KJ_LOG(INFO, "Rate limit exceeded", key, ctx.requestId);
  return ctx.sendError(options_.status_code, core::to_string(core::ErrorKind::RateLimited),
                       options_.message, decision.retry_after);
}

} // namespace portico::gateway
