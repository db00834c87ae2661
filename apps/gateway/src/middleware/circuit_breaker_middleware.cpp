#include "middleware/circuit_breaker_middleware.h"

#include <kj/debug.h>

namespace portico::gateway {

CircuitBreakerMiddleware::CircuitBreakerMiddleware(kj::Own<upstream::CircuitBreaker> breaker,
                                                   core::MetricsRegistry& metrics)
    : breaker_(kj::mv(breaker)),
      rejected_(metrics.register_counter("portico_circuit_open_total",
                                         "Requests rejected by an open circuit")) {}

kj::Promise<void> CircuitBreakerMiddleware::process(RequestContext& ctx,
                                                    kj::Function<kj::Promise<void>()> next) {
  if (!breaker_->allow_request()) {
    rejected_.increment();
    return ctx.sendError(core::ErrorKind::CircuitOpen, "Service temporarily unavailable"_kj,
                         breaker_->retry_after());
  }

  return next().then(
      [this, &ctx]() {
        if (ctx.response.statusOr(200) >= 500) {
          breaker_->record_failure();
        } else {
          breaker_->record_success();
        }
      },
      [this](kj::Exception&& e) {
        KJ_IF_SOME(kind, core::error_kind(e)) {
          if (core::is_admission_rejection(kind)) {
            kj::throwFatalException(kj::mv(e));
          }
        }
        breaker_->record_failure();
        kj::throwFatalException(kj::mv(e));
      });
}

} // namespace portico::gateway
