#include "middleware/metrics_middleware.h"

#include <kj/debug.h>

namespace portico::gateway {

MetricsMiddleware::MetricsMiddleware(core::MetricsRegistry& registry)
    : requests_total_(registry.register_counter("portico_requests_total", "Total HTTP requests")),
      errors_total_(registry.register_counter("portico_request_errors_total",
                                              "Requests answered with status 400 or above")),
      duration_(registry.register_histogram("portico_request_duration_seconds",
                                            "Request duration in seconds")),
      active_(registry.register_gauge("portico_active_requests", "Requests in flight")) {}

void MetricsMiddleware::record_request(uint status, double duration_sec) {
  requests_total_.increment();
  if (status >= 400) {
    errors_total_.increment();
  }
  duration_.observe(duration_sec);
}

kj::Promise<void> MetricsMiddleware::process(RequestContext& ctx,
                                             kj::Function<kj::Promise<void>()> next) {
  active_.increment();
  auto start = kj::systemPreciseMonotonicClock().now();

  auto elapsed = [start]() {
    return (kj::systemPreciseMonotonicClock().now() - start) / kj::NANOSECONDS / 1e9;
  };

  return next()
      .then(
          [this, &ctx, elapsed]() { record_request(ctx.response.statusOr(200), elapsed()); },
          [this, &ctx, elapsed](kj::Exception&& e) {
            record_request(
                ctx.response.statusOr(core::http_status(core::error_kind_or_internal(e))),
                elapsed());
            kj::throwFatalException(kj::mv(e));
          })
      .attach(kj::defer([this]() { active_.decrement(); }));
}

} // namespace portico::gateway
