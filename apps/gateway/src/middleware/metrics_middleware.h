#pragma once

#include "middleware.h"
#include "portico/core/metrics.h"

namespace portico::gateway {

/**
 * Metrics collection middleware.
 *
 * Records into the shared MetricsRegistry:
 * - portico_requests_total
 * - portico_request_errors_total (status >= 400, or a failure)
 * - portico_request_duration_seconds
 * - portico_active_requests
 */
class MetricsMiddleware final : public Middleware {
public:
  explicit MetricsMiddleware(core::MetricsRegistry& registry);

  kj::Promise<void> process(RequestContext& ctx, kj::Function<kj::Promise<void>()> next) override;

  kj::StringPtr name() const override {
    return "metrics"_kj;
  }

  void record_request(uint status, double duration_sec);

private:
  core::Counter& requests_total_;
  core::Counter& errors_total_;
  core::Histogram& duration_;
  core::Gauge& active_;
};

} // namespace portico::gateway
