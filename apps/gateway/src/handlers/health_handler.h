#pragma once

#include "middleware.h"
#include "portico/core/metrics.h"
#include "portico/upstream/service_registry.h"
#include "request_context.h"
#include "router.h"

#include <cstdint>
#include <kj/async.h>
#include <kj/memory.h>
#include <kj/string.h>
#include <kj/time.h>
#include <kj/vector.h>

namespace portico::gateway {

struct ProcessMemory {
  uint64_t rss_bytes = 0;
  uint64_t peak_rss_bytes = 0;
};

/**
 * Health and metrics endpoints served by the gateway itself.
 *
 * Handles:
 * - GET /health - status, uptime, route count, middleware count, process memory
 * - GET /metrics - Prometheus text exposition of the shared MetricsRegistry
 */
class HealthHandler {
public:
  HealthHandler(const Router& router, const kj::Vector<kj::Own<Middleware>>& middlewares,
                const core::MetricsRegistry& metrics);

  /// Include registry statistics in the health report.
  void set_registry(const upstream::ServiceRegistry& registry) {
    registry_ = registry;
  }

  /**
   * Response format:
   * {
   *   "status": "ok",
   *   "uptime": 12.5,
   *   "routes": 3,
   *   "middlewares": 2,
   *   "memory": {"rss": 10485760, "peakRss": 12582912},
   *   "timestamp": "2026-10-17T09:26:00.000Z",
   *   "services": {"total": 1, "healthy": {"users": 2}}
   * }
   */
  kj::Promise<void> handleHealth(RequestContext& ctx);

  kj::Promise<void> handleMetrics(RequestContext& ctx);

  kj::String health_json() const;

  static ProcessMemory process_memory();

private:
  const Router& router_;
  const kj::Vector<kj::Own<Middleware>>& middlewares_;
  const core::MetricsRegistry& metrics_;
  kj::Maybe<const upstream::ServiceRegistry&> registry_;
  kj::TimePoint started_;
};

} // namespace portico::gateway
