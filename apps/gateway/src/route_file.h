#pragma once

#include "portico/core/json.h"
#include "portico/upstream/service_registry.h"
#include "router.h"

#include <kj/string.h>
#include <kj/time.h>

namespace portico::gateway {

/**
 * Declarative routes file.
 *
 * Format:
 * ```json
 * {
 *   "services": [
 *     {"name": "users", "algorithm": "least-connections",
 *      "instances": [{"url": "http://10.0.0.5:8080", "id": "u1", "weight": 2,
 *                     "health_path": "/healthz"}]}
 *   ],
 *   "routes": [
 *     {"path": "/api/users/*", "service": "users", "methods": ["GET", "POST"],
 *      "auth": true, "timeout_ms": 5000, "retry": {"attempts": 2, "delay_ms": 100}},
 *     {"path": "/status", "target": "http://status.internal"}
 *   ]
 * }
 * ```
 * Services are registered before routes. Omitted route fields take the router defaults,
 * except the timeout, which defaults to @p default_timeout.
 */
class RouteFile {
public:
  struct Summary {
    size_t services = 0;
    size_t routes = 0;
  };

  /// @throws kj::Exception tagged InvalidConfig for malformed entries
  static Summary apply(const core::JsonDocument& document, Router& router,
                       upstream::ServiceRegistry& registry, kj::Duration default_timeout);

  /// Read @p path and apply it. Parse errors are reported as InvalidConfig.
  static Summary load(kj::StringPtr path, Router& router, upstream::ServiceRegistry& registry,
                      kj::Duration default_timeout);

  static upstream::ServiceDefinition parse_service(const core::JsonValue& value);
  static RouteConfig parse_route(const core::JsonValue& value, kj::Duration default_timeout);
};

} // namespace portico::gateway
