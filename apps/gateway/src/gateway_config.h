#pragma once

#include "middleware/access_log_middleware.h"
#include "portico/upstream/load_balancer.h"

#include <cstdint>
#include <kj/common.h>
#include <kj/string.h>
#include <kj/time.h>

namespace portico::gateway {

/// Where circuit breakers sit when they are enabled.
enum class BreakerScope : uint8_t {
  Backend, ///< One breaker per backend authority, inside the proxy
  Gateway, ///< One breaker in the middleware chain guarding every proxied route
};

kj::Maybe<BreakerScope> parse_breaker_scope(kj::StringPtr name);

/**
 * @brief Gateway configuration loaded from environment variables
 *
 * Every setting has a PORTICO_* variable; unset variables keep the defaults below.
 * Defaults are suitable for development only.
 */
struct GatewayConfig {
  // Server
  kj::String host = kj::str("0.0.0.0");
  uint16_t port = 8080;
  bool tls_enabled = false;
  kj::String tls_cert_path;
  kj::String tls_key_path;

  // Proxy
  kj::Duration request_timeout = 30 * kj::SECONDS;
  uint max_connections_per_backend = 50;
  kj::Duration keepalive = 5 * kj::SECONDS;
  upstream::Algorithm lb_algorithm = upstream::Algorithm::RoundRobin;

  // Rate limiting
  uint64_t rate_limit_max = 100;
  kj::Duration rate_limit_window = 60 * kj::SECONDS;

  // Circuit breaker
  bool cb_enabled = false;
  BreakerScope cb_scope = BreakerScope::Backend;
  uint64_t cb_threshold = 5;
  kj::Duration cb_timeout = 60 * kj::SECONDS;
  kj::Duration cb_monitoring = 60 * kj::SECONDS;

  // Authentication
  bool auth_enabled = false;
  kj::String jwt_secret;
  kj::Maybe<kj::String> jwt_issuer;

  // Health checks
  bool health_check_enabled = false;
  kj::Duration health_check_interval = 30 * kj::SECONDS;
  kj::Duration health_check_timeout = 5 * kj::SECONDS;

  // Built-in endpoints
  kj::String health_path = kj::str("/health");
  kj::String metrics_path = kj::str("/metrics");

  AccessLogFormat access_log_format = AccessLogFormat::Combined;
  kj::Maybe<kj::String> routes_file;

  /**
   * @brief Load configuration from environment variables
   *
   * @throws kj::Exception tagged InvalidConfig when a variable cannot be parsed
   */
  static GatewayConfig loadFromEnv();

  /**
   * @brief Validate configuration and log warnings
   *
   * Logs warnings for insecure configurations and keeps going.
   *
   * @throws kj::Exception tagged InvalidConfig if the gateway cannot run with this config
   */
  void validate() const;
};

} // namespace portico::gateway
