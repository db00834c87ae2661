#include "gateway_config.h"

#include "portico/core/error.h"

#include <cstdlib>
#include <kj/debug.h>

namespace portico::gateway {

namespace {

kj::Maybe<kj::StringPtr> env(const char* name) {
  if (const char* value = std::getenv(name)) {
    return kj::StringPtr(value);
  }
  return kj::none;
}

bool parse_flag(const char* name, kj::StringPtr value) {
  if (value == "true"_kj || value == "1"_kj || value == "yes"_kj) {
    return true;
  }
  if (value == "false"_kj || value == "0"_kj || value == "no"_kj || value.size() == 0) {
    return false;
  }
  core::throw_error(core::ErrorKind::InvalidConfig,
                    kj::str(name, " must be true or false, got '", value, "'"));
}

uint64_t parse_number(const char* name, kj::StringPtr value) {
  KJ_IF_SOME(number, value.tryParseAs<uint64_t>()) {
    return number;
  }
  core::throw_error(core::ErrorKind::InvalidConfig,
                    kj::str(name, " must be a non-negative integer, got '", value, "'"));
}

void read_flag(const char* name, bool& out) {
  KJ_IF_SOME(value, env(name)) {
    out = parse_flag(name, value);
  }
}

void read_millis(const char* name, kj::Duration& out) {
  KJ_IF_SOME(value, env(name)) {
    out = static_cast<int64_t>(parse_number(name, value)) * kj::MILLISECONDS;
  }
}

void read_string(const char* name, kj::String& out) {
  KJ_IF_SOME(value, env(name)) {
    out = kj::heapString(value);
  }
}

} // namespace

kj::Maybe<BreakerScope> parse_breaker_scope(kj::StringPtr name) {
  if (name == "backend"_kj) {
    return BreakerScope::Backend;
  }
  if (name == "gateway"_kj) {
    return BreakerScope::Gateway;
  }
  return kj::none;
}

GatewayConfig GatewayConfig::loadFromEnv() {
  GatewayConfig config;

  // Server
  read_string("PORTICO_HOST", config.host);
  KJ_IF_SOME(value, env("PORTICO_PORT")) {
    auto port = parse_number("PORTICO_PORT", value);
    if (port > 65535) {
      core::throw_error(core::ErrorKind::InvalidConfig, kj::str("PORTICO_PORT out of range: ", port));
    }
    config.port = static_cast<uint16_t>(port);
  }
  read_flag("PORTICO_TLS_ENABLED", config.tls_enabled);
  read_string("PORTICO_TLS_CERT", config.tls_cert_path);
  read_string("PORTICO_TLS_KEY", config.tls_key_path);

  // Proxy
  read_millis("PORTICO_REQUEST_TIMEOUT_MS", config.request_timeout);
  KJ_IF_SOME(value, env("PORTICO_MAX_CONNECTIONS_PER_BACKEND")) {
    config.max_connections_per_backend =
        static_cast<uint>(parse_number("PORTICO_MAX_CONNECTIONS_PER_BACKEND", value));
  }
  read_millis("PORTICO_KEEPALIVE_MS", config.keepalive);
  KJ_IF_SOME(value, env("PORTICO_LB_ALGORITHM")) {
    KJ_IF_SOME(algorithm, upstream::parse_algorithm(value)) {
      config.lb_algorithm = algorithm;
    } else {
      core::throw_error(core::ErrorKind::InvalidConfig,
                        kj::str("unknown PORTICO_LB_ALGORITHM '", value, "'"));
    }
  }

  // Rate limiting
  KJ_IF_SOME(value, env("PORTICO_RATE_LIMIT_MAX")) {
    config.rate_limit_max = parse_number("PORTICO_RATE_LIMIT_MAX", value);
  }
  read_millis("PORTICO_RATE_LIMIT_WINDOW_MS", config.rate_limit_window);

  // Circuit breaker
  read_flag("PORTICO_CB_ENABLED", config.cb_enabled);
  KJ_IF_SOME(value, env("PORTICO_CB_SCOPE")) {
    KJ_IF_SOME(scope, parse_breaker_scope(value)) {
      config.cb_scope = scope;
    } else {
      core::throw_error(core::ErrorKind::InvalidConfig,
                        kj::str("unknown PORTICO_CB_SCOPE '", value, "'"));
    }
  }
  KJ_IF_SOME(value, env("PORTICO_CB_THRESHOLD")) {
    config.cb_threshold = parse_number("PORTICO_CB_THRESHOLD", value);
  }
  read_millis("PORTICO_CB_TIMEOUT_MS", config.cb_timeout);
  read_millis("PORTICO_CB_MONITORING_MS", config.cb_monitoring);

  // Authentication
  read_flag("PORTICO_AUTH_ENABLED", config.auth_enabled);
  read_string("PORTICO_JWT_SECRET", config.jwt_secret);
  KJ_IF_SOME(value, env("PORTICO_JWT_ISSUER")) {
    config.jwt_issuer = kj::heapString(value);
  }

  // Health checks
  read_flag("PORTICO_HEALTH_CHECK_ENABLED", config.health_check_enabled);
  read_millis("PORTICO_HEALTH_CHECK_INTERVAL_MS", config.health_check_interval);
  read_millis("PORTICO_HEALTH_CHECK_TIMEOUT_MS", config.health_check_timeout);

  read_string("PORTICO_HEALTH_PATH", config.health_path);
  read_string("PORTICO_METRICS_PATH", config.metrics_path);

  KJ_IF_SOME(value, env("PORTICO_ACCESS_LOG_FORMAT")) {
    KJ_IF_SOME(format, parse_access_log_format(value)) {
      config.access_log_format = format;
    } else {
      core::throw_error(core::ErrorKind::InvalidConfig,
                        kj::str("unknown PORTICO_ACCESS_LOG_FORMAT '", value, "'"));
    }
  }
  KJ_IF_SOME(value, env("PORTICO_ROUTES_FILE")) {
    config.routes_file = kj::heapString(value);
  }

  return config;
}

void GatewayConfig::validate() const {
  // Security warnings
  if (!auth_enabled) {
    KJ_LOG(WARNING, "Authentication disabled; routes with auth enabled will answer 401");
  }
  if (auth_enabled && jwt_secret.size() > 0 && jwt_secret.size() < 32) {
    KJ_LOG(WARNING, "JWT secret should be at least 32 characters", "current_length",
           jwt_secret.size());
  }
  if (host == "0.0.0.0"_kj && !tls_enabled) {
    KJ_LOG(WARNING, "Listening on all interfaces without TLS");
  }

  // Validation errors (cannot continue)
  if (port == 0) {
    core::throw_error(core::ErrorKind::InvalidConfig, "Invalid port number: 0");
  }
  if (tls_enabled && (tls_cert_path.size() == 0 || tls_key_path.size() == 0)) {
    core::throw_error(core::ErrorKind::InvalidConfig,
                      "PORTICO_TLS_CERT and PORTICO_TLS_KEY are required when TLS is enabled");
  }
  if (auth_enabled && jwt_secret.size() == 0) {
    core::throw_error(core::ErrorKind::InvalidConfig,
                      "PORTICO_JWT_SECRET is required when authentication is enabled");
  }
  if (rate_limit_max == 0) {
    core::throw_error(core::ErrorKind::InvalidConfig, "Rate limit max must be > 0");
  }
  if (rate_limit_window <= 0 * kj::SECONDS) {
    core::throw_error(core::ErrorKind::InvalidConfig, "Rate limit window must be > 0");
  }
  if (cb_enabled && cb_threshold == 0) {
    core::throw_error(core::ErrorKind::InvalidConfig, "Circuit breaker threshold must be > 0");
  }
  if (max_connections_per_backend == 0) {
    core::throw_error(core::ErrorKind::InvalidConfig, "Max connections per backend must be > 0");
  }
  if (request_timeout <= 0 * kj::SECONDS) {
    core::throw_error(core::ErrorKind::InvalidConfig, "Request timeout must be > 0");
  }
  if (health_check_enabled && health_check_interval <= 0 * kj::SECONDS) {
    core::throw_error(core::ErrorKind::InvalidConfig, "Health check interval must be > 0");
  }
  if (health_path.size() == 0 || health_path[0] != '/' || metrics_path.size() == 0 ||
      metrics_path[0] != '/') {
    core::throw_error(core::ErrorKind::InvalidConfig, "Health and metrics paths must start with '/'");
  }
}

} // namespace portico::gateway
