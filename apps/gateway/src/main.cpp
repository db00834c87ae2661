/**
 * @file main.cpp
 * @brief Main entry point for the Portico API gateway
 *
 * Initialization order (dependencies first):
 * 1. Access logger
 * 2. TLS contexts and the upstream HTTP clients (per-backend circuit breakers live here)
 * 3. Routes file into the router and service registry
 * 4. Middleware chain (metrics, access log, rate limit, auth, gateway circuit breaker)
 * 5. Health checks and rate-limit sweeper
 * 6. HTTP server
 *
 * Shutdown sequence:
 * 1. Stop accepting connections
 * 2. Let in-flight requests finish
 * 3. Cancel health probes and the sweeper
 * 4. Flush the access log
 *
 * Configuration is read from PORTICO_* environment variables, see gateway_config.h.
 */

#include "auth/jwt_verifier.h"
#include "gateway_config.h"
#include "gateway_server.h"
#include "middleware/access_log_middleware.h"
#include "middleware/auth_middleware.h"
#include "middleware/circuit_breaker_middleware.h"
#include "middleware/metrics_middleware.h"
#include "middleware/rate_limit_middleware.h"
#include "middleware/rate_limiter.h"
#include "portico/core/logger.h"
#include "portico/core/metrics.h"
#include "portico/upstream/health_prober.h"
#include "portico/upstream/load_balancer.h"
#include "portico/upstream/service_registry.h"
#include "proxy/proxy_handler.h"
#include "route_file.h"
#include "router.h"

#include <atomic>
#include <csignal>
#include <exception>
#include <kj/async-io.h>
#include <kj/compat/http.h>
#include <kj/compat/tls.h>
#include <kj/debug.h>
#include <kj/filesystem.h>
#include <kj/string.h>

namespace portico {

namespace {
// Uses std::atomic for lock-free access from the signal handler
std::atomic<bool> g_shutdown_requested{false};
std::atomic<int> g_shutdown_signal{0};

/**
 * @brief Signal handler for SIGTERM and SIGINT
 *
 * Must stay async-signal-safe: only atomic stores.
 */
void signal_handler(int signal) {
  g_shutdown_signal.store(signal, std::memory_order_release);
  g_shutdown_requested.store(true, std::memory_order_release);
}

kj::String read_text_file(kj::StringPtr path) {
  auto fs = kj::newDiskFilesystem();
  auto resolved = fs->getCurrentPath().evalNative(path);
  return fs->getRoot().openFile(resolved)->readAllText();
}
} // namespace

namespace gateway {

/**
 * @brief Owns every gateway component and drives startup and shutdown
 */
class GatewayLifecycle {
public:
  GatewayLifecycle(const GatewayConfig& config, kj::AsyncIoContext& io)
      : config_(config), io_(io),
        registry_(upstream::HealthCheckConfig{.interval = config.health_check_interval,
                                              .timeout = config.health_check_timeout}),
        balancer_(config.lb_algorithm), poolSync_(registry_, balancer_) {}

  ~GatewayLifecycle() {
    cleanup();
  }

  KJ_DISALLOW_COPY_AND_MOVE(GatewayLifecycle);

  void initialize() {
    KJ_LOG(INFO, "Initializing gateway components in dependency order");

    KJ_LOG(INFO, "[1/6] Initializing access log");
    initializeAccessLog();

    KJ_LOG(INFO, "[2/6] Initializing upstream clients", "tls", config_.tls_enabled);
    initializeUpstream();

    KJ_LOG(INFO, "[3/6] Loading routes");
    initializeRoutes();

    KJ_LOG(INFO, "[4/6] Initializing middleware chain");
    initializeMiddleware();

    KJ_LOG(INFO, "[5/6] Starting background tasks");
    initializeBackgroundTasks();

    KJ_LOG(INFO, "[6/6] Binding listener", "host", config_.host, "port", config_.port);

    KJ_LOG(INFO, "All components initialized successfully");
  }

  kj::Promise<void> run() {
    auto& network = io_.provider->getNetwork();
    auto address = co_await network.parseAddress(config_.host, config_.port);
    kj::Own<kj::ConnectionReceiver> receiver = address->listen();

    KJ_IF_SOME(tls, serverTls_) {
      receiver = tls->wrapPort(kj::mv(receiver));
    }

    auto serving = server_->listen(kj::mv(receiver), config_.host).fork();

    // A listener failure ends the wait early and propagates from here
    co_await serving.addBranch().exclusiveJoin(waitForShutdown());

    KJ_LOG(INFO, "Stopping HTTP server, draining in-flight requests");
    server_->stop();
    co_await serving.addBranch();
  }

  kj::Promise<void> waitForShutdown() {
    while (!g_shutdown_requested.load(std::memory_order_acquire)) {
      co_await io_.provider->getTimer().afterDelay(100 * kj::MILLISECONDS);
    }
    KJ_LOG(INFO, "Shutdown signal received", "signal",
           g_shutdown_signal.load(std::memory_order_acquire));
  }

  /**
   * @brief Release background work. Safe to call twice.
   */
  void cleanup() {
    if (cleanedUp_) {
      return;
    }
    cleanedUp_ = true;

    KJ_LOG(INFO, "Starting graceful shutdown sequence");
    registry_.disable_health_checks();
    sweeper_ = kj::none;
    KJ_IF_SOME(logger, accessLogger_) {
      logger->flush();
    }
    KJ_LOG(INFO, "Graceful shutdown complete");
  }

private:
  void initializeAccessLog() {
    kj::Own<core::LogFormatter> formatter;
    if (config_.access_log_format == AccessLogFormat::Json) {
      formatter = kj::heap<core::JsonFormatter>();
    } else {
      formatter = kj::heap<core::PlainFormatter>();
    }
    accessLogger_ = kj::heap<core::Logger>(kj::mv(formatter));
  }

  void initializeUpstream() {
    auto& network = io_.provider->getNetwork();
    auto& timer = io_.provider->getTimer();

    // Outbound TLS uses the system trust store
    clientTls_ = kj::heap<kj::TlsContext>();
    tlsNetwork_ = clientTls_->wrapNetwork(network);

    if (config_.tls_enabled) {
      kj::TlsKeypair keypair{
          .privateKey = kj::TlsPrivateKey(read_text_file(config_.tls_key_path)),
          .certificate = kj::TlsCertificate(read_text_file(config_.tls_cert_path)),
      };
      kj::TlsContext::Options options;
      options.defaultKeypair = kj::mv(keypair);
      serverTls_ = kj::heap<kj::TlsContext>(kj::mv(options));
    }

    ProxyConfig proxyConfig;
    proxyConfig.max_connections_per_backend = config_.max_connections_per_backend;
    proxyConfig.keepalive = config_.keepalive;
    proxyConfig.circuit_breaker_enabled =
        config_.cb_enabled && config_.cb_scope == BreakerScope::Backend;
    proxyConfig.circuit_breaker = breakerConfig();

    kj::Maybe<kj::Network&> tls = *KJ_ASSERT_NONNULL(tlsNetwork_);
    proxy_ = kj::heap<ProxyHandler>(timer, network, tls, headerTable_, balancer_, metrics_,
                                    kj::mv(proxyConfig));
    prober_ = kj::heap<upstream::HttpHealthProber>(timer, network, tls, headerTable_);
  }

  void initializeRoutes() {
    KJ_IF_SOME(path, config_.routes_file) {
      RouteFile::load(path, router_, registry_, config_.request_timeout);
    } else {
      KJ_LOG(WARNING, "PORTICO_ROUTES_FILE not set; starting without routes");
    }
  }

  void initializeMiddleware() {
    server_ = kj::heap<GatewayServer>(
        io_.provider->getTimer(), headerTable_, router_, *KJ_ASSERT_NONNULL(proxy_), metrics_,
        GatewayServerOptions{
            .health_path = kj::str(config_.health_path),
            .metrics_path = kj::str(config_.metrics_path),
            .protocol = kj::str(config_.tls_enabled ? "https" : "http"),
        });
    server_->health().set_registry(registry_);

    server_->on_error().subscribe([](const RequestFailed& event) {
      KJ_LOG(ERROR, "Request failed", event.request_id, event.message);
    });

    server_->use(kj::heap<MetricsMiddleware>(metrics_));

    auto accessConfig = AccessLogMiddleware::default_config();
    accessConfig.exclude_paths.add(kj::str(config_.health_path));
    accessConfig.exclude_paths.add(kj::str(config_.metrics_path));
    accessConfig.format = config_.access_log_format;
    server_->use(kj::heap<AccessLogMiddleware>(*KJ_ASSERT_NONNULL(accessLogger_),
                                               kj::mv(accessConfig)));

    auto limiter = kj::heap<RateLimiter>(RateLimiterConfig{
        .max_requests = static_cast<uint>(config_.rate_limit_max),
        .window = config_.rate_limit_window,
    });
    rateLimiter_ = *limiter;
    server_->use(kj::heap<RateLimitMiddleware>(kj::mv(limiter), metrics_));

    if (config_.auth_enabled) {
      // Optional mode: identities are attached when present, routes with auth enforce them
      auth::JwtConfig jwtConfig;
      jwtConfig.secret = kj::str(config_.jwt_secret);
      KJ_IF_SOME(issuer, config_.jwt_issuer) {
        jwtConfig.issuer = kj::str(issuer);
      }
      AuthMiddleware::Config authConfig;
      authConfig.required = false;
      server_->use(kj::heap<AuthMiddleware>(kj::heap<auth::JwtVerifier>(kj::mv(jwtConfig)),
                                            kj::mv(authConfig)));
    }

    if (config_.cb_enabled && config_.cb_scope == BreakerScope::Gateway) {
      server_->use(kj::heap<CircuitBreakerMiddleware>(
          kj::heap<upstream::CircuitBreaker>("gateway"_kj, breakerConfig()), metrics_));
    }
  }

  upstream::CircuitBreakerConfig breakerConfig() const {
    return upstream::CircuitBreakerConfig{
        .failure_threshold = config_.cb_threshold,
        .timeout = config_.cb_timeout,
        .monitoring_period = config_.cb_monitoring,
    };
  }

  void initializeBackgroundTasks() {
    auto& timer = io_.provider->getTimer();
    if (config_.health_check_enabled) {
      registry_.enable_health_checks(timer, *KJ_ASSERT_NONNULL(prober_));
      KJ_LOG(INFO, "Health checks enabled", "interval_ms",
             config_.health_check_interval / kj::MILLISECONDS);
    }

    KJ_IF_SOME(limiter, rateLimiter_) {
      sweeper_ = limiter.run_sweeper(timer, config_.rate_limit_window).eagerlyEvaluate(
          [](kj::Exception&& e) { KJ_LOG(ERROR, "Rate-limit sweeper stopped", e); });
    }
  }

  const GatewayConfig& config_;
  kj::AsyncIoContext& io_;
  bool cleanedUp_ = false;

  kj::HttpHeaderTable headerTable_;
  core::MetricsRegistry metrics_;
  upstream::ServiceRegistry registry_;
  upstream::LoadBalancer balancer_;
  upstream::PoolSync poolSync_;
  Router router_;

  kj::Maybe<kj::Own<core::Logger>> accessLogger_;
  kj::Maybe<kj::Own<kj::TlsContext>> clientTls_;
  kj::Maybe<kj::Own<kj::TlsContext>> serverTls_;
  kj::Maybe<kj::Own<kj::Network>> tlsNetwork_;
  kj::Maybe<kj::Own<ProxyHandler>> proxy_;
  kj::Maybe<kj::Own<upstream::HttpHealthProber>> prober_;
  kj::Own<GatewayServer> server_;
  kj::Maybe<RateLimiter&> rateLimiter_;
  kj::Maybe<kj::Promise<void>> sweeper_;
};

} // namespace gateway
} // namespace portico

int main() {
  using namespace portico;
  using namespace portico::gateway;

  try {
    auto config = GatewayConfig::loadFromEnv();
    config.validate();

    KJ_LOG(INFO, "========================================");
    KJ_LOG(INFO, "  Portico Gateway Starting");
    KJ_LOG(INFO, "========================================");
    KJ_LOG(INFO, "Configuration:", "host", config.host, "port", config.port, "tls",
           config.tls_enabled, "auth_enabled", config.auth_enabled, "lb_algorithm",
           upstream::to_string(config.lb_algorithm), "rate_limit_max", config.rate_limit_max);

    // SIGTERM from service managers and containers, SIGINT from a terminal
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGINT, signal_handler);
    KJ_LOG(INFO, "Signal handlers registered (SIGTERM, SIGINT)");

    auto io = kj::setupAsyncIo();
    KJ_LOG(INFO, "KJ EventLoop initialized");

    auto lifecycle = kj::heap<GatewayLifecycle>(config, io);
    try {
      lifecycle->initialize();
    } catch (const kj::Exception& e) {
      KJ_LOG(ERROR, "Component initialization failed", e.getDescription());
      return 1;
    }

    KJ_LOG(INFO, "Press Ctrl+C to stop the server");
    try {
      lifecycle->run().wait(io.waitScope);
    } catch (const kj::Exception& e) {
      KJ_LOG(ERROR, "Server error", e.getDescription());
      return 1;
    }

    lifecycle->cleanup();
    KJ_LOG(INFO, "Gateway shutdown complete");
    return 0;
  } catch (const kj::Exception& e) {
    KJ_LOG(ERROR, "Fatal KJ exception", e.getDescription());
    return 1;
  } catch (const std::exception& e) {
    KJ_LOG(ERROR, "Fatal std::exception", e.what());
    return 1;
  }
}
