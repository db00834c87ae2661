#pragma once

#include "handlers/health_handler.h"
#include "middleware.h"
#include "portico/core/listeners.h"
#include "portico/core/metrics.h"
#include "proxy/proxy_handler.h"
#include "router.h"

#include <kj/async-io.h>
#include <kj/compat/http.h>
#include <kj/memory.h>
#include <kj/string.h>
#include <kj/vector.h>

namespace portico::gateway {

struct ServerStarted {
  kj::String host;
  uint port;
};

struct ServerStopped {};

struct RequestCompleted {
  kj::String request_id;
  kj::HttpMethod method;
  kj::String path;
  uint status;
  kj::Duration duration;
};

struct RequestFailed {
  kj::String request_id;
  kj::String message;
};

struct GatewayServerOptions {
  kj::String health_path = kj::str("/health");
  kj::String metrics_path = kj::str("/metrics");
  /// Protocol reported to backends in X-Forwarded-Proto.
  kj::String protocol = kj::str("http");
};

/**
 * @brief The request pipeline: middleware chain, router and proxy
 *
 * Request flow:
 * 1. Build a RequestContext (request id, start time, client address)
 * 2. Answer the health and metrics endpoints directly
 * 3. Run middleware in registration order; any of them may answer and stop the chain
 * 4. Match a route: 405 with Allow when only the method is wrong, 404 otherwise
 * 5. Reject routes with auth enabled when no identity was attached (401)
 * 6. Proxy to the backend
 *
 * Failures are mapped by ErrorKind to a status and the standard JSON error body. Untyped
 * failures become a generic 500 and a RequestFailed event. A RequestCompleted event is
 * published for every request, whatever the outcome.
 */
class GatewayServer final : public kj::HttpService {
public:
  GatewayServer(kj::Timer& timer, const kj::HttpHeaderTable& headerTable, Router& router,
                ProxyHandler& proxy, core::MetricsRegistry& metrics,
                GatewayServerOptions options = {});
  ~GatewayServer() noexcept;

  KJ_DISALLOW_COPY_AND_MOVE(GatewayServer);

  /// Append to the middleware chain. Not safe while requests are in flight.
  void use(kj::Own<Middleware> middleware);

  [[nodiscard]] size_t middleware_count() const {
    return middlewares_.size();
  }

  kj::Promise<void> request(kj::HttpMethod method, kj::StringPtr url,
                            const kj::HttpHeaders& headers, kj::AsyncInputStream& requestBody,
                            Response& response) override;

  /**
   * Same as request() with the address of the connected peer, used as client address when
   * no X-Forwarded-For header is present.
   */
  kj::Promise<void> handle(kj::HttpMethod method, kj::StringPtr url,
                           const kj::HttpHeaders& headers, kj::AsyncInputStream& requestBody,
                           Response& response, kj::StringPtr peer);

  /**
   * @brief Serve connections from @p receiver until stop() is called
   *
   * After stop() no new connection is accepted; the promise resolves once every open
   * connection has finished its in-flight request, and ServerStopped is then published.
   */
  kj::Promise<void> listen(kj::Own<kj::ConnectionReceiver> receiver, kj::StringPtr host);

  /// Stop accepting connections. Safe to call before listen() or more than once.
  void stop();

  HealthHandler& health() {
    return health_;
  }
  Router& router() {
    return router_;
  }

  core::ListenerSet<ServerStarted>& on_started() {
    return started_;
  }
  core::ListenerSet<ServerStopped>& on_stopped() {
    return stopped_;
  }
  core::ListenerSet<RequestCompleted>& on_request() {
    return completed_;
  }
  core::ListenerSet<RequestFailed>& on_error() {
    return failed_;
  }

private:
  class ConnectionService;

  kj::Promise<void> run_chain(RequestContext& ctx, size_t index);
  kj::Promise<void> dispatch(RequestContext& ctx);

  kj::Timer& timer_;
  const kj::HttpHeaderTable& headerTable_;
  Router& router_;
  ProxyHandler& proxy_;
  GatewayServerOptions options_;

  kj::Vector<kj::Own<Middleware>> middlewares_;
  HealthHandler health_;

  kj::Maybe<kj::Own<kj::PromiseFulfiller<void>>> stopFulfiller_;
  bool stopRequested_ = false;

  core::ListenerSet<ServerStarted> started_;
  core::ListenerSet<ServerStopped> stopped_;
  core::ListenerSet<RequestCompleted> completed_;
  core::ListenerSet<RequestFailed> failed_;
};

} // namespace portico::gateway
