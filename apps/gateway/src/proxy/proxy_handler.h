#pragma once

#include "portico/core/metrics.h"
#include "portico/upstream/circuit_breaker.h"
#include "portico/upstream/load_balancer.h"
#include "request_context.h"

#include <kj/async-io.h>
#include <kj/compat/http.h>
#include <kj/map.h>
#include <kj/memory.h>
#include <kj/string.h>
#include <kj/timer.h>

namespace portico::gateway {

struct ProxyConfig {
  /// Concurrent requests per backend authority; excess requests queue.
  uint max_connections_per_backend = 50;
  /// How long an idle pooled connection is kept.
  kj::Duration keepalive = 5 * kj::SECONDS;
  /// Guard each backend authority with its own circuit breaker.
  bool circuit_breaker_enabled = false;
  upstream::CircuitBreakerConfig circuit_breaker;
};

/**
 * Where one request is sent.
 */
struct ProxyTarget {
  kj::String scheme;    // "http" or "https"
  kj::String authority; // host[:port]
  kj::String url;       // absolute URL including the query string
};

/**
 * Build the upstream URL: the base URL's path joined with @p path, plus @p query.
 *
 * @throws kj::Exception tagged InvalidConfig when @p base is not an http(s) URL
 */
ProxyTarget resolve_target(kj::StringPtr base, kj::StringPtr path, kj::StringPtr query);

/**
 * Forwards a routed request to its backend and streams the response back.
 *
 * Connections are pooled per scheme and reused per backend authority up to
 * max_connections_per_backend. The route's target is used directly, or an instance of its
 * service is chosen through the LoadBalancer and released when the call ends, however it
 * ends.
 *
 * Transport failures (connection refused, reset, premature close) are retried with
 * exponential backoff while nothing has been sent to the client and no request body has
 * been read. Exhausted retries fail with ErrorKind::UpstreamFailure; a call that exceeds
 * the route timeout fails with ErrorKind::UpstreamTimeout and is not retried.
 *
 * All methods must be called on the event loop thread that owns the HTTP clients.
 */
class ProxyHandler {
public:
  ProxyHandler(kj::Timer& timer, kj::Network& network, kj::Maybe<kj::Network&> tlsNetwork,
               const kj::HttpHeaderTable& headerTable, upstream::LoadBalancer& balancer,
               core::MetricsRegistry& metrics, ProxyConfig config = {});

  KJ_DISALLOW_COPY_AND_MOVE(ProxyHandler);

  /**
   * Proxy @p ctx, which must carry a matched route.
   */
  kj::Promise<void> handle(RequestContext& ctx);

  /// Breaker guarding @p authority, once a request has been sent there.
  kj::Maybe<upstream::CircuitBreaker&> breaker_for(kj::StringPtr authority);

  [[nodiscard]] const ProxyConfig& config() const {
    return config_;
  }

private:
  class TrackingInputStream;

  kj::HttpClient& client_for(const ProxyTarget& target);
  upstream::CircuitBreaker& get_or_create_breaker(kj::StringPtr authority);
  kj::HttpHeaders build_headers(const RequestContext& ctx, kj::StringPtr authority) const;

  kj::Promise<void> forward(RequestContext& ctx, const ProxyTarget& target,
                            TrackingInputStream& body);
  kj::Promise<void> attempt(RequestContext& ctx, const ProxyTarget& target,
                            TrackingInputStream& body, kj::Duration timeout);

  kj::Timer& timer_;
  const kj::HttpHeaderTable& headerTable_;
  upstream::LoadBalancer& balancer_;
  ProxyConfig config_;

  kj::Own<kj::HttpClient> plainClient_;
  kj::Maybe<kj::Own<kj::HttpClient>> tlsClient_;
  kj::HashMap<kj::String, kj::Own<kj::HttpClient>> backends_;
  kj::HashMap<kj::String, kj::Own<upstream::CircuitBreaker>> breakers_;

  core::Counter& retries_;
};

} // namespace portico::gateway
