#include "gateway_server.h"

#include "portico/core/error.h"
#include "portico/core/time.h"
#include "util/http_utils.h"

#include <arpa/inet.h>
#include <cstring>
#include <kj/debug.h>
#include <netinet/in.h>
#include <sys/socket.h>

namespace portico::gateway {

namespace {

// Client-facing text per error kind. Exception descriptions stay in the logs.
kj::StringPtr public_message(core::ErrorKind kind) {
  switch (kind) {
  case core::ErrorKind::NotFound:
    return "Route not found"_kj;
  case core::ErrorKind::MethodNotAllowed:
    return "Method not allowed"_kj;
  case core::ErrorKind::Unauthorized:
    return "Authentication required"_kj;
  case core::ErrorKind::Forbidden:
    return "Insufficient permissions"_kj;
  case core::ErrorKind::RateLimited:
    return "Too many requests"_kj;
  case core::ErrorKind::CircuitOpen:
    return "Service temporarily unavailable"_kj;
  case core::ErrorKind::ServiceUnavailable:
    return "No healthy instance available"_kj;
  case core::ErrorKind::UpstreamFailure:
    return "Upstream request failed"_kj;
  case core::ErrorKind::UpstreamTimeout:
    return "Upstream request timed out"_kj;
  case core::ErrorKind::Internal:
  case core::ErrorKind::InvalidConfig:
    break;
  }
  return "Internal server error"_kj;
}

kj::String peer_address(kj::AsyncIoStream& stream) {
  kj::String result = kj::str("unknown");
  KJ_IF_SOME(exception, kj::runCatchingExceptions([&]() {
               struct sockaddr_storage addr;
               memset(&addr, 0, sizeof(addr));
               kj::uint len = sizeof(addr);
               stream.getpeername(reinterpret_cast<struct sockaddr*>(&addr), &len);

               char buffer[INET6_ADDRSTRLEN] = {};
               if (addr.ss_family == AF_INET) {
                 auto* in = reinterpret_cast<struct sockaddr_in*>(&addr);
                 if (inet_ntop(AF_INET, &in->sin_addr, buffer, sizeof(buffer)) != nullptr) {
                   result = kj::str(buffer);
                 }
               } else if (addr.ss_family == AF_INET6) {
                 auto* in6 = reinterpret_cast<struct sockaddr_in6*>(&addr);
                 if (inet_ntop(AF_INET6, &in6->sin6_addr, buffer, sizeof(buffer)) != nullptr) {
                   result = kj::str(buffer);
                 }
               }
             })) {
    // Wrapped streams (TLS, in-memory pipes) may not expose a socket address
    KJ_LOG(DBG, "peer address unavailable", exception.getDescription());
  }
  return result;
}

} // namespace

class GatewayServer::ConnectionService final : public kj::HttpService {
public:
  ConnectionService(GatewayServer& server, kj::String peer)
      : server_(server), peer_(kj::mv(peer)) {}

  kj::Promise<void> request(kj::HttpMethod method, kj::StringPtr url,
                            const kj::HttpHeaders& headers, kj::AsyncInputStream& requestBody,
                            Response& response) override {
    return server_.handle(method, url, headers, requestBody, response, peer_);
  }

private:
  GatewayServer& server_;
  kj::String peer_;
};

GatewayServer::GatewayServer(kj::Timer& timer, const kj::HttpHeaderTable& headerTable,
                             Router& router, ProxyHandler& proxy, core::MetricsRegistry& metrics,
                             GatewayServerOptions options)
    : timer_(timer), headerTable_(headerTable), router_(router), proxy_(proxy),
      options_(kj::mv(options)), health_(router, middlewares_, metrics) {}

GatewayServer::~GatewayServer() noexcept = default;

void GatewayServer::use(kj::Own<Middleware> middleware) {
  KJ_LOG(INFO, "Middleware added", middleware->name());
  middlewares_.add(kj::mv(middleware));
}

kj::Promise<void> GatewayServer::request(kj::HttpMethod method, kj::StringPtr url,
                                         const kj::HttpHeaders& headers,
                                         kj::AsyncInputStream& requestBody, Response& response) {
  return handle(method, url, headers, requestBody, response, "unknown"_kj);
}

kj::Promise<void> GatewayServer::handle(kj::HttpMethod method, kj::StringPtr url,
                                        const kj::HttpHeaders& headers,
                                        kj::AsyncInputStream& requestBody, Response& response,
                                        kj::StringPtr peer) {
  RecordingResponse recording(response, headerTable_);
  auto path = util::normalizePath(util::extractPath(url));

  RequestContext ctx{
      .requestId = core::generate_id(),
      .startTime = kj::systemPreciseMonotonicClock().now(),
      .startDate = kj::systemPreciseCalendarClock().now(),
      .method = method,
      .url = url,
      .path = path,
      .queryString = util::extractQueryString(url),
      .protocol = options_.protocol,
      .headers = headers,
      .body = requestBody,
      .response = recording,
      .headerTable = headerTable_,
      .clientIP = util::getClientIP(headers, peer),
  };
  recording.addHeader("X-Request-Id"_kj, ctx.requestId);

  auto emitCompleted = [&]() {
    completed_.notify(RequestCompleted{
        .request_id = kj::str(ctx.requestId),
        .method = method,
        .path = kj::str(path),
        .status = recording.statusOr(500),
        .duration = kj::systemPreciseMonotonicClock().now() - ctx.startTime,
    });
  };
  KJ_DEFER(emitCompleted());

  kj::Maybe<kj::Exception> failure;
  try {
    if (method == kj::HttpMethod::GET && path == options_.health_path) {
      co_await health_.handleHealth(ctx);
    } else if (method == kj::HttpMethod::GET && path == options_.metrics_path) {
      co_await health_.handleMetrics(ctx);
    } else {
      co_await run_chain(ctx, 0);
    }
  } catch (kj::Exception& e) {
    failure = kj::mv(e);
  }

  KJ_IF_SOME(e, failure) {
    if (recording.started()) {
      // Status line is gone; the only option left is to abort the connection
      KJ_LOG(WARNING, "request failed after response started", ctx.requestId, e.getDescription());
      kj::throwFatalException(kj::mv(e));
    }

    auto kind = core::error_kind_or_internal(e);
    if (kind == core::ErrorKind::Internal || kind == core::ErrorKind::InvalidConfig) {
      KJ_LOG(ERROR, "unhandled error in request pipeline", ctx.requestId, e);
      failed_.notify(RequestFailed{kj::str(ctx.requestId), kj::str(e.getDescription())});
      co_await ctx.sendError(500, "internal_error"_kj, public_message(kind));
    } else {
      co_await ctx.sendError(kind, public_message(kind), core::retry_after(e));
    }
  }
}

kj::Promise<void> GatewayServer::run_chain(RequestContext& ctx, size_t index) {
  if (index >= middlewares_.size()) {
    return dispatch(ctx);
  }
  return kj::evalNow([&]() {
    return middlewares_[index]->process(ctx,
                                        [this, &ctx, index]() { return run_chain(ctx, index + 1); });
  });
}

kj::Promise<void> GatewayServer::dispatch(RequestContext& ctx) {
  KJ_IF_SOME(match, router_.match(ctx.url, ctx.method)) {
    if (match.route->auth_required() && ctx.identity == kj::none) {
      return ctx.sendError(core::ErrorKind::Unauthorized, "Authentication required"_kj);
    }
    ctx.route = kj::mv(match.route);
    ctx.path_params = kj::mv(match.path_params);
    ctx.query = kj::mv(match.query);
    return proxy_.handle(ctx);
  }

  auto allowed = router_.allowed_methods(ctx.url);
  if (allowed.size() > 0) {
    ctx.response.addHeader("Allow"_kj, util::buildAllowHeader(allowed.asPtr()));
    auto message = kj::str("Method ", util::getMethodName(ctx.method), " not allowed");
    return ctx.sendError(core::ErrorKind::MethodNotAllowed, message);
  }

  return ctx.sendError(core::ErrorKind::NotFound, "Route not found"_kj);
}

kj::Promise<void> GatewayServer::listen(kj::Own<kj::ConnectionReceiver> receiver,
                                        kj::StringPtr host) {
  kj::HttpServer server(timer_, headerTable_,
                        [this](kj::AsyncIoStream& connection) -> kj::Own<kj::HttpService> {
                          return kj::heap<ConnectionService>(*this, peer_address(connection));
                        });

  auto paf = kj::newPromiseAndFulfiller<void>();
  if (stopRequested_) {
    paf.fulfiller->fulfill();
  } else {
    stopFulfiller_ = kj::mv(paf.fulfiller);
  }

  uint port = receiver->getPort();
  KJ_LOG(INFO, "Gateway listening", host, port);
  started_.notify(ServerStarted{kj::str(host), port});

  co_await server.listenHttp(*receiver).exclusiveJoin(kj::mv(paf.promise));

  // Stop accepting, then let in-flight requests finish
  receiver = nullptr;
  co_await server.drain();

  KJ_LOG(INFO, "Gateway stopped");
  stopped_.notify(ServerStopped{});
}

void GatewayServer::stop() {
  stopRequested_ = true;
  KJ_IF_SOME(fulfiller, stopFulfiller_) {
    fulfiller->fulfill();
  }
  stopFulfiller_ = kj::none;
}

} // namespace portico::gateway
