#include "proxy/proxy_handler.h"

#include "router.h"
#include "util/http_utils.h"

#include <kj/compat/url.h>
#include <kj/debug.h>

namespace portico::gateway {

/**
 * Pass-through request body that remembers whether anything was read, which decides
 * whether a failed attempt can be replayed.
 */
class ProxyHandler::TrackingInputStream final : public kj::AsyncInputStream {
public:
  explicit TrackingInputStream(kj::AsyncInputStream& inner) : inner_(inner) {}

  kj::Promise<size_t> tryRead(void* buffer, size_t minBytes, size_t maxBytes) override {
    consumed_ = true;
    return inner_.tryRead(buffer, minBytes, maxBytes);
  }

  kj::Maybe<uint64_t> tryGetLength() override {
    return inner_.tryGetLength();
  }

  kj::Promise<uint64_t> pumpTo(kj::AsyncOutputStream& output, uint64_t amount) override {
    consumed_ = true;
    return inner_.pumpTo(output, amount);
  }

  bool consumed() const {
    return consumed_;
  }

private:
  kj::AsyncInputStream& inner_;
  bool consumed_ = false;
};

ProxyTarget resolve_target(kj::StringPtr base, kj::StringPtr path, kj::StringPtr query) {
  kj::Url parsed;
  KJ_IF_SOME(url, kj::Url::tryParse(base)) {
    parsed = kj::mv(url);
  } else {
    core::throw_error(core::ErrorKind::InvalidConfig, kj::str("invalid backend URL: ", base));
  }
  if (parsed.scheme != "http" && parsed.scheme != "https") {
    core::throw_error(core::ErrorKind::InvalidConfig,
                      kj::str("unsupported backend scheme: ", parsed.scheme));
  }

  // Raw base path, kept exactly as configured (no percent-decoding round trip)
  auto rest = base.asArray().slice(parsed.scheme.size() + 3, base.size());
  size_t start = rest.size();
  size_t end = rest.size();
  for (size_t i = 0; i < rest.size(); ++i) {
    if (rest[i] == '?' || rest[i] == '#') {
      end = i;
      break;
    }
    if (rest[i] == '/' && start == rest.size()) {
      start = i;
    }
  }
  auto basePath = start < end ? rest.slice(start, end) : rest.slice(end, end);
  while (basePath.size() > 0 && basePath[basePath.size() - 1] == '/') {
    basePath = basePath.first(basePath.size() - 1);
  }

  kj::String joined;
  if (basePath.size() == 0) {
    joined = path.size() == 0 ? kj::str("/") : kj::str(path);
  } else if (path.size() == 0 || path == "/") {
    joined = kj::heapString(basePath);
  } else {
    joined = kj::str(basePath, path);
  }

  auto url = query.size() > 0
                 ? kj::str(parsed.scheme, "://", parsed.host, joined, "?", query)
                 : kj::str(parsed.scheme, "://", parsed.host, joined);
  return ProxyTarget{kj::mv(parsed.scheme), kj::mv(parsed.host), kj::mv(url)};
}

ProxyHandler::ProxyHandler(kj::Timer& timer, kj::Network& network,
                           kj::Maybe<kj::Network&> tlsNetwork,
                           const kj::HttpHeaderTable& headerTable,
                           upstream::LoadBalancer& balancer, core::MetricsRegistry& metrics,
                           ProxyConfig config)
    : timer_(timer), headerTable_(headerTable), balancer_(balancer), config_(kj::mv(config)),
      retries_(metrics.register_counter("portico_upstream_retries_total",
                                        "Upstream attempts repeated after a transport failure")) {
  kj::HttpClientSettings settings;
  settings.idleTimeout = config_.keepalive;

  plainClient_ = kj::newHttpClient(timer_, headerTable_, network, kj::none, settings);
  KJ_IF_SOME(tls, tlsNetwork) {
    tlsClient_ = kj::newHttpClient(timer_, headerTable_, network, tls, settings);
  }
}

kj::HttpClient& ProxyHandler::client_for(const ProxyTarget& target) {
  kj::HttpClient* pool = plainClient_.get();
  if (target.scheme == "https") {
    KJ_IF_SOME(tls, tlsClient_) {
      pool = tls.get();
    } else {
      core::throw_error(core::ErrorKind::UpstreamFailure,
                        kj::str("no TLS support configured for ", target.authority));
    }
  }

  auto key = kj::str(target.scheme, "://", target.authority);
  return *backends_.findOrCreate(key, [&]() -> decltype(backends_)::Entry {
    auto limited = kj::newConcurrencyLimitingHttpClient(
        *pool, config_.max_connections_per_backend,
        [authority = kj::str(target.authority)](uint running, uint pending) {
          if (pending > 0) {
            KJ_LOG(DBG, "Backend at concurrency limit", authority, running, pending);
          }
        });
    return {kj::str(key), kj::mv(limited)};
  });
}

upstream::CircuitBreaker& ProxyHandler::get_or_create_breaker(kj::StringPtr authority) {
  return *breakers_.findOrCreate(authority, [&]() -> decltype(breakers_)::Entry {
    auto breaker = kj::heap<upstream::CircuitBreaker>(authority, config_.circuit_breaker);
    breaker->subscribe([name = kj::str(authority)](const upstream::CircuitEvent& event) {
      if (event.kind == upstream::CircuitEvent::Kind::Opened) {
        KJ_LOG(WARNING, "Backend circuit opened", name, event.failures);
      } else if (event.kind == upstream::CircuitEvent::Kind::Closed) {
        KJ_LOG(INFO, "Backend circuit closed", name);
      }
    });
    return {kj::str(authority), kj::mv(breaker)};
  });
}

kj::Maybe<upstream::CircuitBreaker&> ProxyHandler::breaker_for(kj::StringPtr authority) {
  KJ_IF_SOME(breaker, breakers_.find(authority)) {
    return *breaker;
  }
  return kj::none;
}

kj::HttpHeaders ProxyHandler::build_headers(const RequestContext& ctx,
                                            kj::StringPtr authority) const {
  kj::HttpHeaders headers(headerTable_);

  kj::Maybe<kj::StringPtr> forwardedFor;
  ctx.headers.forEach([&](kj::StringPtr name, kj::StringPtr value) {
    if (util::isHopByHopHeader(name) || util::equalsIgnoreCase(name, "host"_kj) ||
        util::equalsIgnoreCase(name, "x-forwarded-proto"_kj) ||
        util::equalsIgnoreCase(name, "x-forwarded-host"_kj) ||
        util::equalsIgnoreCase(name, "x-request-id"_kj)) {
      return;
    }
    if (util::equalsIgnoreCase(name, "x-forwarded-for"_kj)) {
      forwardedFor = value;
      return;
    }
    headers.addPtrPtr(name, value);
  });

  headers.set(kj::HttpHeaderId::HOST, kj::str(authority));
  headers.add("X-Forwarded-Proto"_kj, kj::str(ctx.protocol));
  KJ_IF_SOME(host, ctx.headers.get(kj::HttpHeaderId::HOST)) {
    headers.add("X-Forwarded-Host"_kj, kj::str(host));
  }
  KJ_IF_SOME(previous, forwardedFor) {
    headers.add("X-Forwarded-For"_kj, kj::str(previous, ", ", ctx.clientIP));
  } else {
    headers.add("X-Forwarded-For"_kj, kj::str(ctx.clientIP));
  }
  headers.add("X-Request-Id"_kj, kj::str(ctx.requestId));
  return headers;
}

kj::Promise<void> ProxyHandler::forward(RequestContext& ctx, const ProxyTarget& target,
                                        TrackingInputStream& body) {
  auto& client = client_for(target);
  auto headers = build_headers(ctx, target.authority);

  auto expectedSize = body.tryGetLength();
  auto request = client.request(ctx.method, target.url, headers, expectedSize);

  // Upload concurrently with waiting for the response; a backend may answer before reading
  // the whole body.
  kj::Promise<void> upload = kj::READY_NOW;
  if (expectedSize.orDefault(1) > 0) {
    upload = body.pumpTo(*request.body)
                 .ignoreResult()
                 .attach(kj::mv(request.body))
                 .eagerlyEvaluate([requestId = kj::str(ctx.requestId)](kj::Exception&& e) {
                   KJ_LOG(DBG, "Request body upload ended early", requestId, e.getDescription());
                 });
  } else {
    request.body = nullptr;
  }

  auto response = co_await kj::mv(request.response);

  kj::HttpHeaders responseHeaders(headerTable_);
  response.headers->forEach([&](kj::StringPtr name, kj::StringPtr value) {
    if (!util::isHopByHopHeader(name)) {
      responseHeaders.addPtrPtr(name, value);
    }
  });

  auto expectedSize = response.body->tryGetLength();
  if (ctx.method == kj::HttpMethod::HEAD) {
    // The body is empty; the upstream's Content-Length describes the GET entity
    KJ_IF_SOME(length, response.headers->get(kj::HttpHeaderId::CONTENT_LENGTH)) {
      expectedSize = length.tryParseAs<uint64_t>();
    }
  }

  auto stream = ctx.response.send(response.statusCode, response.statusText, responseHeaders,
                                  expectedSize);
  co_await response.body->pumpTo(*stream);
  co_await kj::mv(upload);
}

kj::Promise<void> ProxyHandler::attempt(RequestContext& ctx, const ProxyTarget& target,
                                        TrackingInputStream& body, kj::Duration timeout) {
  auto guarded = [&]() -> kj::Promise<void> {
    return forward(ctx, target, body).exclusiveJoin(
        timer_.afterDelay(timeout).then([&target, timeout]() -> kj::Promise<void> {
          return core::make_error(
              core::ErrorKind::UpstreamTimeout,
              kj::str("upstream ", target.authority, " did not answer within ",
                      timeout / kj::MILLISECONDS, "ms"));
        }));
  };

  if (!config_.circuit_breaker_enabled) {
    return guarded();
  }
  return get_or_create_breaker(target.authority).execute<void>(kj::mv(guarded));
}

kj::Promise<void> ProxyHandler::handle(RequestContext& ctx) {
  auto& route = *KJ_REQUIRE_NONNULL(ctx.route, "proxy invoked without a matched route");

  kj::String base;
  kj::Maybe<kj::String> service;
  KJ_IF_SOME(name, route.service()) {
    KJ_IF_SOME(selection, balancer_.get_next(name, kj::StringPtr(ctx.clientIP))) {
      base = kj::mv(selection.url);
      service = kj::str(name);
      ctx.instance = kj::str(base);
    } else {
      core::throw_error(core::ErrorKind::ServiceUnavailable,
                        kj::str("no healthy instance of service ", name));
    }
  } else {
    base = kj::str(KJ_ASSERT_NONNULL(route.target()));
  }
  KJ_DEFER({
    KJ_IF_SOME(name, service) {
      balancer_.release(name, base);
    }
  });

  auto target = resolve_target(base, route.rebase(ctx.path), ctx.queryString);
  auto& policy = route.retry();
  TrackingInputStream body(ctx.body);

  for (uint attemptNo = 0;; ++attemptNo) {
    kj::Maybe<kj::Exception> failure;
    try {
      co_await attempt(ctx, target, body, route.timeout());
      co_return;
    } catch (kj::Exception& e) {
      failure = kj::mv(e);
    }
    auto error = KJ_ASSERT_NONNULL(kj::mv(failure));

    // Typed failures (timeout, open circuit) and anything after the response started are
    // final.
    if (core::error_kind(error) != kj::none || ctx.response.started()) {
      kj::throwFatalException(kj::mv(error));
    }

    if (attemptNo >= policy.attempts || body.consumed()) {
      KJ_LOG(WARNING, "Upstream request failed", ctx.requestId, target.url, attemptNo + 1,
             error.getDescription());
      kj::throwFatalException(core::make_error(
          core::ErrorKind::UpstreamFailure,
          kj::str("upstream ", target.authority, " failed after ", attemptNo + 1, " attempt(s)")));
    }

    retries_.increment();
    auto delay = policy.backoff(attemptNo);
    KJ_LOG(INFO, "Retrying upstream request", ctx.requestId, target.url, attemptNo + 1,
           delay / kj::MILLISECONDS, error.getDescription());
    co_await timer_.afterDelay(delay);
  }
}

} // namespace portico::gateway
