/**
 * @file test_gateway_server.cpp
 * @brief Tests for GatewayServer dispatch, error mapping and lifecycle events
 *
 * Tests cover:
 * - 404 and 405 (with Allow) responses from the router
 * - Health and metrics endpoints answered before the middleware chain
 * - Middleware order and short-circuiting
 * - A gateway-wide circuit breaker in the chain in front of the proxy
 * - Typed and untyped failures mapped to status codes
 * - RequestCompleted, RequestFailed, ServerStarted and ServerStopped events
 */

#include "gateway_server.h"
#include "middleware/circuit_breaker_middleware.h"
#include "portico/core/error.h"
#include "portico/core/json.h"
#include "test_common.h"
#include "test_config.h"

#include <kj/async-io.h>
#include <kj/compat/http.h>
#include <kj/string.h>
#include <kj/test.h>
#include <kj/vector.h>

namespace portico::gateway {
namespace {

using ::portico::test::TestContext;
using test::contains;
using test::EmptyInputStream;
using test::MockHttpResponse;

class RecordingMiddleware final : public Middleware {
public:
  RecordingMiddleware(kj::StringPtr name, kj::Vector<kj::String>& order)
      : name_(kj::str(name)), order_(order) {}

  kj::Promise<void> process(RequestContext&, kj::Function<kj::Promise<void>()> next) override {
    order_.add(kj::str(name_));
    return next();
  }

  kj::StringPtr name() const override {
    return name_;
  }

private:
  kj::String name_;
  kj::Vector<kj::String>& order_;
};

/// Answers 418 without calling next().
class TeapotMiddleware final : public Middleware {
public:
  kj::Promise<void> process(RequestContext& ctx, kj::Function<kj::Promise<void>()>) override {
    return ctx.sendError(418, "teapot"_kj, "short and stout"_kj);
  }

  kj::StringPtr name() const override {
    return "teapot"_kj;
  }
};

class ThrowingMiddleware final : public Middleware {
public:
  explicit ThrowingMiddleware(kj::Exception exception) : exception_(kj::mv(exception)) {}

  kj::Promise<void> process(RequestContext&, kj::Function<kj::Promise<void>()>) override {
    return kj::cp(exception_);
  }

  kj::StringPtr name() const override {
    return "throwing"_kj;
  }

private:
  kj::Exception exception_;
};

struct ServerHarness {
  explicit ServerHarness(TestContext& io)
      : io(io), proxy(io.timer(), io.ioProvider().getNetwork(), kj::none, table, balancer, metrics),
        server(io.timer(), table, router, proxy, metrics) {}

  /// Run one request through the pipeline and return the recorded response.
  kj::Own<MockHttpResponse> call(kj::HttpMethod method, kj::StringPtr url) {
    kj::HttpHeaders headers(table);
    EmptyInputStream body;
    auto response = kj::heap<MockHttpResponse>(table);
    server.request(method, url, headers, body, *response).wait(io.waitScope());
    return response;
  }

  RouteConfig target_route(kj::ArrayPtr<const kj::HttpMethod> methods = nullptr) {
    RouteConfig config;
    config.target = kj::str("http://127.0.0.1:9");
    for (auto method : methods) {
      config.methods.add(method);
    }
    return config;
  }

  TestContext& io;
  kj::HttpHeaderTable table;
  core::MetricsRegistry metrics;
  upstream::LoadBalancer balancer;
  Router router;
  ProxyHandler proxy;
  GatewayServer server;
};

KJ_TEST("Gateway::Server: unknown path answers 404 with the error body and a request id") {
  TestContext io;
  ServerHarness h(io);

  auto response = h.call(kj::HttpMethod::GET, "/nowhere"_kj);
  KJ_EXPECT(response->statusCode == 404);

  auto doc = core::JsonDocument::parse(response->body);
  KJ_EXPECT(doc.root()["error"_kj].get_string() == "not_found");
  KJ_EXPECT(doc.root()["message"_kj].get_string() == "Route not found");

  auto requestId = KJ_ASSERT_NONNULL(response->header("X-Request-Id"_kj));
  KJ_EXPECT(requestId.size() > 0);
  KJ_EXPECT(doc.root()["requestId"_kj].get_string() == requestId);
}

KJ_TEST("Gateway::Server: wrong method answers 405 with an Allow header") {
  TestContext io;
  ServerHarness h(io);
  const kj::HttpMethod methods[] = {kj::HttpMethod::GET, kj::HttpMethod::POST};
  h.router.add_route("/orders"_kj, h.target_route(methods));

  auto response = h.call(kj::HttpMethod::DELETE, "/orders"_kj);
  KJ_EXPECT(response->statusCode == 405);
  KJ_EXPECT(KJ_ASSERT_NONNULL(response->header("Allow"_kj)) == "GET, POST");
  KJ_EXPECT(contains(response->body, "Method DELETE not allowed"), response->body);
}

KJ_TEST("Gateway::Server: health and metrics endpoints bypass the middleware chain") {
  TestContext io;
  ServerHarness h(io);
  h.server.use(kj::heap<TeapotMiddleware>());
  h.router.add_route("/a"_kj, h.target_route());
  h.router.add_route("/b"_kj, h.target_route());
  h.metrics.register_counter("portico_test_total"_kj, "test counter"_kj).increment();

  auto health = h.call(kj::HttpMethod::GET, "/health"_kj);
  KJ_EXPECT(health->statusCode == 200);
  auto doc = core::JsonDocument::parse(health->body);
  KJ_EXPECT(doc.root()["status"_kj].get_string() == "ok");
  KJ_EXPECT(doc.root()["routes"_kj].get_int() == 2);
  KJ_EXPECT(doc.root()["middlewares"_kj].get_int() == 1);
  KJ_EXPECT(doc.root()["memory"_kj].is_object());

  auto metrics = h.call(kj::HttpMethod::GET, "/metrics"_kj);
  KJ_EXPECT(metrics->statusCode == 200);
  KJ_EXPECT(contains(metrics->body, "portico_test_total 1"), metrics->body);

  // Any other path goes through the chain
  auto other = h.call(kj::HttpMethod::GET, "/a"_kj);
  KJ_EXPECT(other->statusCode == 418);
}

KJ_TEST("Gateway::Server: middleware runs in registration order and may answer early") {
  TestContext io;
  ServerHarness h(io);
  kj::Vector<kj::String> order;
  h.server.use(kj::heap<RecordingMiddleware>("first"_kj, order));
  h.server.use(kj::heap<RecordingMiddleware>("second"_kj, order));
  h.server.use(kj::heap<TeapotMiddleware>());
  h.server.use(kj::heap<RecordingMiddleware>("never"_kj, order));
  KJ_EXPECT(h.server.middleware_count() == 4);

  auto response = h.call(kj::HttpMethod::GET, "/anything"_kj);
  KJ_EXPECT(response->statusCode == 418);
  KJ_ASSERT(order.size() == 2);
  KJ_EXPECT(order[0] == "first");
  KJ_EXPECT(order[1] == "second");
}

KJ_TEST("Gateway::Server: routes requiring auth answer 401 without an identity") {
  TestContext io;
  ServerHarness h(io);
  auto config = h.target_route();
  config.auth = true;
  h.router.add_route("/private"_kj, kj::mv(config));

  auto response = h.call(kj::HttpMethod::GET, "/private"_kj);
  KJ_EXPECT(response->statusCode == 401);
  KJ_EXPECT(contains(response->body, "\"unauthorized\""), response->body);
}

KJ_TEST("Gateway::Server: typed failures keep their status and Retry-After") {
  TestContext io;
  ServerHarness h(io);
  h.server.use(kj::heap<ThrowingMiddleware>(
      core::make_error(core::ErrorKind::RateLimited, "bucket empty", 3 * kj::SECONDS)));

  auto response = h.call(kj::HttpMethod::GET, "/x"_kj);
  KJ_EXPECT(response->statusCode == 429);
  KJ_EXPECT(KJ_ASSERT_NONNULL(response->header("Retry-After"_kj)) == "3");

  // The exception description is not leaked to the client
  KJ_EXPECT(!contains(response->body, "bucket empty"), response->body);
  auto doc = core::JsonDocument::parse(response->body);
  KJ_EXPECT(doc.root()["error"_kj].get_string() == "rate_limited");
  KJ_EXPECT(doc.root()["retryAfter"_kj].get_int() == 3);
}

KJ_TEST("Gateway::Server: untyped failures become a generic 500 and a RequestFailed event") {
  TestContext io;
  ServerHarness h(io);
  h.server.use(kj::heap<ThrowingMiddleware>(KJ_EXCEPTION(FAILED, "database on fire")));

  kj::Vector<kj::String> failures;
  h.server.on_error().subscribe(
      [&](const RequestFailed& event) { failures.add(kj::str(event.message)); });

  KJ_EXPECT_LOG(ERROR, "unhandled error in request pipeline");
  auto response = h.call(kj::HttpMethod::GET, "/x"_kj);
  KJ_EXPECT(response->statusCode == 500);
  KJ_EXPECT(contains(response->body, "Internal server error"), response->body);
  KJ_EXPECT(!contains(response->body, "database on fire"), response->body);

  KJ_ASSERT(failures.size() == 1);
  KJ_EXPECT(contains(failures[0], "database on fire"), failures[0]);
}

KJ_TEST("Gateway::Server: every request publishes RequestCompleted") {
  TestContext io;
  ServerHarness h(io);
  const kj::HttpMethod methods[] = {kj::HttpMethod::GET};
  h.router.add_route("/orders"_kj, h.target_route(methods));

  struct Seen {
    kj::String path;
    uint status;
    kj::HttpMethod method;
  };
  kj::Vector<Seen> seen;
  h.server.on_request().subscribe([&](const RequestCompleted& event) {
    seen.add(Seen{kj::str(event.path), event.status, event.method});
  });

  (void)h.call(kj::HttpMethod::GET, "/missing"_kj);
  (void)h.call(kj::HttpMethod::PUT, "/orders"_kj);
  (void)h.call(kj::HttpMethod::GET, "/health"_kj);

  KJ_ASSERT(seen.size() == 3);
  KJ_EXPECT(seen[0].path == "/missing");
  KJ_EXPECT(seen[0].status == 404);
  KJ_EXPECT(seen[1].status == 405);
  KJ_EXPECT(seen[1].method == kj::HttpMethod::PUT);
  KJ_EXPECT(seen[2].status == 200);
}

KJ_TEST("Gateway::Server: listen serves until stop and publishes lifecycle events") {
  TestContext io;
  ServerHarness h(io);

  kj::Maybe<uint> startedPort;
  bool stopped = false;
  h.server.on_started().subscribe([&](const ServerStarted& event) { startedPort = event.port; });
  h.server.on_stopped().subscribe([&](const ServerStopped&) { stopped = true; });

  auto receiver = io.listenLoopback();
  uint port = receiver->getPort();
  auto serving = h.server.listen(kj::mv(receiver), "127.0.0.1"_kj).eagerlyEvaluate(nullptr);

  {
    auto client = kj::newHttpClient(io.timer(), h.table, io.ioProvider().getNetwork());
    kj::HttpHeaders headers(h.table);
    auto url = kj::str("http://127.0.0.1:", port, "/health");
    auto request = client->request(kj::HttpMethod::GET, url, headers, uint64_t(0));
    request.body = nullptr;
    auto response = request.response.wait(io.waitScope());
    KJ_EXPECT(response.statusCode == 200);
    auto body = response.body->readAllText().wait(io.waitScope());
    KJ_EXPECT(contains(body, "\"status\":\"ok\""), body);
  }

  KJ_EXPECT(KJ_ASSERT_NONNULL(startedPort) == port);
  KJ_EXPECT(!stopped);

  h.server.stop();
  serving.wait(io.waitScope());
  KJ_EXPECT(stopped);
}

KJ_TEST("Gateway::Server: stop before listen returns immediately") {
  TestContext io;
  ServerHarness h(io);
  h.server.stop();
  h.server.stop();

  bool stopped = false;
  h.server.on_stopped().subscribe([&](const ServerStopped&) { stopped = true; });
  h.server.listen(io.listenLoopback(), "127.0.0.1"_kj).wait(io.waitScope());
  KJ_EXPECT(stopped);
}

KJ_TEST("Gateway::Server: a gateway circuit breaker opens on proxy failures") {
  TestContext io;
  ServerHarness h(io);

  auto receiver = io.listenLoopback();
  uint deadPort = receiver->getPort();
  receiver = nullptr;

  RouteConfig config;
  config.target = kj::str("http://127.0.0.1:", deadPort);
  h.router.add_route("/down"_kj, kj::mv(config));

  upstream::CircuitBreakerConfig breakerConfig;
  breakerConfig.failure_threshold = 2;
  auto breaker = kj::heap<upstream::CircuitBreaker>("gateway"_kj, breakerConfig);
  auto& guard = *breaker;
  h.server.use(kj::heap<CircuitBreakerMiddleware>(kj::mv(breaker), h.metrics));

  KJ_EXPECT(h.call(kj::HttpMethod::GET, "/down"_kj)->statusCode == 502);
  KJ_EXPECT(h.call(kj::HttpMethod::GET, "/down"_kj)->statusCode == 502);
  KJ_EXPECT(guard.state() == upstream::CircuitState::Open);

  auto rejected = h.call(kj::HttpMethod::GET, "/down"_kj);
  KJ_EXPECT(rejected->statusCode == 503);
  KJ_EXPECT(contains(rejected->body, "\"error\":\"circuit_open\""), rejected->body);
  KJ_EXPECT(rejected->header("Retry-After"_kj) != kj::none);

  // Unmatched paths never reach the proxy and count as successes
  guard.reset();
  KJ_EXPECT(h.call(kj::HttpMethod::GET, "/nowhere"_kj)->statusCode == 404);
  KJ_EXPECT(guard.state() == upstream::CircuitState::Closed);
}

} // namespace
} // namespace portico::gateway
