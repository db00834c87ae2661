#include "portico/core/error.h"
#include "router.h"

#include <kj/compat/http.h>
#include <kj/test.h>

namespace portico::gateway {
namespace {

RouteConfig targetConfig(kj::StringPtr target,
                         std::initializer_list<kj::HttpMethod> methods = {}) {
  RouteConfig config;
  config.target = kj::str(target);
  for (auto method : methods) {
    config.methods.add(method);
  }
  return config;
}

kj::StringPtr targetOf(const RouteMatch& match) {
  return KJ_ASSERT_NONNULL(match.route->target());
}

void expectInvalidConfig(kj::Function<void()> action) {
  KJ_IF_SOME(e, kj::runCatchingExceptions([&]() { action(); })) {
    KJ_EXPECT(core::error_kind_or_internal(e) == core::ErrorKind::InvalidConfig, e.getDescription());
  } else {
    KJ_FAIL_EXPECT("expected InvalidConfig");
  }
}

KJ_TEST("Router: exact path matching") {
  Router router;
  router.add_route("/api/orders", targetConfig("http://orders:8080"));
  KJ_EXPECT(router.route_count() == 1);

  KJ_IF_SOME(match, router.match("/api/orders", kj::HttpMethod::GET)) {
    KJ_EXPECT(targetOf(match) == "http://orders:8080");
    KJ_EXPECT(match.route->is_exact());
    KJ_EXPECT(match.path_params.size() == 0);
  } else {
    KJ_FAIL_EXPECT("Expected match for exact path");
  }

  KJ_EXPECT(router.match("/api/orders/123", kj::HttpMethod::GET) == kj::none);
}

KJ_TEST("Router: registering an exact path again replaces the route") {
  Router router;
  router.add_route("/api/users", targetConfig("http://a"));
  router.add_route("/api/users", targetConfig("http://b"));

  KJ_EXPECT(router.route_count() == 1);
  auto match = KJ_ASSERT_NONNULL(router.match("/api/users", kj::HttpMethod::GET));
  KJ_EXPECT(targetOf(match) == "http://b");
}

KJ_TEST("Router: path parameters and query are bound") {
  Router router;
  router.add_route("/api/users/:id", targetConfig("http://users"));
  router.add_route("/api/users/:id/orders/:orderId", targetConfig("http://orders"));

  auto match = KJ_ASSERT_NONNULL(router.match("/api/users/42?full=1&x=a%20b", kj::HttpMethod::GET));
  KJ_EXPECT(targetOf(match) == "http://users");
  KJ_EXPECT(KJ_ASSERT_NONNULL(match.path_params.find("id")) == "42");
  KJ_EXPECT(KJ_ASSERT_NONNULL(match.query.find("full")) == "1");
  KJ_EXPECT(KJ_ASSERT_NONNULL(match.query.find("x")) == "a b");

  auto nested =
      KJ_ASSERT_NONNULL(router.match("/api/users/7/orders/abc", kj::HttpMethod::GET));
  KJ_EXPECT(targetOf(nested) == "http://orders");
  KJ_EXPECT(KJ_ASSERT_NONNULL(nested.path_params.find("id")) == "7");
  KJ_EXPECT(KJ_ASSERT_NONNULL(nested.path_params.find("orderId")) == "abc");

  // A parameter never spans a '/'
  KJ_EXPECT(router.match("/api/users/7/8", kj::HttpMethod::GET) == kj::none);
}

KJ_TEST("Router: wildcard spans segments") {
  Router router;
  router.add_route("/api/echo/*", targetConfig("http://echo"));

  KJ_EXPECT(router.match("/api/echo/a", kj::HttpMethod::GET) != kj::none);
  KJ_EXPECT(router.match("/api/echo/a/b/c", kj::HttpMethod::GET) != kj::none);
  KJ_EXPECT(router.match("/api/other/a", kj::HttpMethod::GET) == kj::none);
}

KJ_TEST("Router: a trailing slash reaches the wildcard under it") {
  Router router;
  router.add_route("/api/echo/*", targetConfig("http://echo"));

  auto match = KJ_ASSERT_NONNULL(router.match("/api/echo/?x=1", kj::HttpMethod::GET));
  KJ_EXPECT(match.route->pattern() == "/api/echo/*");
  KJ_EXPECT(match.route->rebase("/api/echo"_kj) == "/");
  KJ_EXPECT(router.allowed_methods("/api/echo/").size() == 1);

  // Without the slash the wildcard's separator is missing
  KJ_EXPECT(router.match("/api/echo", kj::HttpMethod::GET) == kj::none);
}

KJ_TEST("Router: paths are normalized before lookup") {
  Router router;
  router.add_route("/api/orders", targetConfig("http://orders"));

  KJ_EXPECT(router.match("//api//orders/", kj::HttpMethod::GET) != kj::none);
  KJ_EXPECT(router.match("/api/orders#frag", kj::HttpMethod::GET) != kj::none);
}

KJ_TEST("Router: method mismatch does not block later routes") {
  Router router;
  router.add_route("/api/items/:id", targetConfig("http://writer", {kj::HttpMethod::POST}));
  router.add_route("/api/items/*", targetConfig("http://reader", {kj::HttpMethod::GET}));

  auto get = KJ_ASSERT_NONNULL(router.match("/api/items/5", kj::HttpMethod::GET));
  KJ_EXPECT(targetOf(get) == "http://reader");

  auto post = KJ_ASSERT_NONNULL(router.match("/api/items/5", kj::HttpMethod::POST));
  KJ_EXPECT(targetOf(post) == "http://writer");

  KJ_EXPECT(router.match("/api/items/5", kj::HttpMethod::DELETE) == kj::none);
}

KJ_TEST("Router: pattern routes are tried in registration order") {
  Router router;
  router.add_route("/api/*", targetConfig("http://catch-all"));
  router.add_route("/api/users/:id", targetConfig("http://users"));

  auto match = KJ_ASSERT_NONNULL(router.match("/api/users/1", kj::HttpMethod::GET));
  KJ_EXPECT(targetOf(match) == "http://catch-all");
}

KJ_TEST("Router: allowed methods are collected across matching routes") {
  Router router;
  router.add_route("/api/items/:id",
                   targetConfig("http://a", {kj::HttpMethod::GET, kj::HttpMethod::PUT}));
  router.add_route("/api/items/*", targetConfig("http://b", {kj::HttpMethod::PUT,
                                                             kj::HttpMethod::DELETE}));

  auto allowed = router.allowed_methods("/api/items/9");
  KJ_ASSERT(allowed.size() == 3);
  KJ_EXPECT(allowed[0] == kj::HttpMethod::GET);
  KJ_EXPECT(allowed[1] == kj::HttpMethod::PUT);
  KJ_EXPECT(allowed[2] == kj::HttpMethod::DELETE);

  KJ_EXPECT(router.allowed_methods("/nothing/here").size() == 0);
}

KJ_TEST("Router: routes default to GET") {
  Router router;
  auto route = router.add_route("/health/deep", targetConfig("http://x"));
  KJ_EXPECT(route->methods().size() == 1);
  KJ_EXPECT(route->allows(kj::HttpMethod::GET));
  KJ_EXPECT(!route->allows(kj::HttpMethod::POST));
  KJ_EXPECT(route->timeout() == 30 * kj::SECONDS);
  KJ_EXPECT(route->retry().attempts == 0);
  KJ_EXPECT(route->retry().delay == 1000 * kj::MILLISECONDS);
  KJ_EXPECT(!route->auth_required());
}

KJ_TEST("Router: rebase strips the static prefix") {
  Router router;
  auto echo = router.add_route("/api/echo/*", targetConfig("http://echo"));
  KJ_EXPECT(echo->rebase("/api/echo/a/b") == "/a/b");
  KJ_EXPECT(echo->rebase("/api/echo") == "/");

  auto users = router.add_route("/api/users/:id", targetConfig("http://users"));
  KJ_EXPECT(users->rebase("/api/users/42") == "/42");

  auto root = router.add_route("/:tenant/status", targetConfig("http://status"));
  KJ_EXPECT(root->rebase("/acme/status") == "/acme/status");
}

KJ_TEST("Router: remove and clear") {
  Router router;
  router.add_route("/a", targetConfig("http://a"));
  router.add_route("/b/:id", targetConfig("http://b"));
  KJ_EXPECT(router.routes().size() == 2);

  KJ_EXPECT(router.remove_route("/b/:id"));
  KJ_EXPECT(!router.remove_route("/b/:id"));
  KJ_EXPECT(router.match("/b/1", kj::HttpMethod::GET) == kj::none);
  KJ_EXPECT(router.route_count() == 1);

  router.clear();
  KJ_EXPECT(router.route_count() == 0);
  KJ_EXPECT(router.match("/a", kj::HttpMethod::GET) == kj::none);
}

KJ_TEST("Router: service routes") {
  Router router;
  RouteConfig config;
  config.service = kj::str("users");
  auto route = router.add_route("/users/*", kj::mv(config));
  KJ_EXPECT(route->target() == kj::none);
  KJ_EXPECT(KJ_ASSERT_NONNULL(route->service()) == "users");
}

KJ_TEST("Router: malformed registrations are rejected") {
  Router router;
  expectInvalidConfig([&]() { router.add_route("api/no-slash", targetConfig("http://a")); });
  expectInvalidConfig([&]() { router.add_route("/x", RouteConfig{}); });
  expectInvalidConfig([&]() {
    auto config = targetConfig("http://a");
    config.service = kj::str("svc");
    router.add_route("/x", kj::mv(config));
  });
  expectInvalidConfig([&]() { router.add_route("/x", targetConfig("ftp://files")); });
  expectInvalidConfig([&]() { router.add_route("/x", targetConfig("not a url")); });
  expectInvalidConfig([&]() {
    auto config = targetConfig("http://a");
    config.retry.attempts = RetryPolicy::MAX_ATTEMPTS + 1;
    router.add_route("/x", kj::mv(config));
  });
  expectInvalidConfig([&]() {
    auto config = targetConfig("http://a");
    config.retry.delay = RetryPolicy::MAX_BACKOFF + 1 * kj::SECONDS;
    router.add_route("/x", kj::mv(config));
  });
  KJ_EXPECT(router.route_count() == 0);
}

KJ_TEST("Router: retry backoff doubles and saturates") {
  RetryPolicy policy;
  policy.delay = 100 * kj::MILLISECONDS;
  KJ_EXPECT(policy.backoff(0) == 100 * kj::MILLISECONDS);
  KJ_EXPECT(policy.backoff(1) == 200 * kj::MILLISECONDS);
  KJ_EXPECT(policy.backoff(3) == 800 * kj::MILLISECONDS);
  KJ_EXPECT(policy.backoff(RetryPolicy::MAX_ATTEMPTS) == 60 * kj::SECONDS);
  KJ_EXPECT(policy.backoff(200) == RetryPolicy::MAX_BACKOFF);
}

} // namespace
} // namespace portico::gateway
