/**
 * @file test_middleware.cpp
 * @brief Tests for the middleware chain components
 *
 * Tests cover:
 * - Credential extraction order and auth outcomes (401, 403, optional mode)
 * - Rate-limit headers and 429 rejection
 * - Circuit breaker accounting of statuses, failures and admission rejections
 * - Access log formats, levels and header redaction
 * - Request metrics
 */

#include "auth/jwt_verifier.h"
#include "middleware/access_log_middleware.h"
#include "middleware/auth_middleware.h"
#include "middleware/circuit_breaker_middleware.h"
#include "middleware/metrics_middleware.h"
#include "middleware/rate_limit_middleware.h"
#include "portico/core/error.h"
#include "portico/core/json.h"
#include "portico/core/metrics.h"
#include "test_common.h"

#include <kj/async.h>
#include <kj/test.h>

namespace portico::gateway {
namespace {

using test::CaptureOutput;
using test::contains;
using test::RequestFixture;
using test::respondWith;

constexpr kj::StringPtr SECRET = "0123456789abcdef0123456789abcdef"_kj;

kj::Own<auth::JwtVerifier> verifier() {
  auth::JwtConfig config;
  config.secret = kj::str(SECRET);
  return kj::heap<auth::JwtVerifier>(kj::mv(config));
}

kj::String issue(kj::StringPtr subject, std::initializer_list<kj::StringPtr> roles) {
  kj::Vector<kj::String> owned;
  for (auto role : roles) {
    owned.add(kj::str(role));
  }
  return verifier()->issue(subject, owned.asPtr(), 1 * kj::HOURS);
}

kj::Function<kj::Promise<void>()> counting(RequestContext& ctx, int& calls, uint status = 200) {
  return [&ctx, &calls, status]() {
    ++calls;
    return respondWith(ctx, status)();
  };
}

// =============================================================================
// AuthMiddleware
// =============================================================================

KJ_TEST("AuthMiddleware: bearer token attaches identity") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  AuthMiddleware auth(verifier());

  RequestFixture req(kj::HttpMethod::GET, "/api/orders");
  auto token = issue("alice", {"trader"});
  req.setHeader("Authorization", kj::str("Bearer ", token));

  int calls = 0;
  auth.process(req.ctx, counting(req.ctx, calls)).wait(waitScope);

  KJ_EXPECT(calls == 1);
  auto& identity = KJ_ASSERT_NONNULL(req.ctx.identity);
  KJ_EXPECT(identity.subject == "alice");
  KJ_EXPECT(identity.has_role("trader"));
  KJ_EXPECT(req.inner.statusCode == 200);
}

KJ_TEST("AuthMiddleware: missing token in required mode answers 401") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  AuthMiddleware auth(verifier());

  RequestFixture req(kj::HttpMethod::GET, "/api/orders");
  int calls = 0;
  auth.process(req.ctx, counting(req.ctx, calls)).wait(waitScope);

  KJ_EXPECT(calls == 0);
  KJ_EXPECT(req.inner.statusCode == 401);
  KJ_EXPECT(KJ_ASSERT_NONNULL(req.inner.header("WWW-Authenticate")) == "Bearer");

  auto body = core::JsonDocument::parse(req.inner.body);
  KJ_EXPECT(body.root()["error"].get_string() == "unauthorized");
  KJ_EXPECT(body.root()["message"].get_string() == "No token provided");
  KJ_EXPECT(body.root()["requestId"].get_string() == req.ctx.requestId);
  KJ_EXPECT(body.root()["timestamp"].is_string());
}

KJ_TEST("AuthMiddleware: optional mode passes anonymous requests through") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  AuthMiddleware::Config config;
  config.required = false;
  AuthMiddleware auth(verifier(), kj::mv(config));

  RequestFixture req(kj::HttpMethod::GET, "/api/orders");
  int calls = 0;
  auth.process(req.ctx, counting(req.ctx, calls)).wait(waitScope);

  KJ_EXPECT(calls == 1);
  KJ_EXPECT(req.ctx.identity == kj::none);
}

KJ_TEST("AuthMiddleware: invalid token answers 401 even in optional mode") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  AuthMiddleware::Config config;
  config.required = false;
  AuthMiddleware auth(verifier(), kj::mv(config));

  RequestFixture req(kj::HttpMethod::GET, "/api/orders");
  req.setHeader("Authorization", "Bearer not.a.token");
  int calls = 0;
  auth.process(req.ctx, counting(req.ctx, calls)).wait(waitScope);

  KJ_EXPECT(calls == 0);
  KJ_EXPECT(req.inner.statusCode == 401);
  KJ_EXPECT(contains(req.inner.body, "Invalid or expired token"));
}

KJ_TEST("AuthMiddleware: token sources in priority order") {
  auto token = issue("bob", {});

  {
    RequestFixture req(kj::HttpMethod::GET, "/x?token=from-query");
    req.setHeader("Authorization", "bearer from-header");
    req.setHeader("Cookie", "token=from-cookie");
    KJ_EXPECT(KJ_ASSERT_NONNULL(AuthMiddleware::extract_token(req.ctx)) == "from-header");
  }
  {
    RequestFixture req(kj::HttpMethod::GET, "/x?a=1&token=from-query");
    req.setHeader("Cookie", "token=from-cookie");
    KJ_EXPECT(KJ_ASSERT_NONNULL(AuthMiddleware::extract_token(req.ctx)) == "from-query");
  }
  {
    RequestFixture req(kj::HttpMethod::GET, "/x");
    req.setHeader("Cookie", "theme=dark; token=from-cookie");
    KJ_EXPECT(KJ_ASSERT_NONNULL(AuthMiddleware::extract_token(req.ctx)) == "from-cookie");
  }
  {
    RequestFixture req(kj::HttpMethod::GET, "/x");
    req.setHeader("Authorization", "Basic dXNlcjpwYXNz");
    KJ_EXPECT(AuthMiddleware::extract_token(req.ctx) == kj::none);
  }
}

KJ_TEST("AuthMiddleware: public paths skip authentication") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  AuthMiddleware::Config config;
  config.public_paths.add(kj::str("/public/*"));
  config.public_paths.add(kj::str("/login"));
  AuthMiddleware auth(verifier(), kj::mv(config));

  int calls = 0;
  {
    RequestFixture req(kj::HttpMethod::GET, "/public/docs/index.html");
    auth.process(req.ctx, counting(req.ctx, calls)).wait(waitScope);
  }
  {
    RequestFixture req(kj::HttpMethod::POST, "/login");
    auth.process(req.ctx, counting(req.ctx, calls)).wait(waitScope);
  }
  KJ_EXPECT(calls == 2);

  RequestFixture req(kj::HttpMethod::GET, "/login/extra");
  auth.process(req.ctx, counting(req.ctx, calls)).wait(waitScope);
  KJ_EXPECT(calls == 2);
  KJ_EXPECT(req.inner.statusCode == 401);
}

KJ_TEST("AuthMiddleware: missing role answers 403") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  AuthMiddleware::Config config;
  config.required_roles.add(kj::str("admin"));
  config.required_roles.add(kj::str("operator"));
  AuthMiddleware auth(verifier(), kj::mv(config));

  int calls = 0;
  {
    RequestFixture req(kj::HttpMethod::GET, "/admin");
    req.setHeader("Authorization", kj::str("Bearer ", issue("carol", {"viewer"})));
    auth.process(req.ctx, counting(req.ctx, calls)).wait(waitScope);
    KJ_EXPECT(req.inner.statusCode == 403);
    KJ_EXPECT(contains(req.inner.body, "forbidden"));
  }
  {
    RequestFixture req(kj::HttpMethod::GET, "/admin");
    req.setHeader("Authorization", kj::str("Bearer ", issue("dave", {"operator"})));
    auth.process(req.ctx, counting(req.ctx, calls)).wait(waitScope);
    KJ_EXPECT(req.inner.statusCode == 200);
  }
  KJ_EXPECT(calls == 1);
}

// =============================================================================
// RateLimitMiddleware
// =============================================================================

KJ_TEST("RateLimitMiddleware: sets counters and rejects with 429") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  core::MetricsRegistry metrics;
  RateLimiterConfig config;
  config.max_requests = 2;
  config.window = 30 * kj::SECONDS;
  RateLimitMiddleware middleware(kj::heap<RateLimiter>(config), metrics);

  int calls = 0;
  for (auto expected : {"1"_kj, "0"_kj}) {
    RequestFixture req(kj::HttpMethod::GET, "/api/x", "192.0.2.7");
    middleware.process(req.ctx, counting(req.ctx, calls)).wait(waitScope);
    KJ_EXPECT(req.inner.statusCode == 200);
    KJ_EXPECT(KJ_ASSERT_NONNULL(req.inner.header("X-RateLimit-Limit")) == "2");
    KJ_EXPECT(KJ_ASSERT_NONNULL(req.inner.header("X-RateLimit-Remaining")) == expected);
    KJ_EXPECT(req.inner.header("X-RateLimit-Reset") != kj::none);
    KJ_EXPECT(req.inner.header("Retry-After") == kj::none);
  }

  RequestFixture req(kj::HttpMethod::GET, "/api/x", "192.0.2.7");
  middleware.process(req.ctx, counting(req.ctx, calls)).wait(waitScope);
  KJ_EXPECT(calls == 2);
  KJ_EXPECT(req.inner.statusCode == 429);
  KJ_EXPECT(KJ_ASSERT_NONNULL(req.inner.header("X-RateLimit-Remaining")) == "0");

  auto retryAfter = KJ_ASSERT_NONNULL(req.inner.header("Retry-After")).parseAs<int64_t>();
  KJ_EXPECT(retryAfter > 0 && retryAfter <= 30, retryAfter);

  auto body = core::JsonDocument::parse(req.inner.body);
  KJ_EXPECT(body.root()["error"].get_string() == "rate_limited");
  KJ_EXPECT(body.root()["message"].get_string() == "Too many requests");
  KJ_EXPECT(body.root()["retryAfter"].get_int() == retryAfter);

  KJ_EXPECT(metrics.register_counter("portico_rate_limited_total", "").value() == 1);

  // Another client has its own bucket
  RequestFixture other(kj::HttpMethod::GET, "/api/x", "192.0.2.8");
  middleware.process(other.ctx, counting(other.ctx, calls)).wait(waitScope);
  KJ_EXPECT(other.inner.statusCode == 200);
}

KJ_TEST("RateLimitMiddleware: skip predicate and custom key") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  core::MetricsRegistry metrics;
  RateLimiterConfig config;
  config.max_requests = 1;

  RateLimitOptions options;
  options.skip = kj::Function<bool(const RequestContext&)>(
      [](const RequestContext& ctx) { return ctx.path.startsWith("/internal"); });
  options.key_extractor = kj::Function<kj::String(const RequestContext&)>(
      [](const RequestContext& ctx) { return kj::str(ctx.getHeader("X-Api-Key").orDefault("anon"_kj)); });
  options.status_code = 503;
  options.message = kj::str("Slow down");
  RateLimitMiddleware middleware(kj::heap<RateLimiter>(config), metrics, kj::mv(options));

  int calls = 0;
  for (int i = 0; i < 3; ++i) {
    RequestFixture req(kj::HttpMethod::GET, "/internal/stats");
    middleware.process(req.ctx, counting(req.ctx, calls)).wait(waitScope);
    KJ_EXPECT(req.inner.header("X-RateLimit-Limit") == kj::none);
  }
  KJ_EXPECT(calls == 3);

  {
    RequestFixture req(kj::HttpMethod::GET, "/api", "1.1.1.1");
    req.setHeader("X-Api-Key", "key-1");
    middleware.process(req.ctx, counting(req.ctx, calls)).wait(waitScope);
    KJ_EXPECT(req.inner.statusCode == 200);
  }
  {
    // Same key from a different address shares the bucket
    RequestFixture req(kj::HttpMethod::GET, "/api", "2.2.2.2");
    req.setHeader("X-Api-Key", "key-1");
    middleware.process(req.ctx, counting(req.ctx, calls)).wait(waitScope);
    KJ_EXPECT(req.inner.statusCode == 503);
    KJ_EXPECT(contains(req.inner.body, "Slow down"));
  }
  KJ_EXPECT(middleware.limiter().bucket_count() == 1);
}

// =============================================================================
// CircuitBreakerMiddleware
// =============================================================================

upstream::CircuitBreakerConfig breakerConfig(size_t threshold) {
  upstream::CircuitBreakerConfig config;
  config.failure_threshold = threshold;
  config.timeout = 30 * kj::SECONDS;
  return config;
}

KJ_TEST("CircuitBreakerMiddleware: server errors trip the breaker") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  core::MetricsRegistry metrics;
  CircuitBreakerMiddleware middleware(
      kj::heap<upstream::CircuitBreaker>("backend", breakerConfig(2)), metrics);

  int calls = 0;
  for (int i = 0; i < 2; ++i) {
    RequestFixture req(kj::HttpMethod::GET, "/api");
    middleware.process(req.ctx, counting(req.ctx, calls, 502)).wait(waitScope);
  }
  KJ_EXPECT(middleware.breaker().state() == upstream::CircuitState::Open);

  RequestFixture req(kj::HttpMethod::GET, "/api");
  middleware.process(req.ctx, counting(req.ctx, calls)).wait(waitScope);
  KJ_EXPECT(calls == 2);
  KJ_EXPECT(req.inner.statusCode == 503);
  KJ_EXPECT(req.inner.header("Retry-After") != kj::none);

  auto body = core::JsonDocument::parse(req.inner.body);
  KJ_EXPECT(body.root()["error"].get_string() == "circuit_open");
  KJ_EXPECT(body.root()["retryAfter"].get_int() > 0);
  KJ_EXPECT(metrics.register_counter("portico_circuit_open_total", "").value() == 1);
}

KJ_TEST("CircuitBreakerMiddleware: client errors count as success") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  core::MetricsRegistry metrics;
  CircuitBreakerMiddleware middleware(
      kj::heap<upstream::CircuitBreaker>("backend", breakerConfig(1)), metrics);

  int calls = 0;
  for (int i = 0; i < 5; ++i) {
    RequestFixture req(kj::HttpMethod::GET, "/api");
    middleware.process(req.ctx, counting(req.ctx, calls, 404)).wait(waitScope);
  }
  KJ_EXPECT(middleware.breaker().state() == upstream::CircuitState::Closed);
}

KJ_TEST("CircuitBreakerMiddleware: thrown failures count, admission rejections do not") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  core::MetricsRegistry metrics;
  CircuitBreakerMiddleware middleware(
      kj::heap<upstream::CircuitBreaker>("backend", breakerConfig(2)), metrics);

  auto failWith = [](core::ErrorKind kind) {
    return kj::Function<kj::Promise<void>()>([kind]() -> kj::Promise<void> {
      return core::make_error(kind, "downstream");
    });
  };

  for (int i = 0; i < 4; ++i) {
    RequestFixture req(kj::HttpMethod::GET, "/api");
    auto result = kj::runCatchingExceptions([&]() {
      middleware.process(req.ctx, failWith(core::ErrorKind::RateLimited)).wait(waitScope);
    });
    KJ_EXPECT(result != kj::none);
  }
  KJ_EXPECT(middleware.breaker().state() == upstream::CircuitState::Closed);

  for (int i = 0; i < 2; ++i) {
    RequestFixture req(kj::HttpMethod::GET, "/api");
    KJ_IF_SOME(e, kj::runCatchingExceptions([&]() {
                 middleware.process(req.ctx, failWith(core::ErrorKind::UpstreamFailure))
                     .wait(waitScope);
               })) {
      KJ_EXPECT(core::error_kind_or_internal(e) == core::ErrorKind::UpstreamFailure);
    } else {
      KJ_FAIL_EXPECT("failure was swallowed");
    }
  }
  KJ_EXPECT(middleware.breaker().state() == upstream::CircuitState::Open);
}

// =============================================================================
// AccessLogMiddleware
// =============================================================================

KJ_TEST("AccessLogMiddleware: combined format") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  kj::Vector<CaptureOutput::Record> records;
  core::Logger logger(kj::heap<core::PlainFormatter>(), kj::heap<CaptureOutput>(records));
  AccessLogMiddleware middleware(logger);

  RequestFixture req(kj::HttpMethod::GET, "/api/items?page=2", "203.0.113.9");
  req.setHeader("User-Agent", "curl/8.4");
  int calls = 0;
  middleware.process(req.ctx, counting(req.ctx, calls)).wait(waitScope);

  KJ_ASSERT(records.size() == 1);
  auto& line = records[0].line;
  KJ_EXPECT(records[0].level == core::LogLevel::Info);
  KJ_EXPECT(line.startsWith("203.0.113.9 - - ["), line);
  KJ_EXPECT(contains(line, "\"GET /api/items?page=2\" 200 0 \"-\" \"curl/8.4\""), line);
}

KJ_TEST("AccessLogMiddleware: common and dev formats") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  kj::Vector<CaptureOutput::Record> records;
  core::Logger logger(kj::heap<core::PlainFormatter>(), kj::heap<CaptureOutput>(records));

  AccessLogMiddleware::Config common;
  common.format = AccessLogFormat::Common;
  AccessLogMiddleware commonLog(logger, kj::mv(common));
  AccessLogMiddleware::Config dev;
  dev.format = AccessLogFormat::Dev;
  AccessLogMiddleware devLog(logger, kj::mv(dev));

  int calls = 0;
  {
    RequestFixture req(kj::HttpMethod::POST, "/api/orders");
    req.setHeader("User-Agent", "curl/8.4");
    commonLog.process(req.ctx, counting(req.ctx, calls, 201)).wait(waitScope);
  }
  {
    RequestFixture req(kj::HttpMethod::DELETE, "/api/orders/1");
    devLog.process(req.ctx, counting(req.ctx, calls, 204)).wait(waitScope);
  }

  KJ_ASSERT(records.size() == 2);
  KJ_EXPECT(records[0].line.endsWith("\"POST /api/orders\" 201 0"), records[0].line);
  KJ_EXPECT(records[1].line.startsWith("DELETE /api/orders/1 \x1b[32m204"), records[1].line);
  KJ_EXPECT(records[1].line.endsWith("ms"), records[1].line);
}

KJ_TEST("AccessLogMiddleware: level follows status and exclusions apply") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  kj::Vector<CaptureOutput::Record> records;
  core::Logger logger(kj::heap<core::PlainFormatter>(), kj::heap<CaptureOutput>(records));
  AccessLogMiddleware middleware(logger);

  int calls = 0;
  for (uint status : {404u, 502u}) {
    RequestFixture req(kj::HttpMethod::GET, "/api");
    middleware.process(req.ctx, counting(req.ctx, calls, status)).wait(waitScope);
  }
  {
    RequestFixture req(kj::HttpMethod::GET, "/health");
    middleware.process(req.ctx, counting(req.ctx, calls)).wait(waitScope);
  }

  KJ_EXPECT(calls == 3);
  KJ_ASSERT(records.size() == 2);
  KJ_EXPECT(records[0].level == core::LogLevel::Warn);
  KJ_EXPECT(records[1].level == core::LogLevel::Error);
}

KJ_TEST("AccessLogMiddleware: failures are logged with their mapped status") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  kj::Vector<CaptureOutput::Record> records;
  core::Logger logger(kj::heap<core::PlainFormatter>(), kj::heap<CaptureOutput>(records));
  AccessLogMiddleware middleware(logger);

  RequestFixture req(kj::HttpMethod::GET, "/api/slow");
  auto result = kj::runCatchingExceptions([&]() {
    middleware
        .process(req.ctx,
                 []() -> kj::Promise<void> {
                   return core::make_error(core::ErrorKind::UpstreamTimeout, "slow backend");
                 })
        .wait(waitScope);
  });

  KJ_EXPECT(result != kj::none);
  KJ_ASSERT(records.size() == 1);
  KJ_EXPECT(records[0].level == core::LogLevel::Error);
  KJ_EXPECT(contains(records[0].line, "\" 504 -"), records[0].line);
}

KJ_TEST("AccessLogMiddleware: json records redact credentials") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  kj::Vector<CaptureOutput::Record> records;
  core::Logger logger(kj::heap<core::JsonFormatter>(), kj::heap<CaptureOutput>(records));
  AccessLogMiddleware::Config config;
  config.format = AccessLogFormat::Json;
  AccessLogMiddleware middleware(logger, kj::mv(config));

  RequestFixture req(kj::HttpMethod::GET, "/api/me");
  req.setHeader("Authorization", "Bearer secret-token");
  req.setHeader("Cookie", "session=secret-cookie");
  req.setHeader("X-Api-Key", "secret-key");
  req.setHeader("Accept", "application/json");
  int calls = 0;
  middleware.process(req.ctx, counting(req.ctx, calls)).wait(waitScope);

  KJ_ASSERT(records.size() == 1);
  auto& line = records[0].line;
  KJ_EXPECT(contains(line, "request completed"), line);
  KJ_EXPECT(!contains(line, "secret"), line);
  KJ_EXPECT(contains(line, "[REDACTED]"), line);

  auto headers = core::JsonDocument::parse(AccessLogMiddleware::sanitize_headers(req.headers));
  KJ_EXPECT(headers.root()["authorization"].get_string() == "[REDACTED]");
  KJ_EXPECT(headers.root()["cookie"].get_string() == "[REDACTED]");
  KJ_EXPECT(headers.root()["x-api-key"].get_string() == "[REDACTED]");
  KJ_EXPECT(headers.root()["accept"].get_string() == "application/json");
}

KJ_TEST("AccessLogMiddleware: format names") {
  KJ_EXPECT(KJ_ASSERT_NONNULL(parse_access_log_format("JSON")) == AccessLogFormat::Json);
  KJ_EXPECT(KJ_ASSERT_NONNULL(parse_access_log_format("dev")) == AccessLogFormat::Dev);
  KJ_EXPECT(parse_access_log_format("apache") == kj::none);
  KJ_EXPECT(to_string(AccessLogFormat::Common) == "common");
}

// =============================================================================
// MetricsMiddleware
// =============================================================================

KJ_TEST("MetricsMiddleware: counts requests, errors and durations") {
  kj::EventLoop loop;
  kj::WaitScope waitScope(loop);
  core::MetricsRegistry metrics;
  MetricsMiddleware middleware(metrics);

  auto& active = metrics.register_gauge("portico_active_requests", "");
  int calls = 0;
  for (uint status : {200u, 201u, 404u, 503u}) {
    RequestFixture req(kj::HttpMethod::GET, "/api");
    middleware
        .process(req.ctx,
                 [&, status]() {
                   KJ_EXPECT(active.value() == 1);
                   return counting(req.ctx, calls, status)();
                 })
        .wait(waitScope);
  }

  KJ_EXPECT(metrics.register_counter("portico_requests_total", "").value() == 4);
  KJ_EXPECT(metrics.register_counter("portico_request_errors_total", "").value() == 2);
  KJ_EXPECT(metrics.register_histogram("portico_request_duration_seconds", "").count() == 4);
  KJ_EXPECT(active.value() == 0);

  auto text = metrics.to_prometheus();
  KJ_EXPECT(contains(text, "portico_requests_total 4"), text);
}

} // namespace
} // namespace portico::gateway
