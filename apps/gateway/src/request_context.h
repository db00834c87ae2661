#pragma once

#include "auth/token_verifier.h"
#include "portico/core/error.h"

#include <kj/common.h>
#include <kj/compat/http.h>
#include <kj/function.h>
#include <kj/map.h>
#include <kj/refcount.h>
#include <kj/string.h>
#include <kj/time.h>
#include <kj/vector.h>

namespace portico::gateway {

class Route;

/**
 * Response wrapper handed to middleware and handlers.
 *
 * Records the status once a response has started and merges headers queued by middleware
 * (rate-limit counters, request id) into whatever response is eventually sent.
 */
class RecordingResponse final : public kj::HttpService::Response {
public:
  RecordingResponse(kj::HttpService::Response& inner, const kj::HttpHeaderTable& headerTable)
      : inner_(inner), extraHeaders_(headerTable) {}

  kj::Own<kj::AsyncOutputStream> send(kj::uint statusCode, kj::StringPtr statusText,
                                      const kj::HttpHeaders& headers,
                                      kj::Maybe<uint64_t> expectedBodySize = kj::none) override;

  kj::Own<kj::WebSocket> acceptWebSocket(const kj::HttpHeaders& headers) override;

  /// Queue a header for the response; both strings are copied.
  void addHeader(kj::StringPtr name, kj::StringPtr value);

  [[nodiscard]] bool started() const {
    return status_ != kj::none;
  }
  [[nodiscard]] kj::Maybe<uint> status() const {
    return status_;
  }
  /// Recorded status, or @p fallback when nothing was sent.
  [[nodiscard]] uint statusOr(uint fallback) const {
    return status_.orDefault(fallback);
  }
  /// Declared body size of the sent response, when it had one.
  [[nodiscard]] kj::Maybe<uint64_t> bodySize() const {
    return bodySize_;
  }

private:
  kj::HttpService::Response& inner_;
  kj::HttpHeaders extraHeaders_;
  bool hasExtraHeaders_ = false;
  kj::Maybe<uint> status_;
  kj::Maybe<uint64_t> bodySize_;
};

/**
 * Per-request context containing request data, authentication info,
 * and response helpers.
 *
 * Built by GatewayServer for each request and passed through middleware to the handler.
 * Owned by exactly one request.
 */
struct RequestContext {
  kj::String requestId;
  kj::TimePoint startTime; // monotonic, for durations
  kj::Date startDate;      // wall clock, for logs

  // Request data
  kj::HttpMethod method;
  kj::StringPtr url; // raw request target including the query string
  kj::StringPtr path;
  kj::StringPtr queryString;
  kj::StringPtr protocol; // "http" or "https" as seen by the client
  const kj::HttpHeaders& headers;
  kj::AsyncInputStream& body;

  RecordingResponse& response;
  const kj::HttpHeaderTable& headerTable;

  // Populated once the router matched
  kj::Maybe<kj::Own<const Route>> route;
  kj::HashMap<kj::String, kj::String> path_params;
  kj::HashMap<kj::String, kj::String> query;

  // Instance URL chosen by the load balancer, if the route targets a service
  kj::Maybe<kj::String> instance;

  // Populated by AuthMiddleware
  kj::Maybe<auth::Identity> identity;

  kj::String clientIP;

  // Response helpers
  kj::Promise<void> sendJson(uint status, kj::String body);

  /**
   * Send the standard error body
   * {"error": category, "message", "timestamp", "requestId"[, "retryAfter"]}.
   * A retry-after duration also sets the Retry-After header (whole seconds, rounded up).
   */
  kj::Promise<void> sendError(uint status, kj::StringPtr category, kj::StringPtr message,
                              kj::Maybe<kj::Duration> retryAfter = kj::none);
  kj::Promise<void> sendError(core::ErrorKind kind, kj::StringPtr message,
                              kj::Maybe<kj::Duration> retryAfter = kj::none);

  kj::Maybe<kj::StringPtr> getHeader(kj::StringPtr name) const;
};

/**
 * Error response body shared by the pipeline and its middleware.
 */
kj::String buildErrorBody(kj::StringPtr category, kj::StringPtr message, kj::StringPtr requestId,
                          kj::Maybe<kj::Duration> retryAfter = kj::none);

} // namespace portico::gateway
