#include "request_context.h"

#include "portico/core/json.h"
#include "portico/core/time.h"
#include "util/http_utils.h"

#include <kj/debug.h>

namespace portico::gateway {

kj::Own<kj::AsyncOutputStream> RecordingResponse::send(kj::uint statusCode,
                                                       kj::StringPtr statusText,
                                                       const kj::HttpHeaders& headers,
                                                       kj::Maybe<uint64_t> expectedBodySize) {
  KJ_REQUIRE(status_ == kj::none, "response already started");
  status_ = statusCode;
  bodySize_ = expectedBodySize;

  if (!hasExtraHeaders_) {
    return inner_.send(statusCode, statusText, headers, expectedBodySize);
  }

  auto merged = headers.clone();
  extraHeaders_.forEach([&](kj::StringPtr name, kj::StringPtr value) {
    if (util::findHeader(merged, name) == kj::none) {
      merged.addPtrPtr(name, value);
    }
  });
  return inner_.send(statusCode, statusText, merged, expectedBodySize);
}

kj::Own<kj::WebSocket> RecordingResponse::acceptWebSocket(const kj::HttpHeaders& headers) {
  status_ = 101u;
  return inner_.acceptWebSocket(headers);
}

void RecordingResponse::addHeader(kj::StringPtr name, kj::StringPtr value) {
  auto ownedName = kj::str(name);
  auto ownedValue = kj::str(value);
  extraHeaders_.addPtrPtr(ownedName, ownedValue);
  extraHeaders_.takeOwnership(kj::mv(ownedName));
  extraHeaders_.takeOwnership(kj::mv(ownedValue));
  hasExtraHeaders_ = true;
}

kj::String buildErrorBody(kj::StringPtr category, kj::StringPtr message, kj::StringPtr requestId,
                          kj::Maybe<kj::Duration> retryAfter) {
  auto builder = core::JsonBuilder::object();
  builder.put("error", category)
      .put("message", message)
      .put("timestamp", core::now_utc_iso8601())
      .put("requestId", requestId);
  KJ_IF_SOME(wait, retryAfter) {
    builder.put("retryAfter", util::ceilSeconds(wait));
  }
  return builder.build();
}

kj::Promise<void> RequestContext::sendJson(uint status, kj::String body) {
  kj::HttpHeaders responseHeaders(headerTable);
  responseHeaders.setPtr(kj::HttpHeaderId::CONTENT_TYPE, "application/json"_kj);

  auto stream = response.send(status, util::statusText(status), responseHeaders, body.size());
  auto promise = stream->write(body.asBytes());
  return promise.attach(kj::mv(stream), kj::mv(body));
}

kj::Promise<void> RequestContext::sendError(uint status, kj::StringPtr category,
                                            kj::StringPtr message,
                                            kj::Maybe<kj::Duration> retryAfter) {
  auto body = buildErrorBody(category, message, requestId, retryAfter);

  kj::HttpHeaders responseHeaders(headerTable);
  responseHeaders.setPtr(kj::HttpHeaderId::CONTENT_TYPE, "application/json"_kj);
  kj::String retryValue;
  KJ_IF_SOME(wait, retryAfter) {
    retryValue = kj::str(util::ceilSeconds(wait));
    responseHeaders.addPtrPtr("Retry-After"_kj, retryValue);
  }

  auto stream = response.send(status, util::statusText(status), responseHeaders, body.size());
  auto promise = stream->write(body.asBytes());
  return promise.attach(kj::mv(stream), kj::mv(body));
}

kj::Promise<void> RequestContext::sendError(core::ErrorKind kind, kj::StringPtr message,
                                            kj::Maybe<kj::Duration> retryAfter) {
  return sendError(core::http_status(kind), core::to_string(kind), message, retryAfter);
}

kj::Maybe<kj::StringPtr> RequestContext::getHeader(kj::StringPtr name) const {
  return util::findHeader(headers, name);
}

} // namespace portico::gateway
