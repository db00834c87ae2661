/**
 * @file test_common.h
 * @brief Shared fixtures for gateway tests
 *
 * - MockHttpResponse records what a handler sent
 * - RequestFixture builds a RequestContext without a socket
 * - CaptureOutput collects log records
 */

#pragma once

#include "portico/core/logger.h"
#include "request_context.h"
#include "util/http_utils.h"

#include <cstring>
#include <kj/async-io.h>
#include <kj/compat/http.h>
#include <kj/string.h>
#include <kj/test.h>
#include <kj/vector.h>

namespace portico::gateway::test {

class MockHttpResponse final : public kj::HttpService::Response {
public:
  kj::uint statusCode{0};
  kj::String statusText;
  kj::String body;
  kj::HttpHeaders responseHeaders;
  kj::Maybe<uint64_t> expectedBodySize;
  bool sent{false};

  explicit MockHttpResponse(const kj::HttpHeaderTable& headerTable)
      : responseHeaders(headerTable) {}

  kj::Own<kj::AsyncOutputStream> send(kj::uint statusCode, kj::StringPtr statusText,
                                      const kj::HttpHeaders& headers,
                                      kj::Maybe<uint64_t> expectedBodySize) override {
    this->statusCode = statusCode;
    this->statusText = kj::str(statusText);
    this->responseHeaders = headers.clone();
    this->expectedBodySize = expectedBodySize;
    this->sent = true;
    return kj::heap<MockOutputStream>(this);
  }

  kj::Own<kj::WebSocket> acceptWebSocket(KJ_UNUSED const kj::HttpHeaders& headers) override {
    KJ_FAIL_REQUIRE("WebSocket not supported in tests");
  }

  kj::Maybe<kj::StringPtr> header(kj::StringPtr name) const {
    return util::findHeader(responseHeaders, name);
  }

private:
  class MockOutputStream final : public kj::AsyncOutputStream {
  public:
    explicit MockOutputStream(MockHttpResponse* parent) : parent_(parent) {}

    kj::Promise<void> write(kj::ArrayPtr<const kj::byte> data) override {
      parent_->body = kj::str(parent_->body, data.asChars());
      return kj::READY_NOW;
    }

    kj::Promise<void> write(kj::ArrayPtr<const kj::ArrayPtr<const kj::byte>> pieces) override {
      for (auto& piece : pieces) {
        parent_->body = kj::str(parent_->body, piece.asChars());
      }
      return kj::READY_NOW;
    }

    kj::Promise<void> whenWriteDisconnected() override {
      return kj::NEVER_DONE;
    }

  private:
    MockHttpResponse* parent_;
  };
};

/// Request body with nothing in it.
class EmptyInputStream final : public kj::AsyncInputStream {
public:
  kj::Promise<size_t> tryRead(void*, size_t, size_t) override {
    return size_t(0);
  }
  kj::Maybe<uint64_t> tryGetLength() override {
    return uint64_t(0);
  }
};

/**
 * @brief Everything a RequestContext points at, owned in one place
 *
 * Headers may be added after construction; the context sees them through its reference.
 */
class RequestFixture {
public:
  RequestFixture(kj::HttpMethod method, kj::StringPtr url, kj::StringPtr clientIP = "10.0.0.1")
      : headers(table), inner(table), response(inner, table), url_(kj::str(url)),
        path_(util::normalizePath(util::extractPath(url_))),
        ctx(RequestContext{
            .requestId = kj::str("1700000000000-test"),
            .startTime = kj::systemPreciseMonotonicClock().now(),
            .startDate = kj::systemPreciseCalendarClock().now(),
            .method = method,
            .url = url_,
            .path = path_,
            .queryString = util::extractQueryString(url_),
            .protocol = "http"_kj,
            .headers = headers,
            .body = body,
            .response = response,
            .headerTable = table,
            .clientIP = kj::str(clientIP),
        }) {}

  KJ_DISALLOW_COPY_AND_MOVE(RequestFixture);

  void setHeader(kj::StringPtr name, kj::StringPtr value) {
    auto ownedName = kj::str(name);
    auto ownedValue = kj::str(value);
    headers.addPtrPtr(ownedName, ownedValue);
    headers.takeOwnership(kj::mv(ownedName));
    headers.takeOwnership(kj::mv(ownedValue));
  }

  kj::HttpHeaderTable table;
  kj::HttpHeaders headers;
  EmptyInputStream body;
  MockHttpResponse inner;
  RecordingResponse response;

private:
  kj::String url_;
  kj::String path_;

public:
  RequestContext ctx;
};

/// Collects every record written through a Logger.
class CaptureOutput final : public core::LogOutput {
public:
  struct Record {
    core::LogLevel level;
    kj::String line;
  };

  explicit CaptureOutput(kj::Vector<Record>& records) : records_(records) {}

  void write(kj::StringPtr formatted, const core::LogEntry& entry) override {
    records_.add(Record{entry.level, kj::str(formatted)});
  }
  void flush() override {}

private:
  kj::Vector<Record>& records_;
};

inline bool contains(kj::StringPtr haystack, kj::StringPtr needle) {
  return strstr(haystack.cStr(), needle.cStr()) != nullptr;
}

/// A continuation that answers with @p status and an empty body.
inline kj::Function<kj::Promise<void>()> respondWith(RequestContext& ctx, uint status) {
  return [&ctx, status]() -> kj::Promise<void> {
    kj::HttpHeaders headers(ctx.headerTable);
    auto stream = ctx.response.send(status, util::statusText(status), headers, uint64_t(0));
    return kj::Promise<void>(kj::READY_NOW).attach(kj::mv(stream));
  };
}

} // namespace portico::gateway::test
