#include "middleware/access_log_middleware.h"

#include "portico/core/json.h"
#include "portico/core/time.h"
#include "util/http_utils.h"

#include <kj/debug.h>

namespace portico::gateway {

namespace {

constexpr kj::StringPtr REDACTED = "[REDACTED]"_kj;

bool is_sensitive_header(kj::StringPtr name) {
  return util::equalsIgnoreCase(name, "authorization"_kj) ||
         util::equalsIgnoreCase(name, "cookie"_kj) || util::equalsIgnoreCase(name, "x-api-key"_kj);
}

core::LogLevel level_for(uint status) {
  if (status >= 500) {
    return core::LogLevel::Error;
  }
  if (status >= 400) {
    return core::LogLevel::Warn;
  }
  return core::LogLevel::Info;
}

kj::StringPtr status_color(uint status) {
  if (status >= 500) {
    return "\x1b[31m"_kj; // red
  }
  if (status >= 400) {
    return "\x1b[33m"_kj; // yellow
  }
  if (status >= 300) {
    return "\x1b[36m"_kj; // cyan
  }
  return "\x1b[32m"_kj; // green
}

kj::String body_size(const RequestContext& ctx) {
  KJ_IF_SOME(size, ctx.response.bodySize()) {
    return kj::str(size);
  }
  return kj::str("-");
}

} // namespace

kj::StringPtr to_string(AccessLogFormat format) {
  switch (format) {
  case AccessLogFormat::Combined:
    return "combined"_kj;
  case AccessLogFormat::Common:
    return "common"_kj;
  case AccessLogFormat::Dev:
    return "dev"_kj;
  case AccessLogFormat::Json:
    return "json"_kj;
  }
  return "combined"_kj;
}

kj::Maybe<AccessLogFormat> parse_access_log_format(kj::StringPtr name) {
  auto lower = util::toLower(name);
  if (lower == "combined") {
    return AccessLogFormat::Combined;
  }
  if (lower == "common") {
    return AccessLogFormat::Common;
  }
  if (lower == "dev") {
    return AccessLogFormat::Dev;
  }
  if (lower == "json") {
    return AccessLogFormat::Json;
  }
  return kj::none;
}

AccessLogMiddleware::Config AccessLogMiddleware::default_config() {
  Config config;
  config.exclude_paths.add(kj::str("/health"));
  config.exclude_paths.add(kj::str("/metrics"));
  return config;
}

AccessLogMiddleware::AccessLogMiddleware(core::Logger& logger, Config config)
    : logger_(logger), config_(kj::mv(config)) {}

bool AccessLogMiddleware::is_excluded(kj::StringPtr path) const {
  for (auto& excluded : config_.exclude_paths) {
    if (path == excluded) {
      return true;
    }
  }
  return false;
}

kj::String AccessLogMiddleware::sanitize_headers(const kj::HttpHeaders& headers) {
  auto builder = core::JsonBuilder::object();
  headers.forEach([&](kj::StringPtr name, kj::StringPtr value) {
    auto key = util::toLower(name);
    builder.put(key, is_sensitive_header(name) ? REDACTED : value);
  });
  return builder.build();
}

kj::String AccessLogMiddleware::format_line(const RequestContext& ctx, uint status,
                                            kj::Duration duration) const {
  auto method = util::getMethodName(ctx.method);
  auto duration_ms = duration / kj::MILLISECONDS;

  switch (config_.format) {
  case AccessLogFormat::Common:
    return kj::str(ctx.clientIP, " - - [", core::format_iso8601(ctx.startDate), "] \"", method,
                   " ", ctx.url, "\" ", status, " ", body_size(ctx));
  case AccessLogFormat::Dev:
    return kj::str(method, " ", ctx.url, " ", status_color(status), status, "\x1b[0m ",
                   duration_ms, "ms");
  case AccessLogFormat::Json:
    return kj::str("request completed");
  case AccessLogFormat::Combined:
    break;
  }

  return kj::str(ctx.clientIP, " - - [", core::format_iso8601(ctx.startDate), "] \"", method, " ",
                 ctx.url, "\" ", status, " ", body_size(ctx), " \"",
                 ctx.getHeader("Referer"_kj).orDefault("-"_kj), "\" \"",
                 ctx.getHeader("User-Agent"_kj).orDefault("-"_kj), "\"");
}

void AccessLogMiddleware::write(const RequestContext& ctx, uint status) {
  auto level = level_for(status);
  if (!logger_.enabled(level)) {
    return;
  }

  auto duration = kj::systemPreciseMonotonicClock().now() - ctx.startTime;
  auto line = format_line(ctx, status, duration);

  kj::Vector<core::LogField> fields;
  if (config_.format == AccessLogFormat::Json) {
    fields.add(core::LogField{kj::str("requestId"), kj::str(ctx.requestId)});
    fields.add(core::LogField{kj::str("method"), kj::str(util::getMethodName(ctx.method))});
    fields.add(core::LogField{kj::str("url"), kj::str(ctx.url)});
    fields.add(core::LogField{kj::str("status"), kj::str(status)});
    fields.add(core::LogField{kj::str("durationMs"), kj::str(duration / kj::MILLISECONDS)});
    fields.add(core::LogField{kj::str("ip"), kj::str(ctx.clientIP)});
    fields.add(core::LogField{kj::str("contentLength"), body_size(ctx)});
    fields.add(core::LogField{kj::str("headers"), sanitize_headers(ctx.headers)});
  }
  logger_.log(level, line, kj::mv(fields));
}

kj::Promise<void> AccessLogMiddleware::process(RequestContext& ctx,
                                               kj::Function<kj::Promise<void>()> next) {
  if (is_excluded(ctx.path)) {
    return next();
  }

  return next().then([this, &ctx]() { write(ctx, ctx.response.statusOr(200)); },
                     [this, &ctx](kj::Exception&& e) {
                       uint status = ctx.response.statusOr(
                           core::http_status(core::error_kind_or_internal(e)));
                       write(ctx, status);
                       kj::throwFatalException(kj::mv(e));
                     });
}

} // namespace portico::gateway
