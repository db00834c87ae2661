#pragma once

#include "middleware.h"
#include "portico/core/logger.h"

#include <kj/common.h>
#include <kj/string.h>
#include <kj/time.h>
#include <kj/vector.h>

namespace portico::gateway {

enum class AccessLogFormat {
  Combined, // Apache combined
  Common,   // Apache common
  Dev,      // short colored line
  Json,     // structured fields through the logger's formatter
};

kj::StringPtr to_string(AccessLogFormat format);
kj::Maybe<AccessLogFormat> parse_access_log_format(kj::StringPtr name);

/**
 * Writes one access log record per completed request.
 *
 * The record is produced after the response finished, from a read-only view of the request,
 * so logging never delays or alters the response. Records are written at Error level for
 * 5xx, Warn for 4xx and Info otherwise. Credential-bearing headers are redacted.
 */
class AccessLogMiddleware final : public Middleware {
public:
  struct Config {
    AccessLogFormat format = AccessLogFormat::Combined;
    kj::Vector<kj::String> exclude_paths;
  };

  /// Config with /health and /metrics excluded.
  static Config default_config();

  AccessLogMiddleware(core::Logger& logger, Config config = default_config());

  kj::Promise<void> process(RequestContext& ctx, kj::Function<kj::Promise<void>()> next) override;

  kj::StringPtr name() const override {
    return "access_log"_kj;
  }

  /// Render the record for @p ctx, which has completed with @p status.
  kj::String format_line(const RequestContext& ctx, uint status, kj::Duration duration) const;

  /// Request headers as a JSON object, with credential values replaced by "[REDACTED]".
  static kj::String sanitize_headers(const kj::HttpHeaders& headers);

private:
  bool is_excluded(kj::StringPtr path) const;
  void write(const RequestContext& ctx, uint status);

  core::Logger& logger_;
  Config config_;
};

} // namespace portico::gateway
