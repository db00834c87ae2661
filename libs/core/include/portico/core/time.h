#pragma once

#include <cstdint>
#include <kj/string.h>
#include <kj/time.h>

namespace portico::core {

[[nodiscard]] std::int64_t now_unix_ms();

/// ISO-8601 UTC timestamp with millisecond precision, e.g. 2024-05-01T12:00:00.123Z
[[nodiscard]] kj::String format_iso8601(kj::Date date);
[[nodiscard]] kj::String now_utc_iso8601();

/// Identifier of the form <epoch-ms>-<9 base36 chars>, used for request and instance ids.
[[nodiscard]] kj::String generate_id();

} // namespace portico::core
