/**
 * @file error.h
 * @brief Typed gateway errors carried inside kj::Exception
 *
 * Components throw kj::Exception everywhere. The gateway-specific category is attached
 * as an exception detail so it survives promise chains and can be recovered by the
 * request pipeline, which maps it to an HTTP status.
 */

#pragma once

#include <cstdint>
#include <kj/common.h>
#include <kj/exception.h>
#include <kj/string.h>
#include <kj/time.h>
#include <source_location>

namespace portico::core {

enum class ErrorKind : std::uint8_t {
  Internal = 0,
  NotFound,
  MethodNotAllowed,
  Unauthorized,
  Forbidden,
  RateLimited,
  CircuitOpen,
  ServiceUnavailable,
  UpstreamFailure,
  UpstreamTimeout,
  InvalidConfig,
};

/// Stable category string used in error bodies, e.g. "circuit_open".
[[nodiscard]] kj::StringPtr to_string(ErrorKind kind);

/// HTTP status code a request failing with @p kind is answered with.
[[nodiscard]] uint http_status(ErrorKind kind);

/// Admission rejections are answered directly and never count as backend failures.
[[nodiscard]] bool is_admission_rejection(ErrorKind kind);

/**
 * @brief Build a kj::Exception tagged with @p kind
 *
 * The exception type follows the kind: admission rejections are OVERLOADED, upstream
 * transport failures DISCONNECTED, everything else FAILED.
 */
[[nodiscard]] kj::Exception make_error(
    ErrorKind kind, kj::StringPtr message,
    const std::source_location& location = std::source_location::current());

/// Same as make_error() but also records how long the caller should wait.
[[nodiscard]] kj::Exception make_error(
    ErrorKind kind, kj::StringPtr message, kj::Duration retry_after,
    const std::source_location& location = std::source_location::current());

[[noreturn]] void throw_error(ErrorKind kind, kj::StringPtr message,
                              const std::source_location& location = std::source_location::current());

/// Recover the kind attached by make_error(); kj::none for foreign exceptions.
[[nodiscard]] kj::Maybe<ErrorKind> error_kind(const kj::Exception& e);

/// Kind of @p e, treating untagged exceptions as Internal.
[[nodiscard]] ErrorKind error_kind_or_internal(const kj::Exception& e);

[[nodiscard]] kj::Maybe<kj::Duration> retry_after(const kj::Exception& e);

} // namespace portico::core
