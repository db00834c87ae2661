#include "portico/core/error.h"

#include <cstring>
#include <kj/array.h>
#include <kj/debug.h>

namespace portico::core {

namespace {

constexpr kj::Exception::DetailTypeId ERROR_KIND_DETAIL = 0x706f72746963'6f01ull;
constexpr kj::Exception::DetailTypeId RETRY_AFTER_DETAIL = 0x706f72746963'6f02ull;

kj::Exception::Type exception_type_for(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::RateLimited:
  case ErrorKind::CircuitOpen:
  case ErrorKind::ServiceUnavailable:
  case ErrorKind::UpstreamTimeout:
    return kj::Exception::Type::OVERLOADED;
  case ErrorKind::UpstreamFailure:
    return kj::Exception::Type::DISCONNECTED;
  default:
    return kj::Exception::Type::FAILED;
  }
}

} // namespace

kj::StringPtr to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Internal:
    return "internal_error"_kj;
  case ErrorKind::NotFound:
    return "not_found"_kj;
  case ErrorKind::MethodNotAllowed:
    return "method_not_allowed"_kj;
  case ErrorKind::Unauthorized:
    return "unauthorized"_kj;
  case ErrorKind::Forbidden:
    return "forbidden"_kj;
  case ErrorKind::RateLimited:
    return "rate_limited"_kj;
  case ErrorKind::CircuitOpen:
    return "circuit_open"_kj;
  case ErrorKind::ServiceUnavailable:
    return "service_unavailable"_kj;
  case ErrorKind::UpstreamFailure:
    return "bad_gateway"_kj;
  case ErrorKind::UpstreamTimeout:
    return "gateway_timeout"_kj;
  case ErrorKind::InvalidConfig:
    return "invalid_config"_kj;
  }
  return "internal_error"_kj;
}

uint http_status(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::NotFound:
    return 404;
  case ErrorKind::MethodNotAllowed:
    return 405;
  case ErrorKind::Unauthorized:
    return 401;
  case ErrorKind::Forbidden:
    return 403;
  case ErrorKind::RateLimited:
    return 429;
  case ErrorKind::CircuitOpen:
  case ErrorKind::ServiceUnavailable:
    return 503;
  case ErrorKind::UpstreamFailure:
    return 502;
  case ErrorKind::UpstreamTimeout:
    return 504;
  case ErrorKind::InvalidConfig:
  case ErrorKind::Internal:
    return 500;
  }
  return 500;
}

bool is_admission_rejection(ErrorKind kind) {
  return kind == ErrorKind::RateLimited || kind == ErrorKind::CircuitOpen ||
         kind == ErrorKind::Unauthorized || kind == ErrorKind::Forbidden;
}

kj::Exception make_error(ErrorKind kind, kj::StringPtr message,
                         const std::source_location& location) {
  kj::Exception e(exception_type_for(kind), location.file_name(),
                  static_cast<int>(location.line()), kj::str(to_string(kind), ": ", message));
  auto detail = kj::heapArray<kj::byte>(1);
  detail[0] = static_cast<kj::byte>(kind);
  e.setDetail(ERROR_KIND_DETAIL, kj::mv(detail));
  return e;
}

kj::Exception make_error(ErrorKind kind, kj::StringPtr message, kj::Duration retry_after,
                         const std::source_location& location) {
  auto e = make_error(kind, message, location);
  int64_t nanos = retry_after / kj::NANOSECONDS;
  auto detail = kj::heapArray<kj::byte>(sizeof(nanos));
  std::memcpy(detail.begin(), &nanos, sizeof(nanos));
  e.setDetail(RETRY_AFTER_DETAIL, kj::mv(detail));
  return e;
}

void throw_error(ErrorKind kind, kj::StringPtr message, const std::source_location& location) {
  kj::throwFatalException(make_error(kind, message, location));
}

kj::Maybe<ErrorKind> error_kind(const kj::Exception& e) {
  KJ_IF_SOME(detail, e.getDetail(ERROR_KIND_DETAIL)) {
    if (detail.size() == 1 && detail[0] <= static_cast<kj::byte>(ErrorKind::InvalidConfig)) {
      return static_cast<ErrorKind>(detail[0]);
    }
  }
  return kj::none;
}

ErrorKind error_kind_or_internal(const kj::Exception& e) {
  KJ_IF_SOME(kind, error_kind(e)) {
    return kind;
  }
  return ErrorKind::Internal;
}

kj::Maybe<kj::Duration> retry_after(const kj::Exception& e) {
  KJ_IF_SOME(detail, e.getDetail(RETRY_AFTER_DETAIL)) {
    if (detail.size() == sizeof(int64_t)) {
      int64_t nanos = 0;
      std::memcpy(&nanos, detail.begin(), sizeof(nanos));
      return nanos * kj::NANOSECONDS;
    }
  }
  return kj::none;
}

} // namespace portico::core
