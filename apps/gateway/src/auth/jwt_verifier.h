/**
 * @file jwt_verifier.h
 * @brief HS256 JSON Web Token issuing and verification
 *
 * Uses OpenSSL HMAC-SHA256 for signatures and yyjson (through core::JsonDocument) for the
 * header and claims. Only HS256 is accepted; any other "alg" is rejected.
 */

#pragma once

#include "auth/token_verifier.h"

#include <cstdint>
#include <kj/array.h>
#include <kj/common.h>
#include <kj/mutex.h>
#include <kj/string.h>
#include <kj/time.h>

namespace portico::gateway::auth {

/**
 * @brief Reason the last verification failed
 */
enum class JwtError {
  NONE,
  INVALID_FORMAT,     // not header.payload.signature
  INVALID_BASE64,
  INVALID_JSON,
  ALGORITHM_MISMATCH, // alg is not HS256
  INVALID_SIGNATURE,
  MISSING_CLAIMS,     // no "sub" or no numeric "exp"
  EXPIRED,
  ISSUER_MISMATCH,
};

kj::StringPtr to_string(JwtError error);

struct JwtConfig {
  kj::String secret;
  /// Required "iss" claim; any issuer is accepted when kj::none.
  kj::Maybe<kj::String> issuer;
  /// Tolerated clock skew when checking "exp".
  kj::Duration leeway = 0 * kj::SECONDS;
};

/**
 * @brief JWT manager for token creation and verification
 *
 * Thread safety: all public methods are thread-safe.
 */
class JwtVerifier final : public TokenVerifier {
public:
  explicit JwtVerifier(JwtConfig config, const kj::Clock& clock = kj::systemPreciseCalendarClock());

  JwtVerifier(const JwtVerifier&) = delete;
  JwtVerifier& operator=(const JwtVerifier&) = delete;

  /**
   * @brief Create a signed token
   *
   * Claims: sub, roles, iat, exp = iat + ttl, and iss when an issuer is configured.
   */
  [[nodiscard]] kj::String issue(kj::StringPtr subject, kj::ArrayPtr<const kj::String> roles,
                                 kj::Duration ttl) const;

  /**
   * @brief Verify signature, algorithm, expiry and issuer
   *
   * Use last_error() to retrieve the specific reason after a kj::none result.
   */
  kj::Maybe<Identity> verify(kj::StringPtr token) const override;

  [[nodiscard]] JwtError last_error() const;

private:
  [[nodiscard]] int64_t current_timestamp() const;
  [[nodiscard]] kj::Array<kj::byte> hmac_sha256(kj::ArrayPtr<const kj::byte> data) const;
  kj::Maybe<Identity> fail(JwtError error) const;

  JwtConfig config_;
  const kj::Clock& clock_;
  mutable kj::MutexGuarded<JwtError> last_error_;
};

/**
 * @brief Encode bytes to Base64URL without padding
 */
[[nodiscard]] kj::String base64url_encode(kj::ArrayPtr<const kj::byte> data);

/**
 * @brief Decode Base64URL (padding optional)
 * @return kj::none on malformed input
 */
[[nodiscard]] kj::Maybe<kj::Array<kj::byte>> base64url_decode(kj::ArrayPtr<const char> encoded);

} // namespace portico::gateway::auth
