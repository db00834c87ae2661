#pragma once

#include <kj/common.h>
#include <kj/string.h>
#include <kj/vector.h>

namespace portico::gateway::auth {

/**
 * @brief Verified caller identity attached to a request
 */
struct Identity {
  kj::String subject;
  kj::Vector<kj::String> roles;
  kj::Maybe<kj::String> issuer;
  int64_t expires_at = 0; // Unix seconds, 0 when the credential does not expire

  bool has_role(kj::StringPtr role) const {
    for (auto& r : roles) {
      if (r == role) {
        return true;
      }
    }
    return false;
  }
};

/**
 * @brief Verifies a bearer credential
 *
 * Implementations are called concurrently from request handling and must be thread-safe.
 */
class TokenVerifier {
public:
  virtual ~TokenVerifier() noexcept = default;

  /// @return the identity, or kj::none when the credential is invalid or expired
  virtual kj::Maybe<Identity> verify(kj::StringPtr token) const = 0;
};

} // namespace portico::gateway::auth
