#pragma once

#include "auth/token_verifier.h"
#include "middleware.h"

#include <kj/common.h>
#include <kj/memory.h>
#include <kj/string.h>
#include <kj/vector.h>

namespace portico::gateway {

/**
 * Authentication middleware.
 *
 * Looks for a credential in, by priority:
 * - Authorization: Bearer <token>
 * - the `token` query parameter
 * - the `token` cookie
 *
 * A verified credential populates RequestContext::identity. An invalid credential is always
 * answered 401; a missing one only when authentication is required. When required roles are
 * configured, the identity must carry at least one of them, otherwise the answer is 403.
 */
class AuthMiddleware final : public Middleware {
public:
  struct Config {
    bool required = true;
    /// Exact paths, or prefixes when the entry ends in '*', that skip authentication.
    kj::Vector<kj::String> public_paths;
    kj::Vector<kj::String> required_roles;
  };

  explicit AuthMiddleware(kj::Own<auth::TokenVerifier> verifier, Config config = {});

  AuthMiddleware(const AuthMiddleware&) = delete;
  AuthMiddleware& operator=(const AuthMiddleware&) = delete;

  kj::Promise<void> process(RequestContext& ctx, kj::Function<kj::Promise<void>()> next) override;

  kj::StringPtr name() const override {
    return "auth"_kj;
  }

  /// Credential carried by the request, if any, following the priority above.
  static kj::Maybe<kj::String> extract_token(const RequestContext& ctx);

private:
  bool is_public_path(kj::StringPtr path) const;
  bool has_required_role(const auth::Identity& identity) const;
  kj::Promise<void> send_unauthorized(RequestContext& ctx, kj::StringPtr message);

  kj::Own<auth::TokenVerifier> verifier_;
  Config config_;
};

} // namespace portico::gateway
