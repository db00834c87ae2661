#include "middleware/auth_middleware.h"

#include "util/http_utils.h"

#include <kj/debug.h>

namespace portico::gateway {

AuthMiddleware::AuthMiddleware(kj::Own<auth::TokenVerifier> verifier, Config config)
    : verifier_(kj::mv(verifier)), config_(kj::mv(config)) {}

kj::Maybe<kj::String> AuthMiddleware::extract_token(const RequestContext& ctx) {
  KJ_IF_SOME(header, ctx.getHeader("Authorization"_kj)) {
    if (header.size() > 7 &&
        util::equalsIgnoreCase(kj::heapString(header.asArray().first(7)), "Bearer "_kj)) {
      return kj::str(header.slice(7));
    }
  }

  auto query = util::parseQuery(ctx.queryString);
  KJ_IF_SOME(token, query.find("token"_kj)) {
    if (token.size() > 0) {
      return kj::mv(token);
    }
  }

  KJ_IF_SOME(token, util::findCookie(ctx.headers, "token"_kj)) {
    if (token.size() > 0) {
      return kj::mv(token);
    }
  }
  return kj::none;
}

bool AuthMiddleware::is_public_path(kj::StringPtr path) const {
  for (auto& entry : config_.public_paths) {
    if (entry.endsWith("*")) {
      if (path.startsWith(kj::heapString(entry.asArray().first(entry.size() - 1)))) {
        return true;
      }
    } else if (path == entry) {
      return true;
    }
  }
  return false;
}

bool AuthMiddleware::has_required_role(const auth::Identity& identity) const {
  if (config_.required_roles.size() == 0) {
    return true;
  }
  for (auto& role : config_.required_roles) {
    if (identity.has_role(role)) {
      return true;
    }
  }
  return false;
}

kj::Promise<void> AuthMiddleware::send_unauthorized(RequestContext& ctx, kj::StringPtr message) {
  ctx.response.addHeader("WWW-Authenticate"_kj, "Bearer"_kj);
  return ctx.sendError(core::ErrorKind::Unauthorized, message);
}

kj::Promise<void> AuthMiddleware::process(RequestContext& ctx,
                                          kj::Function<kj::Promise<void>()> next) {
  if (is_public_path(ctx.path)) {
    return next();
  }

  kj::String token;
  KJ_IF_SOME(t, extract_token(ctx)) {
    token = kj::mv(t);
  } else {
    if (config_.required) {
      return send_unauthorized(ctx, "No token provided"_kj);
    }
    return next();
  }

  KJ_IF_SOME(identity, verifier_->verify(token)) {
    if (!has_required_role(identity)) {
      KJ_LOG(INFO, "Authenticated caller lacks a required role", identity.subject, ctx.path);
      return ctx.sendError(core::ErrorKind::Forbidden, "Insufficient permissions"_kj);
    }
    ctx.identity = kj::mv(identity);
    return next();
  }

  KJ_LOG(INFO, "Rejected invalid credential", ctx.requestId, ctx.path);
  return send_unauthorized(ctx, "Invalid or expired token"_kj);
}

} // namespace portico::gateway
