#include "router.h"

#include "portico/core/error.h"
#include "util/http_utils.h"

#include <kj/compat/url.h>
#include <kj/debug.h>
#include <kj/string.h>

namespace portico::gateway {

namespace {

bool is_param_char(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
}

bool is_dynamic(kj::StringPtr pattern) {
  return pattern.findFirst(':') != kj::none || pattern.findFirst('*') != kj::none;
}

void validate_target(kj::StringPtr pattern, kj::StringPtr target) {
  KJ_IF_SOME(url, kj::Url::tryParse(target)) {
    if (url.scheme != "http" && url.scheme != "https") {
      core::throw_error(core::ErrorKind::InvalidConfig,
                        kj::str("route ", pattern, ": unsupported target scheme ", url.scheme));
    }
    if (url.host.size() == 0) {
      core::throw_error(core::ErrorKind::InvalidConfig,
                        kj::str("route ", pattern, ": target has no host"));
    }
  } else {
    core::throw_error(core::ErrorKind::InvalidConfig,
                      kj::str("route ", pattern, ": invalid target URL ", target));
  }
}

} // namespace

kj::Duration RetryPolicy::backoff(uint attemptNo) const {
  auto result = delay;
  for (uint i = 0; i < attemptNo && result < MAX_BACKOFF; ++i) {
    result = result * 2;
  }
  return kj::min(result, MAX_BACKOFF);
}

// =============================================================================
// Route
// =============================================================================

Route::Route(kj::StringPtr pattern, RouteConfig config)
    : pattern_(util::normalizePath(pattern)), config_(kj::mv(config)),
      tokens_(compile(pattern_)), exact_(!is_dynamic(pattern_)) {
  if (config_.methods.size() == 0) {
    config_.methods.add(kj::HttpMethod::GET);
  }

  if (exact_) {
    prefix_ = kj::str(pattern_);
  } else {
    // Literal text before the first parameter or wildcard, cut back to a segment boundary
    kj::StringPtr head = tokens_.size() > 0 && tokens_[0].kind == Token::Kind::Literal
                             ? kj::StringPtr(tokens_[0].text)
                             : ""_kj;
    size_t cut = 0;
    for (size_t i = 0; i < head.size(); ++i) {
      if (head[i] == '/') {
        cut = i;
      }
    }
    prefix_ = kj::heapString(head.asArray().first(cut));
  }
  if (prefix_ == "/") {
    prefix_ = kj::str();
  }
}

bool Route::allows(kj::HttpMethod method) const {
  for (auto m : config_.methods) {
    if (m == method) {
      return true;
    }
  }
  return false;
}

kj::Maybe<kj::StringPtr> Route::target() const {
  KJ_IF_SOME(t, config_.target) {
    return kj::StringPtr(t);
  }
  return kj::none;
}

kj::Maybe<kj::StringPtr> Route::service() const {
  KJ_IF_SOME(s, config_.service) {
    return kj::StringPtr(s);
  }
  return kj::none;
}

kj::Vector<Route::Token> Route::compile(kj::StringPtr pattern) {
  kj::Vector<Token> tokens;
  kj::Vector<char> literal;

  auto flush_literal = [&]() {
    if (literal.size() > 0) {
      tokens.add(Token{Token::Kind::Literal, kj::heapString(literal.asPtr())});
      literal.clear();
    }
  };

  for (size_t i = 0; i < pattern.size(); ++i) {
    char c = pattern[i];
    if (c == ':' && i + 1 < pattern.size() && is_param_char(pattern[i + 1])) {
      flush_literal();
      size_t end = i + 1;
      while (end < pattern.size() && is_param_char(pattern[end])) {
        ++end;
      }
      tokens.add(Token{Token::Kind::Param, kj::heapString(pattern.slice(i + 1).first(end - i - 1))});
      i = end - 1;
    } else if (c == '*') {
      flush_literal();
      tokens.add(Token{Token::Kind::Wildcard, kj::str()});
    } else {
      literal.add(c);
    }
  }
  flush_literal();
  return tokens;
}

bool Route::match_from(size_t token, size_t pos, kj::ArrayPtr<const char> path,
                       kj::Vector<Binding>& bindings) const {
  if (token == tokens_.size()) {
    return pos == path.size();
  }

  auto& t = tokens_[token];
  switch (t.kind) {
  case Token::Kind::Literal: {
    size_t len = t.text.size();
    if (path.size() - pos < len || path.slice(pos, pos + len) != t.text.asArray()) {
      return false;
    }
    return match_from(token + 1, pos + len, path, bindings);
  }
  case Token::Kind::Param: {
    // One or more characters up to the next '/', longest first
    size_t end = pos;
    while (end < path.size() && path[end] != '/') {
      ++end;
    }
    for (size_t stop = end; stop > pos; --stop) {
      bindings.add(Binding{t.text, path.slice(pos, stop)});
      if (match_from(token + 1, stop, path, bindings)) {
        return true;
      }
      bindings.removeLast();
    }
    return false;
  }
  case Token::Kind::Wildcard: {
    for (size_t stop = path.size() + 1; stop > pos; --stop) {
      if (match_from(token + 1, stop - 1, path, bindings)) {
        return true;
      }
    }
    return false;
  }
  }
  return false;
}

kj::Maybe<kj::HashMap<kj::String, kj::String>> Route::match(kj::StringPtr path) const {
  if (exact_) {
    if (path != pattern_) {
      return kj::none;
    }
    return kj::HashMap<kj::String, kj::String>();
  }

  kj::Vector<Binding> bindings;
  if (!match_from(0, 0, path.asArray(), bindings)) {
    return kj::none;
  }

  kj::HashMap<kj::String, kj::String> params;
  for (auto& binding : bindings) {
    params.upsert(kj::str(binding.name), kj::heapString(binding.value),
                  [](kj::String& existing, kj::String&& replacement) {
                    existing = kj::mv(replacement);
                  });
  }
  return kj::mv(params);
}

kj::String Route::rebase(kj::StringPtr path) const {
  if (prefix_.size() == 0 || !path.startsWith(prefix_)) {
    return kj::str(path);
  }
  auto rest = path.slice(prefix_.size());
  if (rest.size() == 0) {
    return kj::str("/");
  }
  if (rest[0] != '/') {
    // Prefix ended mid-segment ("/api" vs "/apiv2"); keep the path untouched
    return kj::str(path);
  }
  return kj::str(rest);
}

// =============================================================================
// Router
// =============================================================================

kj::Own<const Route> Router::add_route(kj::StringPtr pattern, RouteConfig config) {
  if (!pattern.startsWith("/")) {
    core::throw_error(core::ErrorKind::InvalidConfig,
                      kj::str("route pattern must start with '/': ", pattern));
  }

  bool has_target = config.target != kj::none;
  bool has_service = config.service != kj::none;
  if (has_target == has_service) {
    core::throw_error(core::ErrorKind::InvalidConfig,
                      kj::str("route ", pattern, " needs exactly one of target or service"));
  }
  KJ_IF_SOME(target, config.target) {
    validate_target(pattern, target);
  }
  if (config.retry.attempts > RetryPolicy::MAX_ATTEMPTS) {
    core::throw_error(core::ErrorKind::InvalidConfig,
                      kj::str("route ", pattern, ": retry attempts ", config.retry.attempts,
                              " exceed the maximum of ", RetryPolicy::MAX_ATTEMPTS));
  }
  if (config.retry.delay > RetryPolicy::MAX_BACKOFF) {
    core::throw_error(core::ErrorKind::InvalidConfig,
                      kj::str("route ", pattern, ": retry delay exceeds ",
                              RetryPolicy::MAX_BACKOFF / kj::SECONDS, "s"));
  }

  auto route = kj::atomicRefcounted<Route>(pattern, kj::mv(config));
  auto result = kj::atomicAddRef(*route);

  {
    auto lock = tables_.lockExclusive();
    if (route->is_exact()) {
      lock->exact.upsert(kj::str(route->pattern()), kj::mv(route),
                         [](kj::Own<const Route>& existing, kj::Own<const Route>&& replacement) {
                           existing = kj::mv(replacement);
                         });
    } else {
      lock->patterns.add(kj::mv(route));
    }
  }

  KJ_LOG(INFO, "Route registered", result->pattern(),
         util::buildAllowHeader(result->methods()),
         result->target().orDefault(result->service().orDefault("")));
  return result;
}

bool Router::remove_route(kj::StringPtr pattern) {
  auto normalized = util::normalizePath(pattern);
  auto lock = tables_.lockExclusive();

  bool removed = lock->exact.erase(normalized);

  kj::Vector<kj::Own<const Route>> kept;
  for (auto& route : lock->patterns) {
    if (route->pattern() == normalized) {
      removed = true;
    } else {
      kept.add(kj::mv(route));
    }
  }
  lock->patterns = kj::mv(kept);
  return removed;
}

namespace {

// Pattern routes also see the trailing slash the client sent, so "/api/echo/" reaches
// "/api/echo/*" even though the normalized path is "/api/echo".
kj::Maybe<kj::String> slashed_path(kj::StringPtr url, kj::StringPtr path) {
  if (path.size() > 1 && util::hasTrailingSlash(url)) {
    return kj::str(path, "/");
  }
  return kj::none;
}

kj::Maybe<kj::HashMap<kj::String, kj::String>> match_pattern(const Route& route,
                                                             kj::StringPtr path,
                                                             const kj::Maybe<kj::String>& slashed) {
  KJ_IF_SOME(params, route.match(path)) {
    return kj::mv(params);
  }
  KJ_IF_SOME(s, slashed) {
    return route.match(s);
  }
  return kj::none;
}

} // namespace

kj::Maybe<RouteMatch> Router::match(kj::StringPtr url, kj::HttpMethod method) const {
  auto path = util::normalizePath(url);
  auto slashed = slashed_path(url, path);
  auto lock = tables_.lockShared();

  KJ_IF_SOME(route, lock->exact.find(path)) {
    if (route->allows(method)) {
      return RouteMatch{kj::atomicAddRef(*route), kj::HashMap<kj::String, kj::String>(),
                        util::parseQuery(util::extractQueryString(url))};
    }
  }

  for (auto& route : lock->patterns) {
    if (!route->allows(method)) {
      continue;
    }
    KJ_IF_SOME(params, match_pattern(*route, path, slashed)) {
      return RouteMatch{kj::atomicAddRef(*route), kj::mv(params),
                        util::parseQuery(util::extractQueryString(url))};
    }
  }

  return kj::none;
}

kj::Vector<kj::HttpMethod> Router::allowed_methods(kj::StringPtr url) const {
  auto path = util::normalizePath(url);
  auto slashed = slashed_path(url, path);
  kj::Vector<kj::HttpMethod> methods;

  auto add_unique = [&](const Route& route) {
    for (auto method : route.methods()) {
      bool seen = false;
      for (auto existing : methods) {
        if (existing == method) {
          seen = true;
          break;
        }
      }
      if (!seen) {
        methods.add(method);
      }
    }
  };

  auto lock = tables_.lockShared();
  KJ_IF_SOME(route, lock->exact.find(path)) {
    add_unique(*route);
  }
  for (auto& route : lock->patterns) {
    if (match_pattern(*route, path, slashed) != kj::none) {
      add_unique(*route);
    }
  }
  return methods;
}

kj::Vector<kj::Own<const Route>> Router::routes() const {
  kj::Vector<kj::Own<const Route>> result;
  auto lock = tables_.lockShared();
  for (auto& entry : lock->exact) {
    result.add(kj::atomicAddRef(*entry.value));
  }
  for (auto& route : lock->patterns) {
    result.add(kj::atomicAddRef(*route));
  }
  return result;
}

void Router::clear() {
  auto lock = tables_.lockExclusive();
  lock->exact.clear();
  lock->patterns.clear();
}

size_t Router::route_count() const {
  auto lock = tables_.lockShared();
  return lock->exact.size() + lock->patterns.size();
}

} // namespace portico::gateway
