#pragma once

#include <kj/common.h>
#include <kj/compat/http.h>
#include <kj/map.h>
#include <kj/mutex.h>
#include <kj/refcount.h>
#include <kj/string.h>
#include <kj/time.h>
#include <kj/vector.h>

namespace portico::gateway {

struct RetryPolicy {
  static constexpr uint MAX_ATTEMPTS = 10;
  static constexpr kj::Duration MAX_BACKOFF = 60 * kj::SECONDS;

  /// Extra attempts after the first one, at most MAX_ATTEMPTS.
  uint attempts = 0;
  /// Base backoff; attempt n waits delay * 2^n, capped at MAX_BACKOFF.
  kj::Duration delay = 1000 * kj::MILLISECONDS;

  [[nodiscard]] kj::Duration backoff(uint attemptNo) const;
};

/**
 * Route registration options. Exactly one of target and service must be set.
 */
struct RouteConfig {
  /// Static backend base URL, e.g. "http://users.internal:8080/v1".
  kj::Maybe<kj::String> target;
  /// Load-balanced service name resolved per request.
  kj::Maybe<kj::String> service;
  /// Allowed methods; GET when empty.
  kj::Vector<kj::HttpMethod> methods;
  bool auth = false;
  kj::Duration timeout = 30 * kj::SECONDS;
  RetryPolicy retry;
  kj::HashMap<kj::String, kj::String> metadata;
};

/**
 * An immutable registered route with its compiled matcher.
 *
 * Patterns may contain `:name` segments, which bind one path segment, and `*`, which
 * spans any number of characters (including '/') and is not captured.
 */
class Route final : public kj::AtomicRefcounted {
public:
  Route(kj::StringPtr pattern, RouteConfig config);

  [[nodiscard]] kj::StringPtr pattern() const {
    return pattern_;
  }
  [[nodiscard]] bool is_exact() const {
    return exact_;
  }
  [[nodiscard]] bool allows(kj::HttpMethod method) const;
  [[nodiscard]] kj::ArrayPtr<const kj::HttpMethod> methods() const {
    return config_.methods.asPtr();
  }

  [[nodiscard]] kj::Maybe<kj::StringPtr> target() const;
  [[nodiscard]] kj::Maybe<kj::StringPtr> service() const;
  [[nodiscard]] bool auth_required() const {
    return config_.auth;
  }
  [[nodiscard]] kj::Duration timeout() const {
    return config_.timeout;
  }
  [[nodiscard]] const RetryPolicy& retry() const {
    return config_.retry;
  }
  [[nodiscard]] const kj::HashMap<kj::String, kj::String>& metadata() const {
    return config_.metadata;
  }

  /**
   * Match a normalized path against the compiled pattern.
   * @return `:name` bindings, or kj::none when the path does not match
   */
  [[nodiscard]] kj::Maybe<kj::HashMap<kj::String, kj::String>> match(kj::StringPtr path) const;

  /**
   * Path to send upstream: @p path with the route's static prefix removed ("/" if nothing
   * is left). The prefix is the literal part of the pattern before the first `:` or `*`.
   */
  [[nodiscard]] kj::String rebase(kj::StringPtr path) const;

private:
  struct Token {
    enum class Kind { Literal, Param, Wildcard };
    Kind kind;
    kj::String text; // literal text or parameter name
  };

  struct Binding {
    kj::StringPtr name;
    kj::ArrayPtr<const char> value;
  };

  static kj::Vector<Token> compile(kj::StringPtr pattern);
  bool match_from(size_t token, size_t pos, kj::ArrayPtr<const char> path,
                  kj::Vector<Binding>& bindings) const;

  kj::String pattern_;
  RouteConfig config_;
  kj::Vector<Token> tokens_;
  kj::String prefix_;
  bool exact_;
};

/**
 * Result of a successful route lookup.
 */
struct RouteMatch {
  kj::Own<const Route> route;
  kj::HashMap<kj::String, kj::String> path_params;
  kj::HashMap<kj::String, kj::String> query;
};

/**
 * Request router with an exact-path table and an ordered list of pattern routes.
 *
 * Lookup normalizes the path, strips the query string, checks the exact table, then tries
 * pattern routes in registration order. A route matches only when its method set contains
 * the request method; a path-only match does not stop the search.
 *
 * Usage:
 * ```cpp
 * Router router;
 * RouteConfig config;
 * config.target = kj::str("http://users:8080");
 * config.methods.add(kj::HttpMethod::GET);
 * router.add_route("/api/users/:id", kj::mv(config));
 *
 * KJ_IF_SOME(match, router.match("/api/users/42?full=1", kj::HttpMethod::GET)) {
 *   // match.path_params["id"] == "42", match.query["full"] == "1"
 * }
 * ```
 */
class Router {
public:
  /**
   * Register a route. An exact route replaces any earlier exact route on the same path.
   *
   * @throws kj::Exception tagged InvalidConfig for a malformed pattern or target
   */
  kj::Own<const Route> add_route(kj::StringPtr pattern, RouteConfig config);

  /// @return true when a route with this pattern existed
  bool remove_route(kj::StringPtr pattern);

  /**
   * Match a request target (path plus optional query string).
   */
  kj::Maybe<RouteMatch> match(kj::StringPtr url, kj::HttpMethod method) const;

  /**
   * Methods of every route whose pattern accepts the path, in registration order.
   * Empty when no route matches the path at all.
   */
  kj::Vector<kj::HttpMethod> allowed_methods(kj::StringPtr url) const;

  /// Exact routes followed by pattern routes.
  kj::Vector<kj::Own<const Route>> routes() const;

  void clear();

  size_t route_count() const;

private:
  struct Tables {
    kj::HashMap<kj::String, kj::Own<const Route>> exact;
    kj::Vector<kj::Own<const Route>> patterns;
  };

  kj::MutexGuarded<Tables> tables_;
};

} // namespace portico::gateway
