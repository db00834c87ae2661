#pragma once

#include <kj/compat/http.h>
#include <kj/map.h>
#include <kj/string.h>
#include <kj/vector.h>

namespace portico::gateway::util {

/**
 * @brief HTTP helpers shared by the request pipeline and the proxy.
 */

/**
 * @brief Split the request target and return the path portion (no query string).
 */
kj::String extractPath(kj::StringPtr url);

/**
 * @brief Return the query string without the leading '?', or an empty string.
 */
kj::StringPtr extractQueryString(kj::StringPtr url);

/**
 * @brief Normalize a path: leading '/', no repeated slashes, no trailing slash (except root).
 */
kj::String normalizePath(kj::StringPtr path);

/// True when the path part of a URL (before '?' or '#') ends in '/' and is not just "/".
bool hasTrailingSlash(kj::StringPtr url);

/**
 * @brief Parse an application/x-www-form-urlencoded query string.
 *
 * Later occurrences of a key overwrite earlier ones.
 */
kj::HashMap<kj::String, kj::String> parseQuery(kj::StringPtr query);

/**
 * @brief Case-insensitive header lookup that also sees names not registered in the table.
 */
kj::Maybe<kj::StringPtr> findHeader(const kj::HttpHeaders& headers, kj::StringPtr name);

/**
 * @brief Look up a cookie by name in the Cookie header.
 */
kj::Maybe<kj::String> findCookie(const kj::HttpHeaders& headers, kj::StringPtr name);

/**
 * @brief Client address: first X-Forwarded-For hop, then @p peer, then "unknown".
 */
kj::String getClientIP(const kj::HttpHeaders& headers, kj::StringPtr peer);

/**
 * @brief Headers that describe a single connection and must not be forwarded.
 *
 * Covers Connection, Keep-Alive, Proxy-Connection and Transfer-Encoding, plus the framing
 * headers that KJ regenerates itself (Content-Length, TE, Trailer, Upgrade).
 */
bool isHopByHopHeader(kj::StringPtr name);

bool equalsIgnoreCase(kj::StringPtr a, kj::StringPtr b);

kj::String toLower(kj::StringPtr text);

/**
 * @brief Get HTTP method as string (e.g. "GET").
 */
kj::StringPtr getMethodName(kj::HttpMethod method);

/**
 * @brief Parse an HTTP method name, case-insensitive.
 */
kj::Maybe<kj::HttpMethod> parseMethod(kj::StringPtr methodStr);

/**
 * @brief Comma-separated method list for an Allow header.
 */
kj::String buildAllowHeader(kj::ArrayPtr<const kj::HttpMethod> methods);

/**
 * @brief Reason phrase for a status code ("Not Found" etc.).
 */
kj::StringPtr statusText(uint status);

/**
 * @brief Whole seconds for Retry-After style headers, rounded up.
 */
int64_t ceilSeconds(kj::Duration duration);

} // namespace portico::gateway::util
