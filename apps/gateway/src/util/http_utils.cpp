#include "util/http_utils.h"

#include <kj/encoding.h>

namespace portico::gateway::util {

namespace {

char asciiLower(char c) {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

kj::String trimmedCopy(kj::ArrayPtr<const char> text) {
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && (text[begin] == ' ' || text[begin] == '\t')) {
    ++begin;
  }
  while (end > begin && (text[end - 1] == ' ' || text[end - 1] == '\t')) {
    --end;
  }
  return kj::heapString(text.slice(begin, end));
}

kj::Vector<kj::ArrayPtr<const char>> split(kj::ArrayPtr<const char> text, char delimiter) {
  kj::Vector<kj::ArrayPtr<const char>> parts;
  size_t start = 0;
  for (size_t i = 0; i <= text.size(); ++i) {
    if (i == text.size() || text[i] == delimiter) {
      parts.add(text.slice(start, i));
      start = i + 1;
    }
  }
  return parts;
}

kj::String decodeComponent(kj::ArrayPtr<const char> text) {
  auto decoded = kj::decodeWwwForm(text);
  if (decoded.hadErrors) {
    return kj::heapString(text);
  }
  return kj::mv(decoded);
}

} // namespace

kj::String extractPath(kj::StringPtr url) {
  KJ_IF_SOME(queryStart, url.findFirst('?')) {
    return kj::heapString(url.asArray().first(queryStart));
  }
  return kj::str(url);
}

kj::StringPtr extractQueryString(kj::StringPtr url) {
  KJ_IF_SOME(queryStart, url.findFirst('?')) {
    return url.slice(queryStart + 1);
  }
  return ""_kj;
}

kj::String normalizePath(kj::StringPtr path) {
  kj::ArrayPtr<const char> raw = path.asArray();
  for (size_t i = 0; i < raw.size(); ++i) {
    if (raw[i] == '?' || raw[i] == '#') {
      raw = raw.first(i);
      break;
    }
  }

  kj::Vector<char> out(raw.size() + 2);
  out.add('/');
  for (char c : raw) {
    if (c == '/' && out.back() == '/') {
      continue;
    }
    out.add(c);
  }
  if (out.size() > 1 && out.back() == '/') {
    out.removeLast();
  }
  out.add('\0');
  return kj::String(out.releaseAsArray());
}

bool hasTrailingSlash(kj::StringPtr url) {
  size_t end = url.size();
  for (size_t i = 0; i < url.size(); ++i) {
    if (url[i] == '?' || url[i] == '#') {
      end = i;
      break;
    }
  }
  return end > 1 && url[end - 1] == '/';
}

kj::HashMap<kj::String, kj::String> parseQuery(kj::StringPtr query) {
  kj::HashMap<kj::String, kj::String> result;
  for (auto part : split(query.asArray(), '&')) {
    if (part.size() == 0) {
      continue;
    }
    kj::ArrayPtr<const char> name = part;
    kj::ArrayPtr<const char> value = nullptr;
    for (size_t i = 0; i < part.size(); ++i) {
      if (part[i] == '=') {
        name = part.first(i);
        value = part.slice(i + 1, part.size());
        break;
      }
    }
    result.upsert(decodeComponent(name), decodeComponent(value),
                  [](kj::String& existing, kj::String&& replacement) {
                    existing = kj::mv(replacement);
                  });
  }
  return result;
}

bool equalsIgnoreCase(kj::StringPtr a, kj::StringPtr b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (size_t i = 0; i < a.size(); ++i) {
    if (asciiLower(a[i]) != asciiLower(b[i])) {
      return false;
    }
  }
  return true;
}

kj::String toLower(kj::StringPtr text) {
  auto result = kj::heapString(text);
  for (char& c : result) {
    c = asciiLower(c);
  }
  return result;
}

kj::Maybe<kj::StringPtr> findHeader(const kj::HttpHeaders& headers, kj::StringPtr name) {
  kj::Maybe<kj::StringPtr> result = kj::none;
  headers.forEach([&](kj::StringPtr headerName, kj::StringPtr headerValue) {
    if (result == kj::none && equalsIgnoreCase(headerName, name)) {
      result = headerValue;
    }
  });
  return result;
}

kj::Maybe<kj::String> findCookie(const kj::HttpHeaders& headers, kj::StringPtr name) {
  KJ_IF_SOME(cookieHeader, findHeader(headers, "Cookie"_kj)) {
    for (auto pair : split(cookieHeader.asArray(), ';')) {
      for (size_t i = 0; i < pair.size(); ++i) {
        if (pair[i] == '=') {
          auto key = trimmedCopy(pair.first(i));
          if (key == name) {
            return trimmedCopy(pair.slice(i + 1, pair.size()));
          }
          break;
        }
      }
    }
  }
  return kj::none;
}

kj::String getClientIP(const kj::HttpHeaders& headers, kj::StringPtr peer) {
  KJ_IF_SOME(forwarded, findHeader(headers, "X-Forwarded-For"_kj)) {
    kj::ArrayPtr<const char> first = forwarded.asArray();
    KJ_IF_SOME(comma, forwarded.findFirst(',')) {
      first = first.first(comma);
    }
    auto hop = trimmedCopy(first);
    if (hop.size() > 0) {
      return hop;
    }
  }
  if (peer.size() > 0) {
    return kj::str(peer);
  }
  return kj::str("unknown");
}

bool isHopByHopHeader(kj::StringPtr name) {
  static constexpr kj::StringPtr HOP_BY_HOP[] = {
      "connection"_kj,     "keep-alive"_kj, "proxy-connection"_kj, "transfer-encoding"_kj,
      "content-length"_kj, "te"_kj,         "trailer"_kj,          "upgrade"_kj,
  };
  for (auto candidate : HOP_BY_HOP) {
    if (equalsIgnoreCase(name, candidate)) {
      return true;
    }
  }
  return false;
}

kj::StringPtr getMethodName(kj::HttpMethod method) {
  return kj::toCharSequence(method);
}

kj::Maybe<kj::HttpMethod> parseMethod(kj::StringPtr methodStr) {
  auto upper = kj::heapString(methodStr);
  for (char& c : upper) {
    if (c >= 'a' && c <= 'z') {
      c = static_cast<char>(c - 'a' + 'A');
    }
  }
  return kj::tryParseHttpMethod(upper);
}

kj::String buildAllowHeader(kj::ArrayPtr<const kj::HttpMethod> methods) {
  kj::Vector<kj::StringPtr> parts;
  for (auto method : methods) {
    parts.add(getMethodName(method));
  }
  return kj::strArray(parts, ", ");
}

kj::StringPtr statusText(uint status) {
  switch (status) {
  case 200:
    return "OK"_kj;
  case 400:
    return "Bad Request"_kj;
  case 401:
    return "Unauthorized"_kj;
  case 403:
    return "Forbidden"_kj;
  case 404:
    return "Not Found"_kj;
  case 405:
    return "Method Not Allowed"_kj;
  case 429:
    return "Too Many Requests"_kj;
  case 500:
    return "Internal Server Error"_kj;
  case 502:
    return "Bad Gateway"_kj;
  case 503:
    return "Service Unavailable"_kj;
  case 504:
    return "Gateway Timeout"_kj;
  default:
    return status < 400 ? "OK"_kj : "Error"_kj;
  }
}

int64_t ceilSeconds(kj::Duration duration) {
  int64_t nanos = duration / kj::NANOSECONDS;
  if (nanos <= 0) {
    return 0;
  }
  constexpr int64_t NANOS_PER_SECOND = 1000000000;
  return (nanos + NANOS_PER_SECOND - 1) / NANOS_PER_SECOND;
}

} // namespace portico::gateway::util
