#include "auth/jwt_verifier.h"

#include "portico/core/json.h"

#include <kj/debug.h>
#include <kj/encoding.h>
#include <kj/vector.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace portico::gateway::auth {

namespace {

constexpr kj::StringPtr HEADER_JSON = R"({"alg":"HS256","typ":"JWT"})"_kj;

struct TokenParts {
  kj::ArrayPtr<const char> header;
  kj::ArrayPtr<const char> payload;
  kj::ArrayPtr<const char> signature;
  kj::ArrayPtr<const char> signing_input; // header.payload
};

kj::Maybe<TokenParts> split_token(kj::StringPtr token) {
  auto chars = token.asArray();
  kj::Maybe<size_t> first;
  kj::Maybe<size_t> second;
  for (size_t i = 0; i < chars.size(); ++i) {
    if (chars[i] != '.') {
      continue;
    }
    if (first == kj::none) {
      first = i;
    } else if (second == kj::none) {
      second = i;
    } else {
      return kj::none; // more than two dots
    }
  }

  KJ_IF_SOME(a, first) {
    KJ_IF_SOME(b, second) {
      if (a == 0 || b == a + 1 || b + 1 == chars.size()) {
        return kj::none;
      }
      return TokenParts{chars.first(a), chars.slice(a + 1, b), chars.slice(b + 1, chars.size()),
                        chars.first(b)};
    }
  }
  return kj::none;
}

kj::Maybe<core::JsonDocument> parse_segment(kj::ArrayPtr<const char> segment, bool& bad_base64) {
  KJ_IF_SOME(bytes, base64url_decode(segment)) {
    auto text = kj::heapString(bytes.asChars());
    kj::Maybe<core::JsonDocument> result;
    KJ_IF_SOME(exception,
               kj::runCatchingExceptions([&]() { result = core::JsonDocument::parse(text); })) {
      KJ_LOG(DBG, "JWT segment is not JSON", exception.getDescription());
      return kj::none;
    }
    return kj::mv(result);
  }
  bad_base64 = true;
  return kj::none;
}

} // namespace

kj::StringPtr to_string(JwtError error) {
  switch (error) {
  case JwtError::NONE:
    return "none"_kj;
  case JwtError::INVALID_FORMAT:
    return "invalid_format"_kj;
  case JwtError::INVALID_BASE64:
    return "invalid_base64"_kj;
  case JwtError::INVALID_JSON:
    return "invalid_json"_kj;
  case JwtError::ALGORITHM_MISMATCH:
    return "algorithm_mismatch"_kj;
  case JwtError::INVALID_SIGNATURE:
    return "invalid_signature"_kj;
  case JwtError::MISSING_CLAIMS:
    return "missing_claims"_kj;
  case JwtError::EXPIRED:
    return "expired"_kj;
  case JwtError::ISSUER_MISMATCH:
    return "issuer_mismatch"_kj;
  }
  return "unknown"_kj;
}

kj::String base64url_encode(kj::ArrayPtr<const kj::byte> data) {
  return kj::encodeBase64Url(data);
}

kj::Maybe<kj::Array<kj::byte>> base64url_decode(kj::ArrayPtr<const char> encoded) {
  // Base64URL uses '-' and '_' instead of '+' and '/', and omits padding.
  kj::Vector<char> standard(encoded.size() + 4);
  for (char c : encoded) {
    if (c == '-') {
      standard.add('+');
    } else if (c == '_') {
      standard.add('/');
    } else if (c == '+' || c == '/') {
      return kj::none;
    } else {
      standard.add(c);
    }
  }
  while (standard.size() % 4 != 0) {
    standard.add('=');
  }

  auto result = kj::decodeBase64(standard.asPtr());
  if (result.hadErrors) {
    return kj::none;
  }
  return kj::Array<kj::byte>(kj::mv(result));
}

JwtVerifier::JwtVerifier(JwtConfig config, const kj::Clock& clock)
    : config_(kj::mv(config)), clock_(clock), last_error_(JwtError::NONE) {
  KJ_REQUIRE(config_.secret.size() > 0, "JWT secret must not be empty");
  if (config_.secret.size() < 32) {
    KJ_LOG(WARNING, "JWT secret is shorter than 32 bytes");
  }
}

int64_t JwtVerifier::current_timestamp() const {
  return (clock_.now() - kj::UNIX_EPOCH) / kj::SECONDS;
}

kj::Array<kj::byte> JwtVerifier::hmac_sha256(kj::ArrayPtr<const kj::byte> data) const {
  kj::byte digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;

  auto* ok = HMAC(EVP_sha256(), config_.secret.begin(), static_cast<int>(config_.secret.size()),
                  data.begin(), data.size(), digest, &digest_len);
  KJ_ASSERT(ok != nullptr, "HMAC-SHA256 failed");

  return kj::heapArray<kj::byte>(digest, digest_len);
}

kj::String JwtVerifier::issue(kj::StringPtr subject, kj::ArrayPtr<const kj::String> roles,
                              kj::Duration ttl) const {
  int64_t iat = current_timestamp();
  int64_t exp = iat + ttl / kj::SECONDS;

  auto payload = core::JsonBuilder::object();
  payload.put("sub", subject).put("roles", roles).put("iat", iat).put("exp", exp);
  KJ_IF_SOME(iss, config_.issuer) {
    payload.put("iss", kj::StringPtr(iss));
  }
  auto payload_json = payload.build();

  auto signing_input =
      kj::str(base64url_encode(HEADER_JSON.asBytes()), ".", base64url_encode(payload_json.asBytes()));
  auto signature = hmac_sha256(signing_input.asBytes());
  return kj::str(signing_input, ".", base64url_encode(signature));
}

kj::Maybe<Identity> JwtVerifier::fail(JwtError error) const {
  *last_error_.lockExclusive() = error;
  return kj::none;
}

kj::Maybe<Identity> JwtVerifier::verify(kj::StringPtr token) const {
  *last_error_.lockExclusive() = JwtError::NONE;

  TokenParts parts;
  KJ_IF_SOME(p, split_token(token)) {
    parts = p;
  } else {
    return fail(JwtError::INVALID_FORMAT);
  }

  bool bad_base64 = false;
  core::JsonDocument header_doc;
  KJ_IF_SOME(doc, parse_segment(parts.header, bad_base64)) {
    header_doc = kj::mv(doc);
  } else {
    return fail(bad_base64 ? JwtError::INVALID_BASE64 : JwtError::INVALID_JSON);
  }

  KJ_IF_SOME(alg, header_doc.root()["alg"_kj].get_string_ptr()) {
    if (alg != "HS256"_kj) {
      return fail(JwtError::ALGORITHM_MISMATCH);
    }
  } else {
    return fail(JwtError::ALGORITHM_MISMATCH);
  }

  // Check the signature before reading any claim
  kj::Array<kj::byte> signature;
  KJ_IF_SOME(bytes, base64url_decode(parts.signature)) {
    signature = kj::mv(bytes);
  } else {
    return fail(JwtError::INVALID_BASE64);
  }
  auto expected = hmac_sha256(parts.signing_input.asBytes());
  if (expected.size() != signature.size() ||
      CRYPTO_memcmp(expected.begin(), signature.begin(), expected.size()) != 0) {
    return fail(JwtError::INVALID_SIGNATURE);
  }

  core::JsonDocument payload_doc;
  KJ_IF_SOME(doc, parse_segment(parts.payload, bad_base64)) {
    payload_doc = kj::mv(doc);
  } else {
    return fail(bad_base64 ? JwtError::INVALID_BASE64 : JwtError::INVALID_JSON);
  }

  auto claims = payload_doc.root();
  auto sub = claims["sub"_kj];
  auto exp = claims["exp"_kj];
  if (!sub.is_string() || !exp.is_number()) {
    return fail(JwtError::MISSING_CLAIMS);
  }

  int64_t now = current_timestamp();
  if (exp.get_int() <= now - config_.leeway / kj::SECONDS) {
    return fail(JwtError::EXPIRED);
  }

  kj::Maybe<kj::String> issuer;
  KJ_IF_SOME(iss, claims["iss"_kj].get_string_ptr()) {
    issuer = kj::str(iss);
  }
  KJ_IF_SOME(required, config_.issuer) {
    KJ_IF_SOME(actual, issuer) {
      if (actual != required) {
        return fail(JwtError::ISSUER_MISMATCH);
      }
    } else {
      return fail(JwtError::ISSUER_MISMATCH);
    }
  }

  Identity identity;
  identity.subject = sub.get_string();
  identity.issuer = kj::mv(issuer);
  identity.expires_at = exp.get_int();
  claims["roles"_kj].for_each_array([&](const core::JsonValue& role) {
    KJ_IF_SOME(name, role.get_string_ptr()) {
      identity.roles.add(kj::str(name));
    }
  });
  KJ_IF_SOME(role, claims["role"_kj].get_string_ptr()) {
    identity.roles.add(kj::str(role));
  }
  return kj::mv(identity);
}

JwtError JwtVerifier::last_error() const {
  return *last_error_.lockShared();
}

} // namespace portico::gateway::auth
