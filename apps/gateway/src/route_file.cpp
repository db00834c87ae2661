#include "route_file.h"

#include "portico/core/error.h"
#include "util/http_utils.h"

#include <kj/debug.h>

namespace portico::gateway {

namespace {

[[noreturn]] void invalid(kj::StringPtr message) {
  core::throw_error(core::ErrorKind::InvalidConfig, message);
}

// One day
constexpr int64_t MAX_MILLIS = 86400000;

kj::Duration millis(const core::JsonValue& value, kj::StringPtr field) {
  if (!value.is_int() || value.get_int() < 0 || value.get_int() > MAX_MILLIS) {
    invalid(kj::str("'", field, "' must be an integer between 0 and ", MAX_MILLIS));
  }
  return value.get_int() * kj::MILLISECONDS;
}

} // namespace

upstream::ServiceDefinition RouteFile::parse_service(const core::JsonValue& value) {
  if (!value.is_object()) {
    invalid("service entries must be objects");
  }

  upstream::ServiceDefinition service;
  KJ_IF_SOME(name, value["name"_kj].get_string_ptr()) {
    service.name = kj::str(name);
  } else {
    invalid("service entry without a name");
  }

  KJ_IF_SOME(algorithm, value.get("algorithm"_kj)) {
    KJ_IF_SOME(parsed, upstream::parse_algorithm(algorithm.get_string())) {
      service.algorithm = parsed;
    } else {
      invalid(kj::str("service '", service.name, "': unknown algorithm '", algorithm.get_string(),
                      "'"));
    }
  }

  value["instances"_kj].for_each_array([&](const core::JsonValue& entry) {
    upstream::InstanceDefinition instance;
    KJ_IF_SOME(url, entry["url"_kj].get_string_ptr()) {
      instance.url = kj::str(url);
    } else {
      invalid(kj::str("service '", service.name, "': instance without a url"));
    }
    KJ_IF_SOME(id, entry["id"_kj].get_string_ptr()) {
      instance.id = kj::str(id);
    }
    KJ_IF_SOME(weight, entry.get("weight"_kj)) {
      if (!weight.is_int() || weight.get_int() < 1) {
        invalid(kj::str("service '", service.name, "': weight must be a positive integer"));
      }
      instance.weight = static_cast<uint>(weight.get_int());
    }
    KJ_IF_SOME(path, entry["health_path"_kj].get_string_ptr()) {
      instance.health_path = kj::str(path);
    }
    service.instances.add(kj::mv(instance));
  });

  return service;
}

RouteConfig RouteFile::parse_route(const core::JsonValue& value, kj::Duration default_timeout) {
  RouteConfig config;
  config.timeout = default_timeout;

  KJ_IF_SOME(target, value["target"_kj].get_string_ptr()) {
    config.target = kj::str(target);
  }
  KJ_IF_SOME(service, value["service"_kj].get_string_ptr()) {
    config.service = kj::str(service);
  }

  value["methods"_kj].for_each_array([&](const core::JsonValue& method) {
    auto name = method.get_string();
    KJ_IF_SOME(parsed, util::parseMethod(name)) {
      config.methods.add(parsed);
    } else {
      invalid(kj::str("unknown HTTP method '", name, "'"));
    }
  });

  config.auth = value["auth"_kj].get_bool(false);

  KJ_IF_SOME(timeout, value.get("timeout_ms"_kj)) {
    config.timeout = millis(timeout, "timeout_ms"_kj);
    if (config.timeout == 0 * kj::MILLISECONDS) {
      invalid("'timeout_ms' must be > 0");
    }
  }

  KJ_IF_SOME(retry, value.get("retry"_kj)) {
    KJ_IF_SOME(attempts, retry.get("attempts"_kj)) {
      if (!attempts.is_int() || attempts.get_int() < 0 ||
          attempts.get_int() > RetryPolicy::MAX_ATTEMPTS) {
        invalid(kj::str("'retry.attempts' must be an integer between 0 and ",
                        RetryPolicy::MAX_ATTEMPTS));
      }
      config.retry.attempts = static_cast<uint>(attempts.get_int());
    }
    KJ_IF_SOME(delay, retry.get("delay_ms"_kj)) {
      config.retry.delay = millis(delay, "retry.delay_ms"_kj);
    }
  }

  value["metadata"_kj].for_each_object([&](kj::StringPtr key, const core::JsonValue& entry) {
    config.metadata.upsert(kj::str(key), entry.get_string(), [](auto& existing, auto&& replacement) {
      existing = kj::mv(replacement);
    });
  });

  return config;
}

RouteFile::Summary RouteFile::apply(const core::JsonDocument& document, Router& router,
                                    upstream::ServiceRegistry& registry,
                                    kj::Duration default_timeout) {
  auto root = document.root();
  if (!root.is_object()) {
    invalid("routes file must contain a JSON object");
  }

  Summary summary;
  root["services"_kj].for_each_array([&](const core::JsonValue& entry) {
    registry.register_service(parse_service(entry));
    ++summary.services;
  });

  root["routes"_kj].for_each_array([&](const core::JsonValue& entry) {
    KJ_IF_SOME(path, entry["path"_kj].get_string_ptr()) {
      router.add_route(path, parse_route(entry, default_timeout));
      ++summary.routes;
    } else {
      invalid("route entry without a path");
    }
  });

  return summary;
}

RouteFile::Summary RouteFile::load(kj::StringPtr path, Router& router,
                                   upstream::ServiceRegistry& registry,
                                   kj::Duration default_timeout) {
  kj::Maybe<core::JsonDocument> document;
  KJ_IF_SOME(exception,
             kj::runCatchingExceptions([&]() { document = core::JsonDocument::parse_file(path); })) {
    invalid(kj::str("cannot load routes file ", path, ": ", exception.getDescription()));
  }

  auto summary = apply(KJ_ASSERT_NONNULL(document), router, registry, default_timeout);
  KJ_LOG(INFO, "Routes file loaded", path, "services", summary.services, "routes", summary.routes);
  return summary;
}

} // namespace portico::gateway
