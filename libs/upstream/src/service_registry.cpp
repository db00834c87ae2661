#include "portico/upstream/service_registry.h"

#include "portico/core/error.h"
#include "portico/core/time.h"

#include <kj/debug.h>

namespace portico::upstream {

namespace {

kj::Maybe<kj::String> clone_maybe(const kj::Maybe<kj::String>& value) {
  KJ_IF_SOME(text, value) {
    return kj::str(text);
  }
  return kj::none;
}

} // namespace

ServiceInstance ServiceInstance::clone() const {
  return ServiceInstance{kj::str(id),     kj::str(url),  weight, clone_maybe(health_path),
                         healthy,         registered_at, last_probe};
}

ServiceRecord ServiceRecord::clone() const {
  ServiceRecord copy{kj::str(name), {}, algorithm, registered_at};
  copy.instances.reserve(instances.size());
  for (auto& instance : instances) {
    copy.instances.add(instance.clone());
  }
  return copy;
}

// =============================================================================
// ServiceRegistry
// =============================================================================

ServiceRegistry::ServiceRegistry(HealthCheckConfig config, const kj::Clock& clock)
    : config_(kj::mv(config)), clock_(clock) {}

ServiceRegistry::~ServiceRegistry() noexcept = default;

ServiceRecord ServiceRegistry::register_service(ServiceDefinition definition) {
  if (definition.name.size() == 0 || definition.instances.size() == 0) {
    core::throw_error(core::ErrorKind::InvalidConfig, "Service name and instances are required");
  }

  auto now = clock_.now();
  ServiceRecord record{kj::mv(definition.name), {}, definition.algorithm, now};
  record.instances.reserve(definition.instances.size());
  for (auto& def : definition.instances) {
    if (def.url.size() == 0) {
      core::throw_error(core::ErrorKind::InvalidConfig,
                        kj::str("instance of service ", record.name, " has no url"));
    }
    for (auto& existing : record.instances) {
      if (existing.url == def.url) {
        core::throw_error(core::ErrorKind::InvalidConfig,
                          kj::str("service ", record.name, " lists ", def.url, " twice"));
      }
    }
    kj::String id;
    KJ_IF_SOME(explicit_id, def.id) {
      id = kj::mv(explicit_id);
    } else {
      id = core::generate_id();
    }
    record.instances.add(ServiceInstance{kj::mv(id), kj::mv(def.url), def.weight,
                                         kj::mv(def.health_path), true, now, kj::none});
  }

  auto snapshot = record.clone();
  size_t count = record.instances.size();
  {
    auto lock = services_.lockExclusive();
    lock->upsert(kj::str(record.name), kj::mv(record),
                 [](ServiceRecord& existing, ServiceRecord&& replacement) {
                   existing = kj::mv(replacement);
                 });
  }

  if (scheduler_ != kj::none) {
    schedule(snapshot.name);
  }

  KJ_LOG(INFO, "Service registered", snapshot.name, count);
  listeners_.notify(RegistryEvent{RegistryEvent::Kind::Registered, kj::str(snapshot.name),
                                  kj::none, kj::none, true, count});
  return snapshot;
}

bool ServiceRegistry::deregister(kj::StringPtr name) {
  if (!services_.lockExclusive()->erase(name)) {
    return false;
  }
  probes_.erase(name);

  KJ_LOG(INFO, "Service deregistered", name);
  listeners_.notify(
      RegistryEvent{RegistryEvent::Kind::Deregistered, kj::str(name), kj::none, kj::none});
  return true;
}

kj::Maybe<ServiceRecord> ServiceRegistry::get_service(kj::StringPtr name) const {
  auto lock = services_.lockShared();
  KJ_IF_SOME(record, lock->find(name)) {
    return record.clone();
  }
  return kj::none;
}

kj::Vector<ServiceRecord> ServiceRegistry::all_services() const {
  kj::Vector<ServiceRecord> result;
  auto lock = services_.lockShared();
  for (auto& entry : *lock) {
    result.add(entry.value.clone());
  }
  return result;
}

kj::Vector<ServiceInstance> ServiceRegistry::get_healthy_instances(kj::StringPtr name) const {
  kj::Vector<ServiceInstance> result;
  auto lock = services_.lockShared();
  KJ_IF_SOME(record, lock->find(name)) {
    for (auto& instance : record.instances) {
      if (instance.healthy) {
        result.add(instance.clone());
      }
    }
  }
  return result;
}

bool ServiceRegistry::update_health(kj::StringPtr service, kj::StringPtr instance_id,
                                    bool healthy) {
  kj::Maybe<RegistryEvent> change;
  {
    auto lock = services_.lockExclusive();
    kj::Maybe<ServiceInstance&> found;
    KJ_IF_SOME(record, lock->find(service)) {
      for (auto& instance : record.instances) {
        if (instance.id == instance_id) {
          found = instance;
          break;
        }
      }
    }

    KJ_IF_SOME(instance, found) {
      instance.last_probe = clock_.now();
      if (instance.healthy != healthy) {
        instance.healthy = healthy;
        change = RegistryEvent{RegistryEvent::Kind::HealthChanged, kj::str(service),
                               kj::str(instance.id), kj::str(instance.url), healthy};
      }
    } else {
      return false;
    }
  }

  KJ_IF_SOME(event, change) {
    KJ_LOG(INFO, "Instance health changed", service, instance_id,
           healthy ? "healthy"_kj : "unhealthy"_kj);
    listeners_.notify(event);
  }
  return true;
}

RegistryStats ServiceRegistry::stats() const {
  auto lock = services_.lockShared();
  RegistryStats stats{lock->size(), {}};
  for (auto& entry : *lock) {
    size_t healthy = 0;
    for (auto& instance : entry.value.instances) {
      if (instance.healthy) {
        ++healthy;
      }
    }
    stats.services.add(ServiceStats{kj::str(entry.key), entry.value.instances.size(), healthy,
                                    entry.value.registered_at});
  }
  return stats;
}

kj::String ServiceRegistry::health_url(const ServiceInstance& instance) const {
  kj::StringPtr path = config_.default_path;
  KJ_IF_SOME(custom, instance.health_path) {
    path = custom;
  }

  kj::ArrayPtr<const char> base = instance.url.asArray();
  while (base.size() > 0 && base[base.size() - 1] == '/') {
    base = base.first(base.size() - 1);
  }
  if (path.startsWith("/")) {
    return kj::str(base, path);
  }
  return kj::str(base, "/", path);
}

// -----------------------------------------------------------------------------
// Health check scheduling
// -----------------------------------------------------------------------------

void ServiceRegistry::enable_health_checks(kj::Timer& timer, HealthProber& prober) {
  scheduler_ = Scheduler{timer, prober};
  for (auto& record : all_services()) {
    schedule(record.name);
  }
}

void ServiceRegistry::disable_health_checks() {
  probes_.clear();
  scheduler_ = kj::none;
}

void ServiceRegistry::schedule(kj::StringPtr name) {
  // Replacing an entry cancels the previous loop
  probes_.upsert(kj::str(name), probe_loop(kj::str(name)).eagerlyEvaluate(nullptr),
                 [](kj::Promise<void>& existing, kj::Promise<void>&& replacement) {
                   existing = kj::mv(replacement);
                 });
}

kj::Promise<void> ServiceRegistry::probe_loop(kj::String name) {
  auto& scheduler = KJ_ASSERT_NONNULL(scheduler_);
  for (;;) {
    co_await check_service(name);
    co_await scheduler.timer.afterDelay(config_.interval);
  }
}

kj::Promise<void> ServiceRegistry::check_service(kj::StringPtr name) {
  if (scheduler_ == kj::none) {
    return core::make_error(core::ErrorKind::InvalidConfig,
                            kj::str("health checks are not enabled, cannot probe ", name));
  }

  kj::Vector<kj::Promise<void>> probes;
  {
    auto lock = services_.lockShared();
    KJ_IF_SOME(record, lock->find(name)) {
      for (auto& instance : record.instances) {
        probes.add(probe_instance(kj::str(name), kj::str(instance.id), health_url(instance)));
      }
    }
  }
  return kj::joinPromises(probes.releaseAsArray());
}

kj::Promise<void> ServiceRegistry::probe_instance(kj::String service, kj::String id,
                                                  kj::String url) {
  auto& scheduler = KJ_ASSERT_NONNULL(scheduler_, "health checks are not enabled");

  bool healthy = false;
  try {
    healthy = co_await scheduler.prober.probe(url).exclusiveJoin(
        scheduler.timer.afterDelay(config_.timeout).then([]() { return false; }));
  } catch (kj::Exception& e) {
    KJ_LOG(DBG, "Health probe failed", service, id, url, e.getDescription());
    healthy = false;
  }
  update_health(service, id, healthy);
}

// =============================================================================
// PoolSync
// =============================================================================

PoolSync::PoolSync(ServiceRegistry& registry, LoadBalancer& balancer)
    : registry_(registry), balancer_(balancer) {
  subscription_ = registry_.subscribe([this](const RegistryEvent& event) { on_event(event); });
  for (auto& record : registry_.all_services()) {
    sync_pool(record.name);
  }
}

PoolSync::~PoolSync() noexcept {
  registry_.unsubscribe(subscription_);
}

void PoolSync::sync_pool(kj::StringPtr service) {
  KJ_IF_SOME(record, registry_.get_service(service)) {
    auto specs = kj::heapArrayBuilder<InstanceSpec>(record.instances.size());
    for (auto& instance : record.instances) {
      specs.add(InstanceSpec{kj::str(instance.url), instance.weight});
    }
    auto array = specs.finish();
    balancer_.register_pool(service, array, record.algorithm.orDefault(balancer_.algorithm()));
    for (auto& instance : record.instances) {
      if (!instance.healthy) {
        balancer_.set_health(service, instance.url, false);
      }
    }
  }
}

void PoolSync::on_event(const RegistryEvent& event) {
  switch (event.kind) {
  case RegistryEvent::Kind::Registered:
    sync_pool(event.service);
    break;
  case RegistryEvent::Kind::Deregistered:
    balancer_.unregister(event.service);
    break;
  case RegistryEvent::Kind::HealthChanged:
    KJ_IF_SOME(url, event.instance_url) {
      balancer_.set_health(event.service, url, event.healthy);
    }
    break;
  }
}

} // namespace portico::upstream
