#pragma once

#include "portico/core/listeners.h"
#include "portico/upstream/load_balancer.h"

#include <kj/async.h>
#include <kj/common.h>
#include <kj/map.h>
#include <kj/mutex.h>
#include <kj/string.h>
#include <kj/time.h>
#include <kj/timer.h>
#include <kj/vector.h>

namespace portico::upstream {

struct InstanceDefinition {
  /// Stable identifier; generated when absent.
  kj::Maybe<kj::String> id;
  kj::String url;
  uint weight = 1;
  /// Probe path appended to url; the registry default when absent.
  kj::Maybe<kj::String> health_path;
};

struct ServiceDefinition {
  kj::String name;
  kj::Vector<InstanceDefinition> instances;
  /// Balancing algorithm for this service's pool; the balancer default when absent.
  kj::Maybe<Algorithm> algorithm;
};

struct ServiceInstance {
  kj::String id;
  kj::String url;
  uint weight;
  kj::Maybe<kj::String> health_path;
  bool healthy;
  kj::Date registered_at;
  kj::Maybe<kj::Date> last_probe;

  ServiceInstance clone() const;
};

struct ServiceRecord {
  kj::String name;
  kj::Vector<ServiceInstance> instances;
  kj::Maybe<Algorithm> algorithm;
  kj::Date registered_at;

  ServiceRecord clone() const;
};

struct RegistryEvent {
  enum class Kind { Registered, Deregistered, HealthChanged };

  Kind kind;
  kj::String service;
  /// Set for HealthChanged.
  kj::Maybe<kj::String> instance_id;
  kj::Maybe<kj::String> instance_url;
  bool healthy = true;
  /// Instance count for Registered.
  size_t instances = 0;
};

struct ServiceStats {
  kj::String name;
  size_t instances;
  size_t healthy;
  kj::Date registered_at;
};

struct RegistryStats {
  size_t total_services;
  kj::Vector<ServiceStats> services;
};

struct HealthCheckConfig {
  kj::Duration interval = 30 * kj::SECONDS;
  /// A probe still running after this long counts as unhealthy.
  kj::Duration timeout = 5 * kj::SECONDS;
  kj::String default_path = kj::str("/health");
};

/**
 * @brief Performs one health probe
 */
class HealthProber {
public:
  virtual ~HealthProber() noexcept = default;

  /**
   * @param url Full probe URL; only valid until the call returns
   * @return true for a healthy answer. Failures may reject instead of returning false.
   */
  virtual kj::Promise<bool> probe(kj::StringPtr url) = 0;
};

/**
 * @brief Dynamic service membership and instance health
 *
 * Registering a name that already exists replaces the service and its instances.
 * Every instance starts healthy. Health changes are published only when the recorded flag
 * actually flips, once per flip.
 *
 * Lookups and health updates are thread-safe. Health check scheduling
 * (enable_health_checks(), and register/deregister while it is enabled) must happen on the
 * event loop thread that owns the timer, and must not be triggered from a registry listener.
 */
class ServiceRegistry final {
public:
  explicit ServiceRegistry(HealthCheckConfig config = {},
                           const kj::Clock& clock = kj::systemPreciseCalendarClock());
  ~ServiceRegistry() noexcept;

  KJ_DISALLOW_COPY_AND_MOVE(ServiceRegistry);

  /**
   * @throws kj::Exception tagged InvalidConfig without a name or instances
   */
  ServiceRecord register_service(ServiceDefinition definition);

  /// Remove the service and cancel its probes. @return false when unknown
  bool deregister(kj::StringPtr name);

  [[nodiscard]] kj::Maybe<ServiceRecord> get_service(kj::StringPtr name) const;
  [[nodiscard]] kj::Vector<ServiceRecord> all_services() const;
  [[nodiscard]] kj::Vector<ServiceInstance> get_healthy_instances(kj::StringPtr name) const;

  /**
   * @brief Record a health observation and stamp the instance's last probe time
   * @return false when the service or instance is unknown
   */
  bool update_health(kj::StringPtr service, kj::StringPtr instance_id, bool healthy);

  [[nodiscard]] RegistryStats stats() const;

  core::ListenerId subscribe(kj::Function<void(const RegistryEvent&)> listener) {
    return listeners_.subscribe(kj::mv(listener));
  }
  bool unsubscribe(core::ListenerId id) {
    return listeners_.unsubscribe(id);
  }

  /**
   * @brief Probe every registered service now and then every interval
   *
   * Services registered later are scheduled as they arrive.
   */
  void enable_health_checks(kj::Timer& timer, HealthProber& prober);
  void disable_health_checks();

  /// Probe every instance of @p name once, each independently. Rejects with InvalidConfig
  /// unless health checks are enabled.
  kj::Promise<void> check_service(kj::StringPtr name);

  [[nodiscard]] kj::String health_url(const ServiceInstance& instance) const;

  [[nodiscard]] const HealthCheckConfig& config() const {
    return config_;
  }

private:
  struct Scheduler {
    kj::Timer& timer;
    HealthProber& prober;
  };

  void schedule(kj::StringPtr name);
  kj::Promise<void> probe_loop(kj::String name);
  kj::Promise<void> probe_instance(kj::String service, kj::String id, kj::String url);

  HealthCheckConfig config_;
  const kj::Clock& clock_;
  kj::MutexGuarded<kj::HashMap<kj::String, ServiceRecord>> services_;
  core::ListenerSet<RegistryEvent> listeners_;

  kj::Maybe<Scheduler> scheduler_;
  kj::HashMap<kj::String, kj::Promise<void>> probes_;
};

/**
 * @brief Keeps LoadBalancer pools in step with a ServiceRegistry
 *
 * Registrations become pools, deregistrations remove them and health flips are forwarded
 * to the matching pool instance. Services already registered are synchronized on
 * construction.
 */
class PoolSync final {
public:
  PoolSync(ServiceRegistry& registry, LoadBalancer& balancer);
  ~PoolSync() noexcept;

  KJ_DISALLOW_COPY_AND_MOVE(PoolSync);

private:
  void sync_pool(kj::StringPtr service);
  void on_event(const RegistryEvent& event);

  ServiceRegistry& registry_;
  LoadBalancer& balancer_;
  core::ListenerId subscription_;
};

} // namespace portico::upstream
