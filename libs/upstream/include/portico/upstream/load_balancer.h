#pragma once

#include <atomic>
#include <cstdint>
#include <kj/common.h>
#include <kj/map.h>
#include <kj/memory.h>
#include <kj/mutex.h>
#include <kj/string.h>
#include <kj/time.h>
#include <kj/vector.h>

namespace portico::upstream {

enum class Algorithm {
  RoundRobin,
  LeastConnections,
  Random,
  IpHash,
  Weighted,
};

[[nodiscard]] kj::StringPtr to_string(Algorithm algorithm);

/// Accepts "round-robin", "least-connections", "random", "ip-hash", "weighted".
[[nodiscard]] kj::Maybe<Algorithm> parse_algorithm(kj::StringPtr name);

struct InstanceSpec {
  kj::String url;
  uint weight = 1;
};

/// Returned by get_next(); the caller must release() the url when the request completes.
struct Selection {
  kj::String url;
  uint weight;
};

struct InstanceStats {
  kj::String url;
  bool healthy;
  int64_t connections;
  int64_t last_used_ms; // 0 when never selected
  uint weight;
};

struct PoolStats {
  kj::String name;
  Algorithm algorithm;
  size_t total;
  size_t healthy;
  kj::Vector<InstanceStats> instances;
};

/**
 * @brief Per-service instance pools with pluggable selection
 *
 * Only healthy instances are eligible. Selection increments the instance's in-flight
 * counter and stamps its last-used time; release() decrements it, floored at zero.
 * Counters, health and the rotation cursor are atomics, so selections never lose updates
 * and never block each other beyond the shared pool-map lock.
 */
class LoadBalancer final {
public:
  explicit LoadBalancer(Algorithm algorithm = Algorithm::RoundRobin,
                        const kj::Clock& clock = kj::systemPreciseCalendarClock());

  /// Create or replace the pool for @p service. Every instance starts healthy.
  /// Instance URLs must be unique within the pool (InvalidConfig otherwise).
  void register_pool(kj::StringPtr service, kj::ArrayPtr<const InstanceSpec> instances);

  /// Same as register_pool() with an algorithm that overrides the balancer default.
  void register_pool(kj::StringPtr service, kj::ArrayPtr<const InstanceSpec> instances,
                     Algorithm algorithm);

  bool unregister(kj::StringPtr service);
  void clear();

  /**
   * @brief Pick an instance of @p service
   * @param client_ip Used by IpHash; the other algorithms ignore it
   * @return kj::none when the service is unknown or has no healthy instance
   */
  [[nodiscard]] kj::Maybe<Selection> get_next(kj::StringPtr service,
                                              kj::Maybe<kj::StringPtr> client_ip = kj::none);

  void release(kj::StringPtr service, kj::StringPtr url);

  /// @return false when the service or instance is unknown
  bool set_health(kj::StringPtr service, kj::StringPtr url, bool healthy);

  [[nodiscard]] bool has_pool(kj::StringPtr service) const;
  [[nodiscard]] kj::Maybe<PoolStats> get_stats(kj::StringPtr service) const;
  [[nodiscard]] kj::Vector<PoolStats> all_stats() const;

  [[nodiscard]] Algorithm algorithm() const noexcept {
    return algorithm_;
  }

private:
  struct Instance {
    Instance(kj::StringPtr url, uint weight) : url(kj::heapString(url)), weight(weight) {}

    const kj::String url;
    const uint weight;
    mutable std::atomic<bool> healthy{true};
    mutable std::atomic<int64_t> connections{0};
    mutable std::atomic<int64_t> last_used_ms{0};
  };

  struct Pool {
    Algorithm algorithm;
    kj::Vector<kj::Own<Instance>> instances;
    mutable std::atomic<uint64_t> cursor{0};
  };

  const Instance& choose(const Pool& pool, kj::ArrayPtr<const Instance* const> healthy,
                         kj::Maybe<kj::StringPtr> client_ip) const;
  PoolStats stats_for(kj::StringPtr name, const Pool& pool) const;

  Algorithm algorithm_;
  const kj::Clock& clock_;
  kj::MutexGuarded<kj::HashMap<kj::String, kj::Own<Pool>>> pools_;
};

} // namespace portico::upstream
