#include "portico/upstream/load_balancer.h"

#include "portico/core/error.h"

#include <kj/debug.h>
#include <random>

namespace portico::upstream {

namespace {

std::mt19937_64& rng() {
  thread_local std::mt19937_64 engine{std::random_device{}()};
  return engine;
}

size_t random_index(size_t n) {
  std::uniform_int_distribution<size_t> dist(0, n - 1);
  return dist(rng());
}

} // namespace

kj::StringPtr to_string(Algorithm algorithm) {
  switch (algorithm) {
  case Algorithm::RoundRobin:
    return "round-robin"_kj;
  case Algorithm::LeastConnections:
    return "least-connections"_kj;
  case Algorithm::Random:
    return "random"_kj;
  case Algorithm::IpHash:
    return "ip-hash"_kj;
  case Algorithm::Weighted:
    return "weighted"_kj;
  }
  return "round-robin"_kj;
}

kj::Maybe<Algorithm> parse_algorithm(kj::StringPtr name) {
  if (name == "round-robin") return Algorithm::RoundRobin;
  if (name == "least-connections") return Algorithm::LeastConnections;
  if (name == "random") return Algorithm::Random;
  if (name == "ip-hash") return Algorithm::IpHash;
  if (name == "weighted") return Algorithm::Weighted;
  return kj::none;
}

LoadBalancer::LoadBalancer(Algorithm algorithm, const kj::Clock& clock)
    : algorithm_(algorithm), clock_(clock) {}

void LoadBalancer::register_pool(kj::StringPtr service,
                                 kj::ArrayPtr<const InstanceSpec> instances) {
  register_pool(service, instances, algorithm_);
}

void LoadBalancer::register_pool(kj::StringPtr service,
                                 kj::ArrayPtr<const InstanceSpec> instances,
                                 Algorithm algorithm) {
  for (size_t i = 0; i < instances.size(); ++i) {
    for (size_t j = 0; j < i; ++j) {
      if (instances[i].url == instances[j].url) {
        core::throw_error(core::ErrorKind::InvalidConfig,
                          kj::str("pool ", service, " lists ", instances[i].url, " twice"));
      }
    }
  }

  auto pool = kj::heap<Pool>();
  pool->algorithm = algorithm;
  for (auto& spec : instances) {
    pool->instances.add(kj::heap<Instance>(spec.url, spec.weight == 0 ? 1 : spec.weight));
  }

  auto lock = pools_.lockExclusive();
  lock->upsert(kj::str(service), kj::mv(pool),
               [](kj::Own<Pool>& existing, kj::Own<Pool>&& replacement) {
                 existing = kj::mv(replacement);
               });
  KJ_LOG(INFO, "registered pool", service, instances.size(), to_string(algorithm));
}

bool LoadBalancer::unregister(kj::StringPtr service) {
  return pools_.lockExclusive()->erase(service);
}

void LoadBalancer::clear() {
  pools_.lockExclusive()->clear();
}

kj::Maybe<Selection> LoadBalancer::get_next(kj::StringPtr service,
                                            kj::Maybe<kj::StringPtr> client_ip) {
  auto lock = pools_.lockShared();
  KJ_IF_SOME(pool, lock->find(service)) {
    kj::Vector<const Instance*> healthy(pool->instances.size());
    for (auto& instance : pool->instances) {
      if (instance->healthy.load(std::memory_order_acquire)) {
        healthy.add(instance.get());
      }
    }
    if (healthy.empty()) {
      return kj::none;
    }

    const Instance& chosen = choose(*pool, healthy.asPtr(), client_ip);
    chosen.connections.fetch_add(1, std::memory_order_relaxed);
    chosen.last_used_ms.store((clock_.now() - kj::UNIX_EPOCH) / kj::MILLISECONDS,
                              std::memory_order_relaxed);
    return Selection{kj::heapString(chosen.url), chosen.weight};
  }
  return kj::none;
}

const LoadBalancer::Instance& LoadBalancer::choose(const Pool& pool,
                                                   kj::ArrayPtr<const Instance* const> healthy,
                                                   kj::Maybe<kj::StringPtr> client_ip) const {
  size_t n = healthy.size();
  switch (pool.algorithm) {
  case Algorithm::RoundRobin:
    return *healthy[pool.cursor.fetch_add(1, std::memory_order_relaxed) % n];

  case Algorithm::LeastConnections: {
    // Strict comparison: ties go to the earliest instance.
    const Instance* best = healthy[0];
    for (size_t i = 1; i < n; ++i) {
      if (healthy[i]->connections.load() < best->connections.load()) {
        best = healthy[i];
      }
    }
    return *best;
  }

  case Algorithm::Random:
    return *healthy[random_index(n)];

  case Algorithm::IpHash:
    KJ_IF_SOME(ip, client_ip) {
      if (ip.size() > 0) {
        uint64_t hash = 0;
        for (char c : ip) {
          hash += static_cast<unsigned char>(c);
        }
        return *healthy[hash % n];
      }
    }
    return *healthy[random_index(n)];

  case Algorithm::Weighted: {
    uint64_t total = 0;
    for (auto* instance : healthy) {
      total += instance->weight;
    }
    std::uniform_int_distribution<uint64_t> dist(0, total - 1);
    uint64_t point = dist(rng());
    for (auto* instance : healthy) {
      if (point < instance->weight) {
        return *instance;
      }
      point -= instance->weight;
    }
    return *healthy[0];
  }
  }
  return *healthy[0];
}

void LoadBalancer::release(kj::StringPtr service, kj::StringPtr url) {
  auto lock = pools_.lockShared();
  KJ_IF_SOME(pool, lock->find(service)) {
    for (auto& instance : pool->instances) {
      if (instance->url == url) {
        auto current = instance->connections.load(std::memory_order_relaxed);
        while (current > 0 &&
               !instance->connections.compare_exchange_weak(current, current - 1,
                                                            std::memory_order_relaxed)) {
        }
        return;
      }
    }
  }
}

bool LoadBalancer::set_health(kj::StringPtr service, kj::StringPtr url, bool healthy) {
  auto lock = pools_.lockShared();
  KJ_IF_SOME(pool, lock->find(service)) {
    for (auto& instance : pool->instances) {
      if (instance->url == url) {
        bool previous = instance->healthy.exchange(healthy, std::memory_order_acq_rel);
        if (previous != healthy) {
          KJ_LOG(INFO, "instance health changed", service, url, healthy ? "healthy" : "unhealthy");
        }
        return true;
      }
    }
  }
  return false;
}

bool LoadBalancer::has_pool(kj::StringPtr service) const {
  return pools_.lockShared()->find(service) != kj::none;
}

PoolStats LoadBalancer::stats_for(kj::StringPtr name, const Pool& pool) const {
  PoolStats stats{kj::heapString(name), pool.algorithm, pool.instances.size(), 0, {}};
  for (auto& instance : pool.instances) {
    bool healthy = instance->healthy.load();
    if (healthy) {
      ++stats.healthy;
    }
    stats.instances.add(InstanceStats{kj::heapString(instance->url), healthy,
                                      instance->connections.load(),
                                      instance->last_used_ms.load(), instance->weight});
  }
  return stats;
}

kj::Maybe<PoolStats> LoadBalancer::get_stats(kj::StringPtr service) const {
  auto lock = pools_.lockShared();
  KJ_IF_SOME(pool, lock->find(service)) {
    return stats_for(service, *pool);
  }
  return kj::none;
}

kj::Vector<PoolStats> LoadBalancer::all_stats() const {
  auto lock = pools_.lockShared();
  kj::Vector<PoolStats> result;
  for (auto& entry : *lock) {
    result.add(stats_for(entry.key, *entry.value));
  }
  return result;
}

} // namespace portico::upstream
