#pragma once

#include <atomic>
#include <cstdint>
#include <kj/array.h>
#include <kj/common.h>
#include <kj/map.h>
#include <kj/memory.h>
#include <kj/mutex.h>
#include <kj/string.h>
#include <memory>

namespace portico::core {

enum class MetricType { Counter, Gauge, Histogram };

class Metric {
public:
  Metric(kj::StringPtr name, kj::StringPtr description)
      : name_(kj::heapString(name)), description_(kj::heapString(description)) {}
  virtual ~Metric() noexcept = default;

  [[nodiscard]] kj::StringPtr name() const noexcept {
    return name_;
  }
  [[nodiscard]] kj::StringPtr description() const noexcept {
    return description_;
  }
  [[nodiscard]] virtual MetricType type() const noexcept = 0;

private:
  kj::String name_;
  kj::String description_;
};

// Monotonically increasing
class Counter final : public Metric {
public:
  using Metric::Metric;

  void increment(int64_t value = 1) noexcept {
    count_.fetch_add(value, std::memory_order_relaxed);
  }
  [[nodiscard]] int64_t value() const noexcept {
    return count_.load(std::memory_order_relaxed);
  }
  [[nodiscard]] MetricType type() const noexcept override {
    return MetricType::Counter;
  }

private:
  std::atomic<int64_t> count_{0};
};

class Gauge final : public Metric {
public:
  using Metric::Metric;

  void increment(int64_t value = 1) noexcept {
    value_.fetch_add(value, std::memory_order_relaxed);
  }
  void decrement(int64_t value = 1) noexcept {
    value_.fetch_sub(value, std::memory_order_relaxed);
  }
  void set(int64_t value) noexcept {
    value_.store(value, std::memory_order_relaxed);
  }
  [[nodiscard]] int64_t value() const noexcept {
    return value_.load(std::memory_order_relaxed);
  }
  [[nodiscard]] MetricType type() const noexcept override {
    return MetricType::Gauge;
  }

private:
  std::atomic<int64_t> value_{0};
};

/**
 * @brief Cumulative histogram with fixed upper bounds (seconds for latencies)
 */
class Histogram final : public Metric {
public:
  Histogram(kj::StringPtr name, kj::StringPtr description,
            kj::Array<double> buckets = default_buckets());

  void observe(double value) noexcept;

  [[nodiscard]] int64_t count() const noexcept {
    return count_.load();
  }
  [[nodiscard]] double sum() const noexcept {
    return sum_.load();
  }
  [[nodiscard]] kj::ArrayPtr<const double> buckets() const noexcept {
    return buckets_;
  }
  /// Observations less than or equal to buckets()[index].
  [[nodiscard]] int64_t bucket_count(size_t index) const noexcept {
    return bucket_counts_[index].load();
  }
  [[nodiscard]] MetricType type() const noexcept override {
    return MetricType::Histogram;
  }

  static kj::Array<double> default_buckets();

private:
  kj::Array<double> buckets_;
  // std::atomic is neither copyable nor movable, so kj::Array cannot hold it
  std::unique_ptr<std::atomic<int64_t>[]> bucket_counts_;
  std::atomic<int64_t> count_{0};
  std::atomic<double> sum_{0.0};
};

/**
 * @brief Named metrics exported in Prometheus text format
 *
 * Registration is idempotent: registering an existing name keeps the existing metric.
 * Returned references stay valid for the registry's lifetime.
 */
class MetricsRegistry final {
public:
  Counter& register_counter(kj::StringPtr name, kj::StringPtr description);
  Gauge& register_gauge(kj::StringPtr name, kj::StringPtr description);
  Histogram& register_histogram(kj::StringPtr name, kj::StringPtr description,
                                kj::Array<double> buckets = Histogram::default_buckets());

  [[nodiscard]] kj::Maybe<Counter&> counter(kj::StringPtr name) const;
  [[nodiscard]] kj::Maybe<Gauge&> gauge(kj::StringPtr name) const;
  [[nodiscard]] kj::Maybe<Histogram&> histogram(kj::StringPtr name) const;

  [[nodiscard]] kj::String to_prometheus() const;

private:
  struct RegistryState {
    kj::TreeMap<kj::String, kj::Own<Counter>> counters;
    kj::TreeMap<kj::String, kj::Own<Gauge>> gauges;
    kj::TreeMap<kj::String, kj::Own<Histogram>> histograms;
  };

  kj::MutexGuarded<RegistryState> guarded_;
};

} // namespace portico::core
