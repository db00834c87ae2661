#include "portico/core/metrics.h"

#include <kj/string-tree.h>
#include <kj/vector.h>

namespace portico::core {

Histogram::Histogram(kj::StringPtr name, kj::StringPtr description, kj::Array<double> buckets)
    : Metric(name, description), buckets_(kj::mv(buckets)),
      bucket_counts_(std::make_unique<std::atomic<int64_t>[]>(buckets_.size())) {
  for (size_t i = 0; i < buckets_.size(); ++i) {
    bucket_counts_[i].store(0);
  }
}

void Histogram::observe(double value) noexcept {
  count_.fetch_add(1);
  sum_.fetch_add(value);
  for (size_t i = 0; i < buckets_.size(); ++i) {
    if (value <= buckets_[i]) {
      bucket_counts_[i].fetch_add(1);
    }
  }
}

kj::Array<double> Histogram::default_buckets() {
  return kj::heapArray<double>(
      {0.001, 0.005, 0.01, 0.025, 0.05, 0.1, 0.25, 0.5, 1.0, 2.5, 5.0, 10.0, 30.0, 60.0});
}

namespace {

template <typename T, typename... Args>
T& find_or_insert(kj::TreeMap<kj::String, kj::Own<T>>& map, kj::StringPtr name, Args&&... args) {
  KJ_IF_SOME(existing, map.find(name)) {
    return *existing;
  }
  auto metric = kj::heap<T>(name, kj::fwd<Args>(args)...);
  T& ref = *metric;
  map.insert(kj::str(name), kj::mv(metric));
  return ref;
}

template <typename T>
kj::Maybe<T&> lookup(const kj::TreeMap<kj::String, kj::Own<T>>& map, kj::StringPtr name) {
  KJ_IF_SOME(existing, map.find(name)) {
    return *existing;
  }
  return kj::none;
}

void add_header(kj::Vector<kj::StringTree>& lines, const Metric& metric, kj::StringPtr type) {
  if (metric.description().size() > 0) {
    lines.add(kj::strTree("# HELP ", metric.name(), " ", metric.description(), "\n"));
  }
  lines.add(kj::strTree("# TYPE ", metric.name(), " ", type, "\n"));
}

} // namespace

Counter& MetricsRegistry::register_counter(kj::StringPtr name, kj::StringPtr description) {
  return find_or_insert(guarded_.lockExclusive()->counters, name, description);
}

Gauge& MetricsRegistry::register_gauge(kj::StringPtr name, kj::StringPtr description) {
  return find_or_insert(guarded_.lockExclusive()->gauges, name, description);
}

Histogram& MetricsRegistry::register_histogram(kj::StringPtr name, kj::StringPtr description,
                                               kj::Array<double> buckets) {
  return find_or_insert(guarded_.lockExclusive()->histograms, name, description,
                        kj::mv(buckets));
}

kj::Maybe<Counter&> MetricsRegistry::counter(kj::StringPtr name) const {
  return lookup(guarded_.lockExclusive()->counters, name);
}

kj::Maybe<Gauge&> MetricsRegistry::gauge(kj::StringPtr name) const {
  return lookup(guarded_.lockExclusive()->gauges, name);
}

kj::Maybe<Histogram&> MetricsRegistry::histogram(kj::StringPtr name) const {
  return lookup(guarded_.lockExclusive()->histograms, name);
}

kj::String MetricsRegistry::to_prometheus() const {
  auto lock = guarded_.lockExclusive();
  kj::Vector<kj::StringTree> lines;

  for (const auto& entry : lock->counters) {
    add_header(lines, *entry.value, "counter");
    lines.add(kj::strTree(entry.key, " ", entry.value->value(), "\n"));
  }

  for (const auto& entry : lock->gauges) {
    add_header(lines, *entry.value, "gauge");
    lines.add(kj::strTree(entry.key, " ", entry.value->value(), "\n"));
  }

  for (const auto& entry : lock->histograms) {
    const auto& histogram = *entry.value;
    add_header(lines, histogram, "histogram");
    auto buckets = histogram.buckets();
    for (size_t i = 0; i < buckets.size(); ++i) {
      lines.add(kj::strTree(entry.key, "_bucket{le=\"", buckets[i], "\"} ",
                            histogram.bucket_count(i), "\n"));
    }
    lines.add(kj::strTree(entry.key, "_bucket{le=\"+Inf\"} ", histogram.count(), "\n"));
    lines.add(kj::strTree(entry.key, "_sum ", histogram.sum(), "\n"));
    lines.add(kj::strTree(entry.key, "_count ", histogram.count(), "\n"));
  }

  return kj::StringTree(lines.releaseAsArray(), "").flatten();
}

} // namespace portico::core
