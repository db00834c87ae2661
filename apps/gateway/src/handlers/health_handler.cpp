#include "handlers/health_handler.h"

#include "portico/core/json.h"
#include "portico/core/time.h"

#include <fstream>
#include <kj/debug.h>
#include <sys/resource.h>
#include <unistd.h>

namespace portico::gateway {

HealthHandler::HealthHandler(const Router& router,
                             const kj::Vector<kj::Own<Middleware>>& middlewares,
                             const core::MetricsRegistry& metrics)
    : router_(router), middlewares_(middlewares), metrics_(metrics),
      started_(kj::systemPreciseMonotonicClock().now()) {}

ProcessMemory HealthHandler::process_memory() {
  ProcessMemory memory;

  // Resident set from /proc/self/statm (second field, in pages)
  std::ifstream statm("/proc/self/statm");
  uint64_t size_pages = 0;
  uint64_t resident_pages = 0;
  if (statm >> size_pages >> resident_pages) {
    memory.rss_bytes = resident_pages * static_cast<uint64_t>(sysconf(_SC_PAGESIZE));
  }

  struct rusage usage {};
  if (getrusage(RUSAGE_SELF, &usage) == 0) {
    memory.peak_rss_bytes = static_cast<uint64_t>(usage.ru_maxrss) * 1024; // kB on Linux
  }
  return memory;
}

kj::String HealthHandler::health_json() const {
  auto uptime = kj::systemPreciseMonotonicClock().now() - started_;
  auto memory = process_memory();

  auto builder = core::JsonBuilder::object();
  builder.put("status", "ok")
      .put("uptime", static_cast<double>(uptime / kj::MILLISECONDS) / 1000.0)
      .put("routes", static_cast<uint64_t>(router_.route_count()))
      .put("middlewares", static_cast<uint64_t>(middlewares_.size()))
      .put_object("memory",
                  [&](core::JsonBuilder& mem) {
                    mem.put("rss", memory.rss_bytes).put("peakRss", memory.peak_rss_bytes);
                  })
      .put("timestamp", core::now_utc_iso8601());

  KJ_IF_SOME(registry, registry_) {
    auto stats = registry.stats();
    builder.put_object("services", [&](core::JsonBuilder& services) {
      services.put("total", static_cast<uint64_t>(stats.total_services));
      services.put_object("healthy", [&](core::JsonBuilder& healthy) {
        for (auto& service : stats.services) {
          healthy.put(service.name, static_cast<uint64_t>(service.healthy));
        }
      });
    });
  }
  return builder.build();
}

kj::Promise<void> HealthHandler::handleHealth(RequestContext& ctx) {
  return ctx.sendJson(200, health_json());
}

kj::Promise<void> HealthHandler::handleMetrics(RequestContext& ctx) {
  auto body = metrics_.to_prometheus();

  kj::HttpHeaders headers(ctx.headerTable);
  headers.setPtr(kj::HttpHeaderId::CONTENT_TYPE, "text/plain; version=0.0.4"_kj);

  auto stream = ctx.response.send(200, "OK"_kj, headers, body.size());
  auto promise = stream->write(body.asBytes());
  return promise.attach(kj::mv(stream), kj::mv(body));
}

} // namespace portico::gateway
