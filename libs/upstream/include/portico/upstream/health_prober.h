#pragma once

#include "portico/upstream/service_registry.h"

#include <kj/async-io.h>
#include <kj/compat/http.h>
#include <kj/memory.h>
#include <kj/timer.h>

namespace portico::upstream {

/**
 * @brief GET probe over HTTP(S); any 2xx answer means healthy
 *
 * Uses its own connection pool so probes never queue behind proxied traffic.
 */
class HttpHealthProber final : public HealthProber {
public:
  HttpHealthProber(kj::Timer& timer, kj::Network& network, kj::Maybe<kj::Network&> tlsNetwork,
                   const kj::HttpHeaderTable& headerTable);

  kj::Promise<bool> probe(kj::StringPtr url) override;

private:
  const kj::HttpHeaderTable& headerTable_;
  kj::Own<kj::HttpClient> client_;
};

} // namespace portico::upstream
