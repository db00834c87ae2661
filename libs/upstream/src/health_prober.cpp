#include "portico/upstream/health_prober.h"

#include <kj/debug.h>

namespace portico::upstream {

HttpHealthProber::HttpHealthProber(kj::Timer& timer, kj::Network& network,
                                   kj::Maybe<kj::Network&> tlsNetwork,
                                   const kj::HttpHeaderTable& headerTable)
    : headerTable_(headerTable),
      client_(kj::newHttpClient(timer, headerTable, network, tlsNetwork)) {}

kj::Promise<bool> HttpHealthProber::probe(kj::StringPtr url) {
  kj::HttpHeaders headers(headerTable_);
  headers.addPtrPtr("User-Agent"_kj, "portico-health-check"_kj);

  auto request = client_->request(kj::HttpMethod::GET, url, headers, uint64_t(0));
  request.body = nullptr;
  return kj::mv(request.response).then([](kj::HttpClient::Response&& response) {
    bool healthy = response.statusCode >= 200 && response.statusCode < 300;
    // Drain the body so the connection can be reused
    auto body = kj::mv(response.body);
    auto drained = body->readAllBytes();
    return drained.ignoreResult().attach(kj::mv(body)).then([healthy]() { return healthy; });
  });
}

} // namespace portico::upstream
