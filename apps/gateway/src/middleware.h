#pragma once

#include "request_context.h"

#include <kj/async.h>
#include <kj/function.h>
#include <kj/string.h>

namespace portico::gateway {

/**
 * Base interface for middleware components.
 *
 * Middleware runs in registration order before the router. Each one either calls next()
 * to continue the chain or writes a response itself and returns without calling it.
 * Failures thrown from next() propagate back through every middleware that already ran.
 */
class Middleware {
public:
  virtual ~Middleware() noexcept = default;

  /**
   * Process the request through this middleware.
   *
   * @param ctx The request context
   * @param next Function to call to continue to next middleware/handler
   * @return Promise that completes when request processing is done
   */
  virtual kj::Promise<void> process(RequestContext& ctx,
                                    kj::Function<kj::Promise<void>()> next) = 0;

  /// Short name used in logs and the health report.
  virtual kj::StringPtr name() const = 0;
};

} // namespace portico::gateway
