#pragma once

#include <string>

#include "context.hpp"

namespace switchyard {

/**
 * Fault boundary of the middleware chain. Anything thrown by later steps is
 * caught here, logged with a stack trace and turned into a single 500
 * diagnostic response. Place it first so it covers the whole chain.
 */
class RecoveryMiddleware {
public:
    void operator()(Context& ctx) const;

    // Symbolized frames of the calling thread, one per line
    static std::string captureStackTrace();

private:
    static void handleFault(Context& ctx, const std::string& message);
};

} // namespace switchyard
