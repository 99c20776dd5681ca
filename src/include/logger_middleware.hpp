#pragma once

#include "context.hpp"

namespace switchyard {

// Logs method, path, status and elapsed time of every request it wraps
class LoggerMiddleware {
public:
    void operator()(Context& ctx) const;
};

} // namespace switchyard
