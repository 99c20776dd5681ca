#include "logger_middleware.hpp"

#include <chrono>
#include <crow/logging.h>

namespace switchyard {

void LoggerMiddleware::operator()(Context& ctx) const {
    auto start = std::chrono::steady_clock::now();
    CROW_LOG_DEBUG << "Started " << ctx.method() << " " << ctx.path();

    ctx.next();

    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start).count();
    CROW_LOG_INFO << ctx.method() << " " << ctx.path() << " -> "
                  << ctx.response().code << " (" << elapsed << " us)";
}

} // namespace switchyard
