#include "recovery_middleware.hpp"

#include <crow/logging.h>
#include <cstdlib>
#include <exception>
#include <sstream>

#ifndef _WIN32
#include <execinfo.h>
#endif

namespace switchyard {

void RecoveryMiddleware::operator()(Context& ctx) const {
    try {
        ctx.next();
    } catch (const std::exception& e) {
        handleFault(ctx, e.what());
    } catch (...) {
        handleFault(ctx, "unknown exception");
    }
}

void RecoveryMiddleware::handleFault(Context& ctx, const std::string& message) {
    std::string trace = captureStackTrace();

    ctx.diagnostics().logServerError(ctx.request(), "panic recovered: " + message);
    CROW_LOG_ERROR << "Stack trace:\n" << trace;

    if (ctx.responded()) {
        CROW_LOG_WARNING << "Response already written before the fault on "
                         << ctx.method() << " " << ctx.path() << ", keeping it";
        return;
    }

    crow::json::wvalue details;
    details["panic_message"] = message;
    details["stack_trace"] = trace;
    details["note"] = "The application recovered from a critical error";

    ctx.writeError(Error::InternalFault("Internal server error", message), std::move(details), trace);
}

std::string RecoveryMiddleware::captureStackTrace() {
#ifdef _WIN32
    return "stack trace unavailable on this platform";
#else
    constexpr int kMaxFrames = 64;
    void* frames[kMaxFrames];
    int count = backtrace(frames, kMaxFrames);

    char** symbols = backtrace_symbols(frames, count);
    if (!symbols) {
        return "stack trace unavailable";
    }

    std::ostringstream trace;
    for (int i = 0; i < count; ++i) {
        trace << "#" << i << " " << symbols[i] << "\n";
    }
    std::free(symbols);
    return trace.str();
#endif
}

} // namespace switchyard
