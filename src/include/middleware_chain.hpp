#pragma once

#include <functional>
#include <vector>

namespace switchyard {

class Context;

using Handler = std::function<void(Context&)>;

// A middleware proceeds by calling ctx.next(); returning without it ends the request
using Middleware = std::function<void(Context&)>;

/**
 * Immutable ordered sequence of middleware ending in a terminal handler.
 * Steps execute in registration order: m0, m1, ..., mn, handler.
 */
class MiddlewareChain {
public:
    MiddlewareChain() = default;
    MiddlewareChain(std::vector<Middleware> middleware, Handler handler);

    // New chain with the given middleware placed before this chain's own
    MiddlewareChain withPrefix(const std::vector<Middleware>& outer) const;

    // Number of steps including the terminal handler
    size_t size() const;
    bool empty() const { return !handler_; }

    // Step at index; indices below middlewareCount() are middleware, the last one is the handler
    const std::function<void(Context&)>& step(size_t index) const;
    size_t middlewareCount() const { return middleware_.size(); }

    // Start the chain for a request
    void run(Context& ctx) const;

private:
    std::vector<Middleware> middleware_;
    Handler handler_;
};

} // namespace switchyard
