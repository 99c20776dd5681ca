#include "middleware_chain.hpp"
#include "context.hpp"

#include <stdexcept>

namespace switchyard {

MiddlewareChain::MiddlewareChain(std::vector<Middleware> middleware, Handler handler)
    : middleware_(std::move(middleware)), handler_(std::move(handler))
{
    if (!handler_) {
        throw std::invalid_argument("Middleware chain requires a handler");
    }
    for (const auto& mw : middleware_) {
        if (!mw) {
            throw std::invalid_argument("Middleware chain contains an empty middleware");
        }
    }
}

MiddlewareChain MiddlewareChain::withPrefix(const std::vector<Middleware>& outer) const {
    std::vector<Middleware> combined;
    combined.reserve(outer.size() + middleware_.size());
    combined.insert(combined.end(), outer.begin(), outer.end());
    combined.insert(combined.end(), middleware_.begin(), middleware_.end());
    return MiddlewareChain(std::move(combined), handler_);
}

size_t MiddlewareChain::size() const {
    return handler_ ? middleware_.size() + 1 : 0;
}

const std::function<void(Context&)>& MiddlewareChain::step(size_t index) const {
    if (index < middleware_.size()) {
        return middleware_[index];
    }
    if (index == middleware_.size() && handler_) {
        return handler_;
    }
    throw std::out_of_range("Middleware chain step out of range");
}

void MiddlewareChain::run(Context& ctx) const {
    ctx.runChain(*this);
}

} // namespace switchyard
