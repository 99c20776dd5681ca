#include "request_counter.hpp"
#include "context.hpp"

#include <string>

namespace switchyard {

RequestCounter::RequestCounter()
    : total(std::make_shared<std::atomic<uint64_t>>(0))
{
}

Middleware RequestCounter::middleware() {
    auto counter = total;
    return [counter](Context& ctx) {
        uint64_t current = counter->fetch_add(1, std::memory_order_relaxed) + 1;
        ctx.setHeader("X-Request-Count", std::to_string(current));
        ctx.next();
    };
}

uint64_t RequestCounter::count() const {
    return total->load(std::memory_order_relaxed);
}

} // namespace switchyard
