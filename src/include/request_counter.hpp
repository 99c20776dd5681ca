#pragma once

#include <atomic>
#include <cstdint>
#include <memory>

#include "middleware_chain.hpp"

namespace switchyard {

/**
 * Counts requests across all connections and reports the running total in
 * the X-Request-Count response header.
 */
class RequestCounter {
public:
    RequestCounter();

    // Middleware sharing this counter's total
    Middleware middleware();

    uint64_t count() const;

private:
    std::shared_ptr<std::atomic<uint64_t>> total;
};

} // namespace switchyard
