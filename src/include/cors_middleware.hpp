#pragma once

#include <string>
#include <vector>

#include "context.hpp"

namespace switchyard {

struct CorsConfig {
    std::vector<std::string> allowed_origins;
    std::vector<std::string> allowed_methods;
    std::vector<std::string> allowed_headers;

    // Allow-all origins with the default method and header sets
    static CorsConfig defaults();

    /**
     * Read the configuration from the environment:
     * CORS_ALLOWED_ORIGINS (falling back to ALLOWED_ORIGINS), CORS_ALLOWED_METHODS
     * and CORS_ALLOWED_HEADERS, each a comma-separated list. Unset or empty
     * variables keep the defaults.
     */
    static CorsConfig fromEnvironment();

    bool allowsOrigin(const std::string& origin) const;
};

class CorsMiddleware {
public:
    explicit CorsMiddleware(CorsConfig config = CorsConfig::defaults());

    void operator()(Context& ctx) const;

    const CorsConfig& config() const { return config_; }

private:
    CorsConfig config_;
    std::string methods_value_;
    std::string headers_value_;
};

} // namespace switchyard
