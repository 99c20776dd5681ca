#include "cors_middleware.hpp"
#include "request_utils.hpp"

#include <algorithm>
#include <cstdlib>
#include <crow/logging.h>

namespace switchyard {

namespace {

std::string readEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

} // namespace

CorsConfig CorsConfig::defaults() {
    CorsConfig config;
    config.allowed_origins = {"*"};
    config.allowed_methods = {"GET", "POST", "PUT", "DELETE", "PATCH", "OPTIONS"};
    config.allowed_headers = {"Content-Type", "Authorization"};
    return config;
}

CorsConfig CorsConfig::fromEnvironment() {
    CorsConfig config = defaults();

    std::string origins = readEnv("CORS_ALLOWED_ORIGINS");
    if (origins.empty()) {
        origins = readEnv("ALLOWED_ORIGINS");
    }
    if (!origins.empty()) {
        config.allowed_origins = splitList(origins);
    }

    std::string methods = readEnv("CORS_ALLOWED_METHODS");
    if (!methods.empty()) {
        config.allowed_methods = splitList(methods, true);
    }

    std::string headers = readEnv("CORS_ALLOWED_HEADERS");
    if (!headers.empty()) {
        config.allowed_headers = splitList(headers);
    }

    CROW_LOG_DEBUG << "CORS origins from environment: " << joinList(config.allowed_origins);
    return config;
}

bool CorsConfig::allowsOrigin(const std::string& origin) const {
    return std::any_of(allowed_origins.begin(), allowed_origins.end(), [&](const std::string& allowed) {
        return allowed == "*" || allowed == origin;
    });
}

CorsMiddleware::CorsMiddleware(CorsConfig config)
    : config_(std::move(config)),
      methods_value_(joinList(config_.allowed_methods)),
      headers_value_(joinList(config_.allowed_headers))
{
}

void CorsMiddleware::operator()(Context& ctx) const {
    auto origin = ctx.header("Origin");

    if (config_.allowsOrigin(origin)) {
        ctx.setHeader("Access-Control-Allow-Origin", origin.empty() ? "*" : origin);
    }

    ctx.setHeader("Access-Control-Allow-Methods", methods_value_);
    ctx.setHeader("Access-Control-Allow-Headers", headers_value_);
    ctx.setHeader("Access-Control-Allow-Credentials", "true");

    if (ctx.request().method == crow::HTTPMethod::Options) {
        ctx.writeStatus(204);
        return;
    }

    ctx.next();
}

} // namespace switchyard
