#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

#include "cors_middleware.hpp"
#include "error.hpp"

namespace switchyard {

struct AuthSettings {
    // Exact Authorization header values accepted, e.g. "Bearer valid-token"
    std::vector<std::string> tokens;
    std::string jwt_secret;
    std::string jwt_issuer;

    bool enabled() const { return !tokens.empty() || !jwt_secret.empty(); }
};

/**
 * Server settings read from switchyard.yaml:
 *
 *   port: 8080
 *   bind-address: 0.0.0.0
 *   threads: 4
 *   log-level: info
 *   detailed-errors: true
 *   cors:
 *     allowed-origins: [https://a.com]
 *     allowed-methods: GET, POST
 *   auth:
 *     tokens: [Bearer valid-token]
 *
 * Every key is optional. Without a cors section the CORS settings come from
 * the environment.
 */
struct ServerConfig {
    int port = 8080;
    std::string bind_address = "0.0.0.0";
    unsigned int threads = 0;
    std::string log_level = "info";
    bool detailed_errors = true;
    std::optional<CorsConfig> cors;
    AuthSettings auth;

    static Result<ServerConfig> fromYaml(const YAML::Node& root);

    /**
     * Load the configuration file.
     *
     * @param path YAML file to read
     * @param required When false a missing file yields the defaults
     */
    static Result<ServerConfig> loadFile(const std::filesystem::path& path, bool required = true);

    // CORS settings in effect, from the file or else from the environment
    CorsConfig effectiveCors() const;
};

} // namespace switchyard
