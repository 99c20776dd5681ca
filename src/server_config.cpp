#include "server_config.hpp"
#include "request_utils.hpp"

#include <crow/logging.h>

namespace switchyard {

namespace {

// Accepts either a YAML sequence or a comma-separated scalar
std::vector<std::string> readList(const YAML::Node& node, bool upper_case = false) {
    if (node.IsSequence()) {
        std::vector<std::string> items;
        for (const auto& item : node) {
            std::string value = trim(item.as<std::string>());
            if (!value.empty()) {
                items.push_back(upper_case ? toUpper(value) : value);
            }
        }
        return items;
    }
    return splitList(node.as<std::string>(), upper_case);
}

bool isKnownLogLevel(const std::string& level) {
    return level == "debug" || level == "info" || level == "warning" || level == "error";
}

} // namespace

Result<ServerConfig> ServerConfig::fromYaml(const YAML::Node& root) {
    ServerConfig config;
    if (!root || root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        return Error::Configuration("Invalid configuration", "Top-level node must be a map");
    }

    try {
        if (root["port"]) {
            config.port = root["port"].as<int>();
            if (config.port <= 0 || config.port > 65535) {
                return Error::Configuration("Invalid port", std::to_string(config.port));
            }
        }
        if (root["bind-address"]) {
            config.bind_address = root["bind-address"].as<std::string>();
        }
        if (root["threads"]) {
            config.threads = root["threads"].as<unsigned int>();
        }
        if (root["log-level"]) {
            config.log_level = root["log-level"].as<std::string>();
            if (!isKnownLogLevel(config.log_level)) {
                return Error::Configuration("Invalid log level", config.log_level);
            }
        }
        if (root["detailed-errors"]) {
            config.detailed_errors = root["detailed-errors"].as<bool>();
        }

        if (auto cors_node = root["cors"]) {
            CorsConfig cors = CorsConfig::defaults();
            if (cors_node["allowed-origins"]) {
                cors.allowed_origins = readList(cors_node["allowed-origins"]);
            }
            if (cors_node["allowed-methods"]) {
                cors.allowed_methods = readList(cors_node["allowed-methods"], true);
            }
            if (cors_node["allowed-headers"]) {
                cors.allowed_headers = readList(cors_node["allowed-headers"]);
            }
            config.cors = cors;
        }

        if (auto auth_node = root["auth"]) {
            if (auth_node["tokens"]) {
                config.auth.tokens = readList(auth_node["tokens"]);
            }
            if (auth_node["jwt-secret"]) {
                config.auth.jwt_secret = auth_node["jwt-secret"].as<std::string>();
            }
            if (auth_node["jwt-issuer"]) {
                config.auth.jwt_issuer = auth_node["jwt-issuer"].as<std::string>();
            }
        }
    } catch (const YAML::Exception& e) {
        return Error::Configuration("Invalid configuration value", e.what());
    }

    return config;
}

Result<ServerConfig> ServerConfig::loadFile(const std::filesystem::path& path, bool required) {
    if (!std::filesystem::exists(path)) {
        if (required) {
            return Error::Configuration("Configuration file not found", path.string());
        }
        CROW_LOG_INFO << "No configuration file at " << path.string() << ", using defaults";
        return ServerConfig{};
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        return Error::Configuration("Failed to parse " + path.string(), e.what());
    }

    CROW_LOG_INFO << "Loaded configuration from " << path.string();
    return fromYaml(root);
}

CorsConfig ServerConfig::effectiveCors() const {
    if (cors) {
        return *cors;
    }
    return CorsConfig::fromEnvironment();
}

} // namespace switchyard
