#include <catch2/catch_test_macros.hpp>

#include "server_config.hpp"
#include "test_utils.hpp"

namespace switchyard {
namespace test {

TEST_CASE("ServerConfig defaults", "[config]") {
    auto result = ServerConfig::fromYaml(YAML::Node());
    REQUIRE(result.has_value());

    const auto& config = result.value();
    REQUIRE(config.port == 8080);
    REQUIRE(config.bind_address == "0.0.0.0");
    REQUIRE(config.threads == 0);
    REQUIRE(config.log_level == "info");
    REQUIRE(config.detailed_errors);
    REQUIRE_FALSE(config.cors.has_value());
    REQUIRE_FALSE(config.auth.enabled());
}

TEST_CASE("ServerConfig::fromYaml", "[config]") {
    SECTION("All keys") {
        auto root = YAML::Load(R"(
port: 9090
bind-address: 127.0.0.1
threads: 4
log-level: debug
detailed-errors: false
cors:
  allowed-origins: [https://a.com, https://b.com]
  allowed-methods: get, post
auth:
  tokens:
    - Bearer valid-token
  jwt-secret: s3cret
  jwt-issuer: switchyard
)");
        auto result = ServerConfig::fromYaml(root);
        REQUIRE(result.has_value());

        const auto& config = result.value();
        REQUIRE(config.port == 9090);
        REQUIRE(config.bind_address == "127.0.0.1");
        REQUIRE(config.threads == 4);
        REQUIRE(config.log_level == "debug");
        REQUIRE_FALSE(config.detailed_errors);

        REQUIRE(config.cors.has_value());
        REQUIRE(config.cors->allowed_origins == std::vector<std::string>{"https://a.com", "https://b.com"});
        REQUIRE(config.cors->allowed_methods == std::vector<std::string>{"GET", "POST"});
        REQUIRE(config.cors->allowed_headers == std::vector<std::string>{"Content-Type", "Authorization"});

        REQUIRE(config.auth.tokens == std::vector<std::string>{"Bearer valid-token"});
        REQUIRE(config.auth.jwt_secret == "s3cret");
        REQUIRE(config.auth.jwt_issuer == "switchyard");
        REQUIRE(config.auth.enabled());
    }

    SECTION("Port out of range") {
        auto result = ServerConfig::fromYaml(YAML::Load("port: 70000"));
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().category == ErrorCategory::Configuration);
        REQUIRE(result.error().message == "Invalid port");
    }

    SECTION("Unknown log level") {
        auto result = ServerConfig::fromYaml(YAML::Load("log-level: verbose"));
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().details == "verbose");
    }

    SECTION("Wrongly typed value") {
        auto result = ServerConfig::fromYaml(YAML::Load("port: eighty"));
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().message == "Invalid configuration value");
    }

    SECTION("Top level must be a map") {
        auto result = ServerConfig::fromYaml(YAML::Load("[1, 2]"));
        REQUIRE_FALSE(result.has_value());
    }
}

TEST_CASE("ServerConfig::loadFile", "[config]") {
    SECTION("Reads a file") {
        TempFile file("port: 8181\nlog-level: warning\n");
        auto result = ServerConfig::loadFile(file.path());

        REQUIRE(result.has_value());
        REQUIRE(result.value().port == 8181);
        REQUIRE(result.value().log_level == "warning");
    }

    SECTION("Missing required file") {
        auto result = ServerConfig::loadFile("/nonexistent/switchyard.yaml");
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().message == "Configuration file not found");
    }

    SECTION("Missing optional file yields defaults") {
        auto result = ServerConfig::loadFile("/nonexistent/switchyard.yaml", false);
        REQUIRE(result.has_value());
        REQUIRE(result.value().port == 8080);
    }

    SECTION("Malformed YAML") {
        TempFile file("port: [unclosed\n");
        auto result = ServerConfig::loadFile(file.path());
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().category == ErrorCategory::Configuration);
    }
}

TEST_CASE("ServerConfig::effectiveCors", "[config]") {
    SECTION("File settings win over the environment") {
        ScopedEnv origins("CORS_ALLOWED_ORIGINS", std::string("https://env.com"));
        auto result = ServerConfig::fromYaml(YAML::Load("cors:\n  allowed-origins: https://file.com\n"));
        REQUIRE(result.has_value());
        REQUIRE(result.value().effectiveCors().allowed_origins == std::vector<std::string>{"https://file.com"});
    }

    SECTION("Environment is used without a cors section") {
        ScopedEnv origins("CORS_ALLOWED_ORIGINS", std::string("https://env.com"));
        ServerConfig config;
        REQUIRE(config.effectiveCors().allowed_origins == std::vector<std::string>{"https://env.com"});
    }
}

} // namespace test
} // namespace switchyard
