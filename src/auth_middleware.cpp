#include "auth_middleware.hpp"
#include "request_utils.hpp"

#include <crow/logging.h>
#include <jwt-cpp/jwt.h>
#include <stdexcept>

namespace switchyard {

StaticTokenValidator::StaticTokenValidator(std::vector<std::string> tokens) {
    for (const auto& token : tokens) {
        accepted_tokens.insert(trim(token));
    }
}

bool StaticTokenValidator::validate(const std::string& token) const {
    return accepted_tokens.count(trim(token)) > 0;
}

JwtTokenValidator::JwtTokenValidator(std::string secret, std::string issuer)
    : secret(std::move(secret)), issuer(std::move(issuer))
{
    if (this->secret.empty()) {
        throw std::invalid_argument("JWT validator requires a non-empty secret");
    }
}

bool JwtTokenValidator::validate(const std::string& header) const {
    std::string value = trim(header);
    if (value.substr(0, 7) != "Bearer ") {
        return false;
    }

    std::string token = trim(value.substr(7));
    try {
        auto decoded = jwt::decode(token);

        auto verifier = jwt::verify()
            .allow_algorithm(jwt::algorithm::hs256{secret});
        if (!issuer.empty()) {
            verifier.with_issuer(issuer);
        }

        verifier.verify(decoded);
        return true;
    } catch (const std::exception& e) {
        CROW_LOG_DEBUG << "JWT verification failed: " << e.what();
        return false;
    }
}

AuthMiddleware::AuthMiddleware(std::shared_ptr<const TokenValidator> validator)
    : validator(std::move(validator))
{
    if (!this->validator) {
        throw std::invalid_argument("Auth middleware requires a token validator");
    }
}

void AuthMiddleware::operator()(Context& ctx) const {
    const auto& diagnostics = ctx.diagnostics();
    auto auth_header = ctx.header("Authorization");

    if (auth_header.empty()) {
        diagnostics.logAuthFailure(ctx.request(), "Missing Authorization header");

        crow::json::wvalue details;
        details["required_format"] = "Authorization: Bearer <token>";
        details["example"] = "Authorization: Bearer valid-token";
        ctx.writeError(Error::Unauthorized("Missing Authorization header"), std::move(details));
        return;
    }

    if (!validator->validate(auth_header)) {
        diagnostics.logAuthFailure(ctx.request(), "Invalid token");

        crow::json::wvalue details;
        details["token_format"] = "Bearer <token>";
        details["note"] = "Check that the token is valid and has not expired";
        ctx.writeError(Error::Unauthorized("Invalid authentication token"), std::move(details));
        return;
    }

    CROW_LOG_DEBUG << "Authentication successful for " << ctx.method() << " " << ctx.path();
    ctx.next();
}

} // namespace switchyard
