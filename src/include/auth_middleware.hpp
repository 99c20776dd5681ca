#pragma once

#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

#include "context.hpp"

namespace switchyard {

// Decides whether an Authorization header value grants access
class TokenValidator {
public:
    virtual ~TokenValidator() = default;
    virtual bool validate(const std::string& token) const = 0;
};

// Accepts a fixed set of header values, compared after trimming whitespace
class StaticTokenValidator : public TokenValidator {
public:
    explicit StaticTokenValidator(std::vector<std::string> accepted_tokens);

    bool validate(const std::string& token) const override;

private:
    std::unordered_set<std::string> accepted_tokens;
};

/**
 * Validates "Bearer <jwt>" headers signed with HS256. When an issuer is
 * configured the token's "iss" claim has to match it.
 */
class JwtTokenValidator : public TokenValidator {
public:
    JwtTokenValidator(std::string secret, std::string issuer = "");

    bool validate(const std::string& token) const override;

private:
    std::string secret;
    std::string issuer;
};

/**
 * Rejects requests without a valid Authorization header with a 401 payload
 * and stops the chain; otherwise continues.
 */
class AuthMiddleware {
public:
    explicit AuthMiddleware(std::shared_ptr<const TokenValidator> validator);

    void operator()(Context& ctx) const;

private:
    std::shared_ptr<const TokenValidator> validator;
};

} // namespace switchyard
