#pragma once

#include "cloudup/auth/credential.hpp"
#include "cloudup/core/result.hpp"

#include <string>

namespace cloudup::auth {

/**
 * @brief Capability that trades a refresh token for a new access token
 */
class TokenExchanger {
public:
    virtual ~TokenExchanger() = default;

    virtual Result<TokenGrant> refresh(const std::string& refresh_token) = 0;
};

/**
 * @brief Exchanger for services with fixed credentials (WebDAV Basic auth)
 *
 * Always hands out the same non-expiring credential.
 */
class StaticTokenExchanger : public TokenExchanger {
public:
    StaticTokenExchanger(std::string access_token, std::string scheme)
        : access_token_(std::move(access_token)), scheme_(std::move(scheme)) {}

    /// Basic authentication credential for username/password
    static StaticTokenExchanger basic(const std::string& username, const std::string& password);

    Result<TokenGrant> refresh(const std::string&) override {
        TokenGrant grant;
        grant.access_token = access_token_;
        grant.scheme = scheme_;
        return Ok(std::move(grant));
    }

private:
    std::string access_token_;
    std::string scheme_;
};

} // namespace cloudup::auth
