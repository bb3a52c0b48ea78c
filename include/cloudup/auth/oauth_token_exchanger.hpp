#pragma once

#include "cloudup/auth/token_exchanger.hpp"
#include "cloudup/network/http_transport.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace cloudup::auth {

/**
 * @brief OAuth2 refresh_token grant against a token endpoint
 *
 * Client credentials travel in the form body. The reply's access_token,
 * refresh_token and expires_in are decoded; a 400/401 from the endpoint
 * means the refresh token itself is no longer accepted (Auth).
 */
class OAuthTokenExchanger : public TokenExchanger {
public:
    struct Options {
        std::string token_url;
        std::string client_id;
        std::string client_secret;
        std::vector<std::string> scopes;
        std::chrono::milliseconds timeout{std::chrono::seconds(30)};
    };

    OAuthTokenExchanger(std::shared_ptr<network::HttpTransport> transport, Options options);

    Result<TokenGrant> refresh(const std::string& refresh_token) override;

private:
    std::shared_ptr<network::HttpTransport> transport_;
    Options options_;
};

} // namespace cloudup::auth
