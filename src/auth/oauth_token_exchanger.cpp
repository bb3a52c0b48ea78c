#include "cloudup/auth/oauth_token_exchanger.hpp"

#include "cloudup/network/url.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace cloudup::auth {

using json = nlohmann::json;

OAuthTokenExchanger::OAuthTokenExchanger(std::shared_ptr<network::HttpTransport> transport, Options options)
    : transport_(std::move(transport)), options_(std::move(options)) {}

Result<TokenGrant> OAuthTokenExchanger::refresh(const std::string& refresh_token) {
    if (refresh_token.empty()) {
        return Err<TokenGrant>(Error::auth("No refresh token available"));
    }

    std::string form = "grant_type=refresh_token";
    form += "&refresh_token=" + network::form_encode(refresh_token);
    form += "&client_id=" + network::form_encode(options_.client_id);
    if (!options_.client_secret.empty()) {
        form += "&client_secret=" + network::form_encode(options_.client_secret);
    }
    if (!options_.scopes.empty()) {
        std::string scope;
        for (const auto& s : options_.scopes) {
            scope += scope.empty() ? s : " " + s;
        }
        form += "&scope=" + network::form_encode(scope);
    }

    network::HttpRequest request;
    request.method = network::HttpMethod::POST;
    request.url = options_.token_url;
    request.timeout = options_.timeout;
    request.set_header("Content-Type", "application/x-www-form-urlencoded");
    request.set_header("Accept", "application/json");
    request.set_body(form);

    auto sent = transport_->send(request);
    if (sent.is_error()) {
        return Err<TokenGrant>(sent.error());
    }
    const auto& response = sent.value();

    auto payload = json::parse(response.body_as_string(), nullptr, false);
    if (!response.is_success()) {
        std::string detail = "Token endpoint rejected refresh";
        if (!payload.is_discarded() && payload.is_object()) {
            detail += ": " + payload.value("error", std::string("unknown_error"));
            if (payload.contains("error_description")) {
                detail += " (" + payload.value("error_description", std::string()) + ")";
            }
        }
        if (response.status_code == 400 || response.status_code == 401) {
            return Err<TokenGrant>(Error::auth(detail, response.status_code));
        }
        return Err<TokenGrant>(Error::from_http_status(response.status_code, detail));
    }

    if (payload.is_discarded() || !payload.is_object() || !payload.contains("access_token") ||
        !payload["access_token"].is_string()) {
        return Err<TokenGrant>(Error::protocol("Token response has no access_token", response.status_code));
    }

    TokenGrant grant;
    grant.access_token = payload["access_token"].get<std::string>();
    grant.scheme = payload.value("token_type", std::string("Bearer"));
    if (payload.contains("refresh_token") && payload["refresh_token"].is_string()) {
        grant.refresh_token = payload["refresh_token"].get<std::string>();
    }
    if (payload.contains("expires_in") && payload["expires_in"].is_number()) {
        grant.expires_at = Clock::now() + std::chrono::seconds(payload["expires_in"].get<std::int64_t>());
    } else {
        spdlog::debug("Token response without expires_in; treating token as non-expiring");
    }
    return Ok(std::move(grant));
}

} // namespace cloudup::auth
