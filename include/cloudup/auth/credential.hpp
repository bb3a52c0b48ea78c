#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace cloudup::auth {

using Clock = std::chrono::system_clock;

/**
 * @brief Access credential attached to backend requests
 *
 * Immutable once published by a TokenManager; a refresh replaces the whole
 * value rather than editing fields in place.
 */
struct Credential {
    std::string access_token;
    Clock::time_point expires_at = Clock::time_point::max();
    std::string scheme = "Bearer";

    [[nodiscard]] std::string authorization_header() const {
        return scheme + " " + access_token;
    }

    [[nodiscard]] bool expires_within(Clock::duration margin, Clock::time_point now) const {
        if (expires_at == Clock::time_point::max()) {
            return false;
        }
        return expires_at - now <= margin;
    }
};

/**
 * @brief Result of exchanging a refresh token
 *
 * Identity providers may rotate the refresh token; when they do the new one
 * is returned here and must replace the old one.
 */
struct TokenGrant {
    std::string access_token;
    Clock::time_point expires_at = Clock::time_point::max();
    std::optional<std::string> refresh_token;
    std::string scheme = "Bearer";
};

} // namespace cloudup::auth
