#pragma once

#include "cloudup/core/result.hpp"

#include <cstdint>
#include <string>

namespace cloudup::network {

/**
 * @brief Absolute http(s) URL split into the parts a client connection needs
 */
struct Url {
    std::string scheme;  ///< "http" or "https"
    std::string host;
    std::uint16_t port = 0;
    std::string target;  ///< Path plus query, always starting with '/'

    [[nodiscard]] bool is_tls() const noexcept { return scheme == "https"; }

    /// host, or host:port when the port is not the scheme default
    [[nodiscard]] std::string authority() const;

    static Result<Url> parse(const std::string& text);
};

/// Percent-encode a path, leaving '/' and RFC 3986 unreserved characters intact
std::string percent_encode_path(const std::string& path);

/// application/x-www-form-urlencoded encoding of a single value
std::string form_encode(const std::string& value);

/// Join two path fragments with exactly one '/' between them
std::string join_path(const std::string& base, const std::string& tail);

} // namespace cloudup::network
