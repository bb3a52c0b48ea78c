#include "cloudup/core/error.hpp"

#include <sstream>

namespace cloudup {

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Auth: return "Auth";
        case ErrorKind::Network: return "Network";
        case ErrorKind::RateLimited: return "RateLimited";
        case ErrorKind::BackendProtocol: return "BackendProtocol";
        case ErrorKind::Validation: return "Validation";
        case ErrorKind::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

Error Error::auth(std::string message, std::optional<int> status) {
    Error e;
    e.kind = ErrorKind::Auth;
    e.message = std::move(message);
    e.status_code = status;
    return e;
}

Error Error::network(std::string message) {
    Error e;
    e.kind = ErrorKind::Network;
    e.message = std::move(message);
    return e;
}

Error Error::rate_limited(std::string message,
                          std::optional<std::chrono::milliseconds> retry_after,
                          std::optional<int> status) {
    Error e;
    e.kind = ErrorKind::RateLimited;
    e.message = std::move(message);
    e.retry_after = retry_after;
    e.status_code = status;
    return e;
}

Error Error::protocol(std::string message, std::optional<int> status) {
    Error e;
    e.kind = ErrorKind::BackendProtocol;
    e.message = std::move(message);
    e.status_code = status;
    return e;
}

Error Error::validation(std::string message) {
    Error e;
    e.kind = ErrorKind::Validation;
    e.message = std::move(message);
    return e;
}

Error Error::cancelled(std::string message) {
    Error e;
    e.kind = ErrorKind::Cancelled;
    e.message = std::move(message);
    return e;
}

Error Error::from_http_status(int status,
                              const std::string& context,
                              std::optional<std::chrono::milliseconds> retry_after) {
    const std::string message = context + " (HTTP " + std::to_string(status) + ")";
    switch (status) {
        case 401:
        case 403:
            return auth(message, status);
        case 408: {
            Error e = network(message);
            e.status_code = status;
            return e;
        }
        case 429:
            return rate_limited(message, retry_after, status);
        case 400:
        case 405:
        case 411:
        case 413:
        case 415: {
            Error e = validation(message);
            e.status_code = status;
            return e;
        }
        default:
            break;
    }
    if (status == 503 && retry_after.has_value()) {
        return rate_limited(message, retry_after, status);
    }
    return protocol(message, status);
}

Error Error::at_chunk(std::uint32_t index) const {
    Error copy = *this;
    copy.chunk_index = index;
    return copy;
}

Error Error::caused_by(Error inner) const {
    Error copy = *this;
    copy.cause = std::make_shared<const Error>(std::move(inner));
    return copy;
}

std::string Error::describe() const {
    std::ostringstream oss;
    oss << to_string(kind) << ": " << message;
    if (chunk_index) {
        oss << " [chunk " << *chunk_index << "]";
    }
    if (status_code && message.find("HTTP") == std::string::npos) {
        oss << " [status " << *status_code << "]";
    }
    if (attempts > 0) {
        oss << " [attempts " << attempts << "]";
    }
    if (cause) {
        oss << " <- " << cause->describe();
    }
    return oss.str();
}

} // namespace cloudup
