#pragma once

#include <cstdint>
#include <string>

namespace cloudup {

/// Human-readable byte count with two decimals, e.g. "2.00 MB"
std::string format_size(std::uint64_t bytes);

/// Standard (RFC 4648) base64 with padding
std::string base64_encode(const std::string& input);

} // namespace cloudup
