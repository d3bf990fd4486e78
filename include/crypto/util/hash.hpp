#pragma once

#include <string>
#include <string_view>

namespace sk::crypto::hash {

// Lowercase hex HMAC-SHA256 of data under key
std::string hmacSha256Hex(std::string_view key, std::string_view data);

// Constant-time comparison; false when lengths differ
bool constantTimeEquals(std::string_view a, std::string_view b);

}
