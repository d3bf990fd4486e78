#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace sk::session {

enum class ErrorCode {
    NotFound,           // no store entry for the id
    Expired,            // entry exists but its persisted expiry has passed
    MalformedPayload,   // stored bytes are not a valid session record
    EncodeFailed,       // session could not be serialized
    NoCookie,           // request carries no session cookie
    EmptySessionId,     // session cookie (or generated id) is empty
    InvalidSessionId,   // generated id contains characters not allowed in a cookie value
    InvalidSignature    // cookie value failed HMAC verification
};

[[nodiscard]] std::string_view to_string(ErrorCode code);

// Thrown for every failure the session layer itself detects. Store failures are never
// wrapped in this type; they reach the caller exactly as the store raised them.
class Error : public std::runtime_error {
public:
    Error(const ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

}
