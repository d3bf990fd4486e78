#include "session/Error.hpp"

namespace sk::session {

std::string_view to_string(const ErrorCode code) {
    switch (code) {
        case ErrorCode::NotFound:         return "not found";
        case ErrorCode::Expired:          return "expired";
        case ErrorCode::MalformedPayload: return "malformed payload";
        case ErrorCode::EncodeFailed:     return "encode failed";
        case ErrorCode::NoCookie:         return "no session cookie";
        case ErrorCode::EmptySessionId:   return "empty session id";
        case ErrorCode::InvalidSessionId: return "invalid session id";
        case ErrorCode::InvalidSignature: return "invalid signature";
    }
    return "unknown";
}

}
