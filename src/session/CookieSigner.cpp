#include "session/CookieSigner.hpp"
#include "session/Error.hpp"
#include "crypto/util/hash.hpp"

#include <string_view>
#include <utility>

namespace sk::session {

CookieSigner::CookieSigner(std::string secret) : secret_(std::move(secret)) {}

std::string CookieSigner::sign(const std::string& id) const {
    if (!enabled()) return id;
    return id + SEPARATOR + crypto::hash::hmacSha256Hex(secret_, id);
}

std::string CookieSigner::verify(const std::string& value) const {
    if (!enabled()) return value;

    const auto pos = value.rfind(SEPARATOR);
    if (pos == std::string::npos || pos == 0)
        throw Error(ErrorCode::InvalidSignature, "Session cookie is not signed");

    const std::string id = value.substr(0, pos);
    const std::string_view signature(value.data() + pos + 1, value.size() - pos - 1);
    if (!crypto::hash::constantTimeEquals(signature, crypto::hash::hmacSha256Hex(secret_, id)))
        throw Error(ErrorCode::InvalidSignature, "Session cookie signature mismatch");

    return id;
}

}
