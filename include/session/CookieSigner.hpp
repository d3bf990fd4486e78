#pragma once

#include <string>

namespace sk::session {

// Binds a session id to the server secret so a client cannot forge or guess a cookie
// value for an id it was never issued. With an empty secret signing is disabled and the
// cookie value is the bare id.
class CookieSigner {
public:
    static constexpr char SEPARATOR = '.';

    explicit CookieSigner(std::string secret);

    [[nodiscard]] bool enabled() const { return !secret_.empty(); }

    // "<id>.<hex hmac-sha256(secret, id)>", or id when disabled
    [[nodiscard]] std::string sign(const std::string& id) const;

    // Returns the id carried by a signed value. Throws Error{InvalidSignature} when the
    // value is unsigned or the signature does not match.
    [[nodiscard]] std::string verify(const std::string& value) const;

private:
    std::string secret_;
};

}
