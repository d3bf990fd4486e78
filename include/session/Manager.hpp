#pragma once

#include "session/Cookie.hpp"
#include "session/CookieSigner.hpp"
#include "session/Session.hpp"
#include "session/Store.hpp"

#include <chrono>
#include <ctime>
#include <functional>
#include <memory>
#include <string>

namespace sk::config {
struct SessionConfig;
}

namespace sk::session {

// What newSession() hands back: the stored session and the cookie already written to
// the response. Code later in the same request should use the cookie directly
// (retrieve(cookie) or attachCookie()) instead of expecting the request to change.
struct Issued {
    Session session;
    Cookie cookie;
};

class Manager {
public:
    using IdGenerator = std::function<std::string()>;
    using Clock = std::function<std::time_t()>;

    Manager(std::shared_ptr<Store> store,
            std::string cookieSecret,
            IdGenerator generateId,
            std::chrono::seconds duration,
            Clock now = [] { return std::time(nullptr); });

    // Uses crypto::IdGenerator configured from cfg.id as the id source.
    static std::unique_ptr<Manager> fromConfig(std::shared_ptr<Store> store, const config::SessionConfig& cfg);

    // Creates a session expiring now + duration, stores its encoded record (so the
    // expiry is enforced server-side) and appends its Set-Cookie header to res.
    // Store failures propagate unchanged.
    Issued newSession(Response& res) const;

    // Throws Error{NoCookie}, Error{EmptySessionId}, Error{InvalidSignature}, then
    // whatever find() throws.
    [[nodiscard]] Session retrieve(const Request& req) const;
    [[nodiscard]] Session retrieve(const Cookie& cookie) const;

    // Overwrites an existing session. Throws Error{NotFound} without touching the store
    // when no entry exists for session.id. An unset expires_at keeps the stored one.
    void save(const Session& session) const;

    // Store-level operations, no cookie handling. create() stores an empty placeholder
    // and throws Error{EmptySessionId} or Error{InvalidSessionId} for unusable ids.
    [[nodiscard]] Session create(std::time_t expiresAt) const;
    [[nodiscard]] Session find(const std::string& id) const;

    [[nodiscard]] std::chrono::seconds duration() const { return duration_; }
    [[nodiscard]] bool signsCookies() const { return signer_.enabled(); }

private:
    [[nodiscard]] Session retrieveValue(const std::string& value) const;

    std::shared_ptr<Store> store_;
    CookieSigner signer_;
    IdGenerator generateId_;
    std::chrono::seconds duration_;
    Clock now_;
};

}
