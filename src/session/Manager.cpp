#include "session/Manager.hpp"
#include "session/Codec.hpp"
#include "session/Error.hpp"
#include "config/Config.hpp"
#include "crypto/IdGenerator.hpp"
#include "log/Registry.hpp"

#include <stdexcept>
#include <utility>

using namespace sk::log;

namespace sk::session {

namespace {

// Session ids are bearer credentials; logs only ever get a prefix.
std::string redact(const std::string& id) {
    return id.size() <= 6 ? std::string("***") : id.substr(0, 6) + "...";
}

}

Manager::Manager(std::shared_ptr<Store> store,
                 std::string cookieSecret,
                 IdGenerator generateId,
                 const std::chrono::seconds duration,
                 Clock now)
    : store_(std::move(store)),
      signer_(std::move(cookieSecret)),
      generateId_(std::move(generateId)),
      duration_(duration),
      now_(std::move(now)) {
    if (!store_) throw std::invalid_argument("Session store must not be null");
    if (!generateId_) throw std::invalid_argument("Session id generator must not be empty");
    if (!now_) throw std::invalid_argument("Clock must not be empty");
    if (duration_.count() <= 0) throw std::invalid_argument("Session duration must be positive");
}

std::unique_ptr<Manager> Manager::fromConfig(std::shared_ptr<Store> store, const config::SessionConfig& cfg) {
    crypto::IdOptions opts;
    opts.namespace_token = cfg.id.namespace_token;
    opts.random_bytes = cfg.id.random_bytes;
    auto ids = std::make_shared<crypto::IdGenerator>(opts);

    if (cfg.cookie_secret.empty())
        Registry::crypto()->warn("[Manager] No cookie_secret configured, session cookies will not be signed");

    return std::make_unique<Manager>(std::move(store), cfg.cookie_secret,
                                     [ids] { return ids->generate(); },
                                     std::chrono::duration_cast<std::chrono::seconds>(cfg.duration));
}

Issued Manager::newSession(Response& res) const {
    const std::time_t expiresAt = now_() + static_cast<std::time_t>(duration_.count());
    auto session = create(expiresAt);
    store_->put(session.id, encode(session));

    Cookie cookie{std::string(COOKIE_NAME), signer_.sign(session.id), expiresAt};
    setCookie(res, cookie);

    return {std::move(session), std::move(cookie)};
}

Session Manager::retrieve(const Request& req) const {
    const auto value = extractCookie(req, COOKIE_NAME);
    if (!value) throw Error(ErrorCode::NoCookie, "Request carries no '" + std::string(COOKIE_NAME) + "' cookie");
    return retrieveValue(*value);
}

Session Manager::retrieve(const Cookie& cookie) const {
    if (cookie.name != COOKIE_NAME)
        throw Error(ErrorCode::NoCookie, "Cookie '" + cookie.name + "' is not a session cookie");
    return retrieveValue(cookie.value);
}

Session Manager::retrieveValue(const std::string& value) const {
    if (value.empty()) throw Error(ErrorCode::EmptySessionId, "Session cookie value is empty");
    return find(signer_.verify(value));
}

void Manager::save(const Session& session) const {
    const auto existing = find(session.id);

    if (session.expires_at || !existing.expires_at) store_->put(session.id, encode(session));
    else {
        auto merged = session;
        merged.expires_at = existing.expires_at;
        store_->put(session.id, encode(merged));
    }

    Registry::session()->debug("[Manager] Saved session {}", redact(session.id));
}

Session Manager::create(const std::time_t expiresAt) const {
    auto id = generateId_();
    if (id.empty()) throw Error(ErrorCode::EmptySessionId, "Session id generator returned an empty id");
    if (!isValidCookieValue(id))
        throw Error(ErrorCode::InvalidSessionId, "Session id generator returned an id that is not a valid cookie value");

    store_->put(id, {});

    Registry::session()->debug("[Manager] Created session {}", redact(id));
    return Session(std::move(id), expiresAt);
}

Session Manager::find(const std::string& id) const {
    const auto data = store_->get(id);
    if (!data) throw Error(ErrorCode::NotFound, "Session not found");

    auto session = decode(id, *data);
    if (session.isExpired(now_())) throw Error(ErrorCode::Expired, "Session has expired");

    return session;
}

}
