#include "session/Cookie.hpp"
#include "util/timestamp.hpp"

namespace sk::session {

namespace {

void trim(std::string_view& s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
}

std::optional<std::string> findInHeader(std::string_view cookies, const std::string_view key) {
    while (!cookies.empty()) {
        // Split next "name=value" chunk by ';'
        const auto semi = cookies.find(';');
        std::string_view part = cookies.substr(0, semi);
        if (semi == std::string_view::npos) cookies = {};
        else cookies.remove_prefix(semi + 1);

        trim(part);
        if (part.empty()) continue;

        const auto eq = part.find('=');
        if (eq == std::string_view::npos) continue;

        std::string_view name = part.substr(0, eq);
        std::string_view value = part.substr(eq + 1);
        trim(name);
        trim(value);

        if (name == key) {
            // Strip optional quotes
            if (value.size() >= 2 && value.front() == '"' && value.back() == '"')
                value = value.substr(1, value.size() - 2);
            return std::string(value);
        }
    }
    return std::nullopt;
}

}

bool isValidCookieValue(const std::string_view value) {
    if (value.empty()) return false;
    for (const char ch : value) {
        const auto c = static_cast<unsigned char>(ch);
        if (c < 0x21 || c > 0x7e) return false;
        if (c == '"' || c == ',' || c == ';' || c == '\\') return false;
    }
    return true;
}

std::string Cookie::toString() const {
    std::string out = name + "=" + value;
    if (expires) out += "; Expires=" + util::toHttpDate(*expires);
    return out;
}

std::optional<std::string> extractCookie(const Request& req, const std::string_view key) {
    const auto [begin, end] = req.equal_range(http::field::cookie);
    for (auto it = begin; it != end; ++it) {
        const std::string_view header(it->value().data(), it->value().size());
        if (auto value = findInHeader(header, key)) return value;
    }
    return std::nullopt;
}

void attachCookie(Request& req, const Cookie& cookie) {
    const std::string pair = cookie.name + "=" + cookie.value;
    const auto it = req.find(http::field::cookie);
    if (it == req.end() || it->value().empty()) {
        req.set(http::field::cookie, pair);
        return;
    }
    std::string existing(it->value().data(), it->value().size());
    req.set(http::field::cookie, existing + "; " + pair);
}

void setCookie(Response& res, const Cookie& cookie) {
    res.insert(http::field::set_cookie, cookie.toString());
}

}
