#pragma once

#include <ctime>
#include <optional>
#include <string>
#include <string_view>

#include <boost/beast/http.hpp>

namespace sk::session {

namespace http = boost::beast::http;

using Request = http::request<http::string_body>;
using Response = http::response<http::string_body>;

inline constexpr std::string_view COOKIE_NAME = "session";

struct Cookie {
    std::string name{}, value{};
    std::optional<std::time_t> expires{std::nullopt};

    // Renders the Set-Cookie header value: "name=value[; Expires=<IMF-fixdate>]"
    [[nodiscard]] std::string toString() const;
};

// RFC 6265 cookie-octet check: non-empty, printable US-ASCII without whitespace,
// '"', ',', ';' or backslash.
[[nodiscard]] bool isValidCookieValue(std::string_view value);

// Looks through every Cookie header of the request and returns the first value whose
// name matches key. std::nullopt means no such cookie; a present but empty cookie
// yields an empty string.
[[nodiscard]] std::optional<std::string> extractCookie(const Request& req, std::string_view key);

// Appends "name=value" to the request's Cookie header, creating it if needed.
void attachCookie(Request& req, const Cookie& cookie);

// Adds a Set-Cookie header; existing Set-Cookie headers are kept.
void setCookie(Response& res, const Cookie& cookie);

}
