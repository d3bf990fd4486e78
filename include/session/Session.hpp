#pragma once

#include <ctime>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace sk::session {

// OAuth2 bearer credentials for the FHIR endpoint a session was launched against.
struct OAuthToken {
    std::string access_token{}, token_type{}, refresh_token{};
    std::optional<std::time_t> expiry{std::nullopt};

    bool operator==(const OAuthToken& other) const;
    bool operator!=(const OAuthToken& other) const;
};

struct Session {
    std::string id{};
    std::optional<std::time_t> expires_at{std::nullopt};

    // Protocol-level data set during the SMART launch
    std::string fhir_url{}, launch_id{};
    std::optional<OAuthToken> fhir_token{std::nullopt};

    // Application data; always a JSON object
    nlohmann::json values = nlohmann::json::object();

    Session() = default;
    explicit Session(std::string id, std::optional<std::time_t> expiresAt = std::nullopt);

    bool operator==(const Session& other) const;
    bool operator!=(const Session& other) const;

    [[nodiscard]] bool isExpired(std::time_t now) const { return expires_at && now >= *expires_at; }
};

void to_json(nlohmann::json& j, const OAuthToken& t);
void from_json(const nlohmann::json& j, OAuthToken& t);
void to_json(nlohmann::json& j, const Session& s);
void from_json(const nlohmann::json& j, Session& s);

}
