#include "session/Session.hpp"
#include "util/timestamp.hpp"

#include <stdexcept>
#include <utility>

using namespace sk::util;

namespace sk::session {

namespace {

std::optional<std::time_t> optionalTimestamp(const nlohmann::json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    return parseTimestampFromString(j.at(key).get<std::string>());
}

}

bool OAuthToken::operator==(const OAuthToken& other) const {
    return access_token == other.access_token &&
           token_type == other.token_type &&
           refresh_token == other.refresh_token &&
           expiry == other.expiry;
}

bool OAuthToken::operator!=(const OAuthToken& other) const {
    return !(*this == other);
}

Session::Session(std::string id, const std::optional<std::time_t> expiresAt)
    : id(std::move(id)), expires_at(expiresAt) {}

bool Session::operator==(const Session& other) const {
    return id == other.id &&
           expires_at == other.expires_at &&
           fhir_url == other.fhir_url &&
           launch_id == other.launch_id &&
           fhir_token == other.fhir_token &&
           values == other.values;
}

bool Session::operator!=(const Session& other) const {
    return !(*this == other);
}

void to_json(nlohmann::json& j, const OAuthToken& t) {
    j = {
        {"access_token", t.access_token},
        {"token_type", t.token_type},
        {"refresh_token", t.refresh_token}
    };
    if (t.expiry) j["expiry"] = timestampToString(*t.expiry);
}

void from_json(const nlohmann::json& j, OAuthToken& t) {
    if (!j.is_object()) throw std::invalid_argument("fhir_token must be an object");
    t.access_token = j.value("access_token", std::string{});
    t.token_type = j.value("token_type", std::string{});
    t.refresh_token = j.value("refresh_token", std::string{});
    t.expiry = optionalTimestamp(j, "expiry");
}

void to_json(nlohmann::json& j, const Session& s) {
    j = {
        {"id", s.id},
        {"fhir_url", s.fhir_url},
        {"launch_id", s.launch_id},
        {"fhir_token", s.fhir_token ? nlohmann::json(*s.fhir_token) : nlohmann::json(nullptr)},
        {"values", s.values}
    };
    if (s.expires_at) j["expires_at"] = timestampToString(*s.expires_at);
}

// The id is not read back; decode() sets it from the store key.
void from_json(const nlohmann::json& j, Session& s) {
    if (!j.is_object()) throw std::invalid_argument("session record must be a JSON object");

    s.fhir_url = j.value("fhir_url", std::string{});
    s.launch_id = j.value("launch_id", std::string{});
    s.expires_at = optionalTimestamp(j, "expires_at");

    if (j.contains("fhir_token") && !j.at("fhir_token").is_null())
        s.fhir_token = j.at("fhir_token").get<OAuthToken>();
    else s.fhir_token = std::nullopt;

    if (j.contains("values") && !j.at("values").is_null()) {
        const auto& values = j.at("values");
        if (!values.is_object()) throw std::invalid_argument("values must be an object");
        s.values = values;
    } else s.values = nlohmann::json::object();
}

}
