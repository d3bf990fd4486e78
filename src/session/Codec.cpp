#include "session/Codec.hpp"
#include "session/Error.hpp"

#include <stdexcept>

namespace sk::session {

Bytes encode(const Session& session) {
    try {
        const auto dumped = nlohmann::json(session).dump();
        return {dumped.begin(), dumped.end()};
    } catch (const nlohmann::json::exception& e) {
        throw Error(ErrorCode::EncodeFailed, "Failed to encode session: " + std::string(e.what()));
    }
}

Session decode(const std::string& id, const Bytes& data) {
    Session session(id);
    if (data.empty()) return session;

    try {
        const auto j = nlohmann::json::parse(data.begin(), data.end());
        j.get_to(session);
    } catch (const nlohmann::json::exception& e) {
        throw Error(ErrorCode::MalformedPayload, "Malformed session payload: " + std::string(e.what()));
    } catch (const std::invalid_argument& e) {
        throw Error(ErrorCode::MalformedPayload, "Malformed session payload: " + std::string(e.what()));
    }

    session.id = id;
    return session;
}

}
