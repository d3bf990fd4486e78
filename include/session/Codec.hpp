#pragma once

#include "session/Session.hpp"
#include "session/Store.hpp"

#include <string>

namespace sk::session {

// Serializes the session as a JSON object with sorted keys, so equal sessions always
// produce identical bytes. Throws Error{EncodeFailed} for unserializable strings.
[[nodiscard]] Bytes encode(const Session& session);

// Inverse of encode(). An empty buffer is a placeholder written at creation and decodes
// to Session{id} without error. Anything else that is not a valid record throws
// Error{MalformedPayload}.
[[nodiscard]] Session decode(const std::string& id, const Bytes& data);

}
