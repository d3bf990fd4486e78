#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sk::session {

using Bytes = std::vector<uint8_t>;

// Keyed binary storage the session manager persists into. Implementations own their
// durability, locking and error reporting; anything they throw is passed to the caller
// untouched.
class Store {
public:
    virtual ~Store() = default;

    // Stores or overwrites the value for key. An empty value must be accepted.
    virtual void put(const std::string& key, const Bytes& value) = 0;

    // Returns std::nullopt when the key does not exist. A key stored with an empty
    // value yields an empty vector, not std::nullopt.
    [[nodiscard]] virtual std::optional<Bytes> get(const std::string& key) = 0;
};

}
