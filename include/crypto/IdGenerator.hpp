#pragma once

#include <sodium.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace sk::crypto {

// Crockford Base32 (no I, L, O, U): cookie, URL and filesystem safe.
// 32 symbols => each char encodes 5 bits; 128-bit payload => 26 chars
static inline constexpr char kBase32Crockford[] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

enum class Case { Upper, Lower };

// Thread-safe, idempotent
inline void ensure_sodium_init() {
    static const int init = []{
        if (sodium_init() < 0) throw std::runtime_error("libsodium init failed");
        return 1;
    }();
    (void)init;
}

inline std::string b32_crockford_encode(const uint8_t* data, const size_t len, const Case out_case = Case::Upper) {
    if (len == 0) return {};
    std::string out;
    out.reserve((len * 8 + 4) / 5);

    uint32_t buffer = 0;
    int bits = 0;

    for (size_t i = 0; i < len; ++i) {
        buffer = (buffer << 8) | data[i];
        bits += 8;
        while (bits >= 5) {
            bits -= 5;
            out.push_back(kBase32Crockford[(buffer >> bits) & 0x1F]);
        }
    }
    if (bits > 0) out.push_back(kBase32Crockford[(buffer << (5 - bits)) & 0x1F]);

    if (out_case == Case::Lower)
        std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return out;
}

struct IdOptions {
    // Anything stable (deployment name, service name). Empty disables the prefix.
    std::string namespace_token;

    // Characters taken from the derived namespace prefix
    size_t prefix_chars = 6;

    // Random bytes per id, not counting the prefix. 16 bytes => 128-bit => 26 chars.
    size_t random_bytes = 16;

    // Must be a valid cookie-value character
    char separator = '_';

    Case out_case = Case::Upper;
};

// Deterministic BLAKE2b-derived prefix for a namespace token
inline std::string derive_namespace_prefix(const std::string_view namespace_token,
                                           const size_t prefix_chars,
                                           const Case out_case) {
    if (namespace_token.empty() || prefix_chars == 0) return {};
    ensure_sodium_init();
    std::array<uint8_t, 16> digest{};
    if (crypto_generichash(digest.data(), digest.size(),
                           reinterpret_cast<const unsigned char*>(namespace_token.data()),
                           namespace_token.size(),
                           /*key=*/nullptr, 0) != 0)
        throw std::runtime_error("blake2 hash failed");

    std::string enc = b32_crockford_encode(digest.data(), digest.size(), out_case);
    if (enc.size() < prefix_chars) enc.append(prefix_chars - enc.size(), '0');
    enc.resize(prefix_chars);
    return enc;
}

// Session id source: "<ns_prefix><sep><body>" where body is Crockford Base32 of
// `random_bytes` of secure randomness.
class IdGenerator {
public:
    explicit IdGenerator(const IdOptions& opt)
        : options_(opt),
          ns_prefix_(derive_namespace_prefix(opt.namespace_token, opt.prefix_chars, opt.out_case)) {
        ensure_sodium_init();
        if (options_.random_bytes == 0) throw std::invalid_argument("random_bytes must be > 0");
        if (options_.separator == ' ' || options_.separator == ';' || options_.separator == ',' ||
            options_.separator == '"' || options_.separator == '\\' || options_.separator == '\0')
            throw std::invalid_argument("bad separator");
    }

    [[nodiscard]] std::string generate() const {
        const auto body = random_body_();
        if (ns_prefix_.empty()) return body;

        std::string id;
        id.reserve(ns_prefix_.size() + 1 + body.size());
        id.append(ns_prefix_);
        id.push_back(options_.separator);
        id.append(body);
        return id;
    }

    [[nodiscard]] std::string_view namespace_prefix() const { return ns_prefix_; }
    [[nodiscard]] const IdOptions& options() const { return options_; }

private:
    [[nodiscard]] std::string random_body_() const {
        std::vector<uint8_t> buf(options_.random_bytes);
        randombytes_buf(buf.data(), buf.size());
        return b32_crockford_encode(buf.data(), buf.size(), options_.out_case);
    }

    IdOptions options_;
    std::string ns_prefix_;
};

}
