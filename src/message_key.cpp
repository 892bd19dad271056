// -----------------------------------------------------------------------------
// @file message_key.cpp
// @brief Implementation of message key derivation (see message_key.hpp).
//
// Hashing goes through Mbed TLS. The one-shot SHA-256 entry point was renamed
// between the 2.x and 3.x lines; both return 0 on success.
// -----------------------------------------------------------------------------
#include "meshgate/message_key.hpp"

#include <mbedtls/sha256.h>
#include <mbedtls/version.h>

#include <vector>

namespace meshgate {

static const char* HEX_DIGITS = "0123456789abcdef";

// Feed the three inputs into one contiguous buffer, hash, keep 5 bytes.
bool make_message_key(uint64_t nonce, NodeNum node, const std::string& text, MessageKey& out) {
    out.clear();

    std::vector<unsigned char> input;
    const std::string node_str = std::to_string(node);
    input.reserve(sizeof(nonce) + node_str.size() + text.size());

    for (size_t i = 0; i < sizeof(nonce); ++i) {
        input.push_back(static_cast<unsigned char>((nonce >> (8 * i)) & 0xFF));
    }
    input.insert(input.end(), node_str.begin(), node_str.end());
    input.insert(input.end(), text.begin(), text.end());

    unsigned char digest[32];
#if MBEDTLS_VERSION_MAJOR >= 3
    int rc = mbedtls_sha256(input.data(), input.size(), digest, /*is224*/0);
#else
    int rc = mbedtls_sha256_ret(input.data(), input.size(), digest, /*is224*/0);
#endif
    if (rc != 0) return false;

    // Two hex digits per byte; MESSAGE_KEY_LEN/2 bytes of the digest.
    for (size_t i = 0; i < MESSAGE_KEY_LEN / 2; ++i) {
        out.push_back(HEX_DIGITS[digest[i] >> 4]);
        out.push_back(HEX_DIGITS[digest[i] & 0x0F]);
    }
    return true;
}

bool is_message_key(const std::string& s) {
    if (s.size() != MESSAGE_KEY_LEN) return false;
    for (char c : s) {
        const bool digit = ('0' <= c && c <= '9');
        const bool lower = ('a' <= c && c <= 'f');
        if (!digit && !lower) return false;   // uppercase is not something we ever hand out
    }
    return true;
}

} // namespace meshgate
