#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include <array>
#include <initializer_list>
#include <span>
#include <vector>

#include <sodium.h>

namespace wsbeacon::crypto {

constexpr size_t MAC_SIZE = crypto_auth_hmacsha256_BYTES;

using Mac = std::array<uint8_t, MAC_SIZE>;

/**
 * Initialize libsodium. Safe to call more than once.
 */
[[nodiscard]] inline Result<void, Error> init() {
    if (sodium_init() < 0) {
        return Result<void, Error>::err(Error{ErrorCode::Crypto, "Failed to initialize libsodium"});
    }
    return Result<void, Error>::ok();
}

/**
 * HMAC-SHA256 over the concatenation of `parts`, keyed by `key`.
 *
 * The key may be any length; libsodium hashes keys longer than the block
 * size exactly as RFC 2104 requires.
 */
[[nodiscard]] inline Mac hmac_sha256(std::span<const uint8_t> key,
                                     std::initializer_list<std::span<const uint8_t>> parts) {
    crypto_auth_hmacsha256_state state;
    crypto_auth_hmacsha256_init(&state, key.data(), key.size());
    for (const auto& part : parts) {
        crypto_auth_hmacsha256_update(&state, part.data(), part.size());
    }

    Mac out;
    crypto_auth_hmacsha256_final(&state, out.data());
    sodium_memzero(&state, sizeof(state));
    return out;
}

/**
 * Constant-time comparison (sodium_memcmp). Lengths are not secret.
 */
[[nodiscard]] inline bool secure_compare(std::span<const uint8_t> a,
                                         std::span<const uint8_t> b) {
    if (a.size() != b.size()) return false;
    if (a.empty()) return true;
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

/**
 * Fill a buffer from the OS CSPRNG.
 */
inline void fill_random(std::span<uint8_t> out) {
    randombytes_buf(out.data(), out.size());
}

/**
 * Securely zero memory.
 */
inline void secure_zero(void* ptr, size_t len) {
    sodium_memzero(ptr, len);
}

inline void secure_zero(Bytes& bytes) {
    if (!bytes.empty()) {
        secure_zero(bytes.data(), bytes.size());
    }
}

} // namespace wsbeacon::crypto
