#pragma once

#include "core/types.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <optional>

namespace wsbeacon::protocol {

/**
 * The two discovery wire protocols.
 *
 * They serve the same purpose but sign opposite sides of the exchange and
 * are not interoperable:
 *
 *   AuthenticatedRequest   request 60 bytes (MAC'd), response 38 bytes (unsigned)
 *   AuthenticatedResponse  request 28 bytes (open),  response 66 bytes (MAC'd)
 */
enum class ProtocolVariant {
    AuthenticatedRequest,
    AuthenticatedResponse,
};

[[nodiscard]] inline std::string_view variant_name(ProtocolVariant v) noexcept {
    switch (v) {
        case ProtocolVariant::AuthenticatedRequest: return "request-auth";
        case ProtocolVariant::AuthenticatedResponse: return "response-auth";
    }
    return "unknown";
}

[[nodiscard]] inline std::optional<ProtocolVariant> parse_variant(std::string_view name) noexcept {
    if (name == "request-auth") return ProtocolVariant::AuthenticatedRequest;
    if (name == "response-auth") return ProtocolVariant::AuthenticatedResponse;
    return std::nullopt;
}

// Request layout (offsets in bytes). Shared by both variants.
constexpr size_t DEVICE_ID_OFFSET = 0;
constexpr size_t DEVICE_ID_SIZE = 16;
constexpr size_t NONCE_OFFSET = 16;
constexpr size_t NONCE_SIZE = 4;
constexpr size_t TIMESTAMP_OFFSET = 20;
constexpr size_t TIMESTAMP_SIZE = 8;
constexpr size_t SIGNED_HEADER_SIZE = 28;  // deviceId | nonce | timestamp

constexpr size_t IPV4_SIZE = 4;
constexpr size_t PORT_SIZE = 2;
constexpr size_t MAC_SIZE = 32;

// AuthenticatedRequest
constexpr size_t REQUEST_MAC_OFFSET = SIGNED_HEADER_SIZE;
constexpr size_t AUTH_REQUEST_SIZE = SIGNED_HEADER_SIZE + MAC_SIZE;                  // 60
constexpr size_t AUTH_REQUEST_ECHO_SIZE = 32;
constexpr size_t UNSIGNED_RESPONSE_SIZE = AUTH_REQUEST_ECHO_SIZE + IPV4_SIZE + PORT_SIZE;  // 38

// AuthenticatedResponse
constexpr size_t OPEN_REQUEST_SIZE = SIGNED_HEADER_SIZE;                             // 28
constexpr size_t OPEN_REQUEST_ECHO_SIZE = OPEN_REQUEST_SIZE;
constexpr size_t RESPONSE_SIGNED_SIZE = OPEN_REQUEST_ECHO_SIZE + IPV4_SIZE + PORT_SIZE;   // 34
constexpr size_t SIGNED_RESPONSE_SIZE = RESPONSE_SIGNED_SIZE + MAC_SIZE;              // 66

/// Maximum accepted distance between a packet timestamp and the local clock.
constexpr uint64_t FRESHNESS_WINDOW_SECONDS = 30;

/// Well-known ports from the deployed servers.
constexpr uint16_t DEFAULT_DISCOVERY_PORT = 5354;
constexpr uint16_t DEFAULT_WS_PORT = 8080;

/// Receive buffer size used by the listener and the prober.
constexpr size_t MAX_DATAGRAM_SIZE = 1024;

[[nodiscard]] constexpr size_t request_size(ProtocolVariant v) noexcept {
    return v == ProtocolVariant::AuthenticatedRequest ? AUTH_REQUEST_SIZE : OPEN_REQUEST_SIZE;
}

[[nodiscard]] constexpr size_t response_size(ProtocolVariant v) noexcept {
    return v == ProtocolVariant::AuthenticatedRequest ? UNSIGNED_RESPONSE_SIZE : SIGNED_RESPONSE_SIZE;
}

[[nodiscard]] constexpr size_t echo_size(ProtocolVariant v) noexcept {
    return v == ProtocolVariant::AuthenticatedRequest ? AUTH_REQUEST_ECHO_SIZE : OPEN_REQUEST_ECHO_SIZE;
}

// Big-endian helpers. Callers guarantee the span is long enough.

[[nodiscard]] inline uint64_t read_u64_be(std::span<const uint8_t> data) {
    uint64_t value = 0;
    for (size_t i = 0; i < 8; ++i) {
        value = (value << 8) | static_cast<uint64_t>(data[i]);
    }
    return value;
}

[[nodiscard]] inline uint16_t read_u16_be(std::span<const uint8_t> data) {
    return static_cast<uint16_t>((static_cast<uint16_t>(data[0]) << 8) | data[1]);
}

inline void append_u64_be(Bytes& out, uint64_t value) {
    for (int shift = 56; shift >= 0; shift -= 8) {
        out.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
    }
}

inline void append_u16_be(Bytes& out, uint16_t value) {
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(value & 0xFF));
}

inline void append(Bytes& out, std::span<const uint8_t> data) {
    out.insert(out.end(), data.begin(), data.end());
}

/**
 * True when |now - timestamp| <= FRESHNESS_WINDOW_SECONDS.
 * Computed without signed overflow for any pair of u64 values.
 */
[[nodiscard]] constexpr bool is_fresh(uint64_t timestamp, uint64_t now) noexcept {
    const uint64_t skew = now >= timestamp ? now - timestamp : timestamp - now;
    return skew <= FRESHNESS_WINDOW_SECONDS;
}

} // namespace wsbeacon::protocol
