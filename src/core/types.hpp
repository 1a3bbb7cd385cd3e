#pragma once

#include <string>
#include <string_view>
#include <chrono>
#include <array>
#include <vector>
#include <cstdint>
#include <compare>
#include <functional>
#include <optional>
#include <random>
#include <sstream>
#include <iomanip>

#include "core/result.hpp"

namespace wsbeacon {

/// Owned byte buffer used for datagrams and secrets.
using Bytes = std::vector<uint8_t>;

/// IPv4 address as four raw octets in network order.
using Ipv4Octets = std::array<uint8_t, 4>;

/**
 * DeviceId - the 16 opaque bytes a client puts at the start of a request.
 *
 * The protocol attaches no meaning to the bytes; this type only adds
 * generation, hex parsing and hex formatting for logs and tools.
 */
class DeviceId {
public:
    static constexpr size_t BYTE_SIZE = 16;
    using Bytes = std::array<uint8_t, BYTE_SIZE>;

    constexpr DeviceId() noexcept : bytes_{} {}

    explicit constexpr DeviceId(Bytes bytes) noexcept : bytes_(bytes) {}

    /**
     * Generate a random identifier.
     */
    [[nodiscard]] static DeviceId generate() {
        static thread_local std::random_device rd;
        static thread_local std::mt19937_64 gen(rd());
        static thread_local std::uniform_int_distribution<uint64_t> dist;

        Bytes bytes;
        for (size_t i = 0; i < BYTE_SIZE; i += 8) {
            const uint64_t chunk = dist(gen);
            for (size_t j = 0; j < 8; ++j) {
                bytes[i + j] = static_cast<uint8_t>(chunk >> (j * 8));
            }
        }
        return DeviceId(bytes);
    }

    /**
     * Parse exactly 32 hex digits (case-insensitive, no separators).
     */
    [[nodiscard]] static std::optional<DeviceId> parse_hex(std::string_view str) {
        if (str.size() != BYTE_SIZE * 2) return std::nullopt;

        auto nibble = [](char c) -> int {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        };

        Bytes bytes;
        for (size_t i = 0; i < BYTE_SIZE; ++i) {
            const int hi = nibble(str[i * 2]);
            const int lo = nibble(str[i * 2 + 1]);
            if (hi < 0 || lo < 0) return std::nullopt;
            bytes[i] = static_cast<uint8_t>((hi << 4) | lo);
        }
        return DeviceId(bytes);
    }

    /**
     * Lowercase hex, 32 characters.
     */
    [[nodiscard]] std::string to_hex() const {
        std::ostringstream oss;
        oss << std::hex << std::setfill('0');
        for (auto b : bytes_) {
            oss << std::setw(2) << static_cast<int>(b);
        }
        return oss.str();
    }

    [[nodiscard]] constexpr bool is_nil() const noexcept {
        for (auto b : bytes_) {
            if (b != 0) return false;
        }
        return true;
    }

    [[nodiscard]] constexpr const Bytes& bytes() const noexcept {
        return bytes_;
    }

    auto operator<=>(const DeviceId&) const = default;
    bool operator==(const DeviceId&) const = default;

private:
    Bytes bytes_;
};

/**
 * Wall-clock source in whole Unix seconds.
 *
 * The codec samples it once per validation; tests substitute a fixed value.
 */
using UnixClock = std::function<uint64_t()>;

/// Seconds since the Unix epoch from std::chrono::system_clock.
[[nodiscard]] uint64_t system_unix_seconds();

/// The clock used when a config does not supply one.
[[nodiscard]] UnixClock system_clock();

/**
 * Where the announced IPv4 address comes from when it is not fixed.
 * Called once per response so address changes are picked up.
 */
using Ipv4Source = std::function<Result<Ipv4Octets, Error>()>;

} // namespace wsbeacon
