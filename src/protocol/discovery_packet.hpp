#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "protocol/wire.hpp"

#include <array>
#include <span>

namespace wsbeacon::protocol {

/**
 * DiscoveryRequest - the 28 signed header bytes of a request, parsed.
 */
struct DiscoveryRequest {
    DeviceId device_id;
    std::array<uint8_t, NONCE_SIZE> nonce{};
    uint64_t timestamp = 0;

    bool operator==(const DiscoveryRequest&) const = default;
};

/**
 * DiscoveredEndpoint - what a verified response announces.
 */
struct DiscoveredEndpoint {
    Ipv4Octets ip{};
    uint16_t ws_port = 0;

    bool operator==(const DiscoveredEndpoint&) const = default;
};

/**
 * A request for `device_id` stamped with the current time and a random nonce.
 */
[[nodiscard]] DiscoveryRequest make_request(const DeviceId& device_id,
                                            const UnixClock& clock = system_clock());

/**
 * Serialize a request for `variant`. The secret is only used for
 * AuthenticatedRequest, where the MAC over the first 28 bytes is appended.
 */
[[nodiscard]] Bytes encode_request(ProtocolVariant variant,
                                   const DiscoveryRequest& request,
                                   std::span<const uint8_t> secret);

/**
 * Parse the signed header of a request of either variant. Does not check
 * freshness or authenticity.
 */
[[nodiscard]] Result<DiscoveryRequest, Error> decode_request(std::span<const uint8_t> datagram);

/**
 * Requester-side check of a response to `sent_request`.
 *
 * AuthenticatedRequest: exactly 38 bytes, starting with sent_request[0:32].
 * AuthenticatedResponse: exactly 66 bytes, starting with sent_request[0:28],
 * and a trailing HMAC over the first 34 bytes that matches in constant time.
 */
[[nodiscard]] Result<DiscoveredEndpoint, Error> parse_response(ProtocolVariant variant,
                                                               std::span<const uint8_t> sent_request,
                                                               std::span<const uint8_t> response,
                                                               std::span<const uint8_t> secret);

} // namespace wsbeacon::protocol
