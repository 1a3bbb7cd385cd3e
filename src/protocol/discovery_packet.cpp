#include "protocol/discovery_packet.hpp"

#include "crypto/mac.hpp"

#include <algorithm>
#include <string>

namespace wsbeacon::protocol {

DiscoveryRequest make_request(const DeviceId& device_id, const UnixClock& clock) {
    DiscoveryRequest req;
    req.device_id = device_id;
    crypto::fill_random(req.nonce);
    req.timestamp = clock ? clock() : system_unix_seconds();
    return req;
}

Bytes encode_request(ProtocolVariant variant,
                     const DiscoveryRequest& request,
                     std::span<const uint8_t> secret) {
    Bytes out;
    out.reserve(request_size(variant));
    append(out, request.device_id.bytes());
    append(out, request.nonce);
    append_u64_be(out, request.timestamp);

    if (variant == ProtocolVariant::AuthenticatedRequest) {
        const auto mac = crypto::hmac_sha256(secret, {std::span<const uint8_t>(out)});
        append(out, mac);
    }
    return out;
}

Result<DiscoveryRequest, Error> decode_request(std::span<const uint8_t> datagram) {
    if (datagram.size() != OPEN_REQUEST_SIZE && datagram.size() != AUTH_REQUEST_SIZE) {
        return Result<DiscoveryRequest, Error>::err(Error{
            ErrorCode::WrongLength,
            "not a discovery request (" + std::to_string(datagram.size()) + " bytes)"});
    }

    DiscoveryRequest req;
    DeviceId::Bytes id{};
    std::copy_n(datagram.begin() + DEVICE_ID_OFFSET, DEVICE_ID_SIZE, id.begin());
    req.device_id = DeviceId(id);
    std::copy_n(datagram.begin() + NONCE_OFFSET, NONCE_SIZE, req.nonce.begin());
    req.timestamp = read_u64_be(datagram.subspan(TIMESTAMP_OFFSET, TIMESTAMP_SIZE));
    return Result<DiscoveryRequest, Error>::ok(req);
}

Result<DiscoveredEndpoint, Error> parse_response(ProtocolVariant variant,
                                                 std::span<const uint8_t> sent_request,
                                                 std::span<const uint8_t> response,
                                                 std::span<const uint8_t> secret) {
    using R = Result<DiscoveredEndpoint, Error>;

    const size_t want = response_size(variant);
    if (response.size() != want) {
        return R::err(Error{ErrorCode::WrongLength,
                            "expected " + std::to_string(want) + " byte response, got " +
                                std::to_string(response.size())});
    }

    const size_t echo = echo_size(variant);
    if (sent_request.size() < echo ||
        !std::equal(response.begin(), response.begin() + echo, sent_request.begin())) {
        return R::err(Error{ErrorCode::PrefixMismatch, "response does not echo our request"});
    }

    if (variant == ProtocolVariant::AuthenticatedResponse) {
        const auto expected = crypto::hmac_sha256(secret, {response.first(RESPONSE_SIGNED_SIZE)});
        if (!crypto::secure_compare(expected, response.subspan(RESPONSE_SIGNED_SIZE, MAC_SIZE))) {
            return R::err(Error{ErrorCode::BadMac, "response mac mismatch"});
        }
    }

    DiscoveredEndpoint endpoint;
    std::copy_n(response.begin() + echo, IPV4_SIZE, endpoint.ip.begin());
    endpoint.ws_port = read_u16_be(response.subspan(echo + IPV4_SIZE, PORT_SIZE));
    return R::ok(endpoint);
}

} // namespace wsbeacon::protocol
