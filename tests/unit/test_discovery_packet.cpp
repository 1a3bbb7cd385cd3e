#include <catch2/catch_test_macros.hpp>

#include "crypto/mac.hpp"
#include "protocol/discovery_codec.hpp"
#include "protocol/discovery_packet.hpp"

#include <string_view>

using namespace wsbeacon;
using namespace wsbeacon::protocol;

namespace {

constexpr uint64_t kNow = 1'700'000'000;

const Bytes kSecret{'t', 'e', 's', 't', '-', 's', 'e', 'c', 'r', 'e', 't'};

DiscoveryRequest fixed_request() {
    DiscoveryRequest req;
    req.device_id = *DeviceId::parse_hex("00112233445566778899aabbccddeeff");
    req.nonce = {0xde, 0xad, 0xbe, 0xef};
    req.timestamp = kNow;
    return req;
}

std::shared_ptr<const DiscoveryCodec> server_codec(ProtocolVariant variant) {
    CodecConfig cfg;
    cfg.secret = kSecret;
    cfg.server_ip = {10, 0, 0, 7};
    cfg.ws_port = 8080;
    cfg.clock = [] { return kNow; };
    auto codec = make_codec(variant, std::move(cfg));
    REQUIRE(codec.is_ok());
    return codec.unwrap();
}

} // namespace

TEST_CASE("Packet: make_request stamps the clock and a nonce", "[protocol][packet]") {
    REQUIRE(crypto::init().is_ok());

    const auto id = DeviceId::generate();
    const auto req = make_request(id, [] { return kNow; });

    REQUIRE_FALSE(id.is_nil());
    REQUIRE(req.device_id == id);
    REQUIRE(req.timestamp == kNow);
}

TEST_CASE("Packet: open request layout is deviceId, nonce, timestamp", "[protocol][packet]") {
    const auto bytes = encode_request(ProtocolVariant::AuthenticatedResponse, fixed_request(), {});

    REQUIRE(bytes.size() == 28);
    REQUIRE(bytes[0] == 0x00);
    REQUIRE(bytes[15] == 0xff);
    REQUIRE(Bytes(bytes.begin() + 16, bytes.begin() + 20) == Bytes{0xde, 0xad, 0xbe, 0xef});
    REQUIRE(read_u64_be(std::span<const uint8_t>(bytes).subspan(20)) == kNow);
}

TEST_CASE("Packet: signed request carries HMAC over the header", "[protocol][packet]") {
    REQUIRE(crypto::init().is_ok());

    const auto bytes = encode_request(ProtocolVariant::AuthenticatedRequest, fixed_request(), kSecret);
    REQUIRE(bytes.size() == 60);

    const auto mac = crypto::hmac_sha256(kSecret, {std::span<const uint8_t>(bytes).first(28)});
    REQUIRE(Bytes(bytes.begin() + 28, bytes.end()) == Bytes(mac.begin(), mac.end()));
}

TEST_CASE("Packet: decode_request recovers the header of either variant", "[protocol][packet]") {
    REQUIRE(crypto::init().is_ok());

    const auto req = fixed_request();
    for (auto variant : {ProtocolVariant::AuthenticatedRequest, ProtocolVariant::AuthenticatedResponse}) {
        const auto decoded = decode_request(encode_request(variant, req, kSecret));
        REQUIRE(decoded.is_ok());
        REQUIRE(decoded.unwrap() == req);
    }

    REQUIRE(decode_request(Bytes(27, 0)).unwrap_err().is(ErrorCode::WrongLength));
    REQUIRE(decode_request(Bytes(61, 0)).unwrap_err().is(ErrorCode::WrongLength));
}

TEST_CASE("Packet: request-auth exchange parses the endpoint", "[protocol][packet]") {
    auto codec = server_codec(ProtocolVariant::AuthenticatedRequest);
    const auto request = encode_request(ProtocolVariant::AuthenticatedRequest, fixed_request(), kSecret);

    const auto response = codec->respond(request).unwrap();
    const auto endpoint = parse_response(ProtocolVariant::AuthenticatedRequest, request, response, kSecret);

    REQUIRE(endpoint.is_ok());
    REQUIRE(endpoint.unwrap() == DiscoveredEndpoint{{10, 0, 0, 7}, 8080});
}

TEST_CASE("Packet: response-auth exchange parses the endpoint", "[protocol][packet]") {
    auto codec = server_codec(ProtocolVariant::AuthenticatedResponse);
    const auto request = encode_request(ProtocolVariant::AuthenticatedResponse, fixed_request(), {});

    const auto response = codec->respond(request).unwrap();
    const auto endpoint = parse_response(ProtocolVariant::AuthenticatedResponse, request, response, kSecret);

    REQUIRE(endpoint.is_ok());
    REQUIRE(endpoint.unwrap().ip == Ipv4Octets{10, 0, 0, 7});
    REQUIRE(endpoint.unwrap().ws_port == 8080);
}

TEST_CASE("Packet: response-auth rejects a reply signed with another secret", "[protocol][packet]") {
    auto codec = server_codec(ProtocolVariant::AuthenticatedResponse);
    const auto request = encode_request(ProtocolVariant::AuthenticatedResponse, fixed_request(), {});
    const auto response = codec->respond(request).unwrap();

    const Bytes wrong{'w', 'r', 'o', 'n', 'g'};
    const auto endpoint = parse_response(ProtocolVariant::AuthenticatedResponse, request, response, wrong);
    REQUIRE(endpoint.unwrap_err().is(ErrorCode::BadMac));
}

TEST_CASE("Packet: a tampered address fails verification", "[protocol][packet]") {
    auto codec = server_codec(ProtocolVariant::AuthenticatedResponse);
    const auto request = encode_request(ProtocolVariant::AuthenticatedResponse, fixed_request(), {});
    auto response = codec->respond(request).unwrap();

    response[31] = 99;
    const auto endpoint = parse_response(ProtocolVariant::AuthenticatedResponse, request, response, kSecret);
    REQUIRE(endpoint.unwrap_err().is(ErrorCode::BadMac));
}

TEST_CASE("Packet: replies to someone else's request are ignored", "[protocol][packet]") {
    auto codec = server_codec(ProtocolVariant::AuthenticatedRequest);
    const auto request = encode_request(ProtocolVariant::AuthenticatedRequest, fixed_request(), kSecret);

    auto other = fixed_request();
    other.nonce = {1, 2, 3, 4};
    const auto other_request = encode_request(ProtocolVariant::AuthenticatedRequest, other, kSecret);
    const auto response = codec->respond(other_request).unwrap();

    const auto endpoint = parse_response(ProtocolVariant::AuthenticatedRequest, request, response, kSecret);
    REQUIRE(endpoint.unwrap_err().is(ErrorCode::PrefixMismatch));
}

TEST_CASE("Packet: responses must have the exact length", "[protocol][packet]") {
    const auto request = encode_request(ProtocolVariant::AuthenticatedResponse, fixed_request(), {});

    Bytes response(65, 0);
    std::copy(request.begin(), request.end(), response.begin());
    REQUIRE(parse_response(ProtocolVariant::AuthenticatedResponse, request, response, kSecret)
                .unwrap_err()
                .is(ErrorCode::WrongLength));

    REQUIRE(parse_response(ProtocolVariant::AuthenticatedRequest, request, Bytes(39, 0), kSecret)
                .unwrap_err()
                .is(ErrorCode::WrongLength));
}
