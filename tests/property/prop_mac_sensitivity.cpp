#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "crypto/mac.hpp"
#include "protocol/discovery_codec.hpp"
#include "protocol/discovery_packet.hpp"

using namespace wsbeacon;
using namespace wsbeacon::protocol;

namespace {

constexpr uint64_t kNow = 1'700'000'000;

std::shared_ptr<const DiscoveryCodec> make_test_codec(ProtocolVariant variant, const Bytes& secret) {
    CodecConfig cfg;
    cfg.secret = secret;
    cfg.server_ip = {192, 168, 1, 10};
    cfg.ws_port = 4399;
    cfg.clock = [] { return kNow; };
    return make_codec(variant, std::move(cfg)).unwrap();
}

// 20 random header bytes (deviceId | nonce) and a fresh timestamp.
rc::Gen<Bytes> gen_open_request() {
    return rc::gen::map(
        rc::gen::pair(rc::gen::container<Bytes>(DEVICE_ID_SIZE + NONCE_SIZE, rc::gen::arbitrary<uint8_t>()),
                      rc::gen::inRange<int>(-30, 31)),
        [](std::pair<Bytes, int> p) {
            Bytes out = std::move(p.first);
            append_u64_be(out, static_cast<uint64_t>(static_cast<int64_t>(kNow) + p.second));
            return out;
        });
}

rc::Gen<Bytes> gen_secret() {
    return rc::gen::nonEmpty(rc::gen::container<Bytes>(rc::gen::arbitrary<uint8_t>()));
}

} // namespace

TEST_CASE("Property: request-auth accepts its own fresh requests", "[property][codec]") {
    rc::check("encode_request under the shared secret validates",
        []() {
            const auto secret = *gen_secret();
            const auto header = *gen_open_request();
            auto codec = make_test_codec(ProtocolVariant::AuthenticatedRequest, secret);

            Bytes request = header;
            append(request, crypto::hmac_sha256(secret, {std::span<const uint8_t>(header)}));
            RC_ASSERT(codec->validate(request));
        }
    );
}

TEST_CASE("Property: request-auth rejects any single-bit flip", "[property][codec]") {
    rc::check("flipping one bit of a valid 60-byte request makes it invalid",
        []() {
            const auto secret = *gen_secret();
            const auto header = *gen_open_request();
            const auto bit = *rc::gen::inRange<size_t>(0, AUTH_REQUEST_SIZE * 8);
            auto codec = make_test_codec(ProtocolVariant::AuthenticatedRequest, secret);

            Bytes request = header;
            append(request, crypto::hmac_sha256(secret, {std::span<const uint8_t>(header)}));
            request[bit / 8] ^= static_cast<uint8_t>(1u << (bit % 8));
            RC_ASSERT_FALSE(codec->validate(request));
        }
    );
}

TEST_CASE("Property: response-auth MAC covers every signed byte", "[property][codec]") {
    rc::check("receiver-side HMAC matches, and breaks after any change to bytes[0:34]",
        []() {
            const auto secret = *gen_secret();
            const auto request = *gen_open_request();
            const auto index = *rc::gen::inRange<size_t>(0, RESPONSE_SIGNED_SIZE);
            const auto mask = *rc::gen::inRange<int>(1, 256);
            auto codec = make_test_codec(ProtocolVariant::AuthenticatedResponse, secret);

            const auto response = codec->respond(request).unwrap();
            RC_ASSERT(response.size() == SIGNED_RESPONSE_SIZE);

            const std::span<const uint8_t> view(response);
            const auto mac = crypto::hmac_sha256(secret, {view.first(RESPONSE_SIGNED_SIZE)});
            RC_ASSERT(crypto::secure_compare(mac, view.subspan(RESPONSE_SIGNED_SIZE)));

            Bytes tampered = response;
            tampered[index] ^= static_cast<uint8_t>(mask);
            RC_ASSERT(parse_response(ProtocolVariant::AuthenticatedResponse, request, tampered, secret).is_err());
        }
    );
}
