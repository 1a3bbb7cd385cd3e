#include "protocol/discovery_codec.hpp"

#include "crypto/mac.hpp"

#include <string>

namespace wsbeacon::protocol {
namespace {

Result<void, Error> wrong_length(size_t got, size_t want) {
    return Result<void, Error>::err(Error{
        ErrorCode::WrongLength,
        "expected " + std::to_string(want) + " bytes, got " + std::to_string(got)});
}

} // namespace

// ============================================================================
// DiscoveryCodec
// ============================================================================

DiscoveryCodec::DiscoveryCodec(CodecConfig config)
    : secret_(std::move(config.secret))
    , server_ip_(config.server_ip)
    , server_ip_source_(std::move(config.server_ip_source))
    , ws_port_(config.ws_port)
    , clock_(config.clock ? std::move(config.clock) : system_clock()) {}

DiscoveryCodec::~DiscoveryCodec() {
    crypto::secure_zero(secret_);
}

Result<Bytes, Error> DiscoveryCodec::respond(std::span<const uint8_t> datagram) const {
    auto checked = check(datagram);
    if (checked.is_err()) {
        return Result<Bytes, Error>::err(checked.unwrap_err());
    }
    return build_response(datagram);
}

Result<void, Error> DiscoveryCodec::check_length(std::span<const uint8_t> request) const {
    if (request.size() != request_size()) {
        return wrong_length(request.size(), request_size());
    }
    return Result<void, Error>::ok();
}

Result<void, Error> DiscoveryCodec::check_freshness(std::span<const uint8_t> request) const {
    const uint64_t timestamp = read_u64_be(request.subspan(TIMESTAMP_OFFSET, TIMESTAMP_SIZE));
    const uint64_t now = clock_();
    if (!is_fresh(timestamp, now)) {
        return Result<void, Error>::err(Error{
            ErrorCode::StaleTimestamp,
            "timestamp " + std::to_string(timestamp) + " outside window of now " + std::to_string(now)});
    }
    return Result<void, Error>::ok();
}

Result<Bytes, Error> DiscoveryCodec::build_unsigned_reply(std::span<const uint8_t> echo) const {
    Ipv4Octets ip = server_ip_;
    if (server_ip_source_) {
        auto looked_up = server_ip_source_();
        if (looked_up.is_err()) {
            return Result<Bytes, Error>::err(looked_up.unwrap_err());
        }
        ip = looked_up.unwrap();
    }

    Bytes out;
    out.reserve(echo.size() + IPV4_SIZE + PORT_SIZE + MAC_SIZE);
    append(out, echo);
    append(out, ip);
    append_u16_be(out, ws_port_);
    return Result<Bytes, Error>::ok(std::move(out));
}

// ============================================================================
// AuthenticatedRequestCodec
// ============================================================================

AuthenticatedRequestCodec::AuthenticatedRequestCodec(CodecConfig config)
    : DiscoveryCodec(std::move(config)) {}

Result<void, Error> AuthenticatedRequestCodec::check(std::span<const uint8_t> request) const {
    auto length = check_length(request);
    if (length.is_err()) return length;

    auto fresh = check_freshness(request);
    if (fresh.is_err()) return fresh;

    const auto expected = crypto::hmac_sha256(secret(), {request.first(SIGNED_HEADER_SIZE)});
    if (!crypto::secure_compare(expected, request.subspan(REQUEST_MAC_OFFSET, MAC_SIZE))) {
        return Result<void, Error>::err(Error{ErrorCode::BadMac, "request mac mismatch"});
    }
    return Result<void, Error>::ok();
}

Result<Bytes, Error> AuthenticatedRequestCodec::build_response(std::span<const uint8_t> request) const {
    auto length = check_length(request);
    if (length.is_err()) {
        return Result<Bytes, Error>::err(length.unwrap_err());
    }
    return build_unsigned_reply(request.first(AUTH_REQUEST_ECHO_SIZE));
}

// ============================================================================
// AuthenticatedResponseCodec
// ============================================================================

AuthenticatedResponseCodec::AuthenticatedResponseCodec(CodecConfig config)
    : DiscoveryCodec(std::move(config)) {}

Result<void, Error> AuthenticatedResponseCodec::check(std::span<const uint8_t> request) const {
    auto length = check_length(request);
    if (length.is_err()) return length;
    return check_freshness(request);
}

Result<Bytes, Error> AuthenticatedResponseCodec::build_response(std::span<const uint8_t> request) const {
    auto length = check_length(request);
    if (length.is_err()) {
        return Result<Bytes, Error>::err(length.unwrap_err());
    }

    auto reply = build_unsigned_reply(request.first(OPEN_REQUEST_ECHO_SIZE));
    if (reply.is_err()) return reply;

    auto out = std::move(reply).unwrap();
    const auto mac = crypto::hmac_sha256(secret(), {std::span<const uint8_t>(out)});
    append(out, mac);
    return Result<Bytes, Error>::ok(std::move(out));
}

// ============================================================================
// Factory
// ============================================================================

Result<std::shared_ptr<const DiscoveryCodec>, Error> make_codec(ProtocolVariant variant,
                                                               CodecConfig config) {
    using R = Result<std::shared_ptr<const DiscoveryCodec>, Error>;

    if (config.secret.empty()) {
        return R::err(Error{ErrorCode::InvalidConfig, "shared secret must not be empty"});
    }
    if (config.ws_port == 0) {
        return R::err(Error{ErrorCode::InvalidConfig, "websocket port must be non-zero"});
    }

    auto init = crypto::init();
    if (init.is_err()) {
        return R::err(init.unwrap_err());
    }

    switch (variant) {
        case ProtocolVariant::AuthenticatedRequest:
            return R::ok(std::make_shared<const AuthenticatedRequestCodec>(std::move(config)));
        case ProtocolVariant::AuthenticatedResponse:
            return R::ok(std::make_shared<const AuthenticatedResponseCodec>(std::move(config)));
    }
    return R::err(Error{ErrorCode::InvalidConfig, "unknown protocol variant"});
}

} // namespace wsbeacon::protocol
