#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "protocol/wire.hpp"

#include <memory>
#include <span>

namespace wsbeacon::protocol {

/**
 * CodecConfig - everything the server side of the protocol needs.
 *
 * The secret is opaque bytes and never leaves the process. `clock` defaults
 * to the system wall clock when left empty.
 *
 * When `server_ip_source` is set it is asked for the address on every
 * response and `server_ip` is ignored; a failed lookup means no reply.
 */
struct CodecConfig {
    Bytes secret;
    Ipv4Octets server_ip{};
    Ipv4Source server_ip_source;
    uint16_t ws_port = DEFAULT_WS_PORT;
    UnixClock clock;
};

/**
 * DiscoveryCodec - stateless request validation and response construction.
 *
 * One implementation per ProtocolVariant. Instances hold only immutable
 * configuration, so a single codec may be shared across threads.
 */
class DiscoveryCodec {
public:
    virtual ~DiscoveryCodec();

    DiscoveryCodec(const DiscoveryCodec&) = delete;
    DiscoveryCodec& operator=(const DiscoveryCodec&) = delete;

    [[nodiscard]] virtual ProtocolVariant variant() const noexcept = 0;

    [[nodiscard]] size_t request_size() const noexcept { return protocol::request_size(variant()); }
    [[nodiscard]] size_t response_size() const noexcept { return protocol::response_size(variant()); }

    /**
     * Decide whether a datagram is an acceptable request.
     * The error names the first check that failed; it never throws.
     */
    [[nodiscard]] virtual Result<void, Error> check(std::span<const uint8_t> request) const = 0;

    [[nodiscard]] bool validate(std::span<const uint8_t> request) const {
        return check(request).is_ok();
    }

    /**
     * Build the reply for a request that passed check(). Only the length is
     * re-checked here; freshness and authenticity are not.
     */
    [[nodiscard]] virtual Result<Bytes, Error> build_response(std::span<const uint8_t> request) const = 0;

    /**
     * check() followed by build_response(). An error means "send nothing".
     */
    [[nodiscard]] Result<Bytes, Error> respond(std::span<const uint8_t> datagram) const;

protected:
    explicit DiscoveryCodec(CodecConfig config);

    [[nodiscard]] Result<void, Error> check_length(std::span<const uint8_t> request) const;
    [[nodiscard]] Result<void, Error> check_freshness(std::span<const uint8_t> request) const;

    // echo | server_ip | ws_port
    [[nodiscard]] Result<Bytes, Error> build_unsigned_reply(std::span<const uint8_t> echo) const;

    [[nodiscard]] std::span<const uint8_t> secret() const noexcept { return secret_; }

private:
    Bytes secret_;
    Ipv4Octets server_ip_;
    Ipv4Source server_ip_source_;
    uint16_t ws_port_;
    UnixClock clock_;
};

/**
 * Requester signs, responder does not.
 *
 *   request  = deviceId(16) | nonce(4) | timestamp(8) | HMAC(secret, first 28)(32)
 *   response = request[0:32] | server_ip(4) | ws_port(2)
 */
class AuthenticatedRequestCodec final : public DiscoveryCodec {
public:
    explicit AuthenticatedRequestCodec(CodecConfig config);

    [[nodiscard]] ProtocolVariant variant() const noexcept override {
        return ProtocolVariant::AuthenticatedRequest;
    }

    [[nodiscard]] Result<void, Error> check(std::span<const uint8_t> request) const override;
    [[nodiscard]] Result<Bytes, Error> build_response(std::span<const uint8_t> request) const override;
};

/**
 * Responder signs, requester does not. Anyone can elicit a reply; the
 * requester must verify the trailing MAC before trusting the address.
 *
 *   request  = deviceId(16) | nonce(4) | timestamp(8)
 *   response = request(28) | server_ip(4) | ws_port(2) | HMAC(secret, first 34)(32)
 */
class AuthenticatedResponseCodec final : public DiscoveryCodec {
public:
    explicit AuthenticatedResponseCodec(CodecConfig config);

    [[nodiscard]] ProtocolVariant variant() const noexcept override {
        return ProtocolVariant::AuthenticatedResponse;
    }

    [[nodiscard]] Result<void, Error> check(std::span<const uint8_t> request) const override;
    [[nodiscard]] Result<Bytes, Error> build_response(std::span<const uint8_t> request) const override;
};

/**
 * Validate the configuration and create the codec for `variant`.
 * Fails with ErrorCode::InvalidConfig on an empty secret or ws_port 0,
 * and with ErrorCode::Crypto if libsodium cannot be initialized.
 */
[[nodiscard]] Result<std::shared_ptr<const DiscoveryCodec>, Error> make_codec(ProtocolVariant variant,
                                                                             CodecConfig config);

} // namespace wsbeacon::protocol
