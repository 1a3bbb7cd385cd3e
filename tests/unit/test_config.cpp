#include <catch2/catch_test_macros.hpp>

#include "app/config.hpp"

#include <QHash>

using namespace wsbeacon;
using namespace wsbeacon::app;

namespace {

EnvLookup env_of(QHash<QString, QString> vars) {
    return [vars = std::move(vars)](const char* name) {
        return vars.value(QString::fromLatin1(name));
    };
}

EnvLookup empty_env() {
    return env_of({});
}

QStringList args(std::initializer_list<const char*> list) {
    QStringList out{QStringLiteral("wsbeacond")};
    for (const char* a : list) {
        out << QString::fromUtf8(a);
    }
    return out;
}

} // namespace

TEST_CASE("Server config: defaults", "[config]") {
    auto parsed = parse_server_config(args({}), empty_env());
    REQUIRE(parsed.is_ok());

    const auto& cfg = parsed.unwrap();
    REQUIRE(cfg.udp_port == 5354);
    REQUIRE(cfg.ws_port == 8080);
    REQUIRE(cfg.secret == QByteArray("your-secret-key"));
    REQUIRE(cfg.secret_is_default);
    REQUIRE(cfg.variant == protocol::ProtocolVariant::AuthenticatedResponse);
    REQUIRE_FALSE(cfg.host_ip.has_value());
    REQUIRE(cfg.log_file.isEmpty());
    REQUIRE_FALSE(cfg.debug);
}

TEST_CASE("Server config: command line overrides", "[config]") {
    auto parsed = parse_server_config(args({"--port", "6000",
                                            "--ws-port", "4399",
                                            "--secret", "s3cret",
                                            "--variant", "request-auth",
                                            "--host-ip", "192.168.1.10",
                                            "--log-file", "/tmp/wsbeacon.log",
                                            "--debug"}),
                                      empty_env());
    REQUIRE(parsed.is_ok());

    const auto& cfg = parsed.unwrap();
    REQUIRE(cfg.udp_port == 6000);
    REQUIRE(cfg.ws_port == 4399);
    REQUIRE(cfg.secret == QByteArray("s3cret"));
    REQUIRE_FALSE(cfg.secret_is_default);
    REQUIRE(cfg.variant == protocol::ProtocolVariant::AuthenticatedRequest);
    REQUIRE(cfg.host_ip == Ipv4Octets{192, 168, 1, 10});
    REQUIRE(cfg.log_file == QStringLiteral("/tmp/wsbeacon.log"));
    REQUIRE(cfg.debug);
}

TEST_CASE("Server config: secret and debug from the environment", "[config]") {
    auto env = env_of({{QStringLiteral("WSBEACON_SECRET"), QStringLiteral("from-env")},
                       {QStringLiteral("WSBEACON_DEBUG_DISCOVERY"), QStringLiteral("1")}});

    auto parsed = parse_server_config(args({}), env);
    REQUIRE(parsed.is_ok());
    REQUIRE(parsed.unwrap().secret == QByteArray("from-env"));
    REQUIRE_FALSE(parsed.unwrap().secret_is_default);
    REQUIRE(parsed.unwrap().debug);

    auto flag_wins = parse_server_config(args({"--secret", "from-flag"}), env);
    REQUIRE(flag_wins.unwrap().secret == QByteArray("from-flag"));
}

TEST_CASE("Server config: WSBEACON_DEBUG_DISCOVERY=0 leaves debug off", "[config]") {
    auto env = env_of({{QStringLiteral("WSBEACON_DEBUG_DISCOVERY"), QStringLiteral("0")}});
    REQUIRE_FALSE(parse_server_config(args({}), env).unwrap().debug);
}

TEST_CASE("Server config: invalid values are rejected", "[config]") {
    auto fails = [](std::initializer_list<const char*> list) {
        auto parsed = parse_server_config(args(list), empty_env());
        return parsed.is_err() && parsed.unwrap_err().is(ErrorCode::InvalidConfig);
    };

    REQUIRE(fails({"--port", "0"}));
    REQUIRE(fails({"--port", "65536"}));
    REQUIRE(fails({"--port", "abc"}));
    REQUIRE(fails({"--ws-port", "0"}));
    REQUIRE(fails({"--secret", ""}));
    REQUIRE(fails({"--variant", "both"}));
    REQUIRE(fails({"--host-ip", "192.168.1"}));
    REQUIRE(fails({"--host-ip", "192.168.1.256"}));
    REQUIRE(fails({"--no-such-option"}));
}

TEST_CASE("Server config: without --host-ip the address is detected per reply", "[config]") {
    auto cfg = parse_server_config(args({"--secret", "abc", "--ws-port", "9000"}), empty_env()).unwrap();

    const auto codec = cfg.codec_config([] { return Result<Ipv4Octets, Error>::ok({10, 1, 2, 3}); });
    REQUIRE(codec.secret == Bytes{'a', 'b', 'c'});
    REQUIRE(codec.ws_port == 9000);
    REQUIRE(codec.server_ip_source);
    REQUIRE(codec.server_ip_source().unwrap() == Ipv4Octets{10, 1, 2, 3});
}

TEST_CASE("Server config: --host-ip pins the announced address", "[config]") {
    auto cfg = parse_server_config(args({"--host-ip", "192.168.1.10"}), empty_env()).unwrap();

    bool detected = false;
    const auto codec = cfg.codec_config([&] {
        detected = true;
        return Result<Ipv4Octets, Error>::ok({10, 1, 2, 3});
    });
    REQUIRE_FALSE(codec.server_ip_source);
    REQUIRE(codec.server_ip == Ipv4Octets{192, 168, 1, 10});
    REQUIRE_FALSE(detected);
}

TEST_CASE("Probe config: defaults and overrides", "[config]") {
    auto defaults = parse_probe_config(args({}), empty_env());
    REQUIRE(defaults.is_ok());
    REQUIRE(defaults.unwrap().target == QHostAddress(QHostAddress::Broadcast));
    REQUIRE(defaults.unwrap().port == 5354);
    REQUIRE(defaults.unwrap().timeout_ms == 3000);
    REQUIRE_FALSE(defaults.unwrap().device_id.has_value());

    auto parsed = parse_probe_config(args({"--target", "127.0.0.1",
                                           "--port", "7000",
                                           "--timeout-ms", "250",
                                           "--variant", "request-auth",
                                           "--device-id", "000102030405060708090a0b0c0d0e0f"}),
                                     empty_env());
    REQUIRE(parsed.is_ok());

    const auto& cfg = parsed.unwrap();
    REQUIRE(cfg.target == QHostAddress(QHostAddress::LocalHost));
    REQUIRE(cfg.port == 7000);
    REQUIRE(cfg.timeout_ms == 250);
    REQUIRE(cfg.variant == protocol::ProtocolVariant::AuthenticatedRequest);
    REQUIRE(cfg.device_id.has_value());
    REQUIRE(cfg.device_id->to_hex() == "000102030405060708090a0b0c0d0e0f");
}

TEST_CASE("Probe config: invalid values are rejected", "[config]") {
    REQUIRE(parse_probe_config(args({"--target", "not-an-ip"}), empty_env()).is_err());
    REQUIRE(parse_probe_config(args({"--target", "::1"}), empty_env()).is_err());
    REQUIRE(parse_probe_config(args({"--timeout-ms", "0"}), empty_env()).is_err());
    REQUIRE(parse_probe_config(args({"--device-id", "abc"}), empty_env()).is_err());
}
