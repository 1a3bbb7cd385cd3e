#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "protocol/discovery_codec.hpp"
#include "protocol/wire.hpp"

#include <QByteArray>
#include <QHostAddress>
#include <QString>
#include <QStringList>
#include <functional>
#include <optional>

class QCommandLineParser;

namespace wsbeacon::app {

/// Secret used when neither --secret nor WSBEACON_SECRET is given.
constexpr const char* DEFAULT_SECRET = "your-secret-key";
constexpr const char* SECRET_ENV = "WSBEACON_SECRET";
constexpr const char* DEBUG_ENV = "WSBEACON_DEBUG_DISCOVERY";

/// Environment lookup; returns an empty string for unset variables.
using EnvLookup = std::function<QString(const char*)>;

[[nodiscard]] EnvLookup process_environment();

/**
 * ServerConfig - everything wsbeacond needs, validated.
 */
struct ServerConfig {
    quint16 udp_port = protocol::DEFAULT_DISCOVERY_PORT;
    quint16 ws_port = protocol::DEFAULT_WS_PORT;
    QByteArray secret;
    bool secret_is_default = false;
    protocol::ProtocolVariant variant = protocol::ProtocolVariant::AuthenticatedResponse;
    std::optional<Ipv4Octets> host_ip;
    QString log_file;
    bool debug = false;

    /**
     * Codec settings. A --host-ip is announced as given; otherwise
     * `detect` is consulted for every response.
     */
    [[nodiscard]] protocol::CodecConfig codec_config(Ipv4Source detect) const;
};

/**
 * ProbeConfig - options of the wsbeacon-probe tool.
 */
struct ProbeConfig {
    QHostAddress target = QHostAddress(QHostAddress::Broadcast);
    quint16 port = protocol::DEFAULT_DISCOVERY_PORT;
    QByteArray secret;
    protocol::ProtocolVariant variant = protocol::ProtocolVariant::AuthenticatedResponse;
    int timeout_ms = 3000;
    std::optional<DeviceId> device_id;
    bool debug = false;
};

// Option registration, shared between the executables and the tests.
void add_server_options(QCommandLineParser& parser);
void add_probe_options(QCommandLineParser& parser);

Result<ServerConfig, Error> server_config_from_parser(const QCommandLineParser& parser, const EnvLookup& env);
Result<ProbeConfig, Error> probe_config_from_parser(const QCommandLineParser& parser, const EnvLookup& env);

/**
 * Parse a full argument list (argv[0] first). Used where no QCoreApplication
 * drives QCommandLineParser::process(), e.g. in tests.
 */
Result<ServerConfig, Error> parse_server_config(const QStringList& arguments, const EnvLookup& env);
Result<ProbeConfig, Error> parse_probe_config(const QStringList& arguments, const EnvLookup& env);

// Field parsers.
Result<quint16, Error> parse_port(const QString& text, const char* what);
Result<protocol::ProtocolVariant, Error> parse_variant_option(const QString& text);

} // namespace wsbeacon::app
