#include "app/config.hpp"

#include "network/host_address.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QtGlobal>

namespace wsbeacon::app {
namespace {

const QString kPort = QStringLiteral("port");
const QString kWsPort = QStringLiteral("ws-port");
const QString kSecret = QStringLiteral("secret");
const QString kVariant = QStringLiteral("variant");
const QString kHostIp = QStringLiteral("host-ip");
const QString kLogFile = QStringLiteral("log-file");
const QString kDebug = QStringLiteral("debug");
const QString kTarget = QStringLiteral("target");
const QString kTimeout = QStringLiteral("timeout-ms");
const QString kDeviceId = QStringLiteral("device-id");

Error config_error(const std::string& msg) {
    return Error{ErrorCode::InvalidConfig, msg};
}

// --secret, then the environment, then the built-in default.
std::pair<QByteArray, bool> resolve_secret(const QCommandLineParser& parser, const EnvLookup& env) {
    if (parser.isSet(kSecret)) {
        return {parser.value(kSecret).toUtf8(), false};
    }
    const auto from_env = env ? env(SECRET_ENV) : QString{};
    if (!from_env.isEmpty()) {
        return {from_env.toUtf8(), false};
    }
    return {QByteArray(DEFAULT_SECRET), true};
}

bool debug_requested(const QCommandLineParser& parser, const EnvLookup& env) {
    if (parser.isSet(kDebug)) return true;
    const auto value = env ? env(DEBUG_ENV) : QString{};
    return !value.isEmpty() && value != QStringLiteral("0");
}

template<typename Config>
Result<Config, Error> parse_with(const QStringList& arguments,
                                 const EnvLookup& env,
                                 void (*add_options)(QCommandLineParser&),
                                 Result<Config, Error> (*from_parser)(const QCommandLineParser&, const EnvLookup&)) {
    QCommandLineParser parser;
    add_options(parser);
    if (!parser.parse(arguments)) {
        return Result<Config, Error>::err(config_error(parser.errorText().toStdString()));
    }
    return from_parser(parser, env);
}

} // namespace

EnvLookup process_environment() {
    return [](const char* name) { return qEnvironmentVariable(name); };
}

protocol::CodecConfig ServerConfig::codec_config(Ipv4Source detect) const {
    protocol::CodecConfig cfg;
    cfg.secret.assign(secret.begin(), secret.end());
    if (host_ip) {
        cfg.server_ip = *host_ip;
    } else {
        cfg.server_ip_source = std::move(detect);
    }
    cfg.ws_port = ws_port;
    return cfg;
}

Result<quint16, Error> parse_port(const QString& text, const char* what) {
    bool ok = false;
    const uint value = text.trimmed().toUInt(&ok, 10);
    if (!ok || value == 0 || value > 65535) {
        return Result<quint16, Error>::err(config_error(
            std::string("invalid ") + what + ": '" + text.toStdString() + "' (expected 1-65535)"));
    }
    return Result<quint16, Error>::ok(static_cast<quint16>(value));
}

Result<protocol::ProtocolVariant, Error> parse_variant_option(const QString& text) {
    const auto parsed = protocol::parse_variant(text.trimmed().toStdString());
    if (!parsed) {
        return Result<protocol::ProtocolVariant, Error>::err(config_error(
            "unknown variant '" + text.toStdString() + "' (expected request-auth or response-auth)"));
    }
    return Result<protocol::ProtocolVariant, Error>::ok(*parsed);
}

void add_server_options(QCommandLineParser& parser) {
    parser.addOption(QCommandLineOption(
        QStringList{kPort},
        QStringLiteral("UDP port to listen on (default 5354)."),
        QStringLiteral("port"),
        QString::number(protocol::DEFAULT_DISCOVERY_PORT)));
    parser.addOption(QCommandLineOption(
        QStringList{kWsPort},
        QStringLiteral("WebSocket port to announce (default 8080)."),
        QStringLiteral("port"),
        QString::number(protocol::DEFAULT_WS_PORT)));
    parser.addOption(QCommandLineOption(
        QStringList{kSecret},
        QStringLiteral("Shared secret for HMAC (falls back to $WSBEACON_SECRET)."),
        QStringLiteral("secret")));
    parser.addOption(QCommandLineOption(
        QStringList{kVariant},
        QStringLiteral("Wire protocol: request-auth or response-auth (default)."),
        QStringLiteral("variant"),
        QStringLiteral("response-auth")));
    parser.addOption(QCommandLineOption(
        QStringList{kHostIp},
        QStringLiteral("IPv4 address to announce (default: detected for every reply)."),
        QStringLiteral("address")));
    parser.addOption(QCommandLineOption(
        QStringList{kLogFile},
        QStringLiteral("Also append log lines to this file."),
        QStringLiteral("path")));
    parser.addOption(QCommandLineOption(
        QStringList{kDebug},
        QStringLiteral("Enable debug logging (also WSBEACON_DEBUG_DISCOVERY=1).")));
}

void add_probe_options(QCommandLineParser& parser) {
    parser.addOption(QCommandLineOption(
        QStringList{kTarget},
        QStringLiteral("Address to send the probe to (default 255.255.255.255)."),
        QStringLiteral("address"),
        QStringLiteral("255.255.255.255")));
    parser.addOption(QCommandLineOption(
        QStringList{kPort},
        QStringLiteral("Server UDP port (default 5354)."),
        QStringLiteral("port"),
        QString::number(protocol::DEFAULT_DISCOVERY_PORT)));
    parser.addOption(QCommandLineOption(
        QStringList{kSecret},
        QStringLiteral("Shared secret for HMAC (falls back to $WSBEACON_SECRET)."),
        QStringLiteral("secret")));
    parser.addOption(QCommandLineOption(
        QStringList{kVariant},
        QStringLiteral("Wire protocol: request-auth or response-auth (default)."),
        QStringLiteral("variant"),
        QStringLiteral("response-auth")));
    parser.addOption(QCommandLineOption(
        QStringList{kTimeout},
        QStringLiteral("How long to wait for a reply (default 3000)."),
        QStringLiteral("ms"),
        QStringLiteral("3000")));
    parser.addOption(QCommandLineOption(
        QStringList{kDeviceId},
        QStringLiteral("Device id as 32 hex digits (default: random)."),
        QStringLiteral("hex")));
    parser.addOption(QCommandLineOption(
        QStringList{kDebug},
        QStringLiteral("Enable debug logging.")));
}

Result<ServerConfig, Error> server_config_from_parser(const QCommandLineParser& parser, const EnvLookup& env) {
    using R = Result<ServerConfig, Error>;
    ServerConfig cfg;

    auto udp_port = parse_port(parser.value(kPort), "--port");
    if (udp_port.is_err()) return R::err(udp_port.unwrap_err());
    cfg.udp_port = udp_port.unwrap();

    auto ws_port = parse_port(parser.value(kWsPort), "--ws-port");
    if (ws_port.is_err()) return R::err(ws_port.unwrap_err());
    cfg.ws_port = ws_port.unwrap();

    auto variant = parse_variant_option(parser.value(kVariant));
    if (variant.is_err()) return R::err(variant.unwrap_err());
    cfg.variant = variant.unwrap();

    auto [secret, is_default] = resolve_secret(parser, env);
    if (secret.isEmpty()) {
        return R::err(config_error("--secret must not be empty"));
    }
    cfg.secret = std::move(secret);
    cfg.secret_is_default = is_default;

    if (parser.isSet(kHostIp)) {
        auto ip = network::parse_ipv4(parser.value(kHostIp));
        if (ip.is_err()) return R::err(ip.unwrap_err());
        cfg.host_ip = ip.unwrap();
    }

    cfg.log_file = parser.value(kLogFile);
    cfg.debug = debug_requested(parser, env);
    return R::ok(std::move(cfg));
}

Result<ProbeConfig, Error> probe_config_from_parser(const QCommandLineParser& parser, const EnvLookup& env) {
    using R = Result<ProbeConfig, Error>;
    ProbeConfig cfg;

    QHostAddress target;
    if (!target.setAddress(parser.value(kTarget)) ||
        target.protocol() != QAbstractSocket::IPv4Protocol) {
        return R::err(config_error("invalid --target: '" + parser.value(kTarget).toStdString() + "'"));
    }
    cfg.target = target;

    auto port = parse_port(parser.value(kPort), "--port");
    if (port.is_err()) return R::err(port.unwrap_err());
    cfg.port = port.unwrap();

    auto variant = parse_variant_option(parser.value(kVariant));
    if (variant.is_err()) return R::err(variant.unwrap_err());
    cfg.variant = variant.unwrap();

    auto [secret, is_default] = resolve_secret(parser, env);
    Q_UNUSED(is_default)
    if (secret.isEmpty()) {
        return R::err(config_error("--secret must not be empty"));
    }
    cfg.secret = std::move(secret);

    bool ok = false;
    const int timeout = parser.value(kTimeout).toInt(&ok, 10);
    if (!ok || timeout <= 0) {
        return R::err(config_error("invalid --timeout-ms: '" + parser.value(kTimeout).toStdString() + "'"));
    }
    cfg.timeout_ms = timeout;

    if (parser.isSet(kDeviceId)) {
        auto id = DeviceId::parse_hex(parser.value(kDeviceId).toStdString());
        if (!id) {
            return R::err(config_error("invalid --device-id (expected 32 hex digits)"));
        }
        cfg.device_id = *id;
    }

    cfg.debug = debug_requested(parser, env);
    return R::ok(std::move(cfg));
}

Result<ServerConfig, Error> parse_server_config(const QStringList& arguments, const EnvLookup& env) {
    return parse_with<ServerConfig>(arguments, env, &add_server_options, &server_config_from_parser);
}

Result<ProbeConfig, Error> parse_probe_config(const QStringList& arguments, const EnvLookup& env) {
    return parse_with<ProbeConfig>(arguments, env, &add_probe_options, &probe_config_from_parser);
}

} // namespace wsbeacon::app
