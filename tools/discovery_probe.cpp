#include <QCommandLineParser>
#include <QCoreApplication>
#include <QTextStream>

#include "app/config.hpp"
#include "app/logging.hpp"
#include "crypto/mac.hpp"
#include "network/discovery_prober.hpp"
#include "network/host_address.hpp"

// Sends one discovery request and prints "ip:port" of the first verified reply.
int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);
    app.setApplicationName("wsbeacon-probe");
    app.setApplicationVersion("0.1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Discover a wsbeacond server on the local network."));
    parser.addHelpOption();
    parser.addVersionOption();
    wsbeacon::app::add_probe_options(parser);
    parser.process(app);

    auto parsed = wsbeacon::app::probe_config_from_parser(parser, wsbeacon::app::process_environment());
    if (parsed.is_err()) {
        QTextStream(stderr) << "wsbeacon-probe: " << QString::fromStdString(parsed.unwrap_err().message) << "\n";
        return 1;
    }
    const auto config = std::move(parsed).unwrap();

    wsbeacon::app::install_logging();
    if (config.debug) {
        wsbeacon::app::enable_debug_logging();
    }

    wsbeacon::network::ProbeOptions options;
    options.variant = config.variant;
    options.secret.assign(config.secret.begin(), config.secret.end());
    if (config.device_id) {
        options.device_id = *config.device_id;
    }
    options.target = config.target;
    options.port = config.port;
    options.timeout_ms = config.timeout_ms;

    wsbeacon::network::DiscoveryProber prober;
    int exitCode = 1;

    QObject::connect(&prober, &wsbeacon::network::DiscoveryProber::discovered, &app,
                     [&](const wsbeacon::protocol::DiscoveredEndpoint& endpoint, const QHostAddress&) {
                         QTextStream(stdout) << wsbeacon::network::format_ipv4(endpoint.ip) << ":"
                                             << endpoint.ws_port << "\n";
                         exitCode = 0;
                         QCoreApplication::quit();
                     });
    QObject::connect(&prober, &wsbeacon::network::DiscoveryProber::failed, &app,
                     [&](const wsbeacon::Error& error) {
                         QTextStream(stderr) << "wsbeacon-probe: " << QString::fromStdString(error.message) << "\n";
                         exitCode = error.is(wsbeacon::ErrorCode::Timeout) ? 4 : 1;
                         QCoreApplication::quit();
                     });

    auto started = prober.probe(options);
    wsbeacon::crypto::secure_zero(options.secret);
    if (started.is_err()) {
        QTextStream(stderr) << "wsbeacon-probe: " << QString::fromStdString(started.unwrap_err().message) << "\n";
        return started.unwrap_err().is(wsbeacon::ErrorCode::Crypto) ? 2 : 3;
    }

    app.exec();
    return exitCode;
}
