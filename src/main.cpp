#include <QCommandLineParser>
#include <QCoreApplication>
#include <QTextStream>
#include <QTimer>

#include <atomic>
#include <csignal>

#include "app/config.hpp"
#include "app/logging.hpp"
#include "crypto/mac.hpp"
#include "network/discovery_listener.hpp"
#include "network/host_address.hpp"
#include "protocol/discovery_codec.hpp"

namespace {

enum ExitCode : int {
    ExitOk = 0,
    ExitConfig = 1,
    ExitCrypto = 2,
    ExitBind = 3,
};

std::atomic<bool> gShouldStop{false};

void handleSignal(int) {
    gShouldStop.store(true);
}

QString variantLabel(wsbeacon::protocol::ProtocolVariant variant) {
    const auto name = wsbeacon::protocol::variant_name(variant);
    return QString::fromLatin1(name.data(), static_cast<qsizetype>(name.size()));
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("wsbeacond");
    app.setApplicationVersion("0.1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Answers UDP discovery requests with the address of a WebSocket server."));
    parser.addHelpOption();
    parser.addVersionOption();
    wsbeacon::app::add_server_options(parser);
    parser.process(app);

    auto parsed = wsbeacon::app::server_config_from_parser(parser, wsbeacon::app::process_environment());
    if (parsed.is_err()) {
        QTextStream(stderr) << "wsbeacond: " << QString::fromStdString(parsed.unwrap_err().message) << "\n";
        return ExitConfig;
    }
    const auto config = std::move(parsed).unwrap();

    wsbeacon::app::install_logging(config.log_file);
    if (config.debug) {
        wsbeacon::app::enable_debug_logging();
    }

    auto sodium = wsbeacon::crypto::init();
    if (sodium.is_err()) {
        qCCritical(wsbeaconAppLog).noquote() << QString::fromStdString(sodium.unwrap_err().message);
        return ExitCrypto;
    }

    auto codec = wsbeacon::protocol::make_codec(config.variant,
                                                config.codec_config(&wsbeacon::network::detect_local_ipv4));
    if (codec.is_err()) {
        const auto& err = codec.unwrap_err();
        qCCritical(wsbeaconAppLog).noquote() << QString::fromStdString(err.message);
        return err.is(wsbeacon::ErrorCode::Crypto) ? ExitCrypto : ExitConfig;
    }

    if (config.secret_is_default) {
        qCWarning(wsbeaconAppLog) << "using the built-in default secret; set --secret or"
                                  << wsbeacon::app::SECRET_ENV;
    }

    wsbeacon::network::DiscoveryListener listener(codec.unwrap());
    QObject::connect(&listener, &wsbeacon::network::DiscoveryListener::error, &app,
                     [](const QString& msg) {
                         qCWarning(wsbeaconAppLog).noquote() << "listener error:" << msg;
                     });

    auto bound = listener.start(config.udp_port);
    if (bound.is_err()) {
        qCCritical(wsbeaconAppLog).noquote() << QString::fromStdString(bound.unwrap_err().message);
        return ExitBind;
    }

    QString announced;
    if (config.host_ip) {
        announced = wsbeacon::network::format_ipv4(*config.host_ip);
    } else {
        // Only a hint for the log; the address is looked up again for every reply.
        auto detected = wsbeacon::network::detect_local_ipv4();
        if (detected.is_err()) {
            qCWarning(wsbeaconAppLog).noquote() << QString::fromStdString(detected.unwrap_err().message)
                                                << "- requests get no reply until an address appears";
        }
        announced = detected.is_ok()
            ? wsbeacon::network::format_ipv4(detected.unwrap()) + QStringLiteral(" (detected)")
            : QStringLiteral("<none yet>");
    }

    qCInfo(wsbeaconAppLog).noquote()
        << "announcing" << announced
        << "ws port" << config.ws_port
        << "on UDP" << bound.unwrap()
        << "(" + variantLabel(config.variant) + ")";

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    QTimer stopPoll;
    stopPoll.setInterval(100);
    QObject::connect(&stopPoll, &QTimer::timeout, &app, [&]() {
        if (!gShouldStop.load()) return;
        stopPoll.stop();
        qCInfo(wsbeaconAppLog) << "shutting down";
        listener.stop();
        QCoreApplication::quit();
    });
    stopPoll.start();

    return app.exec();
}
