#include "network/discovery_prober.hpp"

#include "crypto/mac.hpp"
#include "network/host_address.hpp"

#include <QByteArray>
#include <QLoggingCategory>
#include <QTimer>
#include <QUdpSocket>

Q_LOGGING_CATEGORY(wsbeaconProbeLog, "wsbeacon.probe")

namespace wsbeacon::network {

DiscoveryProber::DiscoveryProber(QObject* parent)
    : QObject(parent)
    , timeout_(std::make_unique<QTimer>(this))
{
    timeout_->setSingleShot(true);
    connect(timeout_.get(), &QTimer::timeout, this, &DiscoveryProber::onTimeout);
}

DiscoveryProber::~DiscoveryProber() {
    cancel();
}

Result<void, Error> DiscoveryProber::probe(const ProbeOptions& options) {
    if (socket_) {
        return Result<void, Error>::err(Error{ErrorCode::Socket, "probe already in flight"});
    }
    if (options.variant == protocol::ProtocolVariant::AuthenticatedRequest && options.secret.empty()) {
        return Result<void, Error>::err(Error{ErrorCode::InvalidConfig, "shared secret must not be empty"});
    }

    auto init = crypto::init();
    if (init.is_err()) return init;

    socket_ = std::make_unique<QUdpSocket>(this);
    if (!socket_->bind(QHostAddress::AnyIPv4, 0)) {
        const auto msg = socket_->errorString().toStdString();
        socket_.reset();
        return Result<void, Error>::err(Error{ErrorCode::Socket, msg});
    }
    connect(socket_.get(), &QUdpSocket::readyRead, this, &DiscoveryProber::onReadyRead);

    variant_ = options.variant;
    secret_ = options.secret;
    const auto device_id = options.device_id.is_nil() ? DeviceId::generate() : options.device_id;
    request_ = protocol::encode_request(variant_, protocol::make_request(device_id), secret_);

    const qint64 written = socket_->writeDatagram(reinterpret_cast<const char*>(request_.data()),
                                                  static_cast<qint64>(request_.size()),
                                                  options.target,
                                                  options.port);
    if (written != static_cast<qint64>(request_.size())) {
        const auto msg = "failed to send probe: " + socket_->errorString().toStdString();
        finish();
        return Result<void, Error>::err(Error{ErrorCode::Socket, msg});
    }
    // Errors after a successful send are reported through failed().
    connect(socket_.get(), &QUdpSocket::errorOccurred, this, &DiscoveryProber::onSocketError);

    qCDebug(wsbeaconProbeLog).noquote()
        << "sent" << request_.size() << "byte probe to"
        << QStringLiteral("%1:%2").arg(options.target.toString()).arg(options.port);

    timeout_->start(options.timeout_ms);
    return Result<void, Error>::ok();
}

void DiscoveryProber::cancel() {
    finish();
}

void DiscoveryProber::finish() {
    timeout_->stop();
    if (socket_) {
        // May run inside the socket's own readyRead emission.
        socket_->disconnect(this);
        socket_->close();
        socket_.release()->deleteLater();
    }
    crypto::secure_zero(secret_);
    secret_.clear();
    request_.clear();
}

void DiscoveryProber::onReadyRead() {
    while (socket_ && socket_->hasPendingDatagrams()) {
        QByteArray datagram;
        datagram.resize(static_cast<qsizetype>(qMax<qint64>(socket_->pendingDatagramSize(), 0)));

        QHostAddress sender;
        quint16 sender_port = 0;
        const qint64 read = socket_->readDatagram(datagram.data(), datagram.size(), &sender, &sender_port);
        if (read < 0) {
            break;
        }

        const std::span<const uint8_t> bytes(reinterpret_cast<const uint8_t*>(datagram.constData()),
                                             static_cast<size_t>(read));
        auto parsed = protocol::parse_response(variant_, request_, bytes, secret_);
        if (parsed.is_err()) {
            qCDebug(wsbeaconProbeLog).noquote()
                << "ignoring datagram from" << sender.toString() << "-"
                << QString::fromStdString(parsed.unwrap_err().message);
            continue;
        }

        const auto endpoint = parsed.unwrap();
        qCInfo(wsbeaconProbeLog).noquote()
            << "server at" << format_ipv4(endpoint.ip) << "ws port" << endpoint.ws_port;
        finish();
        emit discovered(endpoint, sender);
        return;
    }
}

void DiscoveryProber::onSocketError(QAbstractSocket::SocketError socketError) {
    if (!socket_) return;
    // ICMP unreachable from a closed port; another responder may still answer.
    if (socketError == QAbstractSocket::ConnectionRefusedError) {
        qCDebug(wsbeaconProbeLog) << "ignoring" << socket_->errorString();
        return;
    }

    const auto msg = socket_->errorString().toStdString();
    qCWarning(wsbeaconProbeLog).noquote() << "probe socket error:" << QString::fromStdString(msg);
    finish();
    emit failed(Error{ErrorCode::Socket, msg});
}

void DiscoveryProber::onTimeout() {
    finish();
    emit failed(Error{ErrorCode::Timeout, "discovery timeout"});
}

} // namespace wsbeacon::network
