#include "network/discovery_listener.hpp"

#include "protocol/discovery_packet.hpp"

#include <QByteArray>
#include <QLoggingCategory>
#include <QUdpSocket>

Q_LOGGING_CATEGORY(wsbeaconDiscoveryLog, "wsbeacon.discovery")

namespace wsbeacon::network {
namespace {

std::span<const uint8_t> as_bytes(const QByteArray& data) {
    return {reinterpret_cast<const uint8_t*>(data.constData()), static_cast<size_t>(data.size())};
}

QString describe_sender(const QHostAddress& sender, quint16 port) {
    return QStringLiteral("%1:%2").arg(sender.toString()).arg(port);
}

} // namespace

DiscoveryListener::DiscoveryListener(std::shared_ptr<const protocol::DiscoveryCodec> codec,
                                     QObject* parent)
    : QObject(parent)
    , codec_(std::move(codec))
{
}

DiscoveryListener::~DiscoveryListener() {
    stop();
}

Result<quint16, Error> DiscoveryListener::start(quint16 port) {
    if (socket_) {
        return Result<quint16, Error>::ok(socket_->localPort());
    }

    socket_ = std::make_unique<QUdpSocket>(this);
    if (!socket_->bind(QHostAddress::AnyIPv4,
                       port,
                       QUdpSocket::ShareAddress | QUdpSocket::ReuseAddressHint)) {
        std::string msg;
        if (socket_->error() == QAbstractSocket::AddressInUseError) {
            msg = "UDP port " + std::to_string(port) +
                  " is already in use; choose another with --port";
        } else {
            msg = "failed to bind UDP port " + std::to_string(port) + ": " +
                  socket_->errorString().toStdString();
        }
        socket_.reset();
        return Result<quint16, Error>::err(Error{ErrorCode::Socket, msg});
    }

    connect(socket_.get(), &QUdpSocket::readyRead, this, &DiscoveryListener::onReadyRead);

    const auto bound = socket_->localPort();
    const auto variant = protocol::variant_name(codec_->variant());
    qCInfo(wsbeaconDiscoveryLog).noquote()
        << "listening on UDP" << bound
        << "variant" << QString::fromLatin1(variant.data(), static_cast<qsizetype>(variant.size()));
    return Result<quint16, Error>::ok(bound);
}

void DiscoveryListener::stop() {
    if (!socket_) return;
    // May run from a slot connected to one of our signals, i.e. inside readyRead.
    socket_->disconnect(this);
    socket_->close();
    socket_.release()->deleteLater();
    qCInfo(wsbeaconDiscoveryLog) << "stopped; answered" << answered_ << "rejected" << rejected_;
}

bool DiscoveryListener::isListening() const {
    return socket_ && socket_->state() == QAbstractSocket::BoundState;
}

quint16 DiscoveryListener::port() const {
    return socket_ ? socket_->localPort() : 0;
}

void DiscoveryListener::onReadyRead() {
    if (!socket_) return;

    while (socket_ && socket_->hasPendingDatagrams()) {
        const qint64 pending = socket_->pendingDatagramSize();
        QByteArray datagram;
        datagram.resize(static_cast<qsizetype>(qMax<qint64>(pending, 0)));

        QHostAddress sender;
        quint16 sender_port = 0;
        const qint64 read = socket_->readDatagram(datagram.data(), datagram.size(), &sender, &sender_port);
        if (read < 0) {
            qCWarning(wsbeaconDiscoveryLog) << "readDatagram failed:" << socket_->errorString();
            emit error(socket_->errorString());
            break;
        }
        datagram.truncate(static_cast<qsizetype>(read));

        handleDatagram(datagram, sender, sender_port);
    }
}

void DiscoveryListener::handleDatagram(const QByteArray& datagram,
                                       const QHostAddress& sender,
                                       quint16 senderPort) {
    const auto from = describe_sender(sender, senderPort);

    if (static_cast<size_t>(datagram.size()) > protocol::MAX_DATAGRAM_SIZE) {
        ++rejected_;
        qCDebug(wsbeaconDiscoveryLog).noquote() << "oversized datagram from" << from;
        emit requestRejected(sender, senderPort, QStringLiteral("oversized datagram"));
        return;
    }

    const auto bytes = as_bytes(datagram);
    auto reply = codec_->respond(bytes);
    if (reply.is_err()) {
        ++rejected_;
        const auto& err = reply.unwrap_err();
        const auto reason = QString::fromStdString(err.message);
        if (err.is(ErrorCode::InvalidConfig)) {
            // The request was fine; we have no address to announce.
            qCWarning(wsbeaconDiscoveryLog).noquote() << "not answering" << from << "-" << reason;
        } else {
            qCDebug(wsbeaconDiscoveryLog).noquote() << "invalid discovery request from" << from << "-" << reason;
        }
        emit requestRejected(sender, senderPort, reason);
        return;
    }

    if (!socket_) return;

    const auto& out = reply.unwrap();
    const qint64 written = socket_->writeDatagram(reinterpret_cast<const char*>(out.data()),
                                                  static_cast<qint64>(out.size()),
                                                  sender,
                                                  senderPort);
    if (written != static_cast<qint64>(out.size())) {
        qCWarning(wsbeaconDiscoveryLog).noquote()
            << "failed to send response to" << from << ":" << socket_->errorString();
        emit error(socket_->errorString());
        return;
    }

    ++answered_;
    auto request = protocol::decode_request(bytes);
    qCInfo(wsbeaconDiscoveryLog).noquote()
        << "answered discovery request from" << from
        << "device" << (request.is_ok()
                            ? QString::fromStdString(request.unwrap().device_id.to_hex())
                            : QStringLiteral("?"));
    emit requestAnswered(sender, senderPort);
}

} // namespace wsbeacon::network
