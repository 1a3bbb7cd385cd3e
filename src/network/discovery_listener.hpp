#pragma once

#include "core/result.hpp"
#include "protocol/discovery_codec.hpp"

#include <QObject>
#include <QHostAddress>
#include <memory>

class QUdpSocket;

namespace wsbeacon::network {

/**
 * UDP discovery responder.
 *
 * Owns the datagram socket, hands every received datagram to the codec and
 * sends the codec's bytes back to the sender. Datagrams the codec rejects
 * get no reply. Runs on the event loop of the owning thread.
 */
class DiscoveryListener final : public QObject {
    Q_OBJECT

public:
    explicit DiscoveryListener(std::shared_ptr<const protocol::DiscoveryCodec> codec,
                               QObject* parent = nullptr);
    ~DiscoveryListener() override;

    /**
     * Bind to `port` on all IPv4 interfaces (0 picks an ephemeral port).
     * @return The bound port
     */
    Result<quint16, Error> start(quint16 port = protocol::DEFAULT_DISCOVERY_PORT);

    /**
     * Close the socket. Safe to call when not listening.
     */
    void stop();

    [[nodiscard]] bool isListening() const;
    [[nodiscard]] quint16 port() const;

    [[nodiscard]] quint64 answeredCount() const { return answered_; }
    [[nodiscard]] quint64 rejectedCount() const { return rejected_; }

signals:
    void requestAnswered(const QHostAddress& sender, quint16 senderPort);
    void requestRejected(const QHostAddress& sender, quint16 senderPort, const QString& reason);
    void error(const QString& message);

private slots:
    void onReadyRead();

private:
    void handleDatagram(const QByteArray& datagram, const QHostAddress& sender, quint16 senderPort);

    std::shared_ptr<const protocol::DiscoveryCodec> codec_;
    std::unique_ptr<QUdpSocket> socket_;
    quint64 answered_ = 0;
    quint64 rejected_ = 0;
};

} // namespace wsbeacon::network
