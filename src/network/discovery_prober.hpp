#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "protocol/discovery_packet.hpp"

#include <QAbstractSocket>
#include <QHostAddress>
#include <QObject>
#include <memory>

class QUdpSocket;
class QTimer;

namespace wsbeacon::network {

/**
 * ProbeOptions - client side of one discovery exchange.
 */
struct ProbeOptions {
    protocol::ProtocolVariant variant = protocol::ProtocolVariant::AuthenticatedResponse;
    Bytes secret;
    DeviceId device_id;  // nil: a random id per probe
    QHostAddress target = QHostAddress(QHostAddress::Broadcast);
    quint16 port = protocol::DEFAULT_DISCOVERY_PORT;
    int timeout_ms = 3000;
};

/**
 * DiscoveryProber - broadcasts one request and waits for a verified reply.
 *
 * Replies that do not echo our request or fail verification are ignored;
 * the first good one wins. If nothing arrives before the timeout, failed()
 * is emitted with an ErrorCode::Timeout error.
 */
class DiscoveryProber final : public QObject {
    Q_OBJECT

public:
    explicit DiscoveryProber(QObject* parent = nullptr);
    ~DiscoveryProber() override;

    /**
     * Send a request. Only one probe may be in flight.
     */
    Result<void, Error> probe(const ProbeOptions& options);

    void cancel();

    [[nodiscard]] bool isProbing() const { return socket_ != nullptr; }

signals:
    void discovered(const wsbeacon::protocol::DiscoveredEndpoint& endpoint, const QHostAddress& responder);
    void failed(const wsbeacon::Error& error);

private slots:
    void onReadyRead();
    void onTimeout();
    void onSocketError(QAbstractSocket::SocketError socketError);

private:
    void finish();

    std::unique_ptr<QUdpSocket> socket_;
    std::unique_ptr<QTimer> timeout_;
    protocol::ProtocolVariant variant_ = protocol::ProtocolVariant::AuthenticatedResponse;
    Bytes secret_;
    Bytes request_;
};

} // namespace wsbeacon::network
