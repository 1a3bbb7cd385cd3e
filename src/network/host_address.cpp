#include "network/host_address.hpp"

#include <QAbstractSocket>
#include <QNetworkAddressEntry>
#include <QNetworkInterface>

namespace wsbeacon::network {
namespace {

Ipv4Octets from_ipv4_int(quint32 value) {
    return Ipv4Octets{
        static_cast<uint8_t>((value >> 24) & 0xFF),
        static_cast<uint8_t>((value >> 16) & 0xFF),
        static_cast<uint8_t>((value >> 8) & 0xFF),
        static_cast<uint8_t>(value & 0xFF),
    };
}

} // namespace

Result<Ipv4Octets, Error> parse_ipv4(const QString& text) {
    const auto parts = text.trimmed().split(QLatin1Char('.'));
    if (parts.size() != 4) {
        return Result<Ipv4Octets, Error>::err(
            Error{ErrorCode::InvalidConfig, "invalid IPv4 address: " + text.toStdString()});
    }

    Ipv4Octets octets{};
    for (int i = 0; i < 4; ++i) {
        const auto& part = parts[i];
        bool digits_only = !part.isEmpty() && part.size() <= 3;
        for (const QChar c : part) {
            digits_only = digits_only && c >= QLatin1Char('0') && c <= QLatin1Char('9');
        }

        bool ok = false;
        const int value = part.toInt(&ok, 10);
        if (!digits_only || !ok || value > 255) {
            return Result<Ipv4Octets, Error>::err(
                Error{ErrorCode::InvalidConfig, "invalid IPv4 address: " + text.toStdString()});
        }
        octets[static_cast<size_t>(i)] = static_cast<uint8_t>(value);
    }
    return Result<Ipv4Octets, Error>::ok(octets);
}

Result<Ipv4Octets, Error> detect_local_ipv4() {
    const auto interfaces = QNetworkInterface::allInterfaces();
    for (const auto& iface : interfaces) {
        const auto flags = iface.flags();
        if (!flags.testFlag(QNetworkInterface::IsUp) ||
            !flags.testFlag(QNetworkInterface::IsRunning) ||
            flags.testFlag(QNetworkInterface::IsLoopBack)) {
            continue;
        }
        for (const auto& entry : iface.addressEntries()) {
            const auto ip = entry.ip();
            if (ip.protocol() == QAbstractSocket::IPv4Protocol && !ip.isLoopback()) {
                return Result<Ipv4Octets, Error>::ok(from_ipv4_int(ip.toIPv4Address()));
            }
        }
    }
    return Result<Ipv4Octets, Error>::err(
        Error{ErrorCode::InvalidConfig, "no non-loopback IPv4 interface found; pass --host-ip"});
}

QHostAddress to_host_address(const Ipv4Octets& octets) {
    const quint32 value = (static_cast<quint32>(octets[0]) << 24) |
                          (static_cast<quint32>(octets[1]) << 16) |
                          (static_cast<quint32>(octets[2]) << 8) |
                          static_cast<quint32>(octets[3]);
    return QHostAddress(value);
}

QString format_ipv4(const Ipv4Octets& octets) {
    return to_host_address(octets).toString();
}

} // namespace wsbeacon::network
