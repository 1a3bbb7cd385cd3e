#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <QHostAddress>
#include <QString>

namespace wsbeacon::network {

// Helpers for the single IPv4 address the server announces.

/**
 * Parse a dotted-quad IPv4 address ("192.168.1.10").
 */
Result<Ipv4Octets, Error> parse_ipv4(const QString& text);

/**
 * First interface that is up, running and not loopback, with an IPv4 entry.
 */
Result<Ipv4Octets, Error> detect_local_ipv4();

QHostAddress to_host_address(const Ipv4Octets& octets);

QString format_ipv4(const Ipv4Octets& octets);

} // namespace wsbeacon::network
