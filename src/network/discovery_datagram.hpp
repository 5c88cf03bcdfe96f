#pragma once

#include "core/result.hpp"
#include "network/discovery.hpp"

#include <QByteArray>
#include <QHostAddress>

namespace lanlog::network {

// UDP announcement helpers (used by UdpDiscoveryBackend).
// Kept separate so encode/decode can be tested without sockets.
//
// Format: {"t":"lanlog","v":1,"name":"...","type":"_lanlog._tcp","port":N,"txt":{...}}

inline constexpr int kDatagramVersion = 1;

QByteArray encode_discovery_datagram(const ServiceInfo& info);

Result<PeerInfo, Error> decode_discovery_datagram(const QByteArray& datagram,
                                                  const QHostAddress& sender);

} // namespace lanlog::network
