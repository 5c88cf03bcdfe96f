#pragma once

#include "core/types.hpp"

#include <QHostAddress>
#include <QMetaType>
#include <QString>
#include <map>
#include <optional>
#include <tuple>
#include <variant>

class QDebug;

namespace lanlog::network {

/**
 * ServiceEndpoint - a DNS-SD service instance (name.type.domain).
 *
 * The interface the service was seen on is deliberately absent: a service
 * visible over IPv4 and IPv6, or on two interfaces, is one peer.
 */
struct ServiceEndpoint {
    QString name;
    QString type;
    QString domain;

    bool operator==(const ServiceEndpoint&) const = default;
    bool operator<(const ServiceEndpoint& other) const {
        return std::tie(name, type, domain) < std::tie(other.name, other.type, other.domain);
    }
};

/**
 * HostPortEndpoint - a peer addressed directly, without a service name.
 */
struct HostPortEndpoint {
    QString host;
    uint16_t port = 0;

    bool operator==(const HostPortEndpoint&) const = default;
    bool operator<(const HostPortEndpoint& other) const {
        return std::tie(host, port) < std::tie(other.host, other.port);
    }
};

/**
 * UnknownEndpoint - anything a backend reports that is not one of the above.
 */
struct UnknownEndpoint {
    QString description;

    bool operator==(const UnknownEndpoint&) const = default;
    bool operator<(const UnknownEndpoint& other) const {
        return description < other.description;
    }
};

/**
 * Endpoint - peer identity. Default-constructs to UnknownEndpoint.
 */
using Endpoint = std::variant<UnknownEndpoint, ServiceEndpoint, HostPortEndpoint>;

/**
 * Service instance name for ServiceEndpoint; nullopt for every other kind.
 */
[[nodiscard]] std::optional<QString> service_name(const Endpoint& endpoint);

[[nodiscard]] QString to_string(const Endpoint& endpoint);

/**
 * TXT record of an advertisement.
 */
using TxtRecord = std::map<QString, QString>;

/**
 * Metadata - advertised metadata; monostate when the backend had none.
 */
using Metadata = std::variant<std::monostate, TxtRecord>;

inline constexpr const char* kProtectedKey = "protected";

/**
 * True only when the TXT record has "protected" equal to the literal "true".
 * Absent metadata, an absent key, and any other value ("True", "1", "") are false.
 */
[[nodiscard]] bool is_protected(const Metadata& metadata);

/**
 * PeerInfo - one discovered peer.
 */
struct PeerInfo {
    Endpoint endpoint;
    Metadata metadata;
    QHostAddress host;
    uint16_t port = 0;
    Timestamp last_seen;

    [[nodiscard]] std::optional<QString> name() const { return service_name(endpoint); }
    [[nodiscard]] bool isProtected() const { return is_protected(metadata); }

    // Identity comparison; attributes are not considered.
    bool operator==(const PeerInfo& other) const {
        return endpoint == other.endpoint;
    }
};

// Placeholder shown for peers without a service name.
inline const QString kUnnamedPeer = QStringLiteral("–");

[[nodiscard]] QString display_name(const PeerInfo& peer);

} // namespace lanlog::network

QDebug operator<<(QDebug debug, const lanlog::network::Endpoint& endpoint);

Q_DECLARE_METATYPE(lanlog::network::Endpoint)
Q_DECLARE_METATYPE(lanlog::network::PeerInfo)
