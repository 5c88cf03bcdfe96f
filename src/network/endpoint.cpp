#include "network/endpoint.hpp"

#include <QDebug>

namespace lanlog::network {

namespace {

template<class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

std::optional<QString> service_name(const Endpoint& endpoint) {
    if (const auto* service = std::get_if<ServiceEndpoint>(&endpoint)) {
        return service->name;
    }
    return std::nullopt;
}

QString to_string(const Endpoint& endpoint) {
    return std::visit(overloaded{
        [](const ServiceEndpoint& e) {
            return QStringLiteral("%1.%2.%3").arg(e.name, e.type, e.domain);
        },
        [](const HostPortEndpoint& e) {
            return QStringLiteral("%1:%2").arg(e.host).arg(e.port);
        },
        [](const UnknownEndpoint& e) {
            return QStringLiteral("unknown(%1)").arg(e.description);
        },
    }, endpoint);
}

bool is_protected(const Metadata& metadata) {
    const auto* record = std::get_if<TxtRecord>(&metadata);
    if (!record) {
        return false;
    }
    const auto it = record->find(QString::fromLatin1(kProtectedKey));
    if (it == record->end()) {
        return false;
    }
    // Boolean parse: only "true" and "false" are valid literals.
    return it->second == QLatin1String("true");
}

QString display_name(const PeerInfo& peer) {
    const auto name = peer.name();
    if (!name || name->isEmpty()) {
        return kUnnamedPeer;
    }
    return *name;
}

} // namespace lanlog::network

QDebug operator<<(QDebug debug, const lanlog::network::Endpoint& endpoint) {
    QDebugStateSaver saver(debug);
    debug.noquote() << lanlog::network::to_string(endpoint);
    return debug;
}
