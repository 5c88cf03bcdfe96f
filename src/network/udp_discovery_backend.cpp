#include "network/udp_discovery_backend.hpp"
#include "network/discovery_datagram.hpp"
#include "core/logging.hpp"

#include <QByteArray>
#include <QTimer>
#include <QUdpSocket>

namespace lanlog::network {
namespace {

const QHostAddress kMulticastGroup(QStringLiteral("239.255.77.78"));

DiscoveryErrorKind classify(QAbstractSocket::SocketError error) {
    switch (error) {
        case QAbstractSocket::SocketAccessError:
            return DiscoveryErrorKind::PermissionDenied;
        case QAbstractSocket::AddressInUseError:
        case QAbstractSocket::SocketAddressNotAvailableError:
        case QAbstractSocket::NetworkError:
        case QAbstractSocket::UnsupportedSocketOperationError:
            return DiscoveryErrorKind::Unavailable;
        default:
            return DiscoveryErrorKind::Failure;
    }
}

} // namespace

UdpDiscoveryBackend::UdpDiscoveryBackend(QString service_type, QObject* parent)
    : QObject(parent)
    , service_type_(std::move(service_type))
    , advertise_timer_(std::make_unique<QTimer>(this))
    , prune_timer_(std::make_unique<QTimer>(this))
{
    advertise_timer_->setInterval(ADVERTISE_INTERVAL_MS);
    prune_timer_->setInterval(PRUNE_INTERVAL_MS);

    connect(advertise_timer_.get(), &QTimer::timeout, this, &UdpDiscoveryBackend::onAdvertiseTick);
    connect(prune_timer_.get(), &QTimer::timeout, this, &UdpDiscoveryBackend::onPruneTick);
}

UdpDiscoveryBackend::~UdpDiscoveryBackend() {
    on_peer_lost = nullptr;
    stop_advertising();
    stop_browsing();
}

Result<void, DiscoveryError> UdpDiscoveryBackend::ensureSocket() {
    if (socket_) {
        return Result<void, DiscoveryError>::ok();
    }

    socket_ = std::make_unique<QUdpSocket>(this);
    socket_->setSocketOption(QAbstractSocket::MulticastTtlOption, 1);

    if (!socket_->bind(QHostAddress::AnyIPv4,
                       DISCOVERY_PORT,
                       QUdpSocket::ShareAddress | QUdpSocket::ReuseAddressHint)) {
        DiscoveryError err{classify(socket_->error()), socket_->errorString()};
        socket_.reset();
        return Result<void, DiscoveryError>::err(std::move(err));
    }

    if (!socket_->joinMulticastGroup(kMulticastGroup)) {
        // Broadcast still works; only log.
        qCWarning(lcDiscovery) << "udp: cannot join multicast group:" << socket_->errorString();
    }
    connect(socket_.get(), &QUdpSocket::readyRead, this, &UdpDiscoveryBackend::onReadyRead);
    connect(socket_.get(), &QUdpSocket::errorOccurred, this,
            [this](QAbstractSocket::SocketError error) {
                if (!browsing_ || error == QAbstractSocket::TemporaryError) {
                    return;
                }
                // Delivered queued: the handler may tear the socket down.
                const DiscoveryError err{classify(error), socket_->errorString()};
                QTimer::singleShot(0, this, [this, err]() {
                    if (browsing_ && on_error) on_error(err);
                });
            });

    return Result<void, DiscoveryError>::ok();
}

void UdpDiscoveryBackend::closeSocket() {
    if (!socket_) return;
    // May run from a callback inside onReadyRead(), i.e. during the socket's
    // own readyRead emission, so the object is only deleted once control is
    // back in the event loop.
    QUdpSocket* socket = socket_.release();
    socket->disconnect(this);
    socket->leaveMulticastGroup(kMulticastGroup);
    socket->close();
    socket->deleteLater();
}

Result<void, DiscoveryError> UdpDiscoveryBackend::start_advertising(const ServiceInfo& info) {
    auto socket = ensureSocket();
    if (socket.is_err()) return socket;

    advertised_ = info;
    if (advertised_.type.isEmpty()) {
        advertised_.type = service_type_;
    }
    advertising_ = true;
    advertise_timer_->start();
    announceOnce();
    return Result<void, DiscoveryError>::ok();
}

void UdpDiscoveryBackend::stop_advertising() {
    advertising_ = false;
    advertise_timer_->stop();
    if (!browsing_) {
        closeSocket();
    }
}

Result<void, DiscoveryError> UdpDiscoveryBackend::start_browsing() {
    auto socket = ensureSocket();
    if (socket.is_err()) return socket;

    browsing_ = true;
    prune_timer_->start();
    return Result<void, DiscoveryError>::ok();
}

void UdpDiscoveryBackend::stop_browsing() {
    browsing_ = false;
    prune_timer_->stop();

    auto lost = std::move(peers_);
    peers_.clear();
    if (on_peer_lost) {
        for (const auto& [endpoint, info] : lost) {
            on_peer_lost(endpoint);
        }
    }

    if (!advertising_) {
        closeSocket();
    }
}

void UdpDiscoveryBackend::onReadyRead() {
    QUdpSocket* socket = socket_.get();
    if (!socket) return;

    // Peer callbacks may stop browsing and close the socket; stop reading
    // as soon as this socket is no longer the active one.
    while (socket_.get() == socket && socket->hasPendingDatagrams()) {
        QByteArray datagram;
        datagram.resize(static_cast<qsizetype>(socket->pendingDatagramSize()));

        QHostAddress sender;
        socket->readDatagram(datagram.data(), datagram.size(), &sender, nullptr);

        if (!browsing_) {
            continue;
        }

        auto decoded = decode_discovery_datagram(datagram, sender);
        if (decoded.is_err()) {
            qCDebug(lcDiscovery) << "udp: ignoring datagram from" << sender.toString()
                                 << QString::fromStdString(decoded.unwrap_err().message);
            continue;
        }

        auto info = std::move(decoded).unwrap();
        const auto* service = std::get_if<ServiceEndpoint>(&info.endpoint);
        if (!service || service->type != service_type_) {
            continue;
        }

        auto it = peers_.find(info.endpoint);
        if (it == peers_.end()) {
            peers_.emplace(info.endpoint, info);
            if (on_peer_discovered) on_peer_discovered(info);
        } else {
            it->second = info;
            // Every announcement refreshes presence.
            if (on_peer_updated) on_peer_updated(info);
        }
    }
}

void UdpDiscoveryBackend::announceOnce() {
    if (!socket_ || !advertising_) return;

    const auto bytes = encode_discovery_datagram(advertised_);

    // Multicast (preferred)
    socket_->writeDatagram(bytes, kMulticastGroup, DISCOVERY_PORT);

    // Broadcast (helps on networks without multicast)
    socket_->writeDatagram(bytes, QHostAddress::Broadcast, DISCOVERY_PORT);
}

void UdpDiscoveryBackend::onAdvertiseTick() {
    announceOnce();
}

void UdpDiscoveryBackend::onPruneTick() {
    if (!browsing_) return;

    const auto now = Timestamp::now();
    std::vector<Endpoint> expired;

    for (const auto& [endpoint, info] : peers_) {
        if ((now - info.last_seen).count() > PEER_TTL_MS) {
            expired.push_back(endpoint);
        }
    }

    for (const auto& endpoint : expired) {
        peers_.erase(endpoint);
        if (on_peer_lost) on_peer_lost(endpoint);
    }
}

} // namespace lanlog::network
