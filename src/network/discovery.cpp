#include "network/discovery.hpp"
#include "network/udp_discovery_backend.hpp"
#include "core/logging.hpp"

#include <algorithm>

namespace lanlog::network {

DiscoveryService::DiscoveryService(std::unique_ptr<DiscoveryBackend> backend, QObject* parent)
    : QObject(parent)
    , backend_(std::move(backend))
{
    if (backend_) {
        backend_->on_peer_discovered = [this](PeerInfo peer) {
            handlePeerDiscovered(std::move(peer));
        };
        backend_->on_peer_updated = [this](PeerInfo peer) {
            handlePeerUpdated(std::move(peer));
        };
        backend_->on_peer_lost = [this](Endpoint endpoint) {
            handlePeerLost(endpoint);
        };
        backend_->on_error = [this](DiscoveryError err) {
            handleBackendError(std::move(err));
        };
    }

    restart_timer_.setSingleShot(true);
    connect(&restart_timer_, &QTimer::timeout, this, &DiscoveryService::onRestartTimeout);
}

DiscoveryService::~DiscoveryService() {
    stopAdvertising();
    stopBrowsing();
    if (backend_) {
        backend_->on_peer_discovered = nullptr;
        backend_->on_peer_updated = nullptr;
        backend_->on_peer_lost = nullptr;
        backend_->on_error = nullptr;
    }
}

void DiscoveryService::setRestartPolicy(std::chrono::milliseconds initial_delay,
                                        std::chrono::milliseconds max_delay) {
    initial_restart_delay_ = initial_delay;
    max_restart_delay_ = std::max(initial_delay, max_delay);
    restart_delay_ = initial_restart_delay_;
}

bool DiscoveryService::startAdvertising(const ServiceInfo& info) {
    if (!backend_) {
        reportError(DiscoveryError{DiscoveryErrorKind::Unavailable,
                                   QStringLiteral("Discovery backend not available")});
        return false;
    }

    auto result = backend_->start_advertising(info);
    if (result.is_err()) {
        reportError(result.unwrap_err());
        return false;
    }

    qCInfo(lcDiscovery) << "advertising" << info.name << "type=" << info.type
                        << "port=" << info.port;
    advertising_ = true;
    emit advertisingChanged();
    return true;
}

void DiscoveryService::stopAdvertising() {
    if (backend_ && advertising_) {
        backend_->stop_advertising();
        advertising_ = false;
        emit advertisingChanged();
    }
}

bool DiscoveryService::startBrowsing() {
    wants_browsing_ = true;
    restart_timer_.stop();

    if (browsing_) {
        return true;
    }

    if (!backend_) {
        reportError(DiscoveryError{DiscoveryErrorKind::Unavailable,
                                   QStringLiteral("Discovery backend not available")});
        return false;
    }

    auto result = backend_->start_browsing();
    if (result.is_err()) {
        reportError(result.unwrap_err());
        scheduleRestart();
        return false;
    }

    qCInfo(lcDiscovery) << "browsing started";
    browsing_ = true;
    restart_delay_ = initial_restart_delay_;
    emit browsingChanged();

    if (last_error_) {
        last_error_.reset();
        emit errorCleared();
    }
    return true;
}

void DiscoveryService::stopBrowsing() {
    wants_browsing_ = false;
    restart_timer_.stop();
    restart_delay_ = initial_restart_delay_;

    if (backend_ && browsing_) {
        backend_->stop_browsing();
        browsing_ = false;
        qCInfo(lcDiscovery) << "browsing stopped";
        emit browsingChanged();
    }
    clearPeers();

    if (last_error_) {
        last_error_.reset();
        emit errorCleared();
    }
}

std::optional<PeerInfo> DiscoveryService::peer(const Endpoint& endpoint) const {
    auto it = std::find_if(peers_.begin(), peers_.end(),
        [&](const PeerInfo& p) { return p.endpoint == endpoint; });
    if (it != peers_.end()) {
        return *it;
    }
    return std::nullopt;
}

void DiscoveryService::handlePeerDiscovered(PeerInfo peer) {
    if (!browsing_) return;

    auto it = std::find_if(peers_.begin(), peers_.end(),
        [&](const PeerInfo& p) { return p.endpoint == peer.endpoint; });

    if (it != peers_.end()) {
        // Same identity announced again (another interface, re-resolve).
        handlePeerUpdated(std::move(peer));
        return;
    }

    qCDebug(lcDiscovery) << "peer discovered" << peer.endpoint
                         << "protected=" << peer.isProtected();
    peers_.push_back(peer);
    emit peerDiscovered(peer);
    emit peersChanged();
}

void DiscoveryService::handlePeerUpdated(PeerInfo peer) {
    if (!browsing_) return;

    auto it = std::find_if(peers_.begin(), peers_.end(),
        [&](const PeerInfo& p) { return p.endpoint == peer.endpoint; });

    if (it == peers_.end()) {
        handlePeerDiscovered(std::move(peer));
        return;
    }

    const bool changed = it->metadata != peer.metadata ||
                         it->host != peer.host ||
                         it->port != peer.port;
    *it = peer;
    emit peerUpdated(peer);
    if (changed) {
        emit peersChanged();
    }
}

void DiscoveryService::handlePeerLost(const Endpoint& endpoint) {
    auto it = std::find_if(peers_.begin(), peers_.end(),
        [&](const PeerInfo& p) { return p.endpoint == endpoint; });

    if (it != peers_.end()) {
        qCDebug(lcDiscovery) << "peer lost" << endpoint;
        peers_.erase(it);
        emit peerLost(endpoint);
        emit peersChanged();
    }
}

void DiscoveryService::handleBackendError(DiscoveryError err) {
    qCWarning(lcDiscovery) << "browser failed:" << describe(err);

    if (browsing_) {
        backend_->stop_browsing();
        browsing_ = false;
        emit browsingChanged();
    }
    clearPeers();
    reportError(std::move(err));

    if (wants_browsing_) {
        scheduleRestart();
    }
}

void DiscoveryService::reportError(DiscoveryError err) {
    last_error_ = err;
    emit error(err);
}

void DiscoveryService::scheduleRestart() {
    if (!wants_browsing_) return;

    qCInfo(lcDiscovery) << "retrying discovery in" << restart_delay_.count() << "ms";
    restart_timer_.start(restart_delay_);
    restart_delay_ = std::min(restart_delay_ * 2, max_restart_delay_);
}

void DiscoveryService::onRestartTimeout() {
    if (!wants_browsing_ || browsing_) return;

    auto result = backend_->start_browsing();
    if (result.is_err()) {
        qCWarning(lcDiscovery) << "restart failed:" << describe(result.unwrap_err());
        reportError(result.unwrap_err());
        scheduleRestart();
        return;
    }

    qCInfo(lcDiscovery) << "browsing restarted";
    browsing_ = true;
    restart_delay_ = initial_restart_delay_;
    emit browsingChanged();
    if (last_error_) {
        last_error_.reset();
        emit errorCleared();
    }
}

void DiscoveryService::clearPeers() {
    if (peers_.empty()) return;
    peers_.clear();
    emit peersChanged();
}

std::unique_ptr<DiscoveryBackend> createDiscoveryBackend(const QString& preference,
                                                         const QString& service_type) {
    if (preference == QLatin1String("udp")) {
        return std::make_unique<UdpDiscoveryBackend>(service_type);
    }

#ifdef LANLOG_HAS_AVAHI
    // Implemented in platform/linux/avahi_discovery.cpp
    extern std::unique_ptr<DiscoveryBackend> createAvahiBackend(const QString& service_type);
    return createAvahiBackend(service_type);
#else
    if (preference == QLatin1String("mdns")) {
        qCWarning(lcDiscovery) << "mDNS backend not built; using UDP discovery";
    }
    return std::make_unique<UdpDiscoveryBackend>(service_type);
#endif
}

} // namespace lanlog::network
