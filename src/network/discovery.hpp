#pragma once

#include "core/errors.hpp"
#include "core/result.hpp"
#include "network/endpoint.hpp"

#include <QObject>
#include <QString>
#include <QTimer>
#include <chrono>
#include <functional>
#include <memory>
#include <vector>

namespace lanlog::network {

/**
 * ServiceInfo - what we advertise when acting as a receiving peer.
 */
struct ServiceInfo {
    QString name;
    QString type;
    uint16_t port = 0;
    TxtRecord txt;
};

/**
 * DiscoveryBackend - abstract interface for a platform service browser.
 *
 * Callbacks are invoked on the thread that owns the DiscoveryService; backends
 * that receive events elsewhere must marshal them first.
 */
class DiscoveryBackend {
public:
    virtual ~DiscoveryBackend() = default;

    virtual Result<void, DiscoveryError> start_advertising(const ServiceInfo& info) = 0;
    virtual void stop_advertising() = 0;

    virtual Result<void, DiscoveryError> start_browsing() = 0;
    virtual void stop_browsing() = 0;

    // Callbacks
    std::function<void(PeerInfo)> on_peer_discovered;
    std::function<void(PeerInfo)> on_peer_updated;
    std::function<void(Endpoint)> on_peer_lost;
    std::function<void(DiscoveryError)> on_error;
};

/**
 * DiscoveryService - browses the local network for logging receivers.
 *
 * Keeps a deduplicated, unordered snapshot of live peers. A backend failure is
 * reported once through error(); the service then stops browsing and, while
 * browsing is still wanted, retries with exponential backoff. A successful
 * restart emits errorCleared().
 *
 * Backends:
 * - Linux: Avahi (mDNS/DNS-SD)
 * - Elsewhere, or LANLOG_DISCOVERY_BACKEND=udp: UDP multicast announcements
 */
class DiscoveryService : public QObject {
    Q_OBJECT

    Q_PROPERTY(bool advertising READ isAdvertising NOTIFY advertisingChanged)
    Q_PROPERTY(bool browsing READ isBrowsing NOTIFY browsingChanged)
    Q_PROPERTY(int peerCount READ peerCount NOTIFY peersChanged)

public:
    explicit DiscoveryService(std::unique_ptr<DiscoveryBackend> backend,
                              QObject* parent = nullptr);
    ~DiscoveryService() override;

    bool startAdvertising(const ServiceInfo& info);
    void stopAdvertising();

    /**
     * Start browsing. Returns false (and emits error) when the backend fails;
     * a retry is scheduled in that case.
     */
    bool startBrowsing();

    /**
     * Stop browsing, cancel pending retries and drop all peers.
     */
    void stopBrowsing();

    void setRestartPolicy(std::chrono::milliseconds initial_delay,
                          std::chrono::milliseconds max_delay);

    [[nodiscard]] std::vector<PeerInfo> peers() const { return peers_; }
    [[nodiscard]] std::optional<PeerInfo> peer(const Endpoint& endpoint) const;

    [[nodiscard]] bool isAdvertising() const { return advertising_; }
    [[nodiscard]] bool isBrowsing() const { return browsing_; }
    [[nodiscard]] bool wantsBrowsing() const { return wants_browsing_; }
    [[nodiscard]] int peerCount() const { return static_cast<int>(peers_.size()); }
    [[nodiscard]] const std::optional<DiscoveryError>& lastError() const { return last_error_; }
    [[nodiscard]] std::chrono::milliseconds nextRestartDelay() const { return restart_delay_; }

signals:
    void peerDiscovered(const lanlog::network::PeerInfo& peer);
    void peerUpdated(const lanlog::network::PeerInfo& peer);
    void peerLost(const lanlog::network::Endpoint& endpoint);
    void peersChanged();
    void advertisingChanged();
    void browsingChanged();
    void error(const lanlog::DiscoveryError& error);
    void errorCleared();

private:
    void handlePeerDiscovered(PeerInfo peer);
    void handlePeerUpdated(PeerInfo peer);
    void handlePeerLost(const Endpoint& endpoint);
    void handleBackendError(DiscoveryError error);
    void reportError(DiscoveryError error);
    void scheduleRestart();
    void onRestartTimeout();
    void clearPeers();

    std::unique_ptr<DiscoveryBackend> backend_;
    std::vector<PeerInfo> peers_;
    bool advertising_ = false;
    bool browsing_ = false;
    bool wants_browsing_ = false;

    std::optional<DiscoveryError> last_error_;
    QTimer restart_timer_;
    std::chrono::milliseconds initial_restart_delay_{2000};
    std::chrono::milliseconds max_restart_delay_{30000};
    std::chrono::milliseconds restart_delay_{2000};
};

/**
 * Create the platform-appropriate discovery backend.
 *
 * `preference` is "udp", "mdns" or empty for the platform default.
 */
std::unique_ptr<DiscoveryBackend> createDiscoveryBackend(const QString& preference,
                                                         const QString& service_type);

} // namespace lanlog::network
