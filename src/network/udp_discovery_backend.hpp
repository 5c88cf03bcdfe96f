#pragma once

#include "network/discovery.hpp"
#include <QObject>
#include <QHostAddress>
#include <map>
#include <memory>

class QUdpSocket;
class QTimer;

namespace lanlog::network {

/**
 * UDP multicast/broadcast discovery backend.
 *
 * Cross-platform and needs no mDNS daemon. Periodically announces the
 * advertised ServiceInfo and listens for announcements of the configured
 * service type; peers silent for longer than the TTL are reported lost.
 */
class UdpDiscoveryBackend final : public QObject, public DiscoveryBackend {
    Q_OBJECT

public:
    static constexpr quint16 DISCOVERY_PORT = 47778;
    static constexpr int ADVERTISE_INTERVAL_MS = 1500;
    static constexpr int PRUNE_INTERVAL_MS = 1000;
    static constexpr int64_t PEER_TTL_MS = 6000;

    explicit UdpDiscoveryBackend(QString service_type, QObject* parent = nullptr);
    ~UdpDiscoveryBackend() override;

    Result<void, DiscoveryError> start_advertising(const ServiceInfo& info) override;
    void stop_advertising() override;

    Result<void, DiscoveryError> start_browsing() override;
    void stop_browsing() override;

private slots:
    void onReadyRead();
    void onAdvertiseTick();
    void onPruneTick();

private:
    Result<void, DiscoveryError> ensureSocket();
    void closeSocket();
    void announceOnce();

    QString service_type_;
    std::unique_ptr<QUdpSocket> socket_;
    std::unique_ptr<QTimer> advertise_timer_;
    std::unique_ptr<QTimer> prune_timer_;

    bool advertising_ = false;
    bool browsing_ = false;
    ServiceInfo advertised_{};

    std::map<Endpoint, PeerInfo> peers_;
};

} // namespace lanlog::network
