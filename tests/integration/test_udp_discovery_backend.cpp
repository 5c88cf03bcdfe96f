#include <catch2/catch_test_macros.hpp>

#include <QHostAddress>
#include <QSettings>
#include <QTemporaryDir>
#include <QUdpSocket>

#include "network/discovery_datagram.hpp"
#include "network/udp_discovery_backend.hpp"
#include "service/remote_logger.hpp"
#include "support/fake_backends.hpp"

using namespace lanlog;
using namespace lanlog::network;
using namespace lanlog::service;
using lanlog::testing::FakeConnectionBackend;
using lanlog::testing::MemoryPasscodeStore;
using lanlog::testing::spinFor;
using lanlog::testing::spinUntil;

namespace {

void announce(QUdpSocket& sender, const QString& name) {
    ServiceInfo info{};
    info.name = name;
    info.type = QStringLiteral("_lanlog._tcp");
    info.port = 4000;
    sender.writeDatagram(encode_discovery_datagram(info), QHostAddress::LocalHost,
                         UdpDiscoveryBackend::DISCOVERY_PORT);
}

} // namespace

TEST_CASE("UDP discovery: disabling from a state callback stops reading",
          "[integration][network][discovery]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    QSettings settings(dir.filePath(QStringLiteral("settings.ini")), QSettings::IniFormat);
    MemoryPasscodeStore passcodes;

    DiscoveryService discovery(std::make_unique<UdpDiscoveryBackend>(QStringLiteral("_lanlog._tcp")));
    ConnectionManager connections(std::make_unique<FakeConnectionBackend>(), passcodes,
                                  std::chrono::milliseconds(10000));
    RemoteLogger logger(discovery, connections, passcodes, settings, std::chrono::milliseconds(40));

    logger.enable();
    if (!discovery.isBrowsing()) {
        SKIP("discovery port is not available here");
    }

    int disables = 0;
    logger.subscribe([&](const RemoteLoggerState& state) {
        if (state.enabled && !state.servers.empty()) {
            ++disables;
            logger.disable();
        }
    });

    // Several datagrams queued before the event loop runs, so the first
    // discovery closes the socket while more are still pending.
    QUdpSocket sender;
    announce(sender, QStringLiteral("Desk"));
    announce(sender, QStringLiteral("Kitchen"));
    announce(sender, QStringLiteral("Lab"));

    if (!spinUntil([&]() { return disables > 0; }, 2000)) {
        SKIP("loopback datagrams are not delivered here");
    }
    spinFor(100);

    REQUIRE(disables == 1);
    REQUIRE_FALSE(logger.isEnabled());
    REQUIRE(logger.servers().empty());
    REQUIRE_FALSE(discovery.isBrowsing());
    REQUIRE(discovery.peers().empty());
}

TEST_CASE("UDP discovery: restarting from a discovery callback uses a fresh socket",
          "[integration][network][discovery]") {
    UdpDiscoveryBackend backend(QStringLiteral("_lanlog._tcp"));
    if (backend.start_browsing().is_err()) {
        SKIP("discovery port is not available here");
    }

    std::vector<QString> discovered;
    int restarts = 0;
    bool restarted = false;
    backend.on_peer_discovered = [&](const PeerInfo& peer) {
        discovered.push_back(peer.name().value_or(QString()));
        if (restarts == 0) {
            ++restarts;
            backend.stop_browsing();
            restarted = backend.start_browsing().is_ok();
        }
    };

    QUdpSocket sender;
    announce(sender, QStringLiteral("Desk"));
    announce(sender, QStringLiteral("Kitchen"));

    if (!spinUntil([&]() { return !discovered.empty(); }, 2000)) {
        SKIP("loopback datagrams are not delivered here");
    }
    spinFor(100);

    // Datagrams queued on the old socket are dropped with it.
    REQUIRE(restarts == 1);
    REQUIRE(restarted);
    REQUIRE(discovered.size() == 1);

    announce(sender, QStringLiteral("Lab"));
    REQUIRE(spinUntil([&]() { return discovered.size() == 2; }, 2000));
    REQUIRE(discovered.back() == QStringLiteral("Lab"));

    backend.on_peer_discovered = nullptr;
    backend.stop_browsing();
}
