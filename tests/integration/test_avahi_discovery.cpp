#include <catch2/catch_test_macros.hpp>

#ifdef LANLOG_HAS_AVAHI

#include <QCoreApplication>

#include <set>

#include "network/discovery.hpp"
#include "support/fake_backends.hpp"

using namespace lanlog;
using namespace lanlog::network;
using lanlog::testing::spinFor;
using lanlog::testing::spinUntil;

namespace {

constexpr auto kTestServiceType = "_lanlog-test._tcp";

struct AvahiPair {
    AvahiPair() {
        advertiser = createDiscoveryBackend(QStringLiteral("mdns"), QString::fromLatin1(kTestServiceType));
        browser = createDiscoveryBackend(QStringLiteral("mdns"), QString::fromLatin1(kTestServiceType));

        browser->on_peer_discovered = [this](const PeerInfo& peer) {
            ++discoveries;
            seen.insert(peer.endpoint);
        };
        browser->on_peer_updated = [this](const PeerInfo& peer) { seen.insert(peer.endpoint); };
        browser->on_peer_lost = [this](const Endpoint& endpoint) {
            ++losses;
            seen.erase(endpoint);
        };
    }

    ~AvahiPair() {
        browser->on_peer_discovered = nullptr;
        browser->on_peer_updated = nullptr;
        browser->on_peer_lost = nullptr;
    }

    std::unique_ptr<DiscoveryBackend> advertiser;
    std::unique_ptr<DiscoveryBackend> browser;
    std::set<Endpoint> seen;
    int discoveries = 0;
    int losses = 0;
};

ServiceInfo testService() {
    ServiceInfo info{};
    info.name = QStringLiteral("lanlog-test-%1").arg(QCoreApplication::applicationPid());
    info.type = QString::fromLatin1(kTestServiceType);
    info.port = 47999;
    info.txt = TxtRecord{{QStringLiteral("protected"), QStringLiteral("false")}};
    return info;
}

} // namespace

TEST_CASE("Avahi discovery: nothing is reported after browsing stops",
          "[integration][network][discovery][avahi]") {
    AvahiPair pair;
    const auto advertised = pair.advertiser->start_advertising(testService());
    if (advertised.is_err()) {
        SKIP("Avahi daemon not reachable: " << describe(advertised.unwrap_err()).toStdString());
    }
    REQUIRE(pair.browser->start_browsing().is_ok());

    if (!spinUntil([&]() { return !pair.seen.empty(); }, 5000)) {
        SKIP("mDNS announcements are not delivered here");
    }

    pair.browser->stop_browsing();
    REQUIRE(pair.seen.empty());
    REQUIRE(pair.losses == 1);

    // Quick restart and stop: resolvers started by either session must not
    // deliver anything once browsing is off.
    REQUIRE(pair.browser->start_browsing().is_ok());
    pair.browser->stop_browsing();

    const int discoveries = pair.discoveries;
    spinFor(1500);
    REQUIRE(pair.discoveries == discoveries);
    REQUIRE(pair.seen.empty());

    // A fresh session still finds the service.
    REQUIRE(pair.browser->start_browsing().is_ok());
    REQUIRE(spinUntil([&]() { return !pair.seen.empty(); }, 5000));
    pair.browser->stop_browsing();
    pair.advertiser->stop_advertising();
}

#endif // LANLOG_HAS_AVAHI
