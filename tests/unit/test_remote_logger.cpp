#include <catch2/catch_test_macros.hpp>

#include <QSettings>
#include <QTemporaryDir>

#include <algorithm>

#include "core/config.hpp"
#include "service/remote_logger.hpp"
#include "support/fake_backends.hpp"

using namespace lanlog;
using namespace lanlog::network;
using namespace lanlog::service;
using lanlog::testing::FakeConnectionBackend;
using lanlog::testing::FakeDiscoveryBackend;
using lanlog::testing::MemoryPasscodeStore;
using lanlog::testing::makePeer;
using lanlog::testing::spinFor;
using lanlog::testing::spinUntil;

namespace {

struct LoggerFixture {
    explicit LoggerFixture(const QString& remembered = QString()) {
        REQUIRE(dir.isValid());
        settings = std::make_unique<QSettings>(dir.filePath(QStringLiteral("settings.ini")),
                                               QSettings::IniFormat);
        if (!remembered.isEmpty()) {
            settings->setValue(QString::fromLatin1(settings_keys::kSelectedServer), remembered);
        }

        auto discoveryBackend = std::make_unique<FakeDiscoveryBackend>();
        discoveryFake = discoveryBackend.get();
        discovery = std::make_unique<DiscoveryService>(std::move(discoveryBackend));
        discovery->setRestartPolicy(std::chrono::milliseconds(20), std::chrono::milliseconds(100));

        auto connectionBackend = std::make_unique<FakeConnectionBackend>();
        connectionFake = connectionBackend.get();
        connections = std::make_unique<ConnectionManager>(std::move(connectionBackend), passcodes,
                                                          std::chrono::milliseconds(10000));

        logger = std::make_unique<RemoteLogger>(*discovery, *connections, passcodes, *settings,
                                                std::chrono::milliseconds(40));
        QObject::connect(logger.get(), &RemoteLogger::connectionResult,
                         [this](const ConnectionOutcome& outcome) { outcomes.push_back(outcome); });
    }

    ~LoggerFixture() {
        logger.reset();
        connections.reset();
        discovery.reset();
    }

    QStringList serverNames() const {
        QStringList names;
        for (const auto& entry : logger->servers()) {
            names << entry.name;
        }
        return names;
    }

    QTemporaryDir dir;
    std::unique_ptr<QSettings> settings;
    MemoryPasscodeStore passcodes;
    FakeDiscoveryBackend* discoveryFake = nullptr;
    FakeConnectionBackend* connectionFake = nullptr;
    std::unique_ptr<DiscoveryService> discovery;
    std::unique_ptr<ConnectionManager> connections;
    std::unique_ptr<RemoteLogger> logger;
    std::vector<ConnectionOutcome> outcomes;
};

} // namespace

TEST_CASE("RemoteLogger: rapid toggles collapse into one change", "[remote]") {
    LoggerFixture fx;
    int enabledChanges = 0;
    QObject::connect(fx.logger.get(), &RemoteLogger::enabledChanged, [&]() { ++enabledChanges; });

    fx.logger->setEnabled(true);
    fx.logger->setEnabled(false);
    fx.logger->setEnabled(true);
    REQUIRE_FALSE(fx.logger->isEnabled());

    REQUIRE(spinUntil([&]() { return fx.logger->isEnabled(); }, 2000));
    spinFor(120);

    REQUIRE(enabledChanges == 1);
    REQUIRE(fx.discoveryFake->start_calls == 1);
    REQUIRE(fx.settings->value(QString::fromLatin1(settings_keys::kEnabled)).toBool());
}

TEST_CASE("RemoteLogger: toggles that end on the current state do nothing", "[remote]") {
    LoggerFixture fx;
    fx.logger->setEnabled(true);
    fx.logger->setEnabled(false);
    spinFor(150);

    REQUIRE_FALSE(fx.logger->isEnabled());
    REQUIRE(fx.discoveryFake->start_calls == 0);
    REQUIRE(fx.discoveryFake->stop_calls == 0);
}

TEST_CASE("RemoteLogger: server list follows discovery in name order", "[remote]") {
    LoggerFixture fx;
    fx.logger->enable();

    fx.discoveryFake->discover(makePeer(QStringLiteral("Zed")));
    fx.discoveryFake->discover(makePeer(QStringLiteral("alpha"), true));
    fx.discoveryFake->discover(makePeer(QStringLiteral("Zed")));

    REQUIRE(fx.serverNames() == QStringList{QStringLiteral("alpha"), QStringLiteral("Zed")});
    REQUIRE(fx.logger->servers()[0].is_protected);
    REQUIRE_FALSE(fx.logger->servers()[1].is_protected);

    fx.discoveryFake->lose(makePeer(QStringLiteral("alpha")).endpoint);
    REQUIRE(fx.serverNames() == QStringList{QStringLiteral("Zed")});
}

TEST_CASE("RemoteLogger: disabling clears everything", "[remote]") {
    LoggerFixture fx;
    fx.logger->enable();
    fx.discoveryFake->discover(makePeer(QStringLiteral("Desk")));
    fx.logger->connectToServer(makePeer(QStringLiteral("Desk")).endpoint);
    fx.connectionFake->establish(fx.connectionFake->lastId());
    REQUIRE(fx.logger->selectedServerName() == QStringLiteral("Desk"));

    fx.logger->disable();

    REQUIRE_FALSE(fx.logger->isEnabled());
    REQUIRE(fx.logger->servers().empty());
    REQUIRE_FALSE(fx.logger->selectedServerName().has_value());
    REQUIRE_FALSE(fx.discoveryFake->browsing);
    REQUIRE_FALSE(fx.discovery->isBrowsing());
}

TEST_CASE("RemoteLogger: subscriber may disable from a discovery update", "[remote]") {
    LoggerFixture fx;
    fx.logger->enable();

    int disables = 0;
    fx.logger->subscribe([&](const RemoteLoggerState& state) {
        if (state.enabled && !state.servers.empty()) {
            ++disables;
            fx.logger->disable();
        }
    });

    fx.discoveryFake->discover(makePeer(QStringLiteral("Desk")));
    fx.discoveryFake->update(makePeer(QStringLiteral("Desk"), true));
    fx.discoveryFake->discover(makePeer(QStringLiteral("Lab")));

    REQUIRE(disables == 1);
    REQUIRE_FALSE(fx.logger->isEnabled());
    REQUIRE(fx.logger->servers().empty());
    REQUIRE_FALSE(fx.discovery->isBrowsing());
    REQUIRE(fx.discovery->peers().empty());
    REQUIRE(fx.discoveryFake->stop_calls == 1);
}

TEST_CASE("RemoteLogger: at most one server is selected", "[remote]") {
    LoggerFixture fx;
    fx.logger->enable();
    fx.discoveryFake->discover(makePeer(QStringLiteral("A")));
    fx.discoveryFake->discover(makePeer(QStringLiteral("B")));

    fx.logger->connectToServer(makePeer(QStringLiteral("A")).endpoint);
    fx.connectionFake->establish(fx.connectionFake->lastId());
    fx.logger->connectToServer(makePeer(QStringLiteral("B")).endpoint);
    fx.connectionFake->establish(fx.connectionFake->lastId());

    const auto servers = fx.logger->servers();
    const auto selected = std::count_if(servers.begin(), servers.end(),
                                        [](const ServerEntry& e) { return e.is_selected; });
    REQUIRE(selected == 1);
    REQUIRE(fx.logger->selectedServerName() == QStringLiteral("B"));
    REQUIRE(fx.logger->rememberedServer() == QStringLiteral("B"));
    REQUIRE(fx.settings->value(QString::fromLatin1(settings_keys::kSelectedServer)).toString() ==
            QStringLiteral("B"));
}

TEST_CASE("RemoteLogger: unknown server is reported unreachable", "[remote]") {
    LoggerFixture fx;
    fx.logger->enable();

    fx.logger->connectToServer(makePeer(QStringLiteral("Ghost")).endpoint);

    REQUIRE(fx.outcomes.size() == 1);
    REQUIRE(fx.outcomes[0].error->kind == ConnectionErrorKind::Unreachable);
    REQUIRE(fx.connectionFake->opens.empty());
}

TEST_CASE("RemoteLogger: protected server asks for a passcode", "[remote]") {
    LoggerFixture fx;
    std::vector<PeerInfo> prompts;
    QObject::connect(fx.logger.get(), &RemoteLogger::needsPasscode,
                     [&](const PeerInfo& peer) { prompts.push_back(peer); });

    fx.logger->enable();
    fx.discoveryFake->discover(makePeer(QStringLiteral("Vault"), true));
    fx.logger->connectToServer(makePeer(QStringLiteral("Vault")).endpoint);

    REQUIRE(prompts.size() == 1);
    REQUIRE(fx.connectionFake->opens.empty());

    fx.logger->connectToServer(makePeer(QStringLiteral("Vault")).endpoint, QStringLiteral("1234"));
    fx.connectionFake->establish(fx.connectionFake->lastId());
    REQUIRE(fx.passcodes.get(QStringLiteral("Vault")) == QStringLiteral("1234"));

    REQUIRE(fx.logger->forgetPasscode(QStringLiteral("Vault")).is_ok());
    REQUIRE_FALSE(fx.passcodes.get(QStringLiteral("Vault")).has_value());
}

TEST_CASE("RemoteLogger: browser error is published and cleared", "[remote]") {
    LoggerFixture fx;
    fx.discoveryFake->fail_starts = 1;
    fx.discoveryFake->start_error =
        DiscoveryError{DiscoveryErrorKind::PermissionDenied, QStringLiteral("denied")};

    std::vector<RemoteLoggerState> states;
    auto subscription = fx.logger->subscribe(
        [&](const RemoteLoggerState& state) { states.push_back(state); });

    fx.logger->enable();
    REQUIRE(fx.logger->browserError().has_value());
    REQUIRE(fx.logger->browserError()->kind == DiscoveryErrorKind::PermissionDenied);

    REQUIRE(spinUntil([&]() { return !fx.logger->browserError().has_value(); }, 2000));
    REQUIRE(fx.discoveryFake->start_calls == 2);
    REQUIRE(fx.discovery->isBrowsing());

    REQUIRE_FALSE(states.empty());
    const bool sawError = std::any_of(states.begin(), states.end(),
        [](const RemoteLoggerState& s) { return s.browser_error.has_value(); });
    REQUIRE(sawError);
    REQUIRE_FALSE(states.back().browser_error.has_value());

    QObject::disconnect(subscription);
    const auto before = states.size();
    fx.logger->disable();
    REQUIRE(states.size() == before);
}

TEST_CASE("RemoteLogger: remembered server reconnects when it appears", "[remote]") {
    LoggerFixture fx(QStringLiteral("Desk"));
    fx.logger->enable();
    REQUIRE(fx.connectionFake->opens.empty());

    fx.discoveryFake->discover(makePeer(QStringLiteral("Other")));
    REQUIRE(fx.connectionFake->opens.empty());

    fx.discoveryFake->discover(makePeer(QStringLiteral("Desk")));
    REQUIRE(fx.connectionFake->opens.size() == 1);
    REQUIRE(fx.connectionFake->opens[0].peer.name() == QStringLiteral("Desk"));

    // A failed auto attempt is not retried while the server stays visible.
    fx.connectionFake->failAttempt(fx.connectionFake->lastId(), ConnectionErrorKind::Unreachable);
    fx.discoveryFake->discover(makePeer(QStringLiteral("Third")));
    REQUIRE(fx.connectionFake->opens.size() == 1);

    // It is retried once after the server comes back.
    fx.discoveryFake->lose(makePeer(QStringLiteral("Desk")).endpoint);
    fx.discoveryFake->discover(makePeer(QStringLiteral("Desk")));
    REQUIRE(fx.connectionFake->opens.size() == 2);
}

TEST_CASE("RemoteLogger: protected remembered server without passcode is skipped", "[remote]") {
    LoggerFixture fx(QStringLiteral("Vault"));
    std::vector<PeerInfo> prompts;
    QObject::connect(fx.logger.get(), &RemoteLogger::needsPasscode,
                     [&](const PeerInfo& peer) { prompts.push_back(peer); });

    fx.logger->enable();
    fx.discoveryFake->discover(makePeer(QStringLiteral("Vault"), true));

    REQUIRE(fx.connectionFake->opens.empty());
    REQUIRE(prompts.empty());
}

TEST_CASE("RemoteLogger: explicit disconnect forgets the server", "[remote]") {
    LoggerFixture fx(QStringLiteral("Desk"));
    fx.logger->enable();
    fx.discoveryFake->discover(makePeer(QStringLiteral("Desk")));
    fx.connectionFake->establish(fx.connectionFake->lastId());
    REQUIRE(fx.logger->isSelected(makePeer(QStringLiteral("Desk")).endpoint));

    fx.logger->disconnectFromServer();

    REQUIRE_FALSE(fx.logger->selectedServerName().has_value());
    REQUIRE(fx.logger->rememberedServer().isEmpty());
    REQUIRE_FALSE(fx.settings->contains(QString::fromLatin1(settings_keys::kSelectedServer)));
}

TEST_CASE("RemoteLogger: restore applies the persisted flag", "[remote]") {
    LoggerFixture fx;
    fx.settings->setValue(QString::fromLatin1(settings_keys::kEnabled), true);

    fx.logger->restore();

    REQUIRE(fx.logger->isEnabled());
    REQUIRE(fx.discovery->isBrowsing());
}
