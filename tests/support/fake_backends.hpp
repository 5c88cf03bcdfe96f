#pragma once

#include <QCoreApplication>
#include <QElapsedTimer>

#include <functional>
#include <map>
#include <optional>
#include <vector>

#include "network/connection_manager.hpp"
#include "network/discovery.hpp"
#include "storage/passcode_store.hpp"

namespace lanlog::testing {

inline bool spinUntil(const std::function<bool()>& predicate, int timeoutMs) {
    QElapsedTimer timer;
    timer.start();
    while (!predicate()) {
        if (timer.elapsed() > timeoutMs) {
            return false;
        }
        QCoreApplication::processEvents(QEventLoop::AllEvents, 25);
    }
    return true;
}

inline void spinFor(int ms) {
    QElapsedTimer timer;
    timer.start();
    while (timer.elapsed() < ms) {
        QCoreApplication::processEvents(QEventLoop::AllEvents, 10);
    }
}

inline network::PeerInfo makePeer(const QString& name, bool isProtected = false) {
    network::PeerInfo peer;
    peer.endpoint = network::ServiceEndpoint{name, QStringLiteral("_lanlog._tcp"),
                                             QStringLiteral("local")};
    peer.metadata = network::TxtRecord{
        {QStringLiteral("protected"), isProtected ? QStringLiteral("true") : QStringLiteral("false")}};
    peer.port = 4000;
    return peer;
}

/**
 * Discovery backend driven by the test. Counts calls and can be told to fail
 * the next start_browsing().
 */
class FakeDiscoveryBackend final : public network::DiscoveryBackend {
public:
    Result<void, DiscoveryError> start_advertising(const network::ServiceInfo& info) override {
        advertised = info;
        return Result<void, DiscoveryError>::ok();
    }

    void stop_advertising() override { advertised.reset(); }

    Result<void, DiscoveryError> start_browsing() override {
        ++start_calls;
        if (fail_starts > 0) {
            --fail_starts;
            return Result<void, DiscoveryError>::err(start_error);
        }
        browsing = true;
        return Result<void, DiscoveryError>::ok();
    }

    void stop_browsing() override {
        ++stop_calls;
        browsing = false;
    }

    void discover(const network::PeerInfo& peer) {
        if (on_peer_discovered) on_peer_discovered(peer);
    }

    void update(const network::PeerInfo& peer) {
        if (on_peer_updated) on_peer_updated(peer);
    }

    void lose(const network::Endpoint& endpoint) {
        if (on_peer_lost) on_peer_lost(endpoint);
    }

    void fail(DiscoveryError error) {
        if (on_error) on_error(std::move(error));
    }

    int start_calls = 0;
    int stop_calls = 0;
    int fail_starts = 0;
    DiscoveryError start_error{DiscoveryErrorKind::Unavailable, QStringLiteral("no network")};
    bool browsing = false;
    std::optional<network::ServiceInfo> advertised;
};

/**
 * Connection backend that never touches the network. The test decides how
 * each attempt ends.
 */
class FakeConnectionBackend final : public network::ConnectionBackend {
public:
    struct Open {
        network::AttemptId id = 0;
        network::PeerInfo peer;
        std::optional<QString> passcode;
    };

    void open(network::AttemptId id, const network::PeerInfo& peer,
              const std::optional<QString>& passcode) override {
        opens.push_back(Open{id, peer, passcode});
    }

    void close(network::AttemptId id) override { closes.push_back(id); }

    void establish(network::AttemptId id) {
        if (on_established) on_established(id);
    }

    void failAttempt(network::AttemptId id, ConnectionErrorKind kind) {
        if (on_failed) on_failed(id, ConnectionError{kind, QString()});
    }

    void closeByPeer(network::AttemptId id) {
        if (on_closed) on_closed(id);
    }

    [[nodiscard]] network::AttemptId lastId() const {
        return opens.empty() ? 0 : opens.back().id;
    }

    std::vector<Open> opens;
    std::vector<network::AttemptId> closes;
};

class MemoryPasscodeStore final : public storage::PasscodeStore {
public:
    std::optional<QString> get(const QString& name) const override {
        auto it = values.find(name);
        if (it == values.end()) return std::nullopt;
        return it->second;
    }

    Result<void, Error> set(const QString& name, const QString& passcode) override {
        values[name] = passcode;
        return Result<void, Error>::ok();
    }

    Result<void, Error> remove(const QString& name) override {
        values.erase(name);
        return Result<void, Error>::ok();
    }

    std::map<QString, QString> values;
};

} // namespace lanlog::testing
