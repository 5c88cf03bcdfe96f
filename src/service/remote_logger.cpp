#include "service/remote_logger.hpp"
#include "storage/passcode_store.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"

#include <QSettings>

namespace lanlog::service {

using network::ConnectionManager;
using network::ConnectionOutcome;
using network::DiscoveryService;
using network::Endpoint;
using network::PeerInfo;

RemoteLogger::RemoteLogger(DiscoveryService& discovery,
                           ConnectionManager& connections,
                           storage::PasscodeStore& passcodes,
                           QSettings& settings,
                           std::chrono::milliseconds toggle_debounce,
                           QObject* parent)
    : QObject(parent)
    , discovery_(discovery)
    , connections_(connections)
    , passcodes_(passcodes)
    , settings_(settings)
    , debouncer_(toggle_debounce)
{
    remembered_server_ =
        settings_.value(QString::fromLatin1(settings_keys::kSelectedServer)).toString();

    connect(&debouncer_, &ToggleDebouncer::settled, this, &RemoteLogger::applySettled);

    connect(&discovery_, &DiscoveryService::peersChanged, this, &RemoteLogger::onPeersChanged);
    connect(&discovery_, &DiscoveryService::error, this, [this](const DiscoveryError& error) {
        qCWarning(lcRemote) << "browser error:" << describe(error);
        browser_error_ = error;
        emit browserErrorChanged();
        publish();
    });
    connect(&discovery_, &DiscoveryService::errorCleared, this, [this]() {
        if (!browser_error_) return;
        browser_error_.reset();
        emit browserErrorChanged();
        publish();
    });

    connect(&connections_, &ConnectionManager::stateChanged, this, [this]() { publish(); });
    connect(&connections_, &ConnectionManager::selectionChanged, this, [this]() {
        emit selectionChanged();
        publish();
    });
    connect(&connections_, &ConnectionManager::needsPasscode, this, &RemoteLogger::needsPasscode);
    connect(&connections_, &ConnectionManager::attemptFinished,
            this, &RemoteLogger::onAttemptFinished);
    connect(&connections_, &ConnectionManager::disconnected, this, [](const PeerInfo& peer) {
        qCInfo(lcRemote) << "server" << network::display_name(peer) << "went away";
    });
}

RemoteLogger::~RemoteLogger() {
    debouncer_.cancel();
}

void RemoteLogger::setEnabled(bool enabled) {
    debouncer_.push(enabled);
}

void RemoteLogger::applySettled(bool enabled) {
    if (enabled == enabled_) {
        qCDebug(lcRemote) << "toggle settled on current state" << enabled;
        return;
    }
    if (enabled) {
        enable();
    } else {
        disable();
    }
}

void RemoteLogger::enable() {
    debouncer_.cancel();
    if (enabled_) return;

    qCInfo(lcRemote) << "enabling";
    enabled_ = true;
    persistEnabled();
    emit enabledChanged(true);

    // A failed start is reported through DiscoveryService::error and retried.
    discovery_.startBrowsing();
    onPeersChanged();
    publish();
}

void RemoteLogger::disable() {
    debouncer_.cancel();
    if (!enabled_) return;

    qCInfo(lcRemote) << "disabling";
    enabled_ = false;
    persistEnabled();

    connections_.disconnectFromPeer();
    discovery_.stopBrowsing();
    registry_.clear();
    auto_attempted_.reset();
    if (browser_error_) {
        browser_error_.reset();
        emit browserErrorChanged();
    }

    emit enabledChanged(false);
    emit serversChanged();
    publish();
}

void RemoteLogger::restore() {
    const bool enabled =
        settings_.value(QString::fromLatin1(settings_keys::kEnabled), false).toBool();
    qCInfo(lcRemote) << "restoring enabled =" << enabled;
    if (enabled) {
        enable();
    } else {
        disable();
    }
}

void RemoteLogger::connectToServer(const Endpoint& identity) {
    const auto peer = server(identity);
    if (!peer) {
        reportUnknownServer(identity);
        return;
    }
    connections_.connectToPeer(*peer);
}

void RemoteLogger::connectToServer(const Endpoint& identity, const QString& passcode) {
    const auto peer = server(identity);
    if (!peer) {
        reportUnknownServer(identity);
        return;
    }
    connections_.connectToPeer(*peer, passcode);
}

void RemoteLogger::reportUnknownServer(const Endpoint& identity) {
    qCWarning(lcRemote) << "connect to unknown server" << identity;
    PeerInfo unknown;
    unknown.endpoint = identity;
    emit connectionResult(ConnectionOutcome{unknown, ConnectionError{
        ConnectionErrorKind::Unreachable, QStringLiteral("The server is no longer available")}});
}

void RemoteLogger::disconnectFromServer() {
    rememberServer(QString());
    connections_.disconnectFromPeer();
    publish();
}

Result<void, Error> RemoteLogger::forgetPasscode(const QString& name) {
    return passcodes_.remove(name);
}

std::vector<ServerEntry> RemoteLogger::servers() const {
    std::vector<ServerEntry> entries;
    for (const auto& peer : registry_.list()) {
        ServerEntry entry;
        entry.identity = peer.endpoint;
        entry.name = network::display_name(peer);
        entry.is_protected = peer.isProtected();
        entry.is_selected = connections_.isSelected(peer.endpoint);
        entries.push_back(std::move(entry));
    }
    return entries;
}

std::optional<QString> RemoteLogger::selectedServerName() const {
    if (const auto peer = connections_.selectedPeer()) {
        return network::display_name(*peer);
    }
    return std::nullopt;
}

bool RemoteLogger::isSelected(const Endpoint& identity) const {
    return connections_.isSelected(identity);
}

std::optional<PeerInfo> RemoteLogger::server(const Endpoint& identity) const {
    if (!enabled_) {
        return std::nullopt;
    }
    return registry_.find(identity);
}

std::optional<PeerInfo> RemoteLogger::serverNamed(const QString& name) const {
    for (const auto& peer : registry_.list()) {
        if (peer.name() == name) {
            return peer;
        }
    }
    return std::nullopt;
}

RemoteLoggerState RemoteLogger::snapshot() const {
    RemoteLoggerState state;
    state.enabled = enabled_;
    state.servers = servers();
    state.selected_server_name = selectedServerName();
    state.browser_error = browser_error_;
    state.connecting = connections_.state() == ConnectionManager::State::Connecting;
    return state;
}

QMetaObject::Connection RemoteLogger::subscribe(Callback callback) {
    return connect(this, &RemoteLogger::stateChanged, this,
                   [callback = std::move(callback)](const RemoteLoggerState& state) {
                       callback(state);
                   });
}

void RemoteLogger::onPeersChanged() {
    if (!enabled_) return;

    registry_.apply_snapshot(discovery_.peers());
    if (auto_attempted_ && !registry_.contains(*auto_attempted_)) {
        auto_attempted_.reset();
    }

    emit serversChanged();
    // A serversChanged() handler may have disabled us.
    if (!enabled_) return;
    maybeReconnect();
    publish();
}

void RemoteLogger::onAttemptFinished(const ConnectionOutcome& outcome) {
    if (outcome.succeeded()) {
        if (auto name = outcome.peer.name()) {
            rememberServer(*name);
        }
    }
    emit connectionResult(outcome);
    publish();
}

void RemoteLogger::maybeReconnect() {
    if (remembered_server_.isEmpty() ||
        connections_.state() != ConnectionManager::State::Idle ||
        connections_.selectedPeer()) {
        return;
    }

    const auto peer = serverNamed(remembered_server_);
    if (!peer || (auto_attempted_ && *auto_attempted_ == peer->endpoint)) {
        return;
    }
    // Never prompt on our own initiative.
    if (peer->isProtected() && !passcodes_.get(remembered_server_)) {
        return;
    }

    qCInfo(lcRemote) << "reconnecting to remembered server" << remembered_server_;
    auto_attempted_ = peer->endpoint;
    connections_.connectToPeer(*peer);
}

void RemoteLogger::rememberServer(const QString& name) {
    if (remembered_server_ == name) return;
    remembered_server_ = name;

    const auto key = QString::fromLatin1(settings_keys::kSelectedServer);
    if (name.isEmpty()) {
        settings_.remove(key);
    } else {
        settings_.setValue(key, name);
    }
}

void RemoteLogger::persistEnabled() {
    settings_.setValue(QString::fromLatin1(settings_keys::kEnabled), enabled_);
}

void RemoteLogger::publish() {
    emit stateChanged(snapshot());
}

} // namespace lanlog::service
