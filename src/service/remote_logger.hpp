#pragma once

#include "core/debouncer.hpp"
#include "core/errors.hpp"
#include "core/result.hpp"
#include "network/connection_manager.hpp"
#include "network/discovery.hpp"
#include "network/peer_registry.hpp"

#include <QMetaObject>
#include <QObject>
#include <chrono>
#include <functional>
#include <optional>
#include <vector>

class QSettings;

namespace lanlog::storage {
class PasscodeStore;
}

namespace lanlog::service {

/**
 * One row of the server list.
 */
struct ServerEntry {
    network::Endpoint identity;
    QString name;
    bool is_protected = false;
    bool is_selected = false;

    bool operator==(const ServerEntry&) const = default;
};

/**
 * Immutable snapshot of everything an observer can see.
 */
struct RemoteLoggerState {
    bool enabled = false;
    std::vector<ServerEntry> servers;
    std::optional<QString> selected_server_name;
    std::optional<DiscoveryError> browser_error;
    bool connecting = false;
};

/**
 * RemoteLogger - ties discovery, the peer registry and the connection manager
 * to the enabled toggle.
 *
 * Enabled: browsing runs, the server list follows discovery, and the last
 * server the user connected to is reconnected when it shows up.
 * Disabled: no browsing, no connection, empty server list.
 *
 * Every change is published as a RemoteLoggerState through stateChanged() and
 * to subscribe() callbacks, on the thread that owns this object.
 */
class RemoteLogger : public QObject {
    Q_OBJECT

    Q_PROPERTY(bool enabled READ isEnabled WRITE setEnabled NOTIFY enabledChanged)
    Q_PROPERTY(int serverCount READ serverCount NOTIFY serversChanged)

public:
    using Callback = std::function<void(const RemoteLoggerState&)>;

    RemoteLogger(network::DiscoveryService& discovery,
                 network::ConnectionManager& connections,
                 storage::PasscodeStore& passcodes,
                 QSettings& settings,
                 std::chrono::milliseconds toggle_debounce,
                 QObject* parent = nullptr);
    ~RemoteLogger() override;

    // Debounced; the last value in the quiet window wins.
    void setEnabled(bool enabled);

    void enable();
    void disable();

    // Re-apply the persisted enabled flag.
    void restore();

    void connectToServer(const network::Endpoint& identity);
    void connectToServer(const network::Endpoint& identity, const QString& passcode);
    void disconnectFromServer();
    Result<void, Error> forgetPasscode(const QString& name);

    [[nodiscard]] bool isEnabled() const { return enabled_; }
    [[nodiscard]] std::vector<ServerEntry> servers() const;
    [[nodiscard]] int serverCount() const { return static_cast<int>(registry_.size()); }
    [[nodiscard]] std::optional<QString> selectedServerName() const;
    [[nodiscard]] std::optional<DiscoveryError> browserError() const { return browser_error_; }
    [[nodiscard]] bool isSelected(const network::Endpoint& identity) const;
    [[nodiscard]] std::optional<network::PeerInfo> server(const network::Endpoint& identity) const;
    [[nodiscard]] std::optional<network::PeerInfo> serverNamed(const QString& name) const;
    [[nodiscard]] QString rememberedServer() const { return remembered_server_; }
    [[nodiscard]] RemoteLoggerState snapshot() const;

    /**
     * Call `callback` with a fresh snapshot after every state change.
     * Disconnect the returned handle to unsubscribe.
     */
    QMetaObject::Connection subscribe(Callback callback);

signals:
    void stateChanged(const lanlog::service::RemoteLoggerState& state);
    void enabledChanged(bool enabled);
    void serversChanged();
    void selectionChanged();
    void browserErrorChanged();
    void needsPasscode(const lanlog::network::PeerInfo& peer);
    void connectionResult(const lanlog::network::ConnectionOutcome& outcome);

private:
    void applySettled(bool enabled);
    void onPeersChanged();
    void onAttemptFinished(const network::ConnectionOutcome& outcome);
    void maybeReconnect();
    void reportUnknownServer(const network::Endpoint& identity);
    void rememberServer(const QString& name);
    void persistEnabled();
    void publish();

    network::DiscoveryService& discovery_;
    network::ConnectionManager& connections_;
    storage::PasscodeStore& passcodes_;
    QSettings& settings_;

    ToggleDebouncer debouncer_;
    network::PeerRegistry registry_;

    bool enabled_ = false;
    std::optional<DiscoveryError> browser_error_;
    QString remembered_server_;
    // Identity already auto-connected during its current appearance.
    std::optional<network::Endpoint> auto_attempted_;
};

} // namespace lanlog::service

Q_DECLARE_METATYPE(lanlog::service::RemoteLoggerState)
