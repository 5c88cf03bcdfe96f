#pragma once

#include "core/errors.hpp"
#include "network/endpoint.hpp"

#include <QObject>
#include <QTimer>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>

namespace lanlog::storage {
class PasscodeStore;
}

namespace lanlog::network {

using AttemptId = uint64_t;

/**
 * ConnectionBackend - opens handshaked sessions to peers.
 *
 * Every open() ends in exactly one of on_established or on_failed, delivered
 * asynchronously (never from inside open()). An established session may later
 * end with on_closed. close() tears down an attempt or session silently.
 */
class ConnectionBackend {
public:
    virtual ~ConnectionBackend() = default;

    virtual void open(AttemptId id, const PeerInfo& peer,
                      const std::optional<QString>& passcode) = 0;
    virtual void close(AttemptId id) = 0;

    // Callbacks
    std::function<void(AttemptId)> on_established;
    std::function<void(AttemptId, ConnectionError)> on_failed;
    std::function<void(AttemptId)> on_closed;
};

/**
 * ConnectionOutcome - terminal result of one connect attempt.
 */
struct ConnectionOutcome {
    PeerInfo peer;
    std::optional<ConnectionError> error;

    [[nodiscard]] bool succeeded() const { return !error.has_value(); }
};

/**
 * ConnectionManager - owns the single active session and at most one attempt.
 *
 *   Idle -> Connecting -> Connected
 *                      -> Failed -> Idle (or back to Connected, see below)
 *   Connected -> Idle on disconnect or when the peer goes away
 *
 * A new attempt replaces an in-flight one; the replaced attempt never reports
 * an outcome. The previous session stays up until the new attempt succeeds,
 * so a failed switch leaves the old selection in place.
 */
class ConnectionManager : public QObject {
    Q_OBJECT

    Q_PROPERTY(State state READ state NOTIFY stateChanged)

public:
    enum class State {
        Idle,
        Connecting,
        Connected,
        Failed
    };
    Q_ENUM(State)

    ConnectionManager(std::unique_ptr<ConnectionBackend> backend,
                      storage::PasscodeStore& passcodes,
                      std::chrono::milliseconds timeout,
                      QObject* parent = nullptr);
    ~ConnectionManager() override;

    /**
     * Connect using the stored passcode if the peer is protected. Without a
     * stored passcode emits needsPasscode() and starts nothing.
     */
    void connectToPeer(const PeerInfo& peer);

    /**
     * Connect with an explicit passcode. Stored for the peer name on success.
     */
    void connectToPeer(const PeerInfo& peer, const QString& passcode);

    /**
     * Cancel any attempt and close the session. Reports no outcome.
     */
    void disconnectFromPeer();

    [[nodiscard]] State state() const { return state_; }
    [[nodiscard]] std::optional<PeerInfo> selectedPeer() const;
    [[nodiscard]] std::optional<PeerInfo> pendingPeer() const;
    [[nodiscard]] bool isSelected(const Endpoint& endpoint) const;
    [[nodiscard]] std::chrono::milliseconds timeout() const { return timeout_; }
    void setTimeout(std::chrono::milliseconds timeout) { timeout_ = timeout; }

signals:
    void stateChanged(lanlog::network::ConnectionManager::State state);
    void needsPasscode(const lanlog::network::PeerInfo& peer);
    void attemptFinished(const lanlog::network::ConnectionOutcome& outcome);
    void selectionChanged();
    void disconnected(const lanlog::network::PeerInfo& peer);

private:
    struct Attempt {
        AttemptId id = 0;
        PeerInfo peer;
        std::optional<QString> passcode;
        bool passcode_from_store = false;
    };

    struct Session {
        AttemptId id = 0;
        PeerInfo peer;
    };

    void beginAttempt(const PeerInfo& peer, std::optional<QString> passcode, bool from_store);
    void cancelAttempt();
    void handleEstablished(AttemptId id);
    void handleFailed(AttemptId id, ConnectionError error);
    void handleClosed(AttemptId id);
    void onTimeout();
    void setState(State state);
    [[nodiscard]] State restingState() const;

    std::unique_ptr<ConnectionBackend> backend_;
    storage::PasscodeStore& passcodes_;
    std::chrono::milliseconds timeout_;
    QTimer timeout_timer_;

    State state_ = State::Idle;
    AttemptId next_attempt_id_ = 1;
    std::optional<Attempt> attempt_;
    std::optional<Session> session_;
};

} // namespace lanlog::network

Q_DECLARE_METATYPE(lanlog::network::ConnectionOutcome)
