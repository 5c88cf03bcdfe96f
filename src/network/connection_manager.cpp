#include "network/connection_manager.hpp"
#include "storage/passcode_store.hpp"
#include "core/logging.hpp"

namespace lanlog::network {

ConnectionManager::ConnectionManager(std::unique_ptr<ConnectionBackend> backend,
                                     storage::PasscodeStore& passcodes,
                                     std::chrono::milliseconds timeout,
                                     QObject* parent)
    : QObject(parent)
    , backend_(std::move(backend))
    , passcodes_(passcodes)
    , timeout_(timeout)
{
    backend_->on_established = [this](AttemptId id) {
        handleEstablished(id);
    };
    backend_->on_failed = [this](AttemptId id, ConnectionError error) {
        handleFailed(id, std::move(error));
    };
    backend_->on_closed = [this](AttemptId id) {
        handleClosed(id);
    };

    timeout_timer_.setSingleShot(true);
    connect(&timeout_timer_, &QTimer::timeout, this, &ConnectionManager::onTimeout);
}

ConnectionManager::~ConnectionManager() {
    backend_->on_established = nullptr;
    backend_->on_failed = nullptr;
    backend_->on_closed = nullptr;
    if (attempt_) {
        backend_->close(attempt_->id);
    }
    if (session_) {
        backend_->close(session_->id);
    }
}

std::optional<PeerInfo> ConnectionManager::selectedPeer() const {
    if (session_) {
        return session_->peer;
    }
    return std::nullopt;
}

std::optional<PeerInfo> ConnectionManager::pendingPeer() const {
    if (attempt_) {
        return attempt_->peer;
    }
    return std::nullopt;
}

bool ConnectionManager::isSelected(const Endpoint& endpoint) const {
    return session_ && session_->peer.endpoint == endpoint;
}

void ConnectionManager::connectToPeer(const PeerInfo& peer) {
    std::optional<QString> stored;
    if (auto name = peer.name()) {
        stored = passcodes_.get(*name);
    }

    if (peer.isProtected() && !stored) {
        qCInfo(lcConnection) << "passcode needed for" << peer.endpoint;
        emit needsPasscode(peer);
        return;
    }

    // A stored passcode is only offered to peers that ask for one.
    if (!peer.isProtected()) {
        stored.reset();
    }
    beginAttempt(peer, std::move(stored), true);
}

void ConnectionManager::connectToPeer(const PeerInfo& peer, const QString& passcode) {
    beginAttempt(peer, passcode, false);
}

void ConnectionManager::disconnectFromPeer() {
    cancelAttempt();

    if (session_) {
        qCInfo(lcConnection) << "disconnecting from" << session_->peer.endpoint;
        backend_->close(session_->id);
        session_.reset();
        setState(State::Idle);
        emit selectionChanged();
    } else {
        setState(State::Idle);
    }
}

void ConnectionManager::beginAttempt(const PeerInfo& peer,
                                     std::optional<QString> passcode,
                                     bool from_store) {
    cancelAttempt();

    Attempt attempt;
    attempt.id = next_attempt_id_++;
    attempt.peer = peer;
    attempt.passcode = std::move(passcode);
    attempt.passcode_from_store = from_store && attempt.passcode.has_value();
    attempt_ = attempt;

    qCInfo(lcConnection) << "attempt" << attempt.id << "to" << peer.endpoint
                         << "passcode=" << attempt.passcode.has_value();

    setState(State::Connecting);
    timeout_timer_.start(timeout_);
    backend_->open(attempt.id, attempt.peer, attempt.passcode);
}

void ConnectionManager::cancelAttempt() {
    if (!attempt_) return;

    qCDebug(lcConnection) << "cancelling attempt" << attempt_->id;
    timeout_timer_.stop();
    const auto id = attempt_->id;
    attempt_.reset();
    backend_->close(id);
}

void ConnectionManager::handleEstablished(AttemptId id) {
    if (!attempt_ || attempt_->id != id) {
        qCDebug(lcConnection) << "dropping stale success for attempt" << id;
        backend_->close(id);
        return;
    }

    timeout_timer_.stop();
    const Attempt attempt = *attempt_;
    attempt_.reset();

    if (attempt.passcode && !attempt.passcode_from_store) {
        if (auto name = attempt.peer.name()) {
            auto stored = passcodes_.set(*name, *attempt.passcode);
            if (stored.is_err()) {
                qCWarning(lcConnection) << "cannot store passcode for" << *name << ":"
                                        << QString::fromStdString(stored.unwrap_err().message);
            }
        }
    }

    if (session_) {
        qCInfo(lcConnection) << "closing previous session with" << session_->peer.endpoint;
        backend_->close(session_->id);
    }
    session_ = Session{attempt.id, attempt.peer};

    qCInfo(lcConnection) << "connected to" << attempt.peer.endpoint;
    setState(State::Connected);
    emit selectionChanged();
    emit attemptFinished(ConnectionOutcome{attempt.peer, std::nullopt});
}

void ConnectionManager::handleFailed(AttemptId id, ConnectionError error) {
    if (!attempt_ || attempt_->id != id) {
        qCDebug(lcConnection) << "dropping stale failure for attempt" << id;
        return;
    }

    timeout_timer_.stop();
    const Attempt attempt = *attempt_;
    attempt_.reset();

    qCWarning(lcConnection) << "attempt" << id << "to" << attempt.peer.endpoint
                            << "failed:" << describe(error);

    if (error.kind == ConnectionErrorKind::InvalidPasscode && attempt.passcode_from_store) {
        if (auto name = attempt.peer.name()) {
            auto removed = passcodes_.remove(*name);
            if (removed.is_err()) {
                qCWarning(lcConnection) << "cannot remove stale passcode for" << *name << ":"
                                        << QString::fromStdString(removed.unwrap_err().message);
            }
        }
    }

    setState(State::Failed);
    emit attemptFinished(ConnectionOutcome{attempt.peer, std::move(error)});
    if (state_ == State::Failed) {
        setState(restingState());
    }
}

void ConnectionManager::handleClosed(AttemptId id) {
    if (!session_ || session_->id != id) {
        return;
    }

    const PeerInfo peer = session_->peer;
    session_.reset();

    qCInfo(lcConnection) << "session with" << peer.endpoint << "closed by peer";
    if (state_ == State::Connected) {
        setState(State::Idle);
    }
    emit selectionChanged();
    emit disconnected(peer);
}

void ConnectionManager::onTimeout() {
    if (!attempt_) return;

    const auto id = attempt_->id;
    backend_->close(id);
    handleFailed(id, ConnectionError{ConnectionErrorKind::Timeout,
                                     QStringLiteral("The connection attempt timed out")});
}

void ConnectionManager::setState(State state) {
    if (state_ != state) {
        state_ = state;
        emit stateChanged(state);
    }
}

ConnectionManager::State ConnectionManager::restingState() const {
    return session_ ? State::Connected : State::Idle;
}

} // namespace lanlog::network
