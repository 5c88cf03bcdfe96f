#pragma once

#include "core/types.hpp"
#include "network/connection_manager.hpp"
#include "network/handshake.hpp"

#include <QObject>
#include <QPointer>
#include <map>

namespace lanlog::network {

class Connection;

/**
 * TcpConnectionBackend - client side of the pairing handshake over Connection.
 */
class TcpConnectionBackend final : public QObject, public ConnectionBackend {
    Q_OBJECT

public:
    TcpConnectionBackend(Uuid device_id, QString device_name, QObject* parent = nullptr);
    ~TcpConnectionBackend() override;

    void open(AttemptId id, const PeerInfo& peer,
              const std::optional<QString>& passcode) override;
    void close(AttemptId id) override;

    [[nodiscard]] std::size_t activeCount() const { return sessions_.size(); }

private:
    enum class Phase {
        Connecting,
        AwaitChallenge,
        AwaitVerdict,
        Established
    };

    struct Session {
        QPointer<Connection> connection;
        std::optional<QString> passcode;
        Phase phase = Phase::Connecting;
    };

    void onConnected(AttemptId id);
    void onMessage(AttemptId id, MessageType type, const QByteArray& payload);
    void onSocketError(AttemptId id, const QString& message);
    void onProtocolError(AttemptId id, const QString& message);
    void onDisconnected(AttemptId id);

    void fail(AttemptId id, ConnectionError error);
    void release(AttemptId id);
    Session* find(AttemptId id);

    Uuid device_id_;
    QString device_name_;
    std::map<AttemptId, Session> sessions_;
};

} // namespace lanlog::network
