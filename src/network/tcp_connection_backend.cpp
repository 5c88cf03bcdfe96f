#include "network/tcp_connection_backend.hpp"
#include "network/transport.hpp"
#include "core/logging.hpp"

#include <QTimer>

namespace lanlog::network {

TcpConnectionBackend::TcpConnectionBackend(Uuid device_id, QString device_name, QObject* parent)
    : QObject(parent)
    , device_id_(device_id)
    , device_name_(std::move(device_name))
{}

TcpConnectionBackend::~TcpConnectionBackend() {
    on_established = nullptr;
    on_failed = nullptr;
    on_closed = nullptr;
    while (!sessions_.empty()) {
        release(sessions_.begin()->first);
    }
}

TcpConnectionBackend::Session* TcpConnectionBackend::find(AttemptId id) {
    auto it = sessions_.find(id);
    return it == sessions_.end() ? nullptr : &it->second;
}

void TcpConnectionBackend::open(AttemptId id, const PeerInfo& peer,
                                const std::optional<QString>& passcode) {
    if (peer.host.isNull() || peer.port == 0) {
        // Outcomes are never delivered from inside open().
        QTimer::singleShot(0, this, [this, id]() {
            if (on_failed) {
                on_failed(id, ConnectionError{ConnectionErrorKind::Unreachable,
                                              QStringLiteral("The server has no resolved address")});
            }
        });
        return;
    }

    auto* connection = new Connection(this);
    sessions_[id] = Session{connection, passcode, Phase::Connecting};

    connect(connection, &Connection::connected, this, [this, id]() { onConnected(id); });
    connect(connection, &Connection::messageReceived, this,
            [this, id](MessageType type, const QByteArray& payload) { onMessage(id, type, payload); });
    connect(connection, &Connection::error, this,
            [this, id](const QString& message) { onSocketError(id, message); });
    connect(connection, &Connection::protocolError, this,
            [this, id](const QString& message) { onProtocolError(id, message); });
    connect(connection, &Connection::disconnected, this, [this, id]() { onDisconnected(id); });

    qCDebug(lcConnection) << "tcp: attempt" << id << "connecting to"
                          << peer.host.toString() << peer.port;
    connection->connectToPeer(peer.host, peer.port);
}

void TcpConnectionBackend::close(AttemptId id) {
    release(id);
}

void TcpConnectionBackend::release(AttemptId id) {
    auto it = sessions_.find(id);
    if (it == sessions_.end()) return;

    QPointer<Connection> connection = it->second.connection;
    sessions_.erase(it);

    if (connection) {
        QObject::disconnect(connection, nullptr, this, nullptr);
        connection->disconnect();
        connection->deleteLater();
    }
}

void TcpConnectionBackend::fail(AttemptId id, ConnectionError error) {
    release(id);
    if (on_failed) on_failed(id, std::move(error));
}

void TcpConnectionBackend::onConnected(AttemptId id) {
    auto* session = find(id);
    if (!session) return;

    session->phase = Phase::AwaitChallenge;
    auto sent = session->connection->send(MessageType::ClientHello,
                                          encode(ClientHello{kHandshakeVersion, device_id_, device_name_}));
    if (sent.is_err()) {
        fail(id, ConnectionError{ConnectionErrorKind::Unreachable,
                                 QString::fromStdString(sent.unwrap_err().message)});
    }
}

void TcpConnectionBackend::onMessage(AttemptId id, MessageType type, const QByteArray& payload) {
    auto* session = find(id);
    if (!session) return;

    switch (session->phase) {
        case Phase::AwaitChallenge: {
            if (type != MessageType::ServerChallenge) break;

            auto challenge = decode_server_challenge(payload);
            if (challenge.is_err()) {
                fail(id, ConnectionError{ConnectionErrorKind::Protocol,
                                         QString::fromStdString(challenge.unwrap_err().message)});
                return;
            }
            if (challenge.unwrap().is_protected && !session->passcode) {
                fail(id, to_connection_error(RejectReason::PasscodeRequired));
                return;
            }

            const auto proof = challenge.unwrap().is_protected
                ? make_proof(*session->passcode, challenge.unwrap(), device_id_)
                : ClientProof{};
            session->phase = Phase::AwaitVerdict;
            auto sent = session->connection->send(MessageType::ClientProof, encode(proof));
            if (sent.is_err()) {
                fail(id, ConnectionError{ConnectionErrorKind::Unreachable,
                                         QString::fromStdString(sent.unwrap_err().message)});
            }
            return;
        }

        case Phase::AwaitVerdict: {
            if (type == MessageType::HandshakeAccept) {
                auto accept = decode_handshake_accept(payload);
                if (accept.is_err()) {
                    fail(id, ConnectionError{ConnectionErrorKind::Protocol,
                                             QString::fromStdString(accept.unwrap_err().message)});
                    return;
                }
                session->phase = Phase::Established;
                qCDebug(lcConnection) << "tcp: attempt" << id << "accepted by" << accept.unwrap().name;
                if (on_established) on_established(id);
                return;
            }
            if (type == MessageType::HandshakeReject) {
                auto reject = decode_handshake_reject(payload);
                fail(id, reject.is_ok()
                             ? to_connection_error(reject.unwrap().reason)
                             : ConnectionError{ConnectionErrorKind::Protocol,
                                               QString::fromStdString(reject.unwrap_err().message)});
                return;
            }
            break;
        }

        case Phase::Established:
            // The logging stream is carried elsewhere; nothing is expected here.
            return;

        case Phase::Connecting:
            break;
    }

    fail(id, ConnectionError{ConnectionErrorKind::Protocol,
                             QStringLiteral("Unexpected message 0x%1")
                                 .arg(static_cast<int>(type), 2, 16, QLatin1Char('0'))});
}

void TcpConnectionBackend::onSocketError(AttemptId id, const QString& message) {
    auto* session = find(id);
    if (!session) return;

    if (session->phase == Phase::Established) {
        onDisconnected(id);
        return;
    }

    const auto kind = session->connection &&
                      session->connection->socketError() == QAbstractSocket::SocketTimeoutError
        ? ConnectionErrorKind::Timeout
        : ConnectionErrorKind::Unreachable;
    fail(id, ConnectionError{kind, message});
}

void TcpConnectionBackend::onProtocolError(AttemptId id, const QString& message) {
    auto* session = find(id);
    if (!session) return;

    if (session->phase == Phase::Established) {
        onDisconnected(id);
        return;
    }
    fail(id, ConnectionError{ConnectionErrorKind::Protocol, message});
}

void TcpConnectionBackend::onDisconnected(AttemptId id) {
    auto* session = find(id);
    if (!session) return;

    if (session->phase != Phase::Established) {
        fail(id, ConnectionError{ConnectionErrorKind::Unreachable,
                                 QStringLiteral("The server closed the connection")});
        return;
    }

    release(id);
    if (on_closed) on_closed(id);
}

} // namespace lanlog::network
