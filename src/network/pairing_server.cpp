#include "network/pairing_server.hpp"
#include "core/logging.hpp"

#include <QPointer>
#include <QTimer>
#include <algorithm>

namespace lanlog::network {

PairingServer::PairingServer(QString name, QObject* parent)
    : QObject(parent)
    , name_(std::move(name))
{
    connect(&server_, &TransportServer::newConnection, this, &PairingServer::onNewConnection);
}

PairingServer::~PairingServer() {
    close();
}

Result<uint16_t, Error> PairingServer::listen(uint16_t port, const QHostAddress& address) {
    auto result = server_.listen(port, address);
    if (result.is_ok()) {
        qCInfo(lcServer) << "listening on port" << result.unwrap()
                         << "protected=" << isProtected();
    }
    return result;
}

void PairingServer::close() {
    server_.close();
    while (!clients_.empty()) {
        drop(clients_.begin()->first);
    }
}

void PairingServer::setPasscode(std::optional<QString> passcode) {
    if (passcode && passcode->isEmpty()) {
        passcode.reset();
    }
    passcode_ = std::move(passcode);
}

int PairingServer::clientCount() const {
    return static_cast<int>(std::count_if(clients_.begin(), clients_.end(),
        [](const auto& entry) { return entry.second.phase == Phase::Established; }));
}

ServiceInfo PairingServer::serviceInfo(const QString& service_type) const {
    ServiceInfo info;
    info.name = name_;
    info.type = service_type;
    info.port = server_.port();
    info.txt[QString::fromLatin1(kProtectedKey)] =
        isProtected() ? QStringLiteral("true") : QStringLiteral("false");
    return info;
}

void PairingServer::onNewConnection(QTcpSocket* socket) {
    auto* connection = new Connection(this);
    clients_.emplace(connection, Client{});

    connect(connection, &Connection::messageReceived, this,
            [this, connection](MessageType type, const QByteArray& payload) {
                onMessage(connection, type, payload);
            });
    connect(connection, &Connection::disconnected, this,
            [this, connection]() { drop(connection); });
    connect(connection, &Connection::error, this,
            [this, connection](const QString&) { drop(connection); });
    connect(connection, &Connection::protocolError, this,
            [this, connection](const QString&) { drop(connection); });

    QPointer<Connection> guard(connection);
    QTimer::singleShot(HANDSHAKE_TIMEOUT_MS, this, [this, guard]() {
        if (!guard) return;
        auto it = clients_.find(guard.data());
        if (it != clients_.end() && it->second.phase != Phase::Established) {
            qCInfo(lcServer) << "handshake timed out for" << guard->peerAddress().toString();
            drop(guard.data());
        }
    });

    connection->acceptConnection(socket);
}

void PairingServer::onMessage(Connection* connection, MessageType type, const QByteArray& payload) {
    auto it = clients_.find(connection);
    if (it == clients_.end()) return;
    auto& client = it->second;

    switch (client.phase) {
        case Phase::AwaitHello: {
            if (type != MessageType::ClientHello) {
                reject(connection, RejectReason::Protocol);
                return;
            }
            auto hello = decode_client_hello(payload);
            if (hello.is_err()) {
                qCInfo(lcServer) << "bad hello:" << QString::fromStdString(hello.unwrap_err().message);
                reject(connection, RejectReason::Protocol);
                return;
            }
            client.hello = hello.unwrap();
            client.nonce = crypto::random_challenge();
            client.phase = Phase::AwaitProof;

            ServerChallenge challenge;
            challenge.is_protected = isProtected();
            challenge.nonce = client.nonce;
            sendTo(connection, MessageType::ServerChallenge, encode(challenge));
            return;
        }

        case Phase::AwaitProof: {
            if (type != MessageType::ClientProof) {
                reject(connection, RejectReason::Protocol);
                return;
            }
            auto proof = decode_client_proof(payload);
            if (proof.is_err()) {
                reject(connection, RejectReason::Protocol);
                return;
            }
            if (passcode_) {
                if (proof.unwrap().proof.empty()) {
                    reject(connection, RejectReason::PasscodeRequired);
                    return;
                }
                if (!crypto::verify_passcode_proof(proof.unwrap().proof, passcode_->toStdString(),
                                                   client.nonce, client.hello.device_id)) {
                    reject(connection, RejectReason::InvalidPasscode);
                    return;
                }
            }

            client.phase = Phase::Established;
            sendTo(connection, MessageType::HandshakeAccept, encode(HandshakeAccept{name_}));
            qCInfo(lcServer) << "accepted" << client.hello.name
                             << "from" << connection->peerAddress().toString();
            emit clientAccepted(client.hello.name);
            return;
        }

        case Phase::Established:
            // Logging stream payloads are not interpreted here.
            return;
    }
}

void PairingServer::sendTo(Connection* connection, MessageType type, const QByteArray& payload) {
    auto sent = connection->send(type, payload);
    if (sent.is_err()) {
        qCWarning(lcServer) << "send failed:" << QString::fromStdString(sent.unwrap_err().message);
    }
}

void PairingServer::reject(Connection* connection, RejectReason reason) {
    auto it = clients_.find(connection);
    const QString client_name = it != clients_.end() ? it->second.hello.name : QString();

    qCInfo(lcServer) << "rejecting" << client_name << "reason=" << to_string(reason);
    sendTo(connection, MessageType::HandshakeReject, encode(HandshakeReject{reason}));
    emit clientRejected(client_name, reason);
    drop(connection);
}

void PairingServer::drop(Connection* connection) {
    auto it = clients_.find(connection);
    if (it == clients_.end()) return;

    const bool was_established = it->second.phase == Phase::Established;
    const QString client_name = it->second.hello.name;
    clients_.erase(it);

    QObject::disconnect(connection, nullptr, this, nullptr);
    connection->disconnect();
    connection->deleteLater();

    if (was_established) {
        qCInfo(lcServer) << "client" << client_name << "disconnected";
        emit clientDisconnected(client_name);
    }
}

} // namespace lanlog::network
