#pragma once

#include "core/result.hpp"
#include "network/discovery.hpp"
#include "network/handshake.hpp"
#include "network/transport.hpp"

#include <QObject>
#include <QString>
#include <map>
#include <optional>

namespace lanlog::network {

/**
 * PairingServer - accepting side of the pairing handshake.
 *
 * This is the receiver a remote logger connects to. With a passcode set it
 * advertises protected=true and only accepts clients whose proof matches.
 */
class PairingServer : public QObject {
    Q_OBJECT

public:
    static constexpr int HANDSHAKE_TIMEOUT_MS = 10000;

    explicit PairingServer(QString name, QObject* parent = nullptr);
    ~PairingServer() override;

    Result<uint16_t, Error> listen(uint16_t port = 0,
                                   const QHostAddress& address = QHostAddress::Any);
    void close();

    void setPasscode(std::optional<QString> passcode);
    [[nodiscard]] bool isProtected() const { return passcode_.has_value(); }

    [[nodiscard]] const QString& name() const { return name_; }
    [[nodiscard]] uint16_t port() const { return server_.port(); }
    [[nodiscard]] bool isListening() const { return server_.isListening(); }
    [[nodiscard]] int clientCount() const;

    /**
     * What to advertise for this server.
     */
    [[nodiscard]] ServiceInfo serviceInfo(const QString& service_type) const;

signals:
    void clientAccepted(const QString& client_name);
    void clientRejected(const QString& client_name, lanlog::network::RejectReason reason);
    void clientDisconnected(const QString& client_name);

private:
    enum class Phase {
        AwaitHello,
        AwaitProof,
        Established
    };

    struct Client {
        Phase phase = Phase::AwaitHello;
        ClientHello hello;
        crypto::Challenge nonce{};
    };

    void onNewConnection(QTcpSocket* socket);
    void onMessage(Connection* connection, MessageType type, const QByteArray& payload);
    void sendTo(Connection* connection, MessageType type, const QByteArray& payload);
    void reject(Connection* connection, RejectReason reason);
    void drop(Connection* connection);

    QString name_;
    std::optional<QString> passcode_;
    TransportServer server_;
    std::map<Connection*, Client> clients_;
};

} // namespace lanlog::network
