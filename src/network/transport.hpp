#pragma once

#include "core/result.hpp"
#include <QByteArray>
#include <QHostAddress>
#include <QObject>
#include <QTcpSocket>
#include <QTcpServer>
#include <memory>
#include <vector>

namespace lanlog::network {

/**
 * Message types for the pairing handshake.
 */
enum class MessageType : uint8_t {
    // Handshake
    ClientHello = 0x01,
    ServerChallenge = 0x02,
    ClientProof = 0x03,
    HandshakeAccept = 0x04,
    HandshakeReject = 0x05,

    // Control
    Disconnect = 0x3F
};

/**
 * Protocol message header.
 *
 * Format:
 * - Magic (2 bytes): 0x4C 0x4C ("LL")
 * - Version (1 byte)
 * - Type (1 byte)
 * - Length (4 bytes, big-endian)
 * - Payload (variable)
 */
struct MessageHeader {
    static constexpr uint8_t MAGIC[2] = {0x4C, 0x4C};  // "LL"
    static constexpr uint8_t VERSION = 1;
    static constexpr size_t HEADER_SIZE = 8;
    static constexpr uint32_t MAX_PAYLOAD = 64 * 1024;

    MessageType type;
    uint32_t length;
};

/**
 * Connection - one framed TCP connection, either side.
 *
 * Handles framing only; the handshake itself lives in the connection backend
 * and the pairing server.
 */
class Connection : public QObject {
    Q_OBJECT

public:
    enum class State {
        Disconnected,
        Connecting,
        Open,
        Failed
    };
    Q_ENUM(State)

    explicit Connection(QObject* parent = nullptr);
    ~Connection() override;

    /**
     * Connect to a peer (as client).
     */
    void connectToPeer(const QHostAddress& host, uint16_t port);

    /**
     * Adopt an accepted socket (as server). Takes ownership.
     */
    void acceptConnection(QTcpSocket* socket);

    /**
     * Send Disconnect when open, then close the socket.
     */
    void disconnect();

    Result<void, Error> send(MessageType type, const QByteArray& payload = {});

    [[nodiscard]] State state() const { return state_; }
    [[nodiscard]] bool isOpen() const { return state_ == State::Open; }
    [[nodiscard]] QAbstractSocket::SocketError socketError() const { return socket_error_; }
    [[nodiscard]] QHostAddress peerAddress() const;

signals:
    void connected();
    void disconnected();
    void messageReceived(lanlog::network::MessageType type, const QByteArray& payload);
    // Socket-level failure (refused, unreachable, reset...).
    void error(const QString& message);
    // The peer sent something that is not a valid frame.
    void protocolError(const QString& message);
    void stateChanged(lanlog::network::Connection::State state);

private slots:
    void onSocketConnected();
    void onSocketDisconnected();
    void onSocketError(QAbstractSocket::SocketError error);
    void onReadyRead();

private:
    State state_ = State::Disconnected;
    std::unique_ptr<QTcpSocket> socket_;
    QByteArray read_buffer_;
    QAbstractSocket::SocketError socket_error_ = QAbstractSocket::UnknownSocketError;

    void wireSocket();
    void setState(State state);
    void failProtocol(const QString& message);
};

/**
 * TransportServer - Listens for incoming connections.
 */
class TransportServer : public QObject {
    Q_OBJECT

public:
    explicit TransportServer(QObject* parent = nullptr);
    ~TransportServer() override;

    /**
     * Start listening on a port.
     * @param port Port to listen on (0 for auto-assign)
     * @return The actual port being listened on
     */
    Result<uint16_t, Error> listen(uint16_t port = 0,
                                   const QHostAddress& address = QHostAddress::Any);

    void close();

    [[nodiscard]] uint16_t port() const;
    [[nodiscard]] bool isListening() const;

signals:
    void newConnection(QTcpSocket* socket);

private slots:
    void onNewConnection();

private:
    std::unique_ptr<QTcpServer> server_;
};

std::vector<uint8_t> serializeHeader(const MessageHeader& header);

Result<MessageHeader, Error> deserializeHeader(const std::vector<uint8_t>& data);

} // namespace lanlog::network
