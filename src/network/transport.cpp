#include "network/transport.hpp"
#include "core/logging.hpp"

namespace lanlog::network {

// ============================================================================
// Connection
// ============================================================================

Connection::Connection(QObject* parent)
    : QObject(parent)
    , socket_(std::make_unique<QTcpSocket>(this))
{
    wireSocket();
}

Connection::~Connection() {
    if (socket_) {
        socket_->disconnect(this);
    }
    disconnect();
}

void Connection::wireSocket() {
    connect(socket_.get(), &QTcpSocket::connected,
            this, &Connection::onSocketConnected);
    connect(socket_.get(), &QTcpSocket::disconnected,
            this, &Connection::onSocketDisconnected);
    connect(socket_.get(), &QTcpSocket::errorOccurred,
            this, &Connection::onSocketError);
    connect(socket_.get(), &QTcpSocket::readyRead,
            this, &Connection::onReadyRead);
}

void Connection::connectToPeer(const QHostAddress& host, uint16_t port) {
    setState(State::Connecting);
    socket_->connectToHost(host, port);
}

void Connection::acceptConnection(QTcpSocket* socket) {
    // Take ownership of socket
    socket_->disconnect(this);
    socket->setParent(this);
    socket_.reset(socket);
    wireSocket();

    setState(State::Open);

    // Bytes may have arrived before we were wired up.
    if (socket_->bytesAvailable() > 0) {
        onReadyRead();
    }
}

void Connection::disconnect() {
    if (state_ == State::Disconnected) {
        return;
    }
    if (state_ == State::Open) {
        // Best effort; the peer may already be gone.
        (void)send(MessageType::Disconnect);
    }
    setState(State::Disconnected);
    socket_->disconnectFromHost();
}

Result<void, Error> Connection::send(MessageType type, const QByteArray& payload) {
    if (state_ != State::Open) {
        return Result<void, Error>::err(Error{"Not connected"});
    }
    if (static_cast<uint32_t>(payload.size()) > MessageHeader::MAX_PAYLOAD) {
        return Result<void, Error>::err(Error{"Payload too large"});
    }

    MessageHeader header{type, static_cast<uint32_t>(payload.size())};
    const auto header_bytes = serializeHeader(header);

    if (socket_->write(reinterpret_cast<const char*>(header_bytes.data()),
                       static_cast<qint64>(header_bytes.size())) < 0 ||
        socket_->write(payload) < 0) {
        return Result<void, Error>::err(Error{socket_->errorString().toStdString()});
    }
    socket_->flush();
    return Result<void, Error>::ok();
}

QHostAddress Connection::peerAddress() const {
    return socket_->peerAddress();
}

void Connection::setState(State state) {
    if (state_ != state) {
        state_ = state;
        emit stateChanged(state);
    }
}

void Connection::failProtocol(const QString& message) {
    qCWarning(lcConnection) << "protocol error from" << socket_->peerAddress().toString()
                            << message;
    read_buffer_.clear();
    setState(State::Failed);
    emit protocolError(message);
    socket_->abort();
}

void Connection::onSocketConnected() {
    setState(State::Open);
    emit connected();
}

void Connection::onSocketDisconnected() {
    const bool was_active = state_ == State::Open || state_ == State::Connecting;
    if (state_ != State::Failed) {
        setState(State::Disconnected);
    }
    if (was_active) {
        emit disconnected();
    }
}

void Connection::onSocketError(QAbstractSocket::SocketError err) {
    // The peer closing its end is reported through disconnected().
    if (err == QAbstractSocket::RemoteHostClosedError && state_ == State::Open) {
        return;
    }
    socket_error_ = err;
    const bool was_active = state_ == State::Connecting || state_ == State::Open;
    if (was_active) {
        setState(State::Failed);
        emit error(socket_->errorString());
    }
}

void Connection::onReadyRead() {
    read_buffer_.append(socket_->readAll());

    while (state_ == State::Open &&
           read_buffer_.size() >= static_cast<qsizetype>(MessageHeader::HEADER_SIZE)) {
        std::vector<uint8_t> header_data(
            read_buffer_.begin(),
            read_buffer_.begin() + MessageHeader::HEADER_SIZE
        );

        auto header_result = deserializeHeader(header_data);
        if (header_result.is_err()) {
            failProtocol(QString::fromStdString(header_result.unwrap_err().message));
            return;
        }

        const auto header = header_result.unwrap();
        if (header.length > MessageHeader::MAX_PAYLOAD) {
            failProtocol(QStringLiteral("Payload too large"));
            return;
        }

        const auto total_size = static_cast<qsizetype>(MessageHeader::HEADER_SIZE + header.length);
        if (read_buffer_.size() < total_size) {
            // Need more data
            return;
        }

        const QByteArray payload = read_buffer_.mid(
            static_cast<qsizetype>(MessageHeader::HEADER_SIZE),
            static_cast<qsizetype>(header.length));
        read_buffer_.remove(0, total_size);

        if (header.type == MessageType::Disconnect) {
            setState(State::Disconnected);
            socket_->disconnectFromHost();
            emit disconnected();
            return;
        }

        emit messageReceived(header.type, payload);
    }
}

// ============================================================================
// TransportServer
// ============================================================================

TransportServer::TransportServer(QObject* parent)
    : QObject(parent)
    , server_(std::make_unique<QTcpServer>(this))
{
    connect(server_.get(), &QTcpServer::newConnection,
            this, &TransportServer::onNewConnection);
}

TransportServer::~TransportServer() {
    close();
}

Result<uint16_t, Error> TransportServer::listen(uint16_t port, const QHostAddress& address) {
    if (!server_->listen(address, port)) {
        return Result<uint16_t, Error>::err(
            Error{server_->errorString().toStdString()});
    }

    return Result<uint16_t, Error>::ok(server_->serverPort());
}

void TransportServer::close() {
    server_->close();
}

uint16_t TransportServer::port() const {
    return server_->serverPort();
}

bool TransportServer::isListening() const {
    return server_->isListening();
}

void TransportServer::onNewConnection() {
    while (server_->hasPendingConnections()) {
        QTcpSocket* socket = server_->nextPendingConnection();
        emit newConnection(socket);
    }
}

// ============================================================================
// Serialization
// ============================================================================

std::vector<uint8_t> serializeHeader(const MessageHeader& header) {
    std::vector<uint8_t> data(MessageHeader::HEADER_SIZE);

    data[0] = MessageHeader::MAGIC[0];
    data[1] = MessageHeader::MAGIC[1];
    data[2] = MessageHeader::VERSION;
    data[3] = static_cast<uint8_t>(header.type);
    data[4] = (header.length >> 24) & 0xFF;
    data[5] = (header.length >> 16) & 0xFF;
    data[6] = (header.length >> 8) & 0xFF;
    data[7] = header.length & 0xFF;

    return data;
}

Result<MessageHeader, Error> deserializeHeader(const std::vector<uint8_t>& data) {
    if (data.size() < MessageHeader::HEADER_SIZE) {
        return Result<MessageHeader, Error>::err(Error{"Header too short"});
    }

    if (data[0] != MessageHeader::MAGIC[0] || data[1] != MessageHeader::MAGIC[1]) {
        return Result<MessageHeader, Error>::err(Error{"Invalid magic"});
    }

    if (data[2] != MessageHeader::VERSION) {
        return Result<MessageHeader, Error>::err(Error{"Unsupported version"});
    }

    MessageHeader header;
    header.type = static_cast<MessageType>(data[3]);
    header.length = (static_cast<uint32_t>(data[4]) << 24) |
                    (static_cast<uint32_t>(data[5]) << 16) |
                    (static_cast<uint32_t>(data[6]) << 8) |
                    static_cast<uint32_t>(data[7]);

    return Result<MessageHeader, Error>::ok(header);
}

} // namespace lanlog::network
