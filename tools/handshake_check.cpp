#include <QCoreApplication>
#include <QDir>
#include <QEventLoop>
#include <QHostAddress>
#include <QTemporaryDir>
#include <QTimer>

#include "core/logging.hpp"
#include "crypto/secret.hpp"
#include "network/connection_manager.hpp"
#include "network/pairing_server.hpp"
#include "network/tcp_connection_backend.hpp"
#include "storage/passcode_store.hpp"

using lanlog::network::ConnectionManager;
using lanlog::network::ConnectionOutcome;
using lanlog::network::PeerInfo;

namespace {

std::optional<ConnectionOutcome> run_attempt(ConnectionManager& manager,
                                             const PeerInfo& peer,
                                             const QString& passcode) {
    std::optional<ConnectionOutcome> outcome;

    QEventLoop loop;
    auto finished = QObject::connect(&manager, &ConnectionManager::attemptFinished, &loop,
        [&](const ConnectionOutcome& result) {
            outcome = result;
            loop.quit();
        });

    QTimer timeout;
    timeout.setSingleShot(true);
    QObject::connect(&timeout, &QTimer::timeout, &loop, &QEventLoop::quit);
    timeout.start(3000);

    manager.connectToPeer(peer, passcode);
    loop.exec();

    QObject::disconnect(finished);
    return outcome;
}

} // namespace

int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);

    if (lanlog::crypto::init().is_err()) {
        return 1;
    }
    if (qEnvironmentVariableIsSet("LANLOG_DEBUG")) {
        lanlog::enable_debug_logging();
    }

    QTemporaryDir dir;
    if (!dir.isValid()) {
        return 1;
    }

    lanlog::network::PairingServer server(QStringLiteral("check-server"));
    server.setPasscode(QStringLiteral("1234"));
    auto port = server.listen(0, QHostAddress::LocalHost);
    if (port.is_err()) {
        qCritical().noquote() << "listen failed:" << QString::fromStdString(port.unwrap_err().message);
        return 1;
    }

    lanlog::storage::SettingsPasscodeStore store(dir.filePath(QStringLiteral("passcodes.ini")),
                                                 dir.filePath(QStringLiteral("passcodes.key")));
    ConnectionManager manager(
        std::make_unique<lanlog::network::TcpConnectionBackend>(lanlog::Uuid::generate(),
                                                                QStringLiteral("check-client")),
        store, std::chrono::milliseconds(2000));

    PeerInfo peer;
    peer.endpoint = lanlog::network::ServiceEndpoint{QStringLiteral("check-server"),
                                                     QStringLiteral("_lanlog._tcp"),
                                                     QStringLiteral("local")};
    peer.metadata = lanlog::network::TxtRecord{{QStringLiteral("protected"), QStringLiteral("true")}};
    peer.host = QHostAddress::LocalHost;
    peer.port = port.unwrap();

    const auto wrong = run_attempt(manager, peer, QStringLiteral("0000"));
    if (!wrong || wrong->succeeded() ||
        wrong->error->kind != lanlog::ConnectionErrorKind::InvalidPasscode) {
        qCritical() << "wrong passcode was not rejected";
        return 2;
    }

    const auto right = run_attempt(manager, peer, QStringLiteral("1234"));
    if (!right || !right->succeeded()) {
        qCritical() << "correct passcode was not accepted";
        return 2;
    }

    if (store.get(QStringLiteral("check-server")) != QStringLiteral("1234")) {
        qCritical() << "accepted passcode was not stored";
        return 2;
    }

    qInfo() << "handshake check passed";
    return 0;
}
