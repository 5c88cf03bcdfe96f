#include "cli/commands.hpp"

#include <QCoreApplication>
#include <QEventLoop>
#include <QTimer>

#include "core/logging.hpp"
#include "network/discovery.hpp"
#include "network/pairing_server.hpp"
#include "service/context.hpp"

namespace lanlog::cli {

QString format_server_list(const std::vector<service::ServerEntry>& servers) {
    if (servers.empty()) {
        return QStringLiteral("(no servers)\n");
    }

    QString out;
    for (const auto& server : servers) {
        out += server.is_selected ? QStringLiteral("* ") : QStringLiteral("  ");
        out += server.name;
        if (server.is_protected) {
            out += QStringLiteral(" [locked]");
        }
        out += QLatin1Char('\n');
    }
    return out;
}

int run_browse(service::AppContext& context, std::chrono::seconds duration, QTextStream& out) {
    auto& logger = context.remoteLogger();

    QString last_printed;
    std::optional<DiscoveryError> last_error;
    auto connection = logger.subscribe([&](const service::RemoteLoggerState& state) {
        if (state.browser_error != last_error) {
            last_error = state.browser_error;
            if (last_error) {
                out << "browser error: " << describe(*last_error) << Qt::endl;
            }
        }
        const auto listing = format_server_list(state.servers);
        if (listing != last_printed) {
            last_printed = listing;
            out << "--" << Qt::endl << listing << Qt::flush;
        }
    });

    logger.enable();

    QEventLoop loop;
    QTimer::singleShot(duration, &loop, &QEventLoop::quit);
    loop.exec();

    QObject::disconnect(connection);
    logger.disable();
    return kExitOk;
}

int run_connect(service::AppContext& context,
                const QString& name,
                const std::optional<QString>& passcode,
                std::chrono::milliseconds discovery_wait,
                QTextStream& out) {
    auto& logger = context.remoteLogger();

    QEventLoop loop;
    int exit_code = kExitFailure;
    bool issued = false;

    QTimer deadline;
    deadline.setSingleShot(true);
    QObject::connect(&deadline, &QTimer::timeout, &loop, [&]() {
        out << "server not found: " << name << Qt::endl;
        exit_code = kExitFailure;
        loop.quit();
    });

    auto try_connect = [&]() {
        if (issued) return;
        const auto peer = logger.serverNamed(name);
        if (!peer) return;

        issued = true;
        deadline.stop();
        if (passcode) {
            logger.connectToServer(peer->endpoint, *passcode);
        } else {
            logger.connectToServer(peer->endpoint);
        }
    };

    QObject::connect(&logger, &service::RemoteLogger::serversChanged, &loop, try_connect);
    QObject::connect(&logger, &service::RemoteLogger::needsPasscode, &loop,
                     [&](const network::PeerInfo&) {
                         out << name << " requires a passcode (use --passcode)" << Qt::endl;
                         exit_code = kExitNeedsPasscode;
                         loop.quit();
                     });
    QObject::connect(&logger, &service::RemoteLogger::connectionResult, &loop,
                     [&](const network::ConnectionOutcome& outcome) {
                         if (outcome.peer.name() != name) return;
                         if (outcome.succeeded()) {
                             out << "connected to " << name << Qt::endl;
                             exit_code = kExitOk;
                         } else {
                             out << "connection failed: " << describe(*outcome.error) << Qt::endl;
                             exit_code = outcome.error->kind == ConnectionErrorKind::PasscodeRequired
                                 ? kExitNeedsPasscode
                                 : kExitFailure;
                         }
                         loop.quit();
                     });

    logger.enable();
    deadline.start(discovery_wait);
    try_connect();
    loop.exec();

    logger.disable();
    return exit_code;
}

int run_forget(service::AppContext& context, const QString& name, QTextStream& out) {
    auto removed = context.remoteLogger().forgetPasscode(name);
    if (removed.is_err()) {
        out << "cannot forget passcode: "
            << QString::fromStdString(removed.unwrap_err().message) << Qt::endl;
        return kExitFailure;
    }
    out << "forgot passcode for " << name << Qt::endl;
    return kExitOk;
}

int run_serve(const Config& config, const ServeOptions& options, QTextStream& out) {
    const QString name = options.name.isEmpty() ? config.device_name : options.name;

    network::PairingServer server(name);
    server.setPasscode(options.passcode);

    auto listening = server.listen(options.port);
    if (listening.is_err()) {
        out << "cannot listen: " << QString::fromStdString(listening.unwrap_err().message)
            << Qt::endl;
        return kExitFailure;
    }

    network::DiscoveryService discovery(
        network::createDiscoveryBackend(config.discovery_backend, config.service_type));
    if (!discovery.startAdvertising(server.serviceInfo(config.service_type))) {
        const auto error = discovery.lastError();
        out << "cannot advertise: "
            << (error ? describe(*error) : QStringLiteral("unknown error")) << Qt::endl;
        return kExitFailure;
    }

    QObject::connect(&server, &network::PairingServer::clientAccepted, &server,
                     [&](const QString& client) { out << "accepted " << client << Qt::endl; });
    QObject::connect(&server, &network::PairingServer::clientRejected, &server,
                     [&](const QString& client, network::RejectReason reason) {
                         out << "rejected " << client << " (" << network::to_string(reason) << ")"
                             << Qt::endl;
                     });
    QObject::connect(&server, &network::PairingServer::clientDisconnected, &server,
                     [&](const QString& client) { out << "disconnected " << client << Qt::endl; });

    out << "serving " << name << " on port " << listening.unwrap()
        << (server.isProtected() ? " (protected)" : "") << Qt::endl;

    QEventLoop loop;
    if (options.duration.count() > 0) {
        QTimer::singleShot(options.duration, &loop, &QEventLoop::quit);
    }
    QObject::connect(QCoreApplication::instance(), &QCoreApplication::aboutToQuit,
                     &loop, &QEventLoop::quit);
    loop.exec();

    discovery.stopAdvertising();
    server.close();
    return kExitOk;
}

} // namespace lanlog::cli
