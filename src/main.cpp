#include <QCoreApplication>
#include <QCommandLineParser>
#include <QSettings>
#include <QTextStream>

#include "cli/commands.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"
#include "crypto/secret.hpp"
#include "service/context.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    app.setApplicationName("lanlog");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("lanlog");
    app.setOrganizationDomain("lanlog.local");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Local network remote logger"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption backendOption(
        QStringList{QStringLiteral("backend")},
        QStringLiteral("Discovery backend: udp or mdns (sets LANLOG_DISCOVERY_BACKEND for this run)."),
        QStringLiteral("backend"));
    parser.addOption(backendOption);

    const QCommandLineOption debugOption(
        QStringList{QStringLiteral("debug")},
        QStringLiteral("Enable debug logging on stderr (also sets LANLOG_DEBUG=1)."));
    parser.addOption(debugOption);

    const QCommandLineOption timeoutOption(
        QStringList{QStringLiteral("timeout")},
        QStringLiteral("Connect timeout in milliseconds."),
        QStringLiteral("ms"));
    parser.addOption(timeoutOption);

    const QCommandLineOption secondsOption(
        QStringList{QStringLiteral("seconds")},
        QStringLiteral("How long 'browse' (default 5) or 'serve' (default forever) runs."),
        QStringLiteral("seconds"));
    parser.addOption(secondsOption);

    const QCommandLineOption passcodeOption(
        QStringList{QStringLiteral("passcode")},
        QStringLiteral("Passcode for 'connect', or the passcode 'serve' requires."),
        QStringLiteral("passcode"));
    parser.addOption(passcodeOption);

    const QCommandLineOption nameOption(
        QStringList{QStringLiteral("name")},
        QStringLiteral("Advertised name for 'serve' (default: device name)."),
        QStringLiteral("name"));
    parser.addOption(nameOption);

    const QCommandLineOption portOption(
        QStringList{QStringLiteral("port")},
        QStringLiteral("Listening port for 'serve' (default: any)."),
        QStringLiteral("port"));
    parser.addOption(portOption);

    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("browse | connect <name> | forget <name> | serve"));
    parser.process(app);

    if (parser.isSet(backendOption)) {
        qputenv("LANLOG_DISCOVERY_BACKEND", parser.value(backendOption).toUtf8());
    }
    if (parser.isSet(debugOption)) {
        qputenv("LANLOG_DEBUG", "1");
    }

    QTextStream out(stdout);
    QTextStream err(stderr);

    const auto positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        parser.showHelp(lanlog::cli::kExitUsage);
    }
    const auto command = positional.first();

    auto crypto_result = lanlog::crypto::init();
    if (crypto_result.is_err()) {
        err << "Failed to initialize crypto: "
            << QString::fromStdString(crypto_result.unwrap_err().message) << Qt::endl;
        return lanlog::cli::kExitFailure;
    }

    QSettings settings;
    auto config = lanlog::load_config(settings);

    if (parser.isSet(timeoutOption)) {
        bool ok = false;
        const auto ms = parser.value(timeoutOption).toLongLong(&ok);
        if (!ok || ms <= 0) {
            err << "--timeout expects a positive number of milliseconds" << Qt::endl;
            return lanlog::cli::kExitUsage;
        }
        config.connect_timeout = std::chrono::milliseconds(ms);
    }

    lanlog::install_file_logging(QString{}, config.debug);
    if (config.debug) {
        lanlog::enable_debug_logging();
        qCDebug(lcRemote) << "logging to" << lanlog::default_log_file_path();
    }

    int seconds = 0;
    if (parser.isSet(secondsOption)) {
        bool ok = false;
        seconds = parser.value(secondsOption).toInt(&ok);
        if (!ok || seconds <= 0) {
            err << "--seconds expects a positive number" << Qt::endl;
            return lanlog::cli::kExitUsage;
        }
    }

    std::optional<QString> passcode;
    if (parser.isSet(passcodeOption)) {
        passcode = parser.value(passcodeOption);
    }

    if (command == QStringLiteral("serve")) {
        lanlog::cli::ServeOptions options;
        options.name = parser.value(nameOption);
        options.passcode = passcode;
        options.duration = std::chrono::seconds(seconds);
        if (parser.isSet(portOption)) {
            bool ok = false;
            const auto port = parser.value(portOption).toUInt(&ok);
            if (!ok || port > 65535) {
                err << "--port expects a number between 0 and 65535" << Qt::endl;
                return lanlog::cli::kExitUsage;
            }
            options.port = static_cast<uint16_t>(port);
        }
        return lanlog::cli::run_serve(config, options, out);
    }

    lanlog::service::AppContext context(config, settings);

    if (command == QStringLiteral("browse")) {
        return lanlog::cli::run_browse(context, std::chrono::seconds(seconds > 0 ? seconds : 5), out);
    }

    if (command == QStringLiteral("connect") || command == QStringLiteral("forget")) {
        if (positional.size() < 2) {
            err << "missing server name" << Qt::endl;
            return lanlog::cli::kExitUsage;
        }
        const auto name = positional.at(1);
        if (command == QStringLiteral("forget")) {
            return lanlog::cli::run_forget(context, name, out);
        }
        const auto wait = seconds > 0 ? std::chrono::milliseconds(std::chrono::seconds(seconds))
                                      : config.connect_timeout;
        return lanlog::cli::run_connect(context, name, passcode, wait, out);
    }

    err << "unknown command: " << command << Qt::endl;
    return lanlog::cli::kExitUsage;
}
