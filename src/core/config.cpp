#include "core/config.hpp"

#include <QDir>
#include <QSettings>
#include <QStandardPaths>
#include <QSysInfo>

namespace lanlog {

namespace {

Uuid get_or_create_device_id(QSettings& settings) {
    const QString key = QString::fromLatin1(settings_keys::kDeviceId);
    const QString stored = settings.value(key).toString();
    if (!stored.isEmpty()) {
        if (auto parsed = Uuid::parse(stored.toStdString())) {
            return *parsed;
        }
    }
    auto id = Uuid::generate();
    settings.setValue(key, QString::fromStdString(id.to_string()));
    return id;
}

std::chrono::milliseconds read_millis(const QSettings& settings,
                                      const char* key,
                                      std::chrono::milliseconds fallback) {
    bool ok = false;
    const auto value = settings.value(QString::fromLatin1(key)).toLongLong(&ok);
    if (!ok || value <= 0) {
        return fallback;
    }
    return std::chrono::milliseconds(value);
}

} // namespace

Config load_config(QSettings& settings) {
    Config config;

    config.device_id = get_or_create_device_id(settings);

    const auto host_name = QSysInfo::machineHostName();
    config.device_name = settings.value(QString::fromLatin1(settings_keys::kDeviceName),
                                        host_name.isEmpty() ? QStringLiteral("lanlog")
                                                            : host_name).toString();

    const auto service_type =
        settings.value(QString::fromLatin1(settings_keys::kServiceType)).toString().trimmed();
    if (!service_type.isEmpty()) {
        config.service_type = service_type;
    }

    config.discovery_backend =
        settings.value(QString::fromLatin1(settings_keys::kDiscoveryBackend)).toString()
            .trimmed().toLower();
    config.toggle_debounce =
        read_millis(settings, settings_keys::kToggleDebounceMs, config.toggle_debounce);
    config.connect_timeout =
        read_millis(settings, settings_keys::kConnectTimeoutMs, config.connect_timeout);

    const auto data_dir = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (!data_dir.isEmpty()) {
        config.passcode_store_path = QDir(data_dir).filePath(QStringLiteral("passcodes.ini"));
        config.passcode_key_path = QDir(data_dir).filePath(QStringLiteral("passcodes.key"));
    }

    if (qEnvironmentVariableIsSet("LANLOG_DISCOVERY_BACKEND")) {
        config.discovery_backend =
            qEnvironmentVariable("LANLOG_DISCOVERY_BACKEND").trimmed().toLower();
    }
    if (qEnvironmentVariableIsSet("LANLOG_DEBUG")) {
        config.debug = true;
    }
    if (qEnvironmentVariableIsSet("LANLOG_CONNECT_TIMEOUT_MS")) {
        bool ok = false;
        const auto ms = qEnvironmentVariable("LANLOG_CONNECT_TIMEOUT_MS").toLongLong(&ok);
        if (ok && ms > 0) {
            config.connect_timeout = std::chrono::milliseconds(ms);
        }
    }

    return config;
}

} // namespace lanlog
