#pragma once

#include "core/types.hpp"

#include <QString>
#include <chrono>

class QSettings;

namespace lanlog {

/**
 * Config - runtime settings for the remote logger core.
 *
 * Loaded from the application QSettings, then overridden by LANLOG_* environment
 * variables; the command-line tool applies its own options last.
 */
struct Config {
    static constexpr const char* DEFAULT_SERVICE_TYPE = "_lanlog._tcp";

    QString service_type = QString::fromLatin1(DEFAULT_SERVICE_TYPE);
    QString device_name;
    Uuid device_id;

    std::chrono::milliseconds toggle_debounce{500};
    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds discovery_restart_delay{2000};
    std::chrono::milliseconds discovery_restart_max_delay{30000};

    // "", "udp" or "mdns"
    QString discovery_backend;

    QString passcode_store_path;
    QString passcode_key_path;

    bool debug = false;
};

// Settings keys shared with the remote logger's persisted state.
namespace settings_keys {
constexpr const char* kDeviceId = "device/id";
constexpr const char* kDeviceName = "device/name";
constexpr const char* kServiceType = "discovery/service_type";
constexpr const char* kDiscoveryBackend = "discovery/backend";
constexpr const char* kToggleDebounceMs = "remote/toggle_debounce_ms";
constexpr const char* kConnectTimeoutMs = "remote/connect_timeout_ms";
constexpr const char* kEnabled = "remote/enabled";
constexpr const char* kSelectedServer = "remote/selected_server";
} // namespace settings_keys

/**
 * Load the configuration. Generates and persists the device id on first run.
 */
[[nodiscard]] Config load_config(QSettings& settings);

} // namespace lanlog
