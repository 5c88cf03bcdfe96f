#pragma once

#include "core/config.hpp"
#include "network/connection_manager.hpp"
#include "network/discovery.hpp"
#include "service/remote_logger.hpp"
#include "storage/passcode_store.hpp"

#include <memory>

class QSettings;

namespace lanlog::service {

/**
 * AppContext - the remote logger core, wired once at process start.
 *
 * Backends default to the platform discovery backend and the TCP handshake
 * backend; tests pass their own.
 */
class AppContext {
public:
    AppContext(Config config,
               QSettings& settings,
               std::unique_ptr<network::DiscoveryBackend> discovery_backend = nullptr,
               std::unique_ptr<network::ConnectionBackend> connection_backend = nullptr,
               std::unique_ptr<storage::PasscodeStore> passcodes = nullptr);
    ~AppContext();

    AppContext(const AppContext&) = delete;
    AppContext& operator=(const AppContext&) = delete;

    [[nodiscard]] const Config& config() const { return config_; }
    [[nodiscard]] QSettings& settings() { return settings_; }
    [[nodiscard]] storage::PasscodeStore& passcodes() { return *passcodes_; }
    [[nodiscard]] network::DiscoveryService& discovery() { return *discovery_; }
    [[nodiscard]] network::ConnectionManager& connections() { return *connections_; }
    [[nodiscard]] RemoteLogger& remoteLogger() { return *remote_logger_; }

private:
    Config config_;
    QSettings& settings_;
    std::unique_ptr<storage::PasscodeStore> passcodes_;
    std::unique_ptr<network::DiscoveryService> discovery_;
    std::unique_ptr<network::ConnectionManager> connections_;
    std::unique_ptr<RemoteLogger> remote_logger_;
};

} // namespace lanlog::service
