#include "service/context.hpp"
#include "network/tcp_connection_backend.hpp"
#include "core/logging.hpp"

namespace lanlog::service {

AppContext::AppContext(Config config,
                       QSettings& settings,
                       std::unique_ptr<network::DiscoveryBackend> discovery_backend,
                       std::unique_ptr<network::ConnectionBackend> connection_backend,
                       std::unique_ptr<storage::PasscodeStore> passcodes)
    : config_(std::move(config))
    , settings_(settings)
    , passcodes_(std::move(passcodes))
{
    if (!passcodes_) {
        passcodes_ = std::make_unique<storage::SettingsPasscodeStore>(
            config_.passcode_store_path, config_.passcode_key_path);
    }
    if (!discovery_backend) {
        discovery_backend = network::createDiscoveryBackend(config_.discovery_backend,
                                                            config_.service_type);
    }
    if (!connection_backend) {
        connection_backend = std::make_unique<network::TcpConnectionBackend>(
            config_.device_id, config_.device_name);
    }

    discovery_ = std::make_unique<network::DiscoveryService>(std::move(discovery_backend));
    discovery_->setRestartPolicy(config_.discovery_restart_delay,
                                 config_.discovery_restart_max_delay);

    connections_ = std::make_unique<network::ConnectionManager>(
        std::move(connection_backend), *passcodes_, config_.connect_timeout);

    remote_logger_ = std::make_unique<RemoteLogger>(
        *discovery_, *connections_, *passcodes_, settings_, config_.toggle_debounce);

    qCDebug(lcRemote) << "context ready: device" << config_.device_name
                      << "service type" << config_.service_type;
}

AppContext::~AppContext() {
    // Tear down in dependency order: observers first.
    remote_logger_.reset();
    connections_.reset();
    discovery_.reset();
}

} // namespace lanlog::service
