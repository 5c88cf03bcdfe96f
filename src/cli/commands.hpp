#pragma once

#include <QString>
#include <QTextStream>
#include <chrono>
#include <optional>
#include <vector>

#include "core/config.hpp"
#include "service/remote_logger.hpp"

namespace lanlog::service {
class AppContext;
}

namespace lanlog::cli {

enum ExitCode : int {
    kExitOk = 0,
    kExitUsage = 1,
    kExitFailure = 2,
    kExitNeedsPasscode = 3
};

/**
 * One line per server: "  alpha", "* beta" (selected), "  gamma [locked]".
 */
[[nodiscard]] QString format_server_list(const std::vector<service::ServerEntry>& servers);

int run_browse(service::AppContext& context, std::chrono::seconds duration, QTextStream& out);

int run_connect(service::AppContext& context,
                const QString& name,
                const std::optional<QString>& passcode,
                std::chrono::milliseconds discovery_wait,
                QTextStream& out);

int run_forget(service::AppContext& context, const QString& name, QTextStream& out);

struct ServeOptions {
    QString name;
    std::optional<QString> passcode;
    uint16_t port = 0;
    // 0 runs until the process is stopped.
    std::chrono::seconds duration{0};
};

int run_serve(const Config& config, const ServeOptions& options, QTextStream& out);

} // namespace lanlog::cli
