#include <catch2/catch_test_macros.hpp>

#include "cli/commands.hpp"

using lanlog::cli::format_server_list;
using lanlog::service::ServerEntry;

TEST_CASE("CLI: empty server list", "[cli]") {
    REQUIRE(format_server_list({}) == QStringLiteral("(no servers)\n"));
}

TEST_CASE("CLI: selection and lock markers", "[cli]") {
    std::vector<ServerEntry> servers(3);
    servers[0].name = QStringLiteral("alpha");
    servers[1].name = QStringLiteral("beta");
    servers[1].is_selected = true;
    servers[2].name = QStringLiteral("gamma");
    servers[2].is_protected = true;

    REQUIRE(format_server_list(servers) ==
            QStringLiteral("  alpha\n* beta\n  gamma [locked]\n"));
}
