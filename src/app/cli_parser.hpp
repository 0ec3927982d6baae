#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "core/config/server_config.hpp"
#include "core/errors/tool_errors.hpp"

namespace winsys::app::cli {

    enum class Command {
        Serve,      // MCP over stdin/stdout
        ListTools,  // print advertised schemas
        Call        // dispatch one request and print the report
    };

    struct CliOptions {
        Command command = Command::Serve;
        winsys::core::config::ServerConfig config;
        std::optional<std::string> tool;                              // call only
        nlohmann::json arguments = nlohmann::json::object();         // call only
    };

    winsys::core::errors::Result<CliOptions> parse_and_validate(int argc, char* argv[]);
}
