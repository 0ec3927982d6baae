#include <iostream>
#include <string>
#include "app/cli_parser.hpp"
#include "core/config/session_id.hpp"
#include "core/errors/tool_errors.hpp"
#include "core/logging/logger.hpp"
#include "policy/policy_guard.hpp"
#include "runtime/dispatcher.hpp"
#include "runtime/tool_registry.hpp"
#include "session/mcp_session.hpp"
#include "tools/command_runner.hpp"
#include "tools/port_scanner.hpp"
#include "tools/tool.hpp"

int main(int argc, char* argv[]) {
    // 1. Generate a unique Session ID for this process
    const std::string session_id = winsys::core::config::generate_session_id();

    // 2. Register the Session ID with the Global Logger
    auto& logger = winsys::core::logging::Logger::get();
    logger.set_session_id(session_id);

    // 3. Parse CLI input and return normalized input errors
    auto parsed = winsys::app::cli::parse_and_validate(argc, argv);
    if (winsys::core::errors::is_error(parsed)) {
        const auto& err = winsys::core::errors::get_error(parsed);
        WINSYS_LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            WINSYS_LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }

    const auto& options = winsys::core::errors::get_value(parsed);
    logger.set_min_level(options.config.log_level);
    WINSYS_LOG_DEBUG("PowerShell program: " + options.config.powershell_program);

    // 4. Wire the collaborators every tool shares
    const winsys::tools::ProcessCommandRunner runner{};
    const winsys::tools::TcpPortProber prober{};
    const winsys::policy::PolicyGuard guard;
    const winsys::tools::ToolContext context{runner, prober, options.config, guard};
    const winsys::runtime::ToolRegistry registry(context);
    const winsys::runtime::Dispatcher dispatcher(registry);

    switch (options.command) {
        case winsys::app::cli::Command::ListTools:
            std::cout << registry.describe().dump(2) << std::endl;
            return 0;

        case winsys::app::cli::Command::Call: {
            winsys::protocol::ToolCall call;
            call.name = options.tool.value_or("");
            call.arguments = options.arguments;
            const auto response = dispatcher.handle(call);
            std::cout << response.text << std::endl;
            return response.is_error ? 1 : 0;
        }

        case winsys::app::cli::Command::Serve: {
            WINSYS_LOG_INFO(std::string("Starting ") + winsys::session::kServerName + " " +
                            winsys::session::kServerVersion);
            const winsys::session::McpSession session(registry, dispatcher);
            session.run(std::cin, std::cout);
            return 0;
        }
    }
    return 0;
}
