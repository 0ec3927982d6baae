#include "cli_parser.hpp"
#include <charconv>
#include <cstdint>
#include <optional>
#include <system_error>
#include <vector>

namespace winsys::app::cli {

    using namespace winsys::core::errors;
    using winsys::core::logging::LogLevel;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> powershell;
        std::optional<std::string> command_timeout_ms;
        std::optional<std::string> probe_timeout_ms;
        std::optional<std::string> default_root;
        std::optional<std::string> log_level;
        std::optional<std::string> tool;
        std::optional<std::string> args;
        bool verbose = false;
    };

    // Exception-free integer parsing with inclusive bounds
    Result<uint32_t> parse_bounded(const std::string& flag, const std::string& text,
                                   uint32_t min_value, uint32_t max_value) {
        uint32_t value = 0;
        const char* begin = text.data();
        const char* end = text.data() + text.size();
        auto [ptr, ec] = std::from_chars(begin, end, value);
        if (ec != std::errc() || ptr != end) {
            return ToolError{ErrorCategory::Input, "Invalid number for " + flag, "invalid_integer", "Provide a non-negative integer."};
        }
        if (value < min_value || value > max_value) {
            return ToolError{ErrorCategory::Input, flag + " out of bounds", "bounds_error",
                             "Must be between " + std::to_string(min_value) + " and " + std::to_string(max_value) + "."};
        }
        return value;
    }

    Result<CliOptions> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return ToolError{ErrorCategory::Input, "No command provided.", "missing_command", "Usage: winsys-mcp serve | list-tools | call --tool <name> --args <json>"};
        }

        CliOptions options;
        std::string command = argv[1];
        if (command == "serve") {
            options.command = Command::Serve;
        } else if (command == "list-tools") {
            options.command = Command::ListTools;
        } else if (command == "call") {
            options.command = Command::Call;
        } else {
            return ToolError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command", "Supported commands: serve, list-tools, call."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--powershell") {
                if (i + 1 < args.size()) raw.powershell = args[++i];
                else return ToolError{ErrorCategory::Input, "Missing value for --powershell", "missing_value"};
            } else if (args[i] == "--command-timeout-ms") {
                if (i + 1 < args.size()) raw.command_timeout_ms = args[++i];
                else return ToolError{ErrorCategory::Input, "Missing value for --command-timeout-ms", "missing_value"};
            } else if (args[i] == "--probe-timeout-ms") {
                if (i + 1 < args.size()) raw.probe_timeout_ms = args[++i];
                else return ToolError{ErrorCategory::Input, "Missing value for --probe-timeout-ms", "missing_value"};
            } else if (args[i] == "--default-root") {
                if (i + 1 < args.size()) raw.default_root = args[++i];
                else return ToolError{ErrorCategory::Input, "Missing value for --default-root", "missing_value"};
            } else if (args[i] == "--log-level") {
                if (i + 1 < args.size()) raw.log_level = args[++i];
                else return ToolError{ErrorCategory::Input, "Missing value for --log-level", "missing_value"};
            } else if (args[i] == "--tool") {
                if (i + 1 < args.size()) raw.tool = args[++i];
                else return ToolError{ErrorCategory::Input, "Missing value for --tool", "missing_value"};
            } else if (args[i] == "--args") {
                if (i + 1 < args.size()) raw.args = args[++i];
                else return ToolError{ErrorCategory::Input, "Missing value for --args", "missing_value"};
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else {
                return ToolError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument"};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        auto& config = options.config;

        if (raw.powershell) {
            if (raw.powershell->empty()) {
                return ToolError{ErrorCategory::Input, "--powershell must not be empty", "invalid_value"};
            }
            config.powershell_program = raw.powershell.value();
        }

        if (raw.command_timeout_ms) {
            auto parsed = parse_bounded("--command-timeout-ms", raw.command_timeout_ms.value(), 0, 86400000);
            if (is_error(parsed)) return get_error(parsed);
            config.command_timeout_ms = get_value(parsed);
        }

        if (raw.probe_timeout_ms) {
            auto parsed = parse_bounded("--probe-timeout-ms", raw.probe_timeout_ms.value(), 1, 60000);
            if (is_error(parsed)) return get_error(parsed);
            config.probe_timeout_ms = get_value(parsed);
        }

        if (raw.default_root) {
            if (raw.default_root->empty()) {
                return ToolError{ErrorCategory::Input, "--default-root must not be empty", "invalid_value"};
            }
            config.default_root = raw.default_root.value();
        }

        if (raw.log_level) {
            auto level = winsys::core::logging::parse_log_level(raw.log_level.value());
            if (!level) {
                return ToolError{ErrorCategory::Input, "Invalid log level: " + raw.log_level.value(), "invalid_log_level", "Use one of: debug, info, warn, error."};
            }
            config.log_level = level.value();
        }
        if (raw.verbose) {
            config.log_level = LogLevel::DEBUG;
        }

        // --tool and --args only make sense for a single call
        if (options.command != Command::Call) {
            if (raw.tool || raw.args) {
                return ToolError{ErrorCategory::Input, "--tool and --args are only valid with the 'call' command", "conflicting_flags"};
            }
            return options;
        }

        if (!raw.tool || raw.tool->empty()) {
            return ToolError{ErrorCategory::Input, "Must provide --tool for the 'call' command", "missing_required_flag"};
        }
        options.tool = raw.tool.value();

        if (raw.args) {
            auto parsed = nlohmann::json::parse(raw.args.value(), nullptr, false);
            if (parsed.is_discarded() || !parsed.is_object()) {
                return ToolError{ErrorCategory::Input, "--args must be a JSON object", "invalid_json", "Example: --args '{\"action\":\"list_directory\",\"path\":\"/tmp\"}'"};
            }
            options.arguments = std::move(parsed);
        }

        return options;
    }

} // namespace winsys::app::cli
