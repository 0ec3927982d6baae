#pragma once
#include <cstdint>
#include <string>
#include "core/logging/logger.hpp"

namespace winsys::core::config {

    inline std::string platform_default_root() {
#ifdef _WIN32
        return "C:\\";
#else
        return "/";
#endif
    }

    // Validated settings shared by the transport and every tool handler
    struct ServerConfig {
        std::string powershell_program = "powershell";
        uint32_t command_timeout_ms = 120000; // 0 disables the timeout
        uint32_t probe_timeout_ms = 3000;
        std::string default_root = platform_default_root();
        logging::LogLevel log_level = logging::LogLevel::INFO;
    };

} // namespace winsys::core::config
