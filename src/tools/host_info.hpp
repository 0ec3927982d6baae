#pragma once

#include <cstdint>
#include <string>

namespace winsys::tools {

struct HostFacts {
    std::string hostname;
    std::string platform;
    std::string architecture;
    std::string cpu_model;
    unsigned cpu_count = 0;
    std::uint64_t total_memory_bytes = 0;
    std::uint64_t free_memory_bytes = 0;
    std::uint64_t uptime_seconds = 0;
};

// Facts that are unavailable are left empty or zero.
HostFacts read_host_facts();

}  // namespace winsys::tools
