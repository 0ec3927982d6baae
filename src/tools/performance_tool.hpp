#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include "tools/tool.hpp"

namespace winsys::tools {

enum class PerformanceAction {
    GetCpuUsage,
    GetMemoryUsage,
    GetDiskUsage,
    GetDiskIo,
    GetNetworkIo,
    GetSystemPerformance,
    GetTopProcessesByCpu,
    GetTopProcessesByMemory,
    GetPerformanceCounters,
    MonitorRealTime
};

class PerformanceTool final : public Tool {
public:
    explicit PerformanceTool(const ToolContext& context);

    const protocol::ToolSpec& spec() const override;
    core::errors::Result<std::string> run(const std::string& action,
                                          const Arguments& args) const override;

    // Extra command time for a sampling loop of `samples` steps `interval_s` apart.
    static std::uint32_t sampling_window_ms(std::int64_t samples, std::int64_t interval_s);

private:
    core::errors::Result<std::string> get_cpu_usage(std::int64_t duration) const;
    core::errors::Result<std::string> get_memory_usage() const;
    core::errors::Result<std::string> get_disk_usage() const;
    core::errors::Result<std::string> get_disk_io() const;
    core::errors::Result<std::string> get_network_io() const;
    core::errors::Result<std::string> get_system_performance() const;
    core::errors::Result<std::string> get_top_processes(bool by_memory, std::int64_t count) const;
    core::errors::Result<std::string> get_performance_counters(
        const std::optional<std::string>& counter_name) const;
    core::errors::Result<std::string> monitor_real_time(std::int64_t duration,
                                                        std::int64_t interval) const;
};

}  // namespace winsys::tools
