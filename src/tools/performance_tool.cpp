#include "tools/performance_tool.hpp"

#include <cstdio>
#include <limits>
#include <sstream>
#include <vector>
#include "tools/host_info.hpp"
#include "tools/report_format.hpp"

namespace winsys::tools {

using core::errors::with_context;
using format::code_block;
using format::powershell_quote;
using protocol::ParamType;

namespace {

const std::vector<ActionBinding<PerformanceAction>>& performance_actions() {
    static const std::vector<ActionBinding<PerformanceAction>> bindings = {
        {PerformanceAction::GetCpuUsage, {"get_cpu_usage", {}}},
        {PerformanceAction::GetMemoryUsage, {"get_memory_usage", {}}},
        {PerformanceAction::GetDiskUsage, {"get_disk_usage", {}}},
        {PerformanceAction::GetDiskIo, {"get_disk_io", {}}},
        {PerformanceAction::GetNetworkIo, {"get_network_io", {}}},
        {PerformanceAction::GetSystemPerformance, {"get_system_performance", {}}},
        {PerformanceAction::GetTopProcessesByCpu, {"get_top_processes_by_cpu", {}}},
        {PerformanceAction::GetTopProcessesByMemory, {"get_top_processes_by_memory", {}}},
        {PerformanceAction::GetPerformanceCounters, {"get_performance_counters", {}}},
        {PerformanceAction::MonitorRealTime, {"monitor_real_time", {}}},
    };
    return bindings;
}

// Two-part reports: both queries must succeed.
core::errors::Result<std::string> paired_report(const core::errors::Result<std::string>& first,
                                                const core::errors::Result<std::string>& second,
                                                const std::string& title,
                                                const std::string& first_heading,
                                                const std::string& second_heading) {
    if (core::errors::is_error(first)) {
        return core::errors::get_error(first);
    }
    if (core::errors::is_error(second)) {
        return core::errors::get_error(second);
    }
    return "# " + title + "\n\n## " + first_heading + "\n" +
           code_block(core::errors::get_value(first)) + "\n\n## " + second_heading + "\n" +
           code_block(core::errors::get_value(second));
}

std::string percentage(const std::uint64_t part, const std::uint64_t whole) {
    const double value =
        whole == 0 ? 0.0 : static_cast<double>(part) / static_cast<double>(whole) * 100.0;
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.2f", value);
    return buffer;
}

}  // namespace

PerformanceTool::PerformanceTool(const ToolContext& context) : Tool(context) {}

const protocol::ToolSpec& PerformanceTool::spec() const {
    static const protocol::ToolSpec tool_spec = {
        "performance",
        "Performance monitoring",
        "System performance monitoring including CPU usage, memory usage, disk I/O, "
        "network I/O, and system performance counters",
        action_specs(performance_actions()),
        {
            {"duration", ParamType::Number, "Duration in seconds for monitoring (default: 10)", {}, 10},
            {"interval", ParamType::Number, "Interval in seconds between measurements (default: 1)", {}, 1},
            {"process_count", ParamType::Number, "Number of top processes to show (default: 10)", {}, 10},
            {"counter_name", ParamType::String, "Specific performance counter name to query", {}, nullptr},
        }};
    return tool_spec;
}

std::uint32_t PerformanceTool::sampling_window_ms(const std::int64_t samples,
                                                  const std::int64_t interval_s) {
    if (samples <= 0 || interval_s <= 0) {
        return 0;
    }
    constexpr std::int64_t kCap = std::numeric_limits<std::uint32_t>::max() / 2;
    if (samples > kCap / 1000 / interval_s) {
        return static_cast<std::uint32_t>(kCap);
    }
    return static_cast<std::uint32_t>(samples * interval_s * 1000);
}

core::errors::Result<std::string> PerformanceTool::run(const std::string& action,
                                                       const Arguments& args) const {
    const auto parsed = find_action(performance_actions(), action);
    if (!parsed) {
        return unknown_action_error(action);
    }

    const std::int64_t duration = args.integer_or("duration", 10);
    const std::int64_t process_count = args.integer_or("process_count", 10);
    switch (*parsed) {
        case PerformanceAction::GetCpuUsage:
            return get_cpu_usage(duration);
        case PerformanceAction::GetMemoryUsage:
            return get_memory_usage();
        case PerformanceAction::GetDiskUsage:
            return get_disk_usage();
        case PerformanceAction::GetDiskIo:
            return get_disk_io();
        case PerformanceAction::GetNetworkIo:
            return get_network_io();
        case PerformanceAction::GetSystemPerformance:
            return get_system_performance();
        case PerformanceAction::GetTopProcessesByCpu:
            return get_top_processes(false, process_count);
        case PerformanceAction::GetTopProcessesByMemory:
            return get_top_processes(true, process_count);
        case PerformanceAction::GetPerformanceCounters:
            return get_performance_counters(args.get_string("counter_name"));
        case PerformanceAction::MonitorRealTime:
            return monitor_real_time(duration, args.integer_or("interval", 1));
    }
    return unknown_action_error(action);
}

core::errors::Result<std::string> PerformanceTool::get_cpu_usage(const std::int64_t duration) const {
    const HostFacts facts = read_host_facts();
    const std::string context_message = "Failed to get CPU usage";

    auto overall = with_context(
        powershell("Get-Counter '\\Processor(_Total)\\% Processor Time' -SampleInterval 1 "
                   "-MaxSamples " +
                       std::to_string(duration) +
                       " | Select-Object -ExpandProperty CounterSamples | Select-Object "
                       "CookedValue | Measure-Object -Property CookedValue -Average -Maximum "
                       "-Minimum",
                   sampling_window_ms(duration, 1)),
        context_message);
    if (core::errors::is_error(overall)) {
        return core::errors::get_error(overall);
    }
    auto per_core = with_context(
        powershell("Get-Counter '\\Processor(*)\\% Processor Time' -MaxSamples 1 | Select-Object "
                   "-ExpandProperty CounterSamples | Where-Object {$_.InstanceName -ne '_total'} "
                   "| Select-Object InstanceName, CookedValue | Format-Table -AutoSize"),
        context_message);
    if (core::errors::is_error(per_core)) {
        return core::errors::get_error(per_core);
    }

    std::ostringstream out;
    out << "# CPU Usage Analysis\n\n## CPU Information\n"
        << "- **Model**: " << (facts.cpu_model.empty() ? "Unknown" : facts.cpu_model) << "\n"
        << "- **Cores**: " << facts.cpu_count << "\n"
        << "- **Monitoring Duration**: " << duration << " seconds\n\n"
        << "## Overall CPU Usage Statistics\n" << code_block(core::errors::get_value(overall))
        << "\n\n## Per-Core Usage (Current)\n" << code_block(core::errors::get_value(per_core));
    return out.str();
}

core::errors::Result<std::string> PerformanceTool::get_memory_usage() const {
    const HostFacts facts = read_host_facts();
    const std::uint64_t used = facts.total_memory_bytes > facts.free_memory_bytes
                                   ? facts.total_memory_bytes - facts.free_memory_bytes
                                   : 0;
    const std::string context_message = "Failed to get memory usage";

    auto counters = with_context(
        powershell("Get-Counter '\\Memory\\Available MBytes', '\\Memory\\Committed Bytes', "
                   "'\\Memory\\Pool Nonpaged Bytes', '\\Memory\\Pool Paged Bytes' | "
                   "Select-Object -ExpandProperty CounterSamples | Select-Object Path, "
                   "CookedValue | Format-Table -AutoSize"),
        context_message);
    if (core::errors::is_error(counters)) {
        return core::errors::get_error(counters);
    }
    auto top = with_context(
        powershell("Get-Process | Sort-Object WorkingSet -Descending | Select-Object -First 10 "
                   "Name, @{Name='MemoryMB';Expression={[math]::Round($_.WorkingSet/1MB,2)}} | "
                   "Format-Table -AutoSize"),
        context_message);
    if (core::errors::is_error(top)) {
        return core::errors::get_error(top);
    }

    std::ostringstream out;
    out << "# Memory Usage Analysis\n\n## Overall Memory Status\n"
        << "- **Total Memory**: "
        << format::format_bytes(static_cast<double>(facts.total_memory_bytes)) << "\n"
        << "- **Used Memory**: " << format::format_bytes(static_cast<double>(used)) << "\n"
        << "- **Free Memory**: "
        << format::format_bytes(static_cast<double>(facts.free_memory_bytes)) << "\n"
        << "- **Usage Percentage**: " << percentage(used, facts.total_memory_bytes) << "%\n\n"
        << "## Detailed Memory Counters\n" << code_block(core::errors::get_value(counters))
        << "\n\n## Top 10 Processes by Memory Usage\n" << code_block(core::errors::get_value(top));
    return out.str();
}

core::errors::Result<std::string> PerformanceTool::get_disk_usage() const {
    auto output = with_context(
        powershell("Get-WmiObject -Class Win32_LogicalDisk | Select-Object DeviceID, "
                   "@{Name='SizeGB';Expression={[math]::Round($_.Size/1GB,2)}}, "
                   "@{Name='FreeSpaceGB';Expression={[math]::Round($_.FreeSpace/1GB,2)}}, "
                   "@{Name='UsedSpaceGB';Expression={[math]::Round(($_.Size-$_.FreeSpace)/1GB,2)}}, "
                   "@{Name='PercentFree';Expression={[math]::Round(($_.FreeSpace/$_.Size)*100,2)}}"
                   " | Format-Table -AutoSize"),
        "Failed to get disk usage");
    if (core::errors::is_error(output)) {
        return core::errors::get_error(output);
    }
    return "# Disk Usage Analysis\n\n" + code_block(core::errors::get_value(output));
}

core::errors::Result<std::string> PerformanceTool::get_disk_io() const {
    const std::string context_message = "Failed to get disk I/O";
    auto overall = with_context(
        powershell("Get-Counter '\\PhysicalDisk(_Total)\\Disk Reads/sec', "
                   "'\\PhysicalDisk(_Total)\\Disk Writes/sec', "
                   "'\\PhysicalDisk(_Total)\\Disk Read Bytes/sec', "
                   "'\\PhysicalDisk(_Total)\\Disk Write Bytes/sec', "
                   "'\\PhysicalDisk(_Total)\\% Disk Time' | Select-Object -ExpandProperty "
                   "CounterSamples | Select-Object Path, CookedValue | Format-Table -AutoSize"),
        context_message);
    if (core::errors::is_error(overall)) {
        return core::errors::get_error(overall);
    }
    auto per_disk = with_context(
        powershell("Get-Counter '\\PhysicalDisk(*)\\% Disk Time' | Select-Object -ExpandProperty "
                   "CounterSamples | Where-Object {$_.InstanceName -ne '_total'} | Select-Object "
                   "InstanceName, CookedValue | Format-Table -AutoSize"),
        context_message);
    return paired_report(overall, per_disk, "Disk I/O Performance", "Overall Disk I/O",
                         "Per-Disk Usage");
}

core::errors::Result<std::string> PerformanceTool::get_network_io() const {
    const std::string context_message = "Failed to get network I/O";
    auto total = with_context(
        powershell("Get-Counter '\\Network Interface(*)\\Bytes Total/sec' | Select-Object "
                   "-ExpandProperty CounterSamples | Where-Object {$_.CookedValue -gt 0} | "
                   "Select-Object InstanceName, CookedValue | Format-Table -AutoSize"),
        context_message);
    if (core::errors::is_error(total)) {
        return core::errors::get_error(total);
    }
    auto detail = with_context(
        powershell("Get-Counter '\\Network Interface(*)\\Bytes Received/sec', "
                   "'\\Network Interface(*)\\Bytes Sent/sec' | Select-Object -ExpandProperty "
                   "CounterSamples | Where-Object {$_.CookedValue -gt 0} | Select-Object "
                   "InstanceName, Path, CookedValue | Format-Table -AutoSize"),
        context_message);
    return paired_report(total, detail, "Network I/O Performance", "Total Network Traffic",
                         "Detailed Network Statistics");
}

core::errors::Result<std::string> PerformanceTool::get_system_performance() const {
    const std::string context_message = "Failed to get system performance";
    auto indicators = with_context(
        powershell("Get-Counter '\\Processor(_Total)\\% Processor Time', "
                   "'\\Memory\\Available MBytes', '\\PhysicalDisk(_Total)\\% Disk Time', "
                   "'\\System\\Processor Queue Length', '\\System\\Context Switches/sec' | "
                   "Select-Object -ExpandProperty CounterSamples | Select-Object Path, "
                   "CookedValue | Format-Table -AutoSize"),
        context_message);
    if (core::errors::is_error(indicators)) {
        return core::errors::get_error(indicators);
    }
    auto uptime = with_context(
        powershell("Get-CimInstance -ClassName Win32_OperatingSystem | Select-Object "
                   "LastBootUpTime, @{Name='UptimeHours';Expression={(Get-Date) - "
                   "$_.LastBootUpTime | Select-Object -ExpandProperty TotalHours}} | Format-List"),
        context_message);
    return paired_report(indicators, uptime, "System Performance Overview",
                         "Key Performance Indicators", "System Uptime");
}

core::errors::Result<std::string> PerformanceTool::get_top_processes(const bool by_memory,
                                                                     const std::int64_t count) const {
    const std::string memory_column =
        "@{Name='MemoryMB';Expression={[math]::Round($_.WorkingSet/1MB,2)}}";
    const std::string cpu_column = "@{Name='CPU%';Expression={$_.CPU}}";
    const std::string columns = by_memory ? memory_column + ", " + cpu_column
                                          : cpu_column + ", " + memory_column;

    auto output = with_context(
        powershell("Get-Process | Sort-Object " + std::string(by_memory ? "WorkingSet" : "CPU") +
                   " -Descending | Select-Object -First " + std::to_string(count) +
                   " Name, Id, " + columns + ", StartTime | Format-Table -AutoSize"),
        by_memory ? "Failed to get top processes by memory" : "Failed to get top processes by CPU");
    if (core::errors::is_error(output)) {
        return core::errors::get_error(output);
    }
    return "# Top " + std::to_string(count) + " Processes by " +
           (by_memory ? "Memory" : "CPU") + " Usage\n\n" +
           code_block(core::errors::get_value(output));
}

core::errors::Result<std::string> PerformanceTool::get_performance_counters(
    const std::optional<std::string>& counter_name) const {
    if (!counter_name) {
        auto sets = with_context(
            powershell("Get-Counter -ListSet * | Select-Object CounterSetName, Description | "
                       "Sort-Object CounterSetName | Format-Table -AutoSize"),
            "Failed to get performance counters");
        if (core::errors::is_error(sets)) {
            return core::errors::get_error(sets);
        }
        return "# Available Performance Counter Categories\n\n" +
               code_block(core::errors::get_value(sets));
    }

    auto checked = context().guard.validate_value("counter_name", *counter_name);
    if (core::errors::is_error(checked)) {
        return core::errors::get_error(checked);
    }
    auto output = with_context(
        powershell("Get-Counter " + powershell_quote(*counter_name) +
                   " | Select-Object -ExpandProperty CounterSamples | Select-Object Path, "
                   "CookedValue, RawValue | Format-List"),
        "Failed to get performance counters");
    if (core::errors::is_error(output)) {
        return core::errors::get_error(output);
    }
    return "# Performance Counter: " + *counter_name + "\n\n" +
           code_block(core::errors::get_value(output));
}

core::errors::Result<std::string> PerformanceTool::monitor_real_time(
    const std::int64_t duration, const std::int64_t interval) const {
    const std::string script =
        "$samples = @(); for($i=1; $i -le " + std::to_string(duration) +
        "; $i++) { $cpu = Get-Counter '\\Processor(_Total)\\% Processor Time' -MaxSamples 1; "
        "$mem = Get-Counter '\\Memory\\Available MBytes' -MaxSamples 1; "
        "$samples += \"Sample $i - CPU: $([math]::Round($cpu.CounterSamples.CookedValue,2))% "
        "Memory Available: $([math]::Round($mem.CounterSamples.CookedValue,2))MB\"; "
        "Start-Sleep " +
        std::to_string(interval) + " }; $samples";

    auto output = with_context(powershell(script, sampling_window_ms(duration, interval)),
                               "Failed to monitor real-time performance");
    if (core::errors::is_error(output)) {
        return core::errors::get_error(output);
    }
    return "# Real-time Performance Monitoring\n\nDuration: " + std::to_string(duration) +
           " seconds\nInterval: " + std::to_string(interval) + " second(s)\n\n" +
           code_block(core::errors::get_value(output));
}

}  // namespace winsys::tools
