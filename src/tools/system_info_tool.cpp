#include "tools/system_info_tool.hpp"

#include <cstdlib>
#include <sstream>
#include "tools/host_info.hpp"
#include "tools/report_format.hpp"

namespace winsys::tools {

using core::errors::with_context;
using format::code_block;
using format::powershell_quote;
using protocol::ParamType;

namespace {

constexpr std::size_t kMaxPathEntries = 20;

const std::vector<ActionBinding<SystemInfoAction>>& system_info_actions() {
    static const std::vector<ActionBinding<SystemInfoAction>> bindings = {
        {SystemInfoAction::GetSystemOverview, {"get_system_overview", {}}},
        {SystemInfoAction::GetHardwareInfo, {"get_hardware_info", {}}},
        {SystemInfoAction::GetOsInfo, {"get_os_info", {}}},
        {SystemInfoAction::GetEnvironmentVars, {"get_environment_vars", {}}},
        {SystemInfoAction::GetInstalledSoftware, {"get_installed_software", {}}},
        {SystemInfoAction::GetSystemUptime, {"get_system_uptime", {}}},
        {SystemInfoAction::GetUserInfo, {"get_user_info", {}}},
        {SystemInfoAction::GetSystemPaths, {"get_system_paths", {}}},
    };
    return bindings;
}

std::string env_or_na(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return "N/A";
    }
    return value;
}

std::string filter_line(const std::optional<std::string>& filter) {
    return filter ? "Filter: \"" + *filter + "\"\n\n" : "";
}

}  // namespace

SystemInfoTool::SystemInfoTool(const ToolContext& context) : Tool(context) {}

const protocol::ToolSpec& SystemInfoTool::spec() const {
    static const protocol::ToolSpec tool_spec = {
        "system_info",
        "System information",
        "Comprehensive system information including hardware details, OS info, "
        "environment variables, and system configuration",
        action_specs(system_info_actions()),
        {
            {"category", ParamType::String, "Hardware category to focus on (for hardware_info action)",
             {"cpu", "memory", "disk", "network", "all"}, "all"},
            {"filter", ParamType::String, "Filter for environment variables or software (supports wildcards)", {}, nullptr},
        }};
    return tool_spec;
}

std::vector<std::string> SystemInfoTool::split_path_entries(const std::string& path_value,
                                                            const std::size_t limit) {
    const char separator = path_value.find(';') != std::string::npos ? ';' : ':';
    std::vector<std::string> entries;
    std::istringstream in(path_value);
    std::string entry;
    while (entries.size() < limit && std::getline(in, entry, separator)) {
        entries.push_back(entry);
    }
    return entries;
}

core::errors::Result<std::string> SystemInfoTool::run(const std::string& action,
                                                      const Arguments& args) const {
    const auto parsed = find_action(system_info_actions(), action);
    if (!parsed) {
        return unknown_action_error(action);
    }

    switch (*parsed) {
        case SystemInfoAction::GetSystemOverview:
            return get_system_overview();
        case SystemInfoAction::GetHardwareInfo:
            return get_hardware_info(args.string_or("category", "all"));
        case SystemInfoAction::GetOsInfo:
            return get_os_info();
        case SystemInfoAction::GetEnvironmentVars:
            return get_environment_vars(args.get_string("filter"));
        case SystemInfoAction::GetInstalledSoftware:
            return get_installed_software(args.get_string("filter"));
        case SystemInfoAction::GetSystemUptime:
            return get_system_uptime();
        case SystemInfoAction::GetUserInfo:
            return get_user_info();
        case SystemInfoAction::GetSystemPaths:
            return get_system_paths();
    }
    return unknown_action_error(action);
}

core::errors::Result<std::string> SystemInfoTool::get_system_overview() const {
    const HostFacts facts = read_host_facts();

    auto details = with_context(
        powershell("Get-ComputerInfo | Select-Object WindowsProductName, WindowsVersion, "
                   "TotalPhysicalMemory, CsProcessors, CsSystemType, TimeZone | Format-List"),
        "Failed to get system overview");
    if (core::errors::is_error(details)) {
        return core::errors::get_error(details);
    }

    std::ostringstream out;
    out << "# System Overview\n\n## Basic Information\n"
        << "- **Hostname**: " << facts.hostname << "\n"
        << "- **Platform**: " << facts.platform << "\n"
        << "- **Architecture**: " << facts.architecture << "\n"
        << "- **CPU Cores**: " << facts.cpu_count << "\n"
        << "- **Total Memory**: "
        << format::format_bytes(static_cast<double>(facts.total_memory_bytes)) << "\n"
        << "- **Free Memory**: "
        << format::format_bytes(static_cast<double>(facts.free_memory_bytes)) << "\n"
        << "- **System Uptime**: " << format::format_uptime(facts.uptime_seconds) << "\n\n"
        << "## Windows Details\n"
        << code_block(core::errors::get_value(details));
    return out.str();
}

core::errors::Result<std::string> SystemInfoTool::get_hardware_info(
    const std::string& category) const {
    struct HardwareSection {
        const char* category;
        const char* heading;
        const char* script;
    };
    static const HardwareSection sections[] = {
        {"cpu", "CPU Information",
         "Get-WmiObject -Class Win32_Processor | Select-Object Name, Manufacturer, "
         "MaxClockSpeed, NumberOfCores, NumberOfLogicalProcessors, Architecture | Format-List"},
        {"memory", "Memory Information",
         "Get-WmiObject -Class Win32_PhysicalMemory | Select-Object Manufacturer, Capacity, "
         "Speed, MemoryType, FormFactor | Format-Table -AutoSize"},
        {"disk", "Disk Information",
         "Get-WmiObject -Class Win32_DiskDrive | Select-Object Model, Size, MediaType, "
         "InterfaceType | Format-Table -AutoSize"},
        {"network", "Network Adapters",
         "Get-WmiObject -Class Win32_NetworkAdapter | Where-Object {$_.NetConnectionStatus "
         "-eq 2} | Select-Object Name, MACAddress, Speed, AdapterType | Format-Table -AutoSize"},
    };

    std::string result = "# Hardware Information\n\n";
    bool first = true;
    for (const auto& section : sections) {
        if (category != "all" && category != section.category) {
            continue;
        }
        auto output = with_context(powershell(section.script), "Failed to get hardware info");
        if (core::errors::is_error(output)) {
            return core::errors::get_error(output);
        }
        if (!first) {
            result += "\n\n";
        }
        first = false;
        result += "## " + std::string(section.heading) + "\n" +
                  code_block(core::errors::get_value(output));
    }
    return result;
}

core::errors::Result<std::string> SystemInfoTool::get_os_info() const {
    auto details = with_context(
        powershell("Get-ComputerInfo | Select-Object WindowsProductName, WindowsVersion, "
                   "WindowsBuildLabEx, WindowsInstallationType, WindowsRegisteredOwner, "
                   "TimeZone, BootupState, ThermalState, PowerPlatformRole | Format-List"),
        "Failed to get OS info");
    if (core::errors::is_error(details)) {
        return core::errors::get_error(details);
    }
    auto hotfixes = with_context(
        powershell("Get-HotFix | Sort-Object InstalledOn -Descending | Select-Object -First 10 "
                   "HotFixID, Description, InstalledOn | Format-Table -AutoSize"),
        "Failed to get OS info");
    if (core::errors::is_error(hotfixes)) {
        return core::errors::get_error(hotfixes);
    }

    return "# Operating System Information\n\n## System Details\n" +
           code_block(core::errors::get_value(details)) + "\n\n## Recent Updates\n" +
           code_block(core::errors::get_value(hotfixes));
}

core::errors::Result<std::string> SystemInfoTool::get_environment_vars(
    const std::optional<std::string>& filter) const {
    std::string filter_clause;
    if (filter) {
        auto checked = context().guard.validate_value("filter", *filter);
        if (core::errors::is_error(checked)) {
            return core::errors::get_error(checked);
        }
        const std::string like = powershell_quote("*" + *filter + "*");
        filter_clause = "| Where-Object {$_.Name -like " + like + " -or $_.Value -like " + like +
                        "} ";
    }

    auto output = with_context(
        powershell("Get-ChildItem Env: " + filter_clause +
                   "| Sort-Object Name | Format-Table Name, Value -AutoSize"),
        "Failed to get environment variables");
    if (core::errors::is_error(output)) {
        return core::errors::get_error(output);
    }
    return "# Environment Variables\n\n" + filter_line(filter) +
           code_block(core::errors::get_value(output));
}

core::errors::Result<std::string> SystemInfoTool::get_installed_software(
    const std::optional<std::string>& filter) const {
    std::string filter_clause;
    if (filter) {
        auto checked = context().guard.validate_value("filter", *filter);
        if (core::errors::is_error(checked)) {
            return core::errors::get_error(checked);
        }
        filter_clause =
            "| Where-Object {$_.Name -like " + powershell_quote("*" + *filter + "*") + "} ";
    }

    auto output = with_context(
        powershell("Get-WmiObject -Class Win32_Product " + filter_clause +
                   "| Select-Object Name, Version, Vendor, InstallDate | Sort-Object Name"
                   " | Format-Table -AutoSize"),
        "Failed to get installed software");
    if (core::errors::is_error(output)) {
        return core::errors::get_error(output);
    }
    return "# Installed Software\n\n" + filter_line(filter) +
           code_block(core::errors::get_value(output));
}

core::errors::Result<std::string> SystemInfoTool::get_system_uptime() const {
    auto boot = with_context(
        powershell("Get-CimInstance -ClassName Win32_OperatingSystem | Select-Object "
                   "LastBootUpTime, LocalDateTime | Format-List"),
        "Failed to get system uptime");
    if (core::errors::is_error(boot)) {
        return core::errors::get_error(boot);
    }

    const HostFacts facts = read_host_facts();
    return "# System Uptime\n\n**Current Uptime**: " + format::format_uptime(facts.uptime_seconds) +
           "\n\n## Boot Information\n" + code_block(core::errors::get_value(boot));
}

core::errors::Result<std::string> SystemInfoTool::get_user_info() const {
    auto accounts = with_context(
        powershell("Get-WmiObject -Class Win32_UserAccount | Select-Object Name, FullName, "
                   "Description, Disabled, LocalAccount, SID | Format-Table -AutoSize"),
        "Failed to get user info");
    if (core::errors::is_error(accounts)) {
        return core::errors::get_error(accounts);
    }
    auto current = with_context(native("whoami", {"/all"}), "Failed to get user info");
    if (core::errors::is_error(current)) {
        return core::errors::get_error(current);
    }

    return "# User Information\n\n## Current User Details\n" +
           code_block(core::errors::get_value(current)) + "\n\n## All User Accounts\n" +
           code_block(core::errors::get_value(accounts));
}

core::errors::Result<std::string> SystemInfoTool::get_system_paths() const {
    std::string path_listing = "N/A";
    const char* path_value = std::getenv("PATH");
    if (path_value != nullptr && *path_value != '\0') {
        path_listing.clear();
        for (const auto& entry : split_path_entries(path_value, kMaxPathEntries)) {
            if (!path_listing.empty()) {
                path_listing += "\n";
            }
            path_listing += entry;
        }
    }

    std::ostringstream out;
    out << "# System Paths\n\n## Important Directories\n"
        << "- **System Root**: " << env_or_na("SystemRoot") << "\n"
        << "- **Program Files**: " << env_or_na("ProgramFiles") << "\n"
        << "- **Program Files (x86)**: " << env_or_na("ProgramFiles(x86)") << "\n"
        << "- **User Profile**: " << env_or_na("USERPROFILE") << "\n"
        << "- **AppData**: " << env_or_na("APPDATA") << "\n"
        << "- **Local AppData**: " << env_or_na("LOCALAPPDATA") << "\n"
        << "- **Temp**: " << env_or_na("TEMP") << "\n"
        << "- **Windows Directory**: " << env_or_na("windir") << "\n\n"
        << "## PATH Environment (First 20 entries)\n"
        << code_block(path_listing);
    return out.str();
}

}  // namespace winsys::tools
