#include "tools/registry_tool.hpp"

#include <utility>
#include <vector>
#include "core/logging/logger.hpp"
#include "tools/report_format.hpp"

namespace winsys::tools {

using core::errors::with_context;
using format::code_block;
using format::powershell_quote;
using protocol::ParamType;

namespace {

constexpr int kSearchResultLimit = 20;

const std::vector<ActionBinding<RegistryAction>>& registry_actions() {
    static const std::vector<ActionBinding<RegistryAction>> bindings = {
        {RegistryAction::ReadKey, {"read_key", {"key_path"}}},
        {RegistryAction::ReadValue, {"read_value", {"key_path", "value_name"}}},
        {RegistryAction::SearchKeys, {"search_keys", {"search_term"}}},
        {RegistryAction::ListSubkeys, {"list_subkeys", {"key_path"}}},
        {RegistryAction::GetStartupPrograms, {"get_startup_programs", {}}},
        {RegistryAction::GetInstalledPrograms, {"get_installed_programs", {}}},
        {RegistryAction::GetSystemInfoFromRegistry, {"get_system_info_from_registry", {}}},
    };
    return bindings;
}

std::string registry_path(const std::string& key_path) {
    return powershell_quote("Registry::" + key_path);
}

struct RegistryKeyGroup {
    const char* heading;
    const char* path;
    std::vector<std::string> values;
};

}  // namespace

RegistryTool::RegistryTool(const ToolContext& context) : Tool(context) {}

const protocol::ToolSpec& RegistryTool::spec() const {
    static const protocol::ToolSpec tool_spec = {
        "registry",
        "Registry",
        "Windows Registry operations including reading registry keys, values, and "
        "searching registry entries",
        action_specs(registry_actions()),
        {
            {"key_path", ParamType::String,
             "Registry key path (e.g., HKLM\\SOFTWARE\\Microsoft\\Windows\\CurrentVersion)", {}, nullptr},
            {"value_name", ParamType::String, "Registry value name to read", {}, nullptr},
            {"search_term", ParamType::String, "Search term for finding registry keys or values", {}, nullptr},
            {"hive", ParamType::String, "Registry hive to search in (default: HKLM)",
             {"HKLM", "HKCU", "HKCR", "HKU", "HKCC"}, "HKLM"},
            {"max_depth", ParamType::Number, "Maximum depth for recursive operations (default: 2)", {}, 2},
        }};
    return tool_spec;
}

core::errors::Result<std::string> RegistryTool::run(const std::string& action,
                                                    const Arguments& args) const {
    const auto parsed = find_action(registry_actions(), action);
    if (!parsed) {
        return unknown_action_error(action);
    }

    switch (*parsed) {
        case RegistryAction::ReadKey:
            return read_key(args.string_or("key_path", ""));
        case RegistryAction::ReadValue:
            return read_value(args.string_or("key_path", ""), args.string_or("value_name", ""));
        case RegistryAction::SearchKeys:
            return search_keys(args.string_or("search_term", ""), args.string_or("hive", "HKLM"));
        case RegistryAction::ListSubkeys:
            return list_subkeys(args.string_or("key_path", ""), args.integer_or("max_depth", 2));
        case RegistryAction::GetStartupPrograms:
            return get_startup_programs();
        case RegistryAction::GetInstalledPrograms:
            return get_installed_programs();
        case RegistryAction::GetSystemInfoFromRegistry:
            return get_system_info_from_registry();
    }
    return unknown_action_error(action);
}

core::errors::Result<std::string> RegistryTool::read_key(const std::string& key_path) const {
    auto checked = context().guard.validate_value("key_path", key_path);
    if (core::errors::is_error(checked)) {
        return core::errors::get_error(checked);
    }

    auto output = with_context(
        powershell("Get-ItemProperty -Path " + registry_path(key_path) +
                   " -ErrorAction Stop | Format-List"),
        "Failed to read registry key " + key_path);
    if (core::errors::is_error(output)) {
        return core::errors::get_error(output);
    }
    return "# Registry Key: " + key_path + "\n\n" + code_block(core::errors::get_value(output));
}

core::errors::Result<std::string> RegistryTool::read_value(const std::string& key_path,
                                                           const std::string& value_name) const {
    for (const auto& [name, value] : {std::make_pair("key_path", key_path),
                                      std::make_pair("value_name", value_name)}) {
        auto checked = context().guard.validate_value(name, value);
        if (core::errors::is_error(checked)) {
            return core::errors::get_error(checked);
        }
    }

    auto output = with_context(
        powershell("Get-ItemPropertyValue -Path " + registry_path(key_path) + " -Name " +
                   powershell_quote(value_name) + " -ErrorAction Stop"),
        "Failed to read registry value " + value_name + " from " + key_path);
    if (core::errors::is_error(output)) {
        return core::errors::get_error(output);
    }
    return "# Registry Value\n\n**Key**: " + key_path + "\n**Value Name**: " + value_name +
           "\n**Value**: " + format::trim(core::errors::get_value(output));
}

core::errors::Result<std::string> RegistryTool::search_keys(const std::string& search_term,
                                                            const std::string& hive) const {
    auto checked = context().guard.validate_value("search_term", search_term);
    if (core::errors::is_error(checked)) {
        return core::errors::get_error(checked);
    }

    const std::string limit = std::to_string(kSearchResultLimit);
    auto output = with_context(
        powershell("Get-ChildItem -Path " + registry_path(hive + "\\") +
                   " -Recurse -ErrorAction SilentlyContinue | Where-Object {$_.Name -like " +
                   powershell_quote("*" + search_term + "*") + "} | Select-Object Name -First " +
                   limit + " | Format-Table -AutoSize"),
        "Failed to search registry keys");
    if (core::errors::is_error(output)) {
        return core::errors::get_error(output);
    }
    return "# Registry Key Search Results\n\nSearch term: \"" + search_term + "\"\nHive: " + hive +
           "\nLimit: " + limit + " results\n\n" + code_block(core::errors::get_value(output));
}

core::errors::Result<std::string> RegistryTool::list_subkeys(const std::string& key_path,
                                                             const std::int64_t max_depth) const {
    auto checked = context().guard.validate_value("key_path", key_path);
    if (core::errors::is_error(checked)) {
        return core::errors::get_error(checked);
    }

    // -Depth counts levels below the first, so depth 1 is a plain listing.
    const std::string recurse =
        max_depth > 1 ? " -Recurse -Depth " + std::to_string(max_depth - 1) : "";
    auto output = with_context(
        powershell("Get-ChildItem -Path " + registry_path(key_path) + recurse +
                   " -ErrorAction SilentlyContinue | Select-Object Name, Property"
                   " | Format-Table -AutoSize"),
        "Failed to list subkeys for " + key_path);
    if (core::errors::is_error(output)) {
        return core::errors::get_error(output);
    }
    return "# Registry Subkeys\n\nParent Key: " + key_path + "\nMax Depth: " +
           std::to_string(max_depth) + "\n\n" + code_block(core::errors::get_value(output));
}

std::string RegistryTool::render_locations(const std::string& title,
                                           const std::vector<std::string>& locations,
                                           const std::string& script_suffix) const {
    std::string result = "# " + title + "\n\n";
    for (const auto& location : locations) {
        auto output = powershell(script_suffix.empty()
                                     ? "Get-ItemProperty -Path " + registry_path(location) +
                                           " -ErrorAction SilentlyContinue | Format-List"
                                     : "Get-ChildItem -Path " + registry_path(location) +
                                           " -ErrorAction SilentlyContinue" + script_suffix);
        if (core::errors::is_error(output)) {
            WINSYS_LOG_WARN("Registry location " + location + " unavailable: " +
                            core::errors::get_error(output).message);
            result += "## " + location + "\n*No entries or access denied*\n\n";
            continue;
        }
        const std::string& text = core::errors::get_value(output);
        if (!format::trim(text).empty()) {
            result += "## " + location + "\n" + code_block(text) + "\n\n";
        }
    }
    return result;
}

core::errors::Result<std::string> RegistryTool::get_startup_programs() const {
    return render_locations("Startup Programs from Registry",
                            {"HKLM\\SOFTWARE\\Microsoft\\Windows\\CurrentVersion\\Run",
                             "HKCU\\SOFTWARE\\Microsoft\\Windows\\CurrentVersion\\Run",
                             "HKLM\\SOFTWARE\\Microsoft\\Windows\\CurrentVersion\\RunOnce",
                             "HKCU\\SOFTWARE\\Microsoft\\Windows\\CurrentVersion\\RunOnce"},
                            "");
}

core::errors::Result<std::string> RegistryTool::get_installed_programs() const {
    return render_locations(
        "Installed Programs from Registry",
        {"HKLM\\SOFTWARE\\Microsoft\\Windows\\CurrentVersion\\Uninstall",
         "HKLM\\SOFTWARE\\WOW6432Node\\Microsoft\\Windows\\CurrentVersion\\Uninstall",
         "HKCU\\SOFTWARE\\Microsoft\\Windows\\CurrentVersion\\Uninstall"},
        " | Get-ItemProperty | Where-Object {$_.DisplayName} | Select-Object DisplayName, "
        "DisplayVersion, Publisher, InstallDate | Sort-Object DisplayName | Format-Table -AutoSize");
}

core::errors::Result<std::string> RegistryTool::get_system_info_from_registry() const {
    static const std::vector<RegistryKeyGroup> groups = {
        {"Windows Version", "HKLM\\SOFTWARE\\Microsoft\\Windows NT\\CurrentVersion",
         {"ProductName", "ReleaseId", "CurrentBuild", "UBR"}},
        {"Computer Info", "HKLM\\SYSTEM\\CurrentControlSet\\Control\\ComputerName\\ComputerName",
         {"ComputerName"}},
        {"Processor Info", "HKLM\\HARDWARE\\DESCRIPTION\\System\\CentralProcessor\\0",
         {"ProcessorNameString", "~MHz"}},
    };

    std::string result = "# System Information from Registry\n\n";
    for (const auto& group : groups) {
        result += "## " + std::string(group.heading) + "\n";
        for (const auto& value_name : group.values) {
            auto output = powershell("Get-ItemPropertyValue -Path " + registry_path(group.path) +
                                     " -Name " + powershell_quote(value_name) +
                                     " -ErrorAction SilentlyContinue");
            if (core::errors::is_error(output)) {
                WINSYS_LOG_DEBUG("Registry value " + value_name + " unavailable: " +
                                 core::errors::get_error(output).message);
                result += "- **" + value_name + "**: *Not available*\n";
                continue;
            }
            const std::string value = format::trim(core::errors::get_value(output));
            if (!value.empty()) {
                result += "- **" + value_name + "**: " + value + "\n";
            }
        }
        result += "\n";
    }
    return result;
}

}  // namespace winsys::tools
