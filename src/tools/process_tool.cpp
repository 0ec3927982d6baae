#include "tools/process_tool.hpp"

#include <vector>
#include "tools/report_format.hpp"

namespace winsys::tools {

using core::errors::with_context;
using format::code_block;
using format::powershell_quote;
using format::wql_quote;
using protocol::ParamType;

namespace {

constexpr const char* kIdOrNameRequired =
    "Either process_id or process_name must be provided";

const std::vector<ActionBinding<ProcessAction>>& process_actions() {
    static const std::vector<ActionBinding<ProcessAction>> bindings = {
        {ProcessAction::ListProcesses, {"list_processes", {}}},
        {ProcessAction::GetProcessDetails, {"get_process_details", {}}},
        {ProcessAction::KillProcess, {"kill_process", {}}},
        {ProcessAction::FindProcess, {"find_process", {"process_name"}}},
        {ProcessAction::GetTopProcesses, {"get_top_processes", {}}},
        {ProcessAction::GetProcessTree, {"get_process_tree", {}}},
    };
    return bindings;
}

}  // namespace

ProcessTool::ProcessTool(const ToolContext& context) : Tool(context) {}

const protocol::ToolSpec& ProcessTool::spec() const {
    static const protocol::ToolSpec tool_spec = {
        "process_manager",
        "Process management",
        "Comprehensive process management including listing processes, getting "
        "process details, killing processes, and monitoring resource usage",
        action_specs(process_actions()),
        {
            {"process_id", ParamType::Number, "Process ID for specific process operations", {}, nullptr},
            {"process_name", ParamType::String, "Process name for searching or filtering", {}, nullptr},
            {"sort_by", ParamType::String, "Sort processes by specified criteria (default: cpu)",
             {"cpu", "memory", "name", "pid"}, "cpu"},
            {"limit", ParamType::Number, "Limit number of results (default: 20)", {}, nullptr},
            {"include_system", ParamType::Boolean, "Include system processes (default: true)", {}, true},
        }};
    return tool_spec;
}

std::string ProcessTool::sort_property(const std::string& sort_by) {
    if (sort_by == "memory") {
        return "WorkingSet";
    }
    if (sort_by == "name") {
        return "Name";
    }
    if (sort_by == "pid") {
        return "Id";
    }
    return "CPU";
}

core::errors::Result<std::string> ProcessTool::run(const std::string& action,
                                                   const Arguments& args) const {
    const auto parsed = find_action(process_actions(), action);
    if (!parsed) {
        return unknown_action_error(action);
    }

    const std::string sort_by = args.string_or("sort_by", "cpu");
    switch (*parsed) {
        case ProcessAction::ListProcesses:
            return list_processes(sort_by, args.integer_or("limit", 20),
                                  args.bool_or("include_system", true));
        case ProcessAction::GetProcessDetails:
            return get_process_details(args.get_integer("process_id"),
                                       args.get_string("process_name"));
        case ProcessAction::KillProcess:
            return kill_process(args.get_integer("process_id"),
                                args.get_string("process_name"));
        case ProcessAction::FindProcess:
            return find_process(args.string_or("process_name", ""));
        case ProcessAction::GetTopProcesses:
            // The top-N view keeps its own smaller default.
            return get_top_processes(sort_by, args.integer_or("limit", 10));
        case ProcessAction::GetProcessTree:
            return get_process_tree();
    }
    return unknown_action_error(action);
}

core::errors::Result<std::string> ProcessTool::list_processes(
    const std::string& sort_by, const std::int64_t limit, const bool include_system) const {
    const std::string script =
        "Get-Process " +
        std::string(include_system ? "" : "| Where-Object {$_.SessionId -ne 0} ") +
        "| Sort-Object " + sort_property(sort_by) + " -Descending | Select-Object -First " +
        std::to_string(limit) +
        " Name, Id, CPU, WorkingSet, VirtualMemorySize, SessionId, StartTime"
        " | Format-Table -AutoSize";

    auto output = with_context(powershell(script), "Failed to list processes");
    if (core::errors::is_error(output)) {
        return core::errors::get_error(output);
    }
    return "# Process List\n\nSorted by: " + sort_by + "\nLimit: " + std::to_string(limit) +
           "\nInclude System: " + (include_system ? "true" : "false") + "\n\n" +
           code_block(core::errors::get_value(output));
}

core::errors::Result<std::string> ProcessTool::get_process_details(
    const std::optional<std::int64_t>& process_id,
    const std::optional<std::string>& process_name) const {
    std::string basic_script;
    std::string wmi_script;
    if (process_id) {
        const std::string id = std::to_string(*process_id);
        basic_script = "Get-Process -Id " + id + " -ErrorAction Stop | Select-Object *";
        wmi_script = "Get-WmiObject -Class Win32_Process -Filter 'ProcessId=" + id +
                     "' | Select-Object CommandLine, CreationDate, ExecutablePath, "
                     "PageFileUsage, ThreadCount";
    } else if (process_name) {
        auto name = context().guard.validate_value("process_name", *process_name);
        if (core::errors::is_error(name)) {
            return core::errors::get_error(name);
        }
        basic_script = "Get-Process -Name " + powershell_quote(*process_name) +
                       " -ErrorAction Stop | Select-Object *";
        wmi_script = "Get-WmiObject -Class Win32_Process -Filter " +
                     powershell_quote("Name=" + wql_quote(*process_name + ".exe")) +
                     " | Select-Object CommandLine, CreationDate, ExecutablePath, "
                     "PageFileUsage, ThreadCount";
    } else {
        return missing_parameter_error(kIdOrNameRequired);
    }

    auto basic = with_context(powershell(basic_script), "Failed to get process details");
    if (core::errors::is_error(basic)) {
        return core::errors::get_error(basic);
    }
    auto extended = with_context(powershell(wmi_script), "Failed to get process details");
    if (core::errors::is_error(extended)) {
        return core::errors::get_error(extended);
    }

    return "# Process Details\n\n## Basic Information\n" +
           code_block(core::errors::get_value(basic)) + "\n\n## Extended Information\n" +
           code_block(core::errors::get_value(extended));
}

core::errors::Result<std::string> ProcessTool::kill_process(
    const std::optional<std::int64_t>& process_id,
    const std::optional<std::string>& process_name) const {
    std::string script;
    std::string identifier;
    if (process_id) {
        script = "Stop-Process -Id " + std::to_string(*process_id) +
                 " -Force -ErrorAction Stop";
        identifier = "PID " + std::to_string(*process_id);
    } else if (process_name) {
        auto name = context().guard.validate_value("process_name", *process_name);
        if (core::errors::is_error(name)) {
            return core::errors::get_error(name);
        }
        script = "Stop-Process -Name " + powershell_quote(*process_name) +
                 " -Force -ErrorAction Stop";
        identifier = "process \"" + *process_name + "\"";
    } else {
        return missing_parameter_error(kIdOrNameRequired);
    }

    auto output = with_context(powershell(script), "Failed to kill process");
    if (core::errors::is_error(output)) {
        return core::errors::get_error(output);
    }
    return "# Process Terminated\n\n\xE2\x9C\x85 Successfully terminated " + identifier;
}

core::errors::Result<std::string> ProcessTool::find_process(
    const std::string& process_name) const {
    auto name = context().guard.validate_value("process_name", process_name);
    if (core::errors::is_error(name)) {
        return core::errors::get_error(name);
    }

    const std::string script =
        "Get-Process | Where-Object {$_.Name -like " +
        powershell_quote("*" + process_name + "*") +
        "} | Select-Object Name, Id, CPU, WorkingSet, StartTime | Format-Table -AutoSize";

    auto output = with_context(powershell(script), "Failed to find process");
    if (core::errors::is_error(output)) {
        return core::errors::get_error(output);
    }
    return "# Process Search Results\n\nSearch term: \"" + process_name + "\"\n\n" +
           code_block(core::errors::get_value(output));
}

core::errors::Result<std::string> ProcessTool::get_top_processes(
    const std::string& sort_by, const std::int64_t limit) const {
    const std::string script =
        "Get-Process | Sort-Object " + sort_property(sort_by) +
        " -Descending | Select-Object -First " + std::to_string(limit) +
        " Name, Id, @{Name='CPU%';Expression={$_.CPU}}, "
        "@{Name='MemoryMB';Expression={[math]::Round($_.WorkingSet/1MB,2)}}, "
        "@{Name='ThreadCount';Expression={$_.Threads.Count}}, StartTime"
        " | Format-Table -AutoSize";

    auto output = with_context(powershell(script), "Failed to get top processes");
    if (core::errors::is_error(output)) {
        return core::errors::get_error(output);
    }
    return "# Top " + std::to_string(limit) + " Processes\n\nSorted by: " + sort_by + "\n\n" +
           code_block(core::errors::get_value(output));
}

core::errors::Result<std::string> ProcessTool::get_process_tree() const {
    const std::string script =
        "Get-WmiObject -Class Win32_Process | Select-Object Name, ProcessId, "
        "ParentProcessId, CommandLine | Sort-Object ParentProcessId, ProcessId"
        " | Format-Table -AutoSize";

    auto output = with_context(powershell(script), "Failed to get process tree");
    if (core::errors::is_error(output)) {
        return core::errors::get_error(output);
    }
    return "# Process Tree\n\n" + code_block(core::errors::get_value(output));
}

}  // namespace winsys::tools
