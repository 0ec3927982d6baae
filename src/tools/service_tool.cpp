#include "tools/service_tool.hpp"

#include <vector>
#include "tools/report_format.hpp"

namespace winsys::tools {

using core::errors::with_context;
using format::code_block;
using format::powershell_quote;
using format::wql_quote;
using protocol::ParamType;

namespace {

const std::vector<ActionBinding<ServiceAction>>& service_actions() {
    static const std::vector<ActionBinding<ServiceAction>> bindings = {
        {ServiceAction::ListServices, {"list_services", {}}},
        {ServiceAction::GetServiceDetails, {"get_service_details", {"service_name"}}},
        {ServiceAction::StartService, {"start_service", {"service_name"}}},
        {ServiceAction::StopService, {"stop_service", {"service_name"}}},
        {ServiceAction::RestartService, {"restart_service", {"service_name"}}},
        {ServiceAction::GetServiceStatus, {"get_service_status", {"service_name"}}},
        {ServiceAction::FindService, {"find_service", {"search_term"}}},
        {ServiceAction::GetRunningServices, {"get_running_services", {}}},
        {ServiceAction::GetStartupServices, {"get_startup_services", {}}},
    };
    return bindings;
}

struct StateChange {
    const char* command;
    const char* flags;
    const char* title;
    const char* verb;
};

StateChange state_change_for(const ServiceAction action) {
    switch (action) {
        case ServiceAction::StopService:
            return {"Stop-Service", " -Force", "Stop", "stop"};
        case ServiceAction::RestartService:
            return {"Restart-Service", " -Force", "Restart", "restart"};
        default:
            return {"Start-Service", "", "Start", "start"};
    }
}

}  // namespace

ServiceTool::ServiceTool(const ToolContext& context) : Tool(context) {}

const protocol::ToolSpec& ServiceTool::spec() const {
    static const protocol::ToolSpec tool_spec = {
        "service_manager",
        "Service management",
        "Windows service management including listing services, getting service details, "
        "starting/stopping services, and monitoring service status",
        action_specs(service_actions()),
        {
            {"service_name", ParamType::String, "Service name for specific service operations", {}, nullptr},
            {"status_filter", ParamType::String, "Filter services by status (default: all)",
             {"running", "stopped", "paused", "all"}, "all"},
            {"startup_type_filter", ParamType::String, "Filter services by startup type (default: all)",
             {"automatic", "manual", "disabled", "all"}, "all"},
            {"search_term", ParamType::String, "Search term for finding services", {}, nullptr},
            {"limit", ParamType::Number, "Limit number of results (default: 50)", {}, 50},
        }};
    return tool_spec;
}

std::string ServiceTool::status_value(const std::string& filter) {
    if (filter == "stopped") {
        return "Stopped";
    }
    if (filter == "paused") {
        return "Paused";
    }
    return "Running";
}

std::string ServiceTool::startup_type_value(const std::string& filter) {
    if (filter == "manual") {
        return "Manual";
    }
    if (filter == "disabled") {
        return "Disabled";
    }
    return "Automatic";
}

core::errors::Result<std::string> ServiceTool::run(const std::string& action,
                                                   const Arguments& args) const {
    const auto parsed = find_action(service_actions(), action);
    if (!parsed) {
        return unknown_action_error(action);
    }

    const std::int64_t limit = args.integer_or("limit", 50);
    const std::string service_name = args.string_or("service_name", "");
    if (!service_name.empty()) {
        auto checked = context().guard.validate_value("service_name", service_name);
        if (core::errors::is_error(checked)) {
            return core::errors::get_error(checked);
        }
    }

    switch (*parsed) {
        case ServiceAction::ListServices:
            return list_services(args.string_or("status_filter", "all"),
                                 args.string_or("startup_type_filter", "all"), limit);
        case ServiceAction::GetServiceDetails:
            return get_service_details(service_name);
        case ServiceAction::StartService:
        case ServiceAction::StopService:
        case ServiceAction::RestartService:
            return change_service_state(*parsed, service_name);
        case ServiceAction::GetServiceStatus:
            return get_service_status(service_name);
        case ServiceAction::FindService:
            return find_service(args.string_or("search_term", ""));
        case ServiceAction::GetRunningServices:
            return get_running_services(limit);
        case ServiceAction::GetStartupServices:
            return get_startup_services(limit);
    }
    return unknown_action_error(action);
}

core::errors::Result<std::string> ServiceTool::list_services(
    const std::string& status_filter, const std::string& startup_type_filter,
    const std::int64_t limit) const {
    std::vector<std::string> conditions;
    if (status_filter != "all") {
        conditions.push_back("$_.Status -eq '" + status_value(status_filter) + "'");
    }
    if (startup_type_filter != "all") {
        conditions.push_back("$_.StartType -eq '" + startup_type_value(startup_type_filter) + "'");
    }

    std::string where_clause;
    if (!conditions.empty()) {
        where_clause = "| Where-Object {" + conditions.front();
        for (std::size_t i = 1; i < conditions.size(); ++i) {
            where_clause += " -and " + conditions[i];
        }
        where_clause += "} ";
    }

    auto output = with_context(
        powershell("Get-Service " + where_clause + "| Select-Object -First " +
                   std::to_string(limit) +
                   " Name, DisplayName, Status, StartType | Sort-Object DisplayName"
                   " | Format-Table -AutoSize"),
        "Failed to list services");
    if (core::errors::is_error(output)) {
        return core::errors::get_error(output);
    }
    return "# Windows Services\n\nStatus Filter: " + status_filter +
           "\nStartup Type Filter: " + startup_type_filter + "\nLimit: " + std::to_string(limit) +
           "\n\n" + code_block(core::errors::get_value(output));
}

core::errors::Result<std::string> ServiceTool::get_service_details(
    const std::string& service_name) const {
    const std::string context_message = "Failed to get service details for " + service_name;
    const std::string name = powershell_quote(service_name);

    auto basic = with_context(
        powershell("Get-Service -Name " + name + " -ErrorAction Stop | Select-Object * | Format-List"),
        context_message);
    if (core::errors::is_error(basic)) {
        return core::errors::get_error(basic);
    }
    auto extended = with_context(
        powershell("Get-WmiObject -Class Win32_Service -Filter " +
                   powershell_quote("Name=" + wql_quote(service_name)) +
                   " | Select-Object Name, DisplayName, Description, PathName, StartMode, "
                   "StartName, State, ProcessId, ServiceType | Format-List"),
        context_message);
    if (core::errors::is_error(extended)) {
        return core::errors::get_error(extended);
    }
    auto dependencies = with_context(
        powershell("Get-Service -Name " + name +
                   " | Select-Object -ExpandProperty ServicesDependedOn | Select-Object Name, "
                   "Status | Format-Table -AutoSize"),
        context_message);
    if (core::errors::is_error(dependencies)) {
        return core::errors::get_error(dependencies);
    }

    return "# Service Details: " + service_name + "\n\n## Basic Information\n" +
           code_block(core::errors::get_value(basic)) + "\n\n## Extended Information\n" +
           code_block(core::errors::get_value(extended)) + "\n\n## Dependencies\n" +
           code_block(core::errors::get_value(dependencies));
}

core::errors::Result<std::string> ServiceTool::change_service_state(
    const ServiceAction action, const std::string& service_name) const {
    const StateChange change = state_change_for(action);
    const std::string context_message =
        "Failed to " + std::string(change.verb) + " service " + service_name;
    const std::string name = powershell_quote(service_name);

    auto operation = with_context(
        powershell(std::string(change.command) + " -Name " + name + change.flags +
                   " -ErrorAction Stop"),
        context_message);
    if (core::errors::is_error(operation)) {
        return core::errors::get_error(operation);
    }
    auto status = with_context(
        powershell("Get-Service -Name " + name + " | Select-Object Name, Status"),
        context_message);
    if (core::errors::is_error(status)) {
        return core::errors::get_error(status);
    }

    return "# Service " + std::string(change.title) + " Operation\n\n\xE2\x9C\x85 Attempted to " +
           change.verb + " service: " + service_name + "\n\n## Current Status\n" +
           code_block(core::errors::get_value(status));
}

core::errors::Result<std::string> ServiceTool::get_service_status(
    const std::string& service_name) const {
    auto output = with_context(
        powershell("Get-Service -Name " + powershell_quote(service_name) +
                   " -ErrorAction Stop | Select-Object Name, DisplayName, Status, StartType"
                   " | Format-List"),
        "Failed to get status for service " + service_name);
    if (core::errors::is_error(output)) {
        return core::errors::get_error(output);
    }
    return "# Service Status: " + service_name + "\n\n" +
           code_block(core::errors::get_value(output));
}

core::errors::Result<std::string> ServiceTool::find_service(const std::string& search_term) const {
    auto checked = context().guard.validate_value("search_term", search_term);
    if (core::errors::is_error(checked)) {
        return core::errors::get_error(checked);
    }

    const std::string like = powershell_quote("*" + search_term + "*");
    auto output = with_context(
        powershell("Get-Service | Where-Object {$_.Name -like " + like +
                   " -or $_.DisplayName -like " + like +
                   "} | Select-Object Name, DisplayName, Status, StartType | Sort-Object "
                   "DisplayName | Format-Table -AutoSize"),
        "Failed to search for services");
    if (core::errors::is_error(output)) {
        return core::errors::get_error(output);
    }
    return "# Service Search Results\n\nSearch term: \"" + search_term + "\"\n\n" +
           code_block(core::errors::get_value(output));
}

core::errors::Result<std::string> ServiceTool::get_running_services(const std::int64_t limit) const {
    auto output = with_context(
        powershell("Get-Service | Where-Object {$_.Status -eq 'Running'} | Select-Object -First " +
                   std::to_string(limit) +
                   " Name, DisplayName, Status | Sort-Object DisplayName | Format-Table -AutoSize"),
        "Failed to get running services");
    if (core::errors::is_error(output)) {
        return core::errors::get_error(output);
    }
    return "# Running Services\n\nLimit: " + std::to_string(limit) + "\n\n" +
           code_block(core::errors::get_value(output));
}

core::errors::Result<std::string> ServiceTool::get_startup_services(const std::int64_t limit) const {
    auto output = with_context(
        powershell("Get-WmiObject -Class Win32_Service | Where-Object {$_.StartMode -eq 'Auto'}"
                   " | Select-Object -First " +
                   std::to_string(limit) +
                   " Name, DisplayName, State, StartMode | Sort-Object DisplayName"
                   " | Format-Table -AutoSize"),
        "Failed to get startup services");
    if (core::errors::is_error(output)) {
        return core::errors::get_error(output);
    }
    return "# Automatic Startup Services\n\nLimit: " + std::to_string(limit) + "\n\n" +
           code_block(core::errors::get_value(output));
}

}  // namespace winsys::tools
