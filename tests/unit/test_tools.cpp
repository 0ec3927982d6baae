#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/errors/tool_errors.hpp"
#include "test_doubles.hpp"
#include "tools/network_tool.hpp"
#include "tools/performance_tool.hpp"
#include "tools/process_tool.hpp"
#include "tools/service_tool.hpp"
#include "tools/system_info_tool.hpp"

namespace {

using nlohmann::json;
using winsys::core::errors::ErrorCategory;
using winsys::core::errors::ToolError;
using winsys::protocol::ToolCall;
using winsys::testing::DispatchRig;
using winsys::tools::NetworkTool;
using winsys::tools::PerformanceTool;
using winsys::tools::PortProbeResult;
using winsys::tools::PortState;
using winsys::tools::ProcessTool;
using winsys::tools::ServiceTool;
using winsys::tools::SystemInfoTool;

ToolError access_denied() {
    return ToolError{ErrorCategory::Execution, "Command failed: powershell\nAccess is denied.",
                     "external_command_failed"};
}

bool contains(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

TEST(ProcessToolTest, MapsSortKeysToProperties) {
    EXPECT_EQ(ProcessTool::sort_property("cpu"), "CPU");
    EXPECT_EQ(ProcessTool::sort_property("memory"), "WorkingSet");
    EXPECT_EQ(ProcessTool::sort_property("name"), "Name");
    EXPECT_EQ(ProcessTool::sort_property("pid"), "Id");
}

TEST(ProcessToolTest, ListAndTopViewsKeepSeparateLimits) {
    DispatchRig rig;
    rig.dispatcher.handle(ToolCall{"process_manager", json{{"action", "list_processes"}}});
    rig.dispatcher.handle(ToolCall{"process_manager", json{{"action", "get_top_processes"},
                                                           {"sort_by", "memory"}}});
    ASSERT_EQ(rig.runner.requests.size(), 2u);
    EXPECT_TRUE(contains(rig.runner.script(0), "Sort-Object CPU -Descending | Select-Object -First 20 "));
    EXPECT_TRUE(contains(rig.runner.script(1),
                         "Sort-Object WorkingSet -Descending | Select-Object -First 10 "));
}

TEST(ProcessToolTest, RunsPowerShellNonInteractively) {
    DispatchRig rig;
    rig.config.powershell_program = "pwsh";
    rig.dispatcher.handle(ToolCall{"process_manager", json{{"action", "get_process_tree"}}});
    ASSERT_EQ(rig.runner.requests.size(), 1u);

    const auto& request = rig.runner.requests[0];
    EXPECT_EQ(request.program, "pwsh");
    ASSERT_EQ(request.arguments.size(), 4u);
    EXPECT_EQ(request.arguments[0], "-NoProfile");
    EXPECT_EQ(request.arguments[1], "-NonInteractive");
    EXPECT_EQ(request.arguments[2], "-Command");
    EXPECT_EQ(request.timeout_ms, 120000u);
}

TEST(ProcessToolTest, KillByIdReportsTermination) {
    DispatchRig rig;
    auto response = rig.dispatcher.handle(
        ToolCall{"process_manager", json{{"action", "kill_process"}, {"process_id", 4242}}});
    ASSERT_FALSE(response.is_error) << response.text;
    EXPECT_EQ(response.text, "# Process Terminated\n\n\xE2\x9C\x85 Successfully terminated PID 4242");
    EXPECT_EQ(rig.runner.script(0), "Stop-Process -Id 4242 -Force -ErrorAction Stop");
}

TEST(ProcessToolTest, ProcessNameIsQuotedAsLiteral) {
    DispatchRig rig;
    rig.dispatcher.handle(ToolCall{"process_manager",
                                   json{{"action", "find_process"}, {"process_name", "a'; rm"}}});
    ASSERT_EQ(rig.runner.requests.size(), 1u);
    EXPECT_TRUE(contains(rig.runner.script(0), "-like '*a''; rm*'"));
}

TEST(ProcessToolTest, WmiFilterKeepsApostropheInsideLiteral) {
    DispatchRig rig;
    auto response = rig.dispatcher.handle(ToolCall{
        "process_manager", json{{"action", "get_process_details"}, {"process_name", "O'Brien"}}});
    ASSERT_FALSE(response.is_error) << response.text;
    ASSERT_EQ(rig.runner.requests.size(), 2u);
    EXPECT_EQ(rig.runner.script(1).rfind(
                  "Get-WmiObject -Class Win32_Process -Filter 'Name=''O\\''Brien.exe''' | ", 0),
              0u);
}

TEST(ServiceToolTest, WmiFilterCannotBeWidened) {
    DispatchRig rig;
    auto response = rig.dispatcher.handle(ToolCall{
        "service_manager",
        json{{"action", "get_service_details"}, {"service_name", "x' OR Name LIKE '%"}}});
    ASSERT_FALSE(response.is_error) << response.text;
    ASSERT_EQ(rig.runner.requests.size(), 3u);
    EXPECT_EQ(rig.runner.script(1).rfind(
                  "Get-WmiObject -Class Win32_Service -Filter "
                  "'Name=''x\\'' OR Name LIKE \\''%''' | ",
                  0),
              0u);
}

TEST(ServiceToolTest, SearchTermQuotesAreDoubled) {
    DispatchRig rig;
    auto response = rig.dispatcher.handle(
        ToolCall{"service_manager", json{{"action", "find_service"}, {"search_term", "O'Brien"}}});
    ASSERT_FALSE(response.is_error) << response.text;
    ASSERT_EQ(rig.runner.requests.size(), 1u);
    EXPECT_TRUE(contains(rig.runner.script(0), "$_.Name -like '*O''Brien*'"));
    EXPECT_TRUE(contains(response.text, "Search term: \"O'Brien\""));
}

TEST(ServiceToolTest, StartRunsOperationThenStatusQuery) {
    DispatchRig rig;
    rig.runner.push_stdout("");
    rig.runner.push_stdout("Name    Status\nSpooler Running");
    auto response = rig.dispatcher.handle(
        ToolCall{"service_manager", json{{"action", "start_service"}, {"service_name", "Spooler"}}});
    ASSERT_FALSE(response.is_error) << response.text;
    ASSERT_EQ(rig.runner.requests.size(), 2u);
    EXPECT_EQ(rig.runner.script(0), "Start-Service -Name 'Spooler' -ErrorAction Stop");
    EXPECT_EQ(response.text,
              "# Service Start Operation\n\n\xE2\x9C\x85 Attempted to start service: Spooler\n\n"
              "## Current Status\n```\nName    Status\nSpooler Running\n```");
}

TEST(ServiceToolTest, FailedStopSkipsStatusQuery) {
    DispatchRig rig;
    rig.runner.push_error(access_denied());
    auto response = rig.dispatcher.handle(
        ToolCall{"service_manager", json{{"action", "stop_service"}, {"service_name", "Spooler"}}});
    EXPECT_TRUE(response.is_error);
    EXPECT_EQ(rig.runner.requests.size(), 1u);
    EXPECT_TRUE(contains(response.text, "Failed to stop service Spooler: Command failed"));
}

TEST(ServiceToolTest, FiltersBecomeWhereClause) {
    EXPECT_EQ(ServiceTool::status_value("stopped"), "Stopped");
    EXPECT_EQ(ServiceTool::startup_type_value("disabled"), "Disabled");

    DispatchRig rig;
    rig.dispatcher.handle(ToolCall{"service_manager", json{{"action", "list_services"},
                                                           {"status_filter", "running"},
                                                           {"startup_type_filter", "manual"},
                                                           {"limit", 5}}});
    ASSERT_EQ(rig.runner.requests.size(), 1u);
    EXPECT_TRUE(contains(rig.runner.script(0),
                         "Where-Object {$_.Status -eq 'Running' -and $_.StartType -eq 'Manual'}"));
    EXPECT_TRUE(contains(rig.runner.script(0), "Select-Object -First 5 "));
}

TEST(NetworkToolTest, PingRunsNativeToolWithoutShell) {
    DispatchRig rig;
    auto response = rig.dispatcher.handle(
        ToolCall{"network", json{{"action", "ping_host"}, {"host", "localhost"}}});
    ASSERT_FALSE(response.is_error) << response.text;
    ASSERT_EQ(rig.runner.requests.size(), 1u);
    EXPECT_EQ(rig.runner.requests[0].program, "ping");
    const std::vector<std::string> expected{"-n", "4", "localhost"};
    EXPECT_EQ(rig.runner.requests[0].arguments, expected);
    EXPECT_EQ(response.text.rfind("# Ping Results\n\nTarget: localhost\nCount: 4\n\n", 0), 0u);
}

TEST(NetworkToolTest, InvalidHostNeverReachesRunner) {
    DispatchRig rig;
    for (const std::string host : {"example.com; whoami", "-t", "$(reboot)"}) {
        auto response = rig.dispatcher.handle(
            ToolCall{"network", json{{"action", "trace_route"}, {"host", host}}});
        EXPECT_TRUE(response.is_error) << host;
    }
    EXPECT_TRUE(rig.runner.requests.empty());
}

TEST(NetworkToolTest, ScanProbesFirstTwentyPorts) {
    DispatchRig rig;
    rig.prober.states[7] = PortState::Open;
    auto response = rig.dispatcher.handle(ToolCall{
        "network", json{{"action", "scan_open_ports"}, {"host", "localhost"}, {"port_range", "1-500"}}});
    ASSERT_FALSE(response.is_error) << response.text;
    EXPECT_EQ(rig.prober.probes.size(), 20u);
    EXPECT_TRUE(rig.runner.requests.empty());

    const std::string& text = response.text;
    EXPECT_EQ(text.rfind("# Port Scan Results\n\nTarget: localhost\nPorts: 1-500\n\n", 0), 0u);
    EXPECT_TRUE(contains(text, "\xE2\x9D\x8C Port 1: Closed/Filtered\n"));
    EXPECT_TRUE(contains(text, "\n\xE2\x9C\x85 Port 7: Open"));
    EXPECT_EQ(text.find("Port 21:"), std::string::npos);
}

TEST(NetworkToolTest, ScanRejectsMalformedPortRange) {
    DispatchRig rig;
    auto response = rig.dispatcher.handle(ToolCall{
        "network", json{{"action", "scan_open_ports"}, {"host", "localhost"}, {"port_range", "ssh"}}});
    EXPECT_TRUE(response.is_error);
    EXPECT_TRUE(contains(response.text, "Failed to scan ports on localhost: Invalid port: 'ssh'"));
    EXPECT_TRUE(rig.prober.probes.empty());
}

TEST(NetworkToolTest, RendersEmptyScan) {
    const std::string report = NetworkTool::render_port_scan("h", "10-5", {});
    EXPECT_EQ(report, "# Port Scan Results\n\nTarget: h\nPorts: 10-5\n\n"
                      "No ports to scan: the port range expands to an empty set.");

    const std::vector<PortProbeResult> results{{80, PortState::Open},
                                               {81, PortState::TimeoutOrError}};
    EXPECT_EQ(NetworkTool::render_port_scan("h", "80,81", results),
              "# Port Scan Results\n\nTarget: h\nPorts: 80,81\n\n"
              "\xE2\x9C\x85 Port 80: Open\n\xE2\x9D\x8C Port 81: Timeout/Error");
}

TEST(RegistryToolTest, UnreadableStartupLocationIsSoftFailure) {
    DispatchRig rig;
    rig.runner.push_error(access_denied());
    auto response = rig.dispatcher.handle(
        ToolCall{"registry", json{{"action", "get_startup_programs"}}});
    ASSERT_FALSE(response.is_error) << response.text;
    EXPECT_EQ(rig.runner.requests.size(), 4u);
    EXPECT_TRUE(contains(response.text,
                         "## HKLM\\SOFTWARE\\Microsoft\\Windows\\CurrentVersion\\Run\n"
                         "*No entries or access denied*\n\n"));
    EXPECT_TRUE(contains(response.text, "## HKCU\\SOFTWARE\\Microsoft\\Windows\\CurrentVersion\\Run\n```"));
}

TEST(RegistryToolTest, EmptyLocationIsOmitted) {
    DispatchRig rig;
    rig.runner.default_stdout = "  \n";
    auto response = rig.dispatcher.handle(
        ToolCall{"registry", json{{"action", "get_installed_programs"}}});
    ASSERT_FALSE(response.is_error);
    EXPECT_EQ(response.text, "# Installed Programs from Registry\n\n");
}

TEST(RegistryToolTest, MissingRegistryValueIsNotAvailable) {
    DispatchRig rig;
    rig.runner.push_error(access_denied());
    rig.runner.default_stdout = "22631\r\n";
    auto response = rig.dispatcher.handle(
        ToolCall{"registry", json{{"action", "get_system_info_from_registry"}}});
    ASSERT_FALSE(response.is_error);
    EXPECT_TRUE(contains(response.text, "## Windows Version\n- **ProductName**: *Not available*\n"
                                        "- **ReleaseId**: 22631\n"));
}

TEST(RegistryToolTest, KeyPathIsAddressedThroughProvider) {
    DispatchRig rig;
    rig.dispatcher.handle(ToolCall{
        "registry", json{{"action", "read_value"}, {"key_path", "HKLM\\SOFTWARE\\Vendor"},
                         {"value_name", "Install Dir"}}});
    ASSERT_EQ(rig.runner.requests.size(), 1u);
    EXPECT_EQ(rig.runner.script(0),
              "Get-ItemPropertyValue -Path 'Registry::HKLM\\SOFTWARE\\Vendor' -Name 'Install Dir' "
              "-ErrorAction Stop");
}

TEST(RegistryToolTest, ReadValueRequiresValueName) {
    DispatchRig rig;
    auto response = rig.dispatcher.handle(
        ToolCall{"registry", json{{"action", "read_value"}, {"key_path", "HKLM\\SOFTWARE"}}});
    EXPECT_TRUE(response.is_error);
    EXPECT_TRUE(contains(response.text, "Missing required parameter 'value_name'"));
}

TEST(PerformanceToolTest, SamplingWindowExtendsTimeout) {
    EXPECT_EQ(PerformanceTool::sampling_window_ms(10, 1), 10000u);
    EXPECT_EQ(PerformanceTool::sampling_window_ms(5, 2), 10000u);
    EXPECT_EQ(PerformanceTool::sampling_window_ms(0, 1), 0u);
    EXPECT_EQ(PerformanceTool::sampling_window_ms(-3, 1), 0u);

    DispatchRig rig;
    rig.dispatcher.handle(ToolCall{"performance", json{{"action", "get_cpu_usage"}}});
    ASSERT_FALSE(rig.runner.requests.empty());
    EXPECT_EQ(rig.runner.requests[0].timeout_ms, 120000u + 10000u);
    EXPECT_TRUE(contains(rig.runner.script(0), "-MaxSamples 10 "));
}

TEST(PerformanceToolTest, DisabledTimeoutStaysDisabled) {
    DispatchRig rig;
    rig.config.command_timeout_ms = 0;
    rig.dispatcher.handle(ToolCall{"performance", json{{"action", "monitor_real_time"},
                                                       {"duration", 3}, {"interval", 2}}});
    ASSERT_EQ(rig.runner.requests.size(), 1u);
    EXPECT_EQ(rig.runner.requests[0].timeout_ms, 0u);
}

TEST(SystemInfoToolTest, SplitsPathOnEitherSeparator) {
    const std::vector<std::string> windows{"C:\\Windows", "C:\\Tools"};
    EXPECT_EQ(SystemInfoTool::split_path_entries("C:\\Windows;C:\\Tools", 20), windows);
    const std::vector<std::string> posix{"/usr/bin", "/bin"};
    EXPECT_EQ(SystemInfoTool::split_path_entries("/usr/bin:/bin", 20), posix);
    EXPECT_EQ(SystemInfoTool::split_path_entries("a:b:c:d", 2).size(), 2u);
}

TEST(SystemInfoToolTest, SystemPathsReadEnvironmentOnly) {
    DispatchRig rig;
    auto response = rig.dispatcher.handle(
        ToolCall{"system_info", json{{"action", "get_system_paths"}}});
    ASSERT_FALSE(response.is_error);
    EXPECT_TRUE(rig.runner.requests.empty());
    EXPECT_TRUE(contains(response.text, "## PATH Environment (First 20 entries)\n```\n"));
}

TEST(SystemInfoToolTest, HardwareCategoryLimitsQueries) {
    DispatchRig rig;
    auto all = rig.dispatcher.handle(ToolCall{"system_info", json{{"action", "get_hardware_info"}}});
    ASSERT_FALSE(all.is_error);
    EXPECT_EQ(rig.runner.requests.size(), 4u);

    auto disk = rig.dispatcher.handle(
        ToolCall{"system_info", json{{"action", "get_hardware_info"}, {"category", "disk"}}});
    ASSERT_FALSE(disk.is_error);
    EXPECT_EQ(rig.runner.requests.size(), 5u);
    EXPECT_EQ(disk.text, "# Hardware Information\n\n## Disk Information\n```\nfake output\n```");
}

TEST(SystemInfoToolTest, UserInfoAsksWhoami) {
    DispatchRig rig;
    rig.dispatcher.handle(ToolCall{"system_info", json{{"action", "get_user_info"}}});
    ASSERT_EQ(rig.runner.requests.size(), 2u);
    EXPECT_EQ(rig.runner.requests[1].program, "whoami");
    EXPECT_EQ(rig.runner.requests[1].arguments, std::vector<std::string>{"/all"});
}

}  // namespace
