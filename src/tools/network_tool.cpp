#include "tools/network_tool.hpp"

#include <algorithm>
#include <cctype>
#include "tools/report_format.hpp"

namespace winsys::tools {

using core::errors::with_context;
using format::code_block;
using protocol::ParamType;

namespace {

const std::vector<ActionBinding<NetworkAction>>& network_actions() {
    static const std::vector<ActionBinding<NetworkAction>> bindings = {
        {NetworkAction::GetNetworkAdapters, {"get_network_adapters", {}}},
        {NetworkAction::GetActiveConnections, {"get_active_connections", {}}},
        {NetworkAction::GetListeningPorts, {"get_listening_ports", {}}},
        {NetworkAction::GetRoutingTable, {"get_routing_table", {}}},
        {NetworkAction::PingHost, {"ping_host", {"host"}}},
        {NetworkAction::TraceRoute, {"trace_route", {"host"}}},
        {NetworkAction::GetDnsInfo, {"get_dns_info", {}}},
        {NetworkAction::GetNetworkStatistics, {"get_network_statistics", {}}},
        {NetworkAction::ScanOpenPorts, {"scan_open_ports", {"host"}}},
        {NetworkAction::GetWifiProfiles, {"get_wifi_profiles", {}}},
    };
    return bindings;
}

std::string upper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

}  // namespace

NetworkTool::NetworkTool(const ToolContext& context) : Tool(context) {}

const protocol::ToolSpec& NetworkTool::spec() const {
    static const protocol::ToolSpec tool_spec = {
        "network",
        "Network",
        "Network information and diagnostics including network adapters, connections, "
        "ports, routing, and network testing",
        action_specs(network_actions()),
        {
            {"host", ParamType::String, "Target host for ping, traceroute, or port scanning", {}, nullptr},
            {"port", ParamType::Number, "Specific port number for port-related operations", {}, nullptr},
            {"port_range", ParamType::String, "Port range for scanning (e.g., '80-443')", {}, nullptr},
            {"protocol", ParamType::String, "Protocol filter for connections and ports (default: all)",
             {"tcp", "udp", "all"}, "all"},
            {"count", ParamType::Number, "Number of ping packets to send (default: 4)", {}, 4},
            {"timeout", ParamType::Number, "Timeout in seconds for network operations (default: 5)", {}, 5},
        }};
    return tool_spec;
}

core::errors::Result<std::string> NetworkTool::run(const std::string& action,
                                                   const Arguments& args) const {
    const auto parsed = find_action(network_actions(), action);
    if (!parsed) {
        return unknown_action_error(action);
    }

    const std::string protocol = args.string_or("protocol", "all");
    switch (*parsed) {
        case NetworkAction::GetNetworkAdapters:
            return get_network_adapters();
        case NetworkAction::GetActiveConnections:
            return get_active_connections(protocol);
        case NetworkAction::GetListeningPorts:
            return get_listening_ports(protocol);
        case NetworkAction::GetRoutingTable:
            return get_routing_table();
        case NetworkAction::PingHost:
            return ping_host(args.string_or("host", ""), args.integer_or("count", 4));
        case NetworkAction::TraceRoute:
            return trace_route(args.string_or("host", ""));
        case NetworkAction::GetDnsInfo:
            return get_dns_info();
        case NetworkAction::GetNetworkStatistics:
            return get_network_statistics();
        case NetworkAction::ScanOpenPorts:
            return scan_open_ports(args.string_or("host", ""), args.get_string("port_range"));
        case NetworkAction::GetWifiProfiles:
            return get_wifi_profiles();
    }
    return unknown_action_error(action);
}

core::errors::Result<std::string> NetworkTool::get_network_adapters() const {
    auto adapters = with_context(
        powershell("Get-NetAdapter | Select-Object Name, InterfaceDescription, Status, LinkSpeed, "
                   "MediaType, PhysicalMediaType | Format-Table -AutoSize"),
        "Failed to get network adapters");
    if (core::errors::is_error(adapters)) {
        return core::errors::get_error(adapters);
    }
    auto addresses = with_context(
        powershell("Get-NetIPAddress | Where-Object {$_.AddressFamily -eq 'IPv4'} | Select-Object "
                   "InterfaceAlias, IPAddress, PrefixLength | Format-Table -AutoSize"),
        "Failed to get network adapters");
    if (core::errors::is_error(addresses)) {
        return core::errors::get_error(addresses);
    }

    return "# Network Adapters\n\n## Adapter Information\n" +
           code_block(core::errors::get_value(adapters)) + "\n\n## IP Configuration\n" +
           code_block(core::errors::get_value(addresses));
}

core::errors::Result<std::string> NetworkTool::get_active_connections(
    const std::string& protocol) const {
    const std::string protocol_filter = protocol == "all" ? "" : "-Protocol " + upper(protocol) + " ";
    auto output = with_context(
        powershell("Get-NetTCPConnection " + protocol_filter +
                   "| Where-Object {$_.State -eq 'Established'} | Select-Object LocalAddress, "
                   "LocalPort, RemoteAddress, RemotePort, State, OwningProcess"
                   " | Format-Table -AutoSize"),
        "Failed to get active connections");
    if (core::errors::is_error(output)) {
        return core::errors::get_error(output);
    }
    return "# Active Network Connections\n\nProtocol: " + protocol + "\nState: Established\n\n" +
           code_block(core::errors::get_value(output));
}

core::errors::Result<std::string> NetworkTool::get_listening_ports(
    const std::string& protocol) const {
    std::string result = "# Listening Ports\n\n";

    if (protocol == "all" || protocol == "tcp") {
        auto tcp = with_context(
            powershell("Get-NetTCPConnection | Where-Object {$_.State -eq 'Listen'} | "
                       "Select-Object LocalAddress, LocalPort, OwningProcess | Sort-Object "
                       "LocalPort | Format-Table -AutoSize"),
            "Failed to get listening ports");
        if (core::errors::is_error(tcp)) {
            return core::errors::get_error(tcp);
        }
        result += "## TCP Listening Ports\n" + code_block(core::errors::get_value(tcp));
    }

    if (protocol == "all" || protocol == "udp") {
        auto udp = with_context(
            powershell("Get-NetUDPEndpoint | Select-Object LocalAddress, LocalPort, OwningProcess"
                       " | Sort-Object LocalPort | Format-Table -AutoSize"),
            "Failed to get listening ports");
        if (core::errors::is_error(udp)) {
            return core::errors::get_error(udp);
        }
        if (protocol == "all") {
            result += "\n\n";
        }
        result += "## UDP Listening Ports\n" + code_block(core::errors::get_value(udp));
    }
    return result;
}

core::errors::Result<std::string> NetworkTool::get_routing_table() const {
    auto output = with_context(
        powershell("Get-NetRoute | Where-Object {$_.AddressFamily -eq 'IPv4'} | Select-Object "
                   "DestinationPrefix, NextHop, InterfaceAlias, RouteMetric | Sort-Object "
                   "RouteMetric | Format-Table -AutoSize"),
        "Failed to get routing table");
    if (core::errors::is_error(output)) {
        return core::errors::get_error(output);
    }
    return "# IPv4 Routing Table\n\n" + code_block(core::errors::get_value(output));
}

core::errors::Result<std::string> NetworkTool::ping_host(const std::string& host,
                                                         const std::int64_t count) const {
    auto checked = context().guard.validate_host(host);
    if (core::errors::is_error(checked)) {
        return core::errors::get_error(checked);
    }

    auto output = with_context(native("ping", {"-n", std::to_string(count), host}),
                               "Failed to ping " + host);
    if (core::errors::is_error(output)) {
        return core::errors::get_error(output);
    }
    return "# Ping Results\n\nTarget: " + host + "\nCount: " + std::to_string(count) + "\n\n" +
           code_block(core::errors::get_value(output));
}

core::errors::Result<std::string> NetworkTool::trace_route(const std::string& host) const {
    auto checked = context().guard.validate_host(host);
    if (core::errors::is_error(checked)) {
        return core::errors::get_error(checked);
    }

    auto output = with_context(native("tracert", {host}), "Failed to trace route to " + host);
    if (core::errors::is_error(output)) {
        return core::errors::get_error(output);
    }
    return "# Traceroute Results\n\nTarget: " + host + "\n\n" +
           code_block(core::errors::get_value(output));
}

core::errors::Result<std::string> NetworkTool::get_dns_info() const {
    auto servers = with_context(
        powershell("Get-DnsClientServerAddress | Where-Object {$_.AddressFamily -eq 2} | "
                   "Select-Object InterfaceAlias, ServerAddresses | Format-Table -AutoSize"),
        "Failed to get DNS info");
    if (core::errors::is_error(servers)) {
        return core::errors::get_error(servers);
    }
    auto cache = with_context(
        powershell("Get-DnsClientCache | Select-Object -First 20 Name, Type, Status, Section, "
                   "TimeToLive | Format-Table -AutoSize"),
        "Failed to get DNS info");
    if (core::errors::is_error(cache)) {
        return core::errors::get_error(cache);
    }

    return "# DNS Information\n\n## DNS Servers\n" + code_block(core::errors::get_value(servers)) +
           "\n\n## DNS Cache (First 20 entries)\n" + code_block(core::errors::get_value(cache));
}

core::errors::Result<std::string> NetworkTool::get_network_statistics() const {
    auto adapters = with_context(
        powershell("Get-NetAdapterStatistics | Select-Object Name, BytesReceived, BytesSent, "
                   "PacketsReceived, PacketsSent | Format-Table -AutoSize"),
        "Failed to get network statistics");
    if (core::errors::is_error(adapters)) {
        return core::errors::get_error(adapters);
    }
    auto protocols = with_context(native("netstat", {"-s"}), "Failed to get network statistics");
    if (core::errors::is_error(protocols)) {
        return core::errors::get_error(protocols);
    }

    return "# Network Statistics\n\n## Adapter Statistics\n" +
           code_block(core::errors::get_value(adapters)) + "\n\n## Protocol Statistics\n" +
           code_block(core::errors::get_value(protocols));
}

std::string NetworkTool::render_port_scan(const std::string& host, const std::string& port_spec,
                                          const std::vector<PortProbeResult>& results) {
    std::string report = "# Port Scan Results\n\nTarget: " + host + "\nPorts: " + port_spec + "\n\n";
    if (results.empty()) {
        return report + "No ports to scan: the port range expands to an empty set.";
    }
    for (std::size_t i = 0; i < results.size(); ++i) {
        if (i > 0) {
            report += "\n";
        }
        const auto& result = results[i];
        report += result.state == PortState::Open ? "\xE2\x9C\x85" : "\xE2\x9D\x8C";
        report += " Port " + std::to_string(result.port) + ": " + to_string(result.state);
    }
    return report;
}

core::errors::Result<std::string> NetworkTool::scan_open_ports(
    const std::string& host, const std::optional<std::string>& port_range) const {
    auto checked = context().guard.validate_host(host);
    if (core::errors::is_error(checked)) {
        return core::errors::get_error(checked);
    }

    const std::string port_spec =
        port_range && !port_range->empty() ? *port_range : std::string(kDefaultPortSpec);
    const PortScanner scanner(context().prober, context().config.probe_timeout_ms);
    auto results = with_context(scanner.scan(host, port_spec), "Failed to scan ports on " + host);
    if (core::errors::is_error(results)) {
        return core::errors::get_error(results);
    }
    return render_port_scan(host, port_spec, core::errors::get_value(results));
}

core::errors::Result<std::string> NetworkTool::get_wifi_profiles() const {
    auto output = with_context(native("netsh", {"wlan", "show", "profiles"}),
                               "Failed to get WiFi profiles");
    if (core::errors::is_error(output)) {
        return core::errors::get_error(output);
    }
    return "# WiFi Profiles\n\n" + code_block(core::errors::get_value(output));
}

}  // namespace winsys::tools
