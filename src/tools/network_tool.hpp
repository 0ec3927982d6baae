#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "tools/port_scanner.hpp"
#include "tools/tool.hpp"

namespace winsys::tools {

enum class NetworkAction {
    GetNetworkAdapters,
    GetActiveConnections,
    GetListeningPorts,
    GetRoutingTable,
    PingHost,
    TraceRoute,
    GetDnsInfo,
    GetNetworkStatistics,
    ScanOpenPorts,
    GetWifiProfiles
};

class NetworkTool final : public Tool {
public:
    explicit NetworkTool(const ToolContext& context);

    const protocol::ToolSpec& spec() const override;
    core::errors::Result<std::string> run(const std::string& action,
                                          const Arguments& args) const override;

    static std::string render_port_scan(const std::string& host, const std::string& port_spec,
                                        const std::vector<PortProbeResult>& results);

private:
    core::errors::Result<std::string> get_network_adapters() const;
    core::errors::Result<std::string> get_active_connections(const std::string& protocol) const;
    core::errors::Result<std::string> get_listening_ports(const std::string& protocol) const;
    core::errors::Result<std::string> get_routing_table() const;
    core::errors::Result<std::string> ping_host(const std::string& host, std::int64_t count) const;
    core::errors::Result<std::string> trace_route(const std::string& host) const;
    core::errors::Result<std::string> get_dns_info() const;
    core::errors::Result<std::string> get_network_statistics() const;
    core::errors::Result<std::string> scan_open_ports(
        const std::string& host, const std::optional<std::string>& port_range) const;
    core::errors::Result<std::string> get_wifi_profiles() const;
};

}  // namespace winsys::tools
