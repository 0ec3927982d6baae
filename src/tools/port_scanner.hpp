#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/tool_errors.hpp"

namespace winsys::tools {

enum class PortState {
    Open,
    ClosedOrFiltered,
    TimeoutOrError
};

struct PortProbeResult {
    std::uint16_t port = 0;
    PortState state = PortState::TimeoutOrError;
};

// A range "start-end" never expands past start + kMaxRangeSpan.
constexpr std::uint32_t kMaxRangeSpan = 100;
// Only this many ports of an expanded port list are probed.
constexpr std::size_t kMaxProbedPorts = 20;
constexpr const char* kDefaultPortSpec = "80,443,22,21,25,53,110,993,995";

std::string to_string(PortState state);

// "80-443" -> 80..180 (capped), "22, 80" -> {22, 80}. Empty -> default set.
core::errors::Result<std::vector<std::uint16_t>> expand_port_spec(const std::string& spec);

// One connectivity test. Failures are classifications, never errors.
class PortProber {
public:
    virtual ~PortProber() = default;

    virtual PortState probe(const std::string& host, std::uint16_t port,
                            std::uint32_t timeout_ms) const = 0;
};

// Non-blocking TCP connect against every resolved address of the host.
class TcpPortProber final : public PortProber {
public:
    PortState probe(const std::string& host, std::uint16_t port,
                    std::uint32_t timeout_ms) const override;
};

class PortScanner {
public:
    PortScanner(const PortProber& prober, std::uint32_t probe_timeout_ms);

    // Probes sequentially, in port list order, at most kMaxProbedPorts ports.
    core::errors::Result<std::vector<PortProbeResult>> scan(
        const std::string& host, const std::optional<std::string>& port_spec) const;

private:
    const PortProber& prober_;
    std::uint32_t probe_timeout_ms_;
};

}  // namespace winsys::tools
