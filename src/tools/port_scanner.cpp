#include "tools/port_scanner.hpp"

#include <algorithm>
#include <cerrno>
#include <charconv>
#include <chrono>
#include <fcntl.h>
#include <memory>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <system_error>
#include <unistd.h>
#include "core/logging/logger.hpp"
#include "tools/report_format.hpp"

namespace winsys::tools {

using core::errors::ErrorCategory;
using core::errors::ToolError;

namespace {

class SocketHandle {
public:
    explicit SocketHandle(const int fd) : fd_(fd) {}
    ~SocketHandle() {
        if (fd_ >= 0) {
            static_cast<void>(close(fd_));
        }
    }
    SocketHandle(const SocketHandle&) = delete;
    SocketHandle& operator=(const SocketHandle&) = delete;

    int get() const { return fd_; }

private:
    int fd_;
};

core::errors::Result<std::uint16_t> parse_port(const std::string& token) {
    const std::string trimmed = format::trim(token);
    std::uint32_t value = 0;
    const char* begin = trimmed.data();
    const char* end = trimmed.data() + trimmed.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (trimmed.empty() || ec != std::errc() || ptr != end) {
        return ToolError{ErrorCategory::Input, "Invalid port: '" + trimmed + "'",
                         "invalid_port_spec",
                         "Use a comma list (22,80) or a range (80-443)."};
    }
    if (value == 0 || value > 65535) {
        return ToolError{ErrorCategory::Input,
                         "Port out of range: " + trimmed, "invalid_port_spec",
                         "Ports must be between 1 and 65535."};
    }
    return static_cast<std::uint16_t>(value);
}

PortState classify_connect_error(const int error) {
    switch (error) {
        case ECONNREFUSED:
        case EHOSTUNREACH:
        case ENETUNREACH:
        case ECONNRESET:
            return PortState::ClosedOrFiltered;
        default:
            return PortState::TimeoutOrError;
    }
}

PortState probe_address(const addrinfo& address, const int timeout_ms) {
    SocketHandle socket_fd(socket(address.ai_family, address.ai_socktype,
                                  address.ai_protocol));
    if (socket_fd.get() < 0) {
        return PortState::TimeoutOrError;
    }

    const int flags = fcntl(socket_fd.get(), F_GETFL, 0);
    if (flags == -1 || fcntl(socket_fd.get(), F_SETFL, flags | O_NONBLOCK) == -1) {
        return PortState::TimeoutOrError;
    }

    if (connect(socket_fd.get(), address.ai_addr, address.ai_addrlen) == 0) {
        return PortState::Open;
    }
    if (errno != EINPROGRESS) {
        return classify_connect_error(errno);
    }

    pollfd pfd{};
    pfd.fd = socket_fd.get();
    pfd.events = POLLOUT;
    int ready = 0;
    do {
        ready = poll(&pfd, 1, timeout_ms);
    } while (ready < 0 && errno == EINTR);
    if (ready <= 0) {
        return PortState::TimeoutOrError;
    }

    int socket_error = 0;
    socklen_t length = sizeof(socket_error);
    if (getsockopt(socket_fd.get(), SOL_SOCKET, SO_ERROR, &socket_error, &length) != 0) {
        return PortState::TimeoutOrError;
    }
    if (socket_error == 0) {
        return PortState::Open;
    }
    return classify_connect_error(socket_error);
}

}  // namespace

std::string to_string(const PortState state) {
    switch (state) {
        case PortState::Open:
            return "Open";
        case PortState::ClosedOrFiltered:
            return "Closed/Filtered";
        case PortState::TimeoutOrError:
            return "Timeout/Error";
        default:
            return "Unknown";
    }
}

core::errors::Result<std::vector<std::uint16_t>> expand_port_spec(
    const std::string& spec) {
    std::string effective = format::trim(spec);
    if (effective.empty()) {
        effective = kDefaultPortSpec;
    }

    std::vector<std::uint16_t> ports;
    const auto dash = effective.find('-');
    if (dash != std::string::npos) {
        auto start = parse_port(effective.substr(0, dash));
        if (core::errors::is_error(start)) {
            return core::errors::get_error(start);
        }
        auto end = parse_port(effective.substr(dash + 1));
        if (core::errors::is_error(end)) {
            return core::errors::get_error(end);
        }

        const std::uint32_t first = core::errors::get_value(start);
        const std::uint32_t last =
            std::min<std::uint32_t>(core::errors::get_value(end), first + kMaxRangeSpan);
        for (std::uint32_t port = first; port <= last; ++port) {
            ports.push_back(static_cast<std::uint16_t>(port));
        }
        return ports;
    }

    std::size_t begin = 0;
    while (begin <= effective.size()) {
        const auto comma = effective.find(',', begin);
        const std::string token = effective.substr(
            begin, comma == std::string::npos ? std::string::npos : comma - begin);
        if (!format::trim(token).empty()) {
            auto port = parse_port(token);
            if (core::errors::is_error(port)) {
                return core::errors::get_error(port);
            }
            ports.push_back(core::errors::get_value(port));
        }
        if (comma == std::string::npos) {
            break;
        }
        begin = comma + 1;
    }
    return ports;
}

PortState TcpPortProber::probe(const std::string& host, const std::uint16_t port,
                               const std::uint32_t timeout_ms) const {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* resolved = nullptr;
    const std::string service = std::to_string(port);
    const int rc = getaddrinfo(host.c_str(), service.c_str(), &hints, &resolved);
    if (rc != 0 || resolved == nullptr) {
        WINSYS_LOG_DEBUG("probe: cannot resolve " + host + ": " + gai_strerror(rc));
        return PortState::TimeoutOrError;
    }
    std::unique_ptr<addrinfo, decltype(&freeaddrinfo)> addresses(resolved, &freeaddrinfo);

    // Every resolved address shares one deadline; an open address wins,
    // otherwise an explicit refusal beats a timeout.
    const auto deadline =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    PortState best = PortState::TimeoutOrError;
    for (const addrinfo* address = addresses.get(); address != nullptr;
         address = address->ai_next) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                                   deadline - std::chrono::steady_clock::now())
                                   .count();
        if (remaining <= 0) {
            break;
        }
        const PortState state = probe_address(*address, static_cast<int>(remaining));
        if (state == PortState::Open) {
            return state;
        }
        if (state == PortState::ClosedOrFiltered) {
            best = state;
        }
    }
    return best;
}

PortScanner::PortScanner(const PortProber& prober, const std::uint32_t probe_timeout_ms)
    : prober_(prober), probe_timeout_ms_(probe_timeout_ms) {}

core::errors::Result<std::vector<PortProbeResult>> PortScanner::scan(
    const std::string& host, const std::optional<std::string>& port_spec) const {
    auto expanded = expand_port_spec(port_spec.value_or(kDefaultPortSpec));
    if (core::errors::is_error(expanded)) {
        return core::errors::get_error(expanded);
    }
    const auto& ports = core::errors::get_value(expanded);

    const std::size_t probe_count = std::min(ports.size(), kMaxProbedPorts);
    std::vector<PortProbeResult> results;
    results.reserve(probe_count);
    for (std::size_t i = 0; i < probe_count; ++i) {
        PortProbeResult result;
        result.port = ports[i];
        result.state = prober_.probe(host, ports[i], probe_timeout_ms_);
        results.push_back(result);
    }
    return results;
}

}  // namespace winsys::tools
