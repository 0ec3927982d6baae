#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <gtest/gtest.h>
#include "core/errors/tool_errors.hpp"
#include "test_doubles.hpp"
#include "tools/port_scanner.hpp"

namespace {

using winsys::core::errors::ErrorCategory;
using winsys::core::errors::get_error;
using winsys::core::errors::get_value;
using winsys::core::errors::is_error;
using winsys::testing::FakePortProber;
using winsys::tools::expand_port_spec;
using winsys::tools::PortScanner;
using winsys::tools::PortState;
using winsys::tools::TcpPortProber;

// Listens on an ephemeral loopback port for the lifetime of the object.
class LoopbackListener {
public:
    LoopbackListener() {
        fd_ = socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in address{};
        address.sin_family = AF_INET;
        address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        address.sin_port = 0;
        if (fd_ < 0 || bind(fd_, reinterpret_cast<sockaddr*>(&address), sizeof(address)) != 0 ||
            listen(fd_, 4) != 0) {
            return;
        }
        socklen_t length = sizeof(address);
        if (getsockname(fd_, reinterpret_cast<sockaddr*>(&address), &length) == 0) {
            port_ = ntohs(address.sin_port);
        }
    }

    ~LoopbackListener() { close_socket(); }

    LoopbackListener(const LoopbackListener&) = delete;
    LoopbackListener& operator=(const LoopbackListener&) = delete;

    void close_socket() {
        if (fd_ >= 0) {
            static_cast<void>(close(fd_));
            fd_ = -1;
        }
    }

    std::uint16_t port() const { return port_; }

private:
    int fd_ = -1;
    std::uint16_t port_ = 0;
};

TEST(PortScannerTest, EmptySpecificationUsesDefaultSet) {
    auto result = expand_port_spec("");
    ASSERT_FALSE(is_error(result));
    const std::vector<std::uint16_t> expected{80, 443, 22, 21, 25, 53, 110, 993, 995};
    EXPECT_EQ(get_value(result), expected);
}

TEST(PortScannerTest, RangeIsCappedAtOneHundredAboveStart) {
    auto result = expand_port_spec("80-443");
    ASSERT_FALSE(is_error(result));
    const auto& ports = get_value(result);
    ASSERT_EQ(ports.size(), 101u);
    EXPECT_EQ(ports.front(), 80);
    EXPECT_EQ(ports.back(), 180);
}

TEST(PortScannerTest, ShortRangeIsExpandedFully) {
    auto result = expand_port_spec("8080-8082");
    ASSERT_FALSE(is_error(result));
    const std::vector<std::uint16_t> expected{8080, 8081, 8082};
    EXPECT_EQ(get_value(result), expected);
}

TEST(PortScannerTest, BackwardsRangeIsEmpty) {
    auto result = expand_port_spec("10-5");
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).empty());
}

TEST(PortScannerTest, CommaListKeepsOrderAndSkipsBlanks) {
    auto result = expand_port_spec(" 443, 22,,80 ");
    ASSERT_FALSE(is_error(result));
    const std::vector<std::uint16_t> expected{443, 22, 80};
    EXPECT_EQ(get_value(result), expected);
}

TEST(PortScannerTest, RejectsNonNumericAndOutOfRangePorts) {
    for (const std::string spec : {"abc", "0", "70000", "22,http", "1-x"}) {
        auto result = expand_port_spec(spec);
        ASSERT_TRUE(is_error(result)) << spec;
        EXPECT_EQ(get_error(result).category, ErrorCategory::Input) << spec;
        EXPECT_EQ(get_error(result).code, "invalid_port_spec") << spec;
    }
}

TEST(PortScannerTest, ProbesAtMostTwentyPortsInOrder) {
    FakePortProber prober;
    prober.states[5] = PortState::Open;
    PortScanner scanner(prober, 750);

    auto result = scanner.scan("localhost", std::string("1-500"));
    ASSERT_FALSE(is_error(result));

    const auto& results = get_value(result);
    ASSERT_EQ(results.size(), 20u);
    ASSERT_EQ(prober.probes.size(), 20u);
    for (std::size_t i = 0; i < prober.probes.size(); ++i) {
        EXPECT_EQ(prober.probes[i].port, i + 1);
        EXPECT_EQ(prober.probes[i].host, "localhost");
        EXPECT_EQ(prober.probes[i].timeout_ms, 750u);
    }
    EXPECT_EQ(results[4].state, PortState::Open);
    EXPECT_EQ(results[0].state, PortState::ClosedOrFiltered);
}

TEST(PortScannerTest, MissingSpecificationScansDefaults) {
    FakePortProber prober;
    PortScanner scanner(prober, 100);

    auto result = scanner.scan("10.0.0.1", std::nullopt);
    ASSERT_FALSE(is_error(result));
    ASSERT_EQ(get_value(result).size(), 9u);
    EXPECT_EQ(prober.probes.front().port, 80);
    EXPECT_EQ(prober.probes.back().port, 995);
}

TEST(PortScannerTest, InvalidSpecificationProbesNothing) {
    FakePortProber prober;
    PortScanner scanner(prober, 100);

    auto result = scanner.scan("localhost", std::string("ssh"));
    ASSERT_TRUE(is_error(result));
    EXPECT_TRUE(prober.probes.empty());
}

TEST(PortScannerTest, StateNames) {
    EXPECT_EQ(winsys::tools::to_string(PortState::Open), "Open");
    EXPECT_EQ(winsys::tools::to_string(PortState::ClosedOrFiltered), "Closed/Filtered");
    EXPECT_EQ(winsys::tools::to_string(PortState::TimeoutOrError), "Timeout/Error");
}

TEST(TcpPortProberTest, DetectsListeningLoopbackPort) {
    LoopbackListener listener;
    ASSERT_NE(listener.port(), 0);

    TcpPortProber prober;
    EXPECT_EQ(prober.probe("127.0.0.1", listener.port(), 2000), PortState::Open);
}

TEST(TcpPortProberTest, ClosedLoopbackPortIsRefused) {
    std::uint16_t port = 0;
    {
        LoopbackListener listener;
        port = listener.port();
    }
    ASSERT_NE(port, 0);

    TcpPortProber prober;
    EXPECT_EQ(prober.probe("127.0.0.1", port, 2000), PortState::ClosedOrFiltered);
}

TEST(TcpPortProberTest, UnresolvableHostIsTimeoutOrError) {
    TcpPortProber prober;
    EXPECT_EQ(prober.probe("host.invalid", 80, 500), PortState::TimeoutOrError);
}

}  // namespace
