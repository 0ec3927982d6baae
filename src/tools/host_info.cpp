#include "tools/host_info.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sys/sysinfo.h>
#include <sys/utsname.h>
#include <thread>
#include <unistd.h>
#include "tools/report_format.hpp"

namespace winsys::tools {

namespace {

std::string read_cpu_model() {
    std::ifstream in("/proc/cpuinfo");
    std::string line;
    while (std::getline(in, line)) {
        if (line.rfind("model name", 0) != 0) {
            continue;
        }
        const auto colon = line.find(':');
        if (colon != std::string::npos) {
            return format::trim(line.substr(colon + 1));
        }
    }
    return "";
}

}  // namespace

HostFacts read_host_facts() {
    HostFacts facts;

    char hostname[256] = {};
    if (::gethostname(hostname, sizeof(hostname) - 1) == 0) {
        facts.hostname = hostname;
    }

    struct utsname uts{};
    if (::uname(&uts) == 0) {
        facts.platform = uts.sysname;
        std::transform(facts.platform.begin(), facts.platform.end(), facts.platform.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        facts.architecture = uts.machine;
    }

    const long online = ::sysconf(_SC_NPROCESSORS_ONLN);
    facts.cpu_count = online > 0 ? static_cast<unsigned>(online)
                                 : std::thread::hardware_concurrency();

    struct sysinfo info{};
    if (::sysinfo(&info) == 0) {
        const std::uint64_t unit = info.mem_unit == 0 ? 1 : info.mem_unit;
        facts.total_memory_bytes = static_cast<std::uint64_t>(info.totalram) * unit;
        facts.free_memory_bytes = static_cast<std::uint64_t>(info.freeram) * unit;
        facts.uptime_seconds = info.uptime > 0 ? static_cast<std::uint64_t>(info.uptime) : 0;
    }

    facts.cpu_model = read_cpu_model();
    return facts;
}

}  // namespace winsys::tools
