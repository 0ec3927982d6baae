#include "tools/report_format.hpp"

#include <chrono>
#include <cstdio>

namespace winsys::tools::format {

namespace {

std::string format_utc(const std::time_t time, const char* pattern) {
    std::tm utc{};
    if (gmtime_r(&time, &utc) == nullptr) {
        return "unknown";
    }
    char buffer[32];
    const std::size_t written = std::strftime(buffer, sizeof(buffer), pattern, &utc);
    if (written == 0) {
        return "unknown";
    }
    return std::string(buffer, written);
}

}  // namespace

std::string format_bytes(double bytes) {
    static const char* const kUnits[] = {"B", "KB", "MB", "GB", "TB"};
    constexpr std::size_t kUnitCount = sizeof(kUnits) / sizeof(kUnits[0]);

    std::size_t unit_index = 0;
    while (bytes >= 1024.0 && unit_index < kUnitCount - 1) {
        bytes /= 1024.0;
        ++unit_index;
    }

    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.2f %s", bytes, kUnits[unit_index]);
    return buffer;
}

std::string format_uptime(const std::uint64_t seconds) {
    const std::uint64_t days = seconds / 86400;
    const std::uint64_t hours = (seconds % 86400) / 3600;
    const std::uint64_t minutes = (seconds % 3600) / 60;
    const std::uint64_t secs = seconds % 60;
    return std::to_string(days) + "d " + std::to_string(hours) + "h " +
           std::to_string(minutes) + "m " + std::to_string(secs) + "s";
}

std::string format_date(const std::filesystem::file_time_type time) {
    // file_time_type has no portable epoch in C++17; rebase through now().
    const auto system_time =
        std::chrono::time_point_cast<std::chrono::system_clock::duration>(
            time - std::filesystem::file_time_type::clock::now() +
            std::chrono::system_clock::now());
    return format_utc(std::chrono::system_clock::to_time_t(system_time), "%Y-%m-%d");
}

std::string format_timestamp(const std::time_t time) {
    return format_utc(time, "%Y-%m-%dT%H:%M:%SZ");
}

std::string code_block(const std::string& text) {
    return "```\n" + text + "\n```";
}

std::string powershell_quote(const std::string& value) {
    // PowerShell also closes a single-quoted literal on U+2018..U+201B.
    static const char* const kSmartQuotes[] = {"\xE2\x80\x98", "\xE2\x80\x99",
                                               "\xE2\x80\x9A", "\xE2\x80\x9B"};

    std::string quoted;
    quoted.reserve(value.size() + 2);
    quoted.push_back('\'');
    for (std::size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '\'') {
            quoted += "''";
            continue;
        }
        bool smart_quote = false;
        for (const char* sequence : kSmartQuotes) {
            if (value.compare(i, 3, sequence) == 0) {
                quoted.append(sequence).append(sequence);
                i += 2;
                smart_quote = true;
                break;
            }
        }
        if (!smart_quote) {
            quoted.push_back(value[i]);
        }
    }
    quoted.push_back('\'');
    return quoted;
}

std::string wql_quote(const std::string& value) {
    std::string quoted;
    quoted.reserve(value.size() + 2);
    quoted.push_back('\'');
    for (const char c : value) {
        if (c == '\\' || c == '\'') {
            quoted.push_back('\\');
        }
        quoted.push_back(c);
    }
    quoted.push_back('\'');
    return quoted;
}

std::string trim(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

}  // namespace winsys::tools::format
