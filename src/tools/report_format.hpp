#pragma once

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <string>

namespace winsys::tools::format {

// Largest unit of B/KB/MB/GB/TB whose scaled value is below 1024, two decimals:
// 1536 -> "1.50 KB". Values beyond the TB range stay in TB.
std::string format_bytes(double bytes);

// 93784 -> "1d 2h 3m 4s"
std::string format_uptime(std::uint64_t seconds);

// UTC calendar date, "YYYY-MM-DD".
std::string format_date(std::filesystem::file_time_type time);

// UTC timestamp, "YYYY-MM-DDTHH:MM:SSZ".
std::string format_timestamp(std::time_t time);

// Wraps raw command output in a Markdown fence.
std::string code_block(const std::string& text);

// Single-quoted PowerShell literal; embedded single quotes are doubled so the
// value can never terminate the literal.
std::string powershell_quote(const std::string& value);

// Single-quoted WQL string literal for WMI -Filter clauses. Embedded
// backslashes and single quotes are backslash-escaped.
std::string wql_quote(const std::string& value);

std::string trim(const std::string& text);

}  // namespace winsys::tools::format
