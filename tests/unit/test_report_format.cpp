#include <string>
#include <gtest/gtest.h>
#include "tools/report_format.hpp"

namespace {

using namespace winsys::tools::format;

TEST(ReportFormatTest, FormatsBytesInLargestUnitBelow1024) {
    EXPECT_EQ(format_bytes(0), "0.00 B");
    EXPECT_EQ(format_bytes(1023), "1023.00 B");
    EXPECT_EQ(format_bytes(1536), "1.50 KB");
    EXPECT_EQ(format_bytes(1048576), "1.00 MB");
    EXPECT_EQ(format_bytes(1073741824), "1.00 GB");
}

TEST(ReportFormatTest, StaysInTerabytesBeyondRange) {
    const double two_petabytes = 2.0 * 1024 * 1024 * 1024 * 1024 * 1024;
    EXPECT_EQ(format_bytes(two_petabytes), "2048.00 TB");
}

TEST(ReportFormatTest, FormatsUptime) {
    EXPECT_EQ(format_uptime(0), "0d 0h 0m 0s");
    EXPECT_EQ(format_uptime(93784), "1d 2h 3m 4s");
    EXPECT_EQ(format_uptime(59), "0d 0h 0m 59s");
}

TEST(ReportFormatTest, FormatsUtcTimestamp) {
    EXPECT_EQ(format_timestamp(0), "1970-01-01T00:00:00Z");
    EXPECT_EQ(format_timestamp(951782400), "2000-02-29T00:00:00Z");
}

TEST(ReportFormatTest, WrapsOutputInFence) {
    EXPECT_EQ(code_block("Name  Id"), "```\nName  Id\n```");
    EXPECT_EQ(code_block(""), "```\n\n```");
}

TEST(ReportFormatTest, QuotesPowerShellLiterals) {
    EXPECT_EQ(powershell_quote("Spooler"), "'Spooler'");
    EXPECT_EQ(powershell_quote("it's"), "'it''s'");
    EXPECT_EQ(powershell_quote("'; Stop-Computer; '"), "'''; Stop-Computer; '''");
    EXPECT_EQ(powershell_quote("$env:PATH"), "'$env:PATH'");
}

TEST(ReportFormatTest, DoublesTypographicQuotes) {
    const std::string right_quote = "\xE2\x80\x99";
    EXPECT_EQ(powershell_quote("a" + right_quote + "b"),
              "'a" + right_quote + right_quote + "b'");
}

TEST(ReportFormatTest, EscapesWqlLiterals) {
    EXPECT_EQ(wql_quote("Spooler"), "'Spooler'");
    EXPECT_EQ(wql_quote("O'Brien"), "'O\\'Brien'");
    EXPECT_EQ(wql_quote("C:\\svc"), "'C:\\\\svc'");
    EXPECT_EQ(wql_quote("x' OR Name LIKE '%"), "'x\\' OR Name LIKE \\'%'");
}

TEST(ReportFormatTest, TrimsWhitespace) {
    EXPECT_EQ(trim("  True\r\n"), "True");
    EXPECT_EQ(trim(" \t\n"), "");
}

}  // namespace
