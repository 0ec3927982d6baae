#include "tools/filesystem_tool.hpp"

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <limits>
#include <sstream>
#include <sys/stat.h>
#include <system_error>
#include <vector>
#include "tools/directory_walker.hpp"
#include "tools/report_format.hpp"

namespace winsys::tools {

using core::errors::ErrorCategory;
using core::errors::ToolError;
using core::errors::with_context;
using format::code_block;
using format::powershell_quote;
using protocol::ParamType;

namespace {

constexpr std::uintmax_t kMaxReadBytes = 1024 * 1024;
constexpr std::int64_t kBytesPerMb = 1024 * 1024;

const std::vector<ActionBinding<FilesystemAction>>& filesystem_actions() {
    static const std::vector<ActionBinding<FilesystemAction>> bindings = {
        {FilesystemAction::ListDirectory, {"list_directory", {}}},
        {FilesystemAction::ReadFile, {"read_file", {"path"}}},
        {FilesystemAction::SearchFiles, {"search_files", {"pattern"}}},
        {FilesystemAction::GetFileInfo, {"get_file_info", {"path"}}},
        {FilesystemAction::FindLargeFiles, {"find_large_files", {}}},
        {FilesystemAction::GetDiskUsage, {"get_disk_usage", {}}},
    };
    return bindings;
}

std::string file_type_label(const mode_t mode) {
    if (S_ISDIR(mode)) {
        return "Directory";
    }
    if (S_ISLNK(mode)) {
        return "Symbolic link";
    }
    return "File";
}

std::string octal_mode(const mode_t mode) {
    std::ostringstream out;
    out << std::oct << static_cast<unsigned long>(mode);
    return out.str();
}

}  // namespace

FilesystemTool::FilesystemTool(const ToolContext& context) : Tool(context) {}

const protocol::ToolSpec& FilesystemTool::spec() const {
    static const protocol::ToolSpec tool_spec = {
        "filesystem",
        "File system",
        "Comprehensive file system operations including directory browsing, file "
        "reading, searching, and basic file operations",
        action_specs(filesystem_actions()),
        {
            {"path", ParamType::String, "File or directory path (required for most actions)", {}, nullptr},
            {"pattern", ParamType::String, "Search pattern for file searching (supports wildcards)", {}, nullptr},
            {"recursive", ParamType::Boolean, "Whether to search recursively (default: false)", {}, false},
            {"max_depth", ParamType::Number, "Maximum depth for recursive operations (default: 3)", {}, 3},
            {"size_threshold", ParamType::Number, "Size threshold in MB for finding large files (default: 100)", {}, 100},
        }};
    return tool_spec;
}

core::errors::Result<std::string> FilesystemTool::run(const std::string& action,
                                                      const Arguments& args) const {
    const auto parsed = find_action(filesystem_actions(), action);
    if (!parsed) {
        return unknown_action_error(action);
    }

    const std::string root = context().config.default_root;
    switch (*parsed) {
        case FilesystemAction::ListDirectory:
            return list_directory(args.string_or("path", root),
                                  args.bool_or("recursive", false),
                                  args.integer_or("max_depth", 3));
        case FilesystemAction::ReadFile:
            return read_file(args.string_or("path", ""));
        case FilesystemAction::SearchFiles:
            return search_files(args.string_or("pattern", ""), args.string_or("path", root),
                                args.bool_or("recursive", false));
        case FilesystemAction::GetFileInfo:
            return get_file_info(args.string_or("path", ""));
        case FilesystemAction::FindLargeFiles:
            return find_large_files(args.string_or("path", root),
                                    args.integer_or("size_threshold", 100));
        case FilesystemAction::GetDiskUsage:
            return get_disk_usage();
    }
    return unknown_action_error(action);
}

core::errors::Result<std::string> FilesystemTool::list_directory(
    const std::string& path, const bool recursive, const std::int64_t max_depth) const {
    const DirectoryWalker walker{};
    const auto depth = std::clamp<std::int64_t>(max_depth, 0, std::numeric_limits<int>::max());
    auto listing = walker.list(path, recursive, static_cast<int>(depth));
    if (core::errors::is_error(listing)) {
        return core::errors::get_error(listing);
    }
    return render_listing(core::errors::get_value(listing));
}

core::errors::Result<std::string> FilesystemTool::read_file(const std::string& path) const {
    const std::string context_message = "Cannot read file " + path;

    std::error_code ec;
    const auto status = std::filesystem::status(path, ec);
    if (ec || !std::filesystem::exists(status)) {
        return ToolError{ErrorCategory::Input,
                         context_message + ": " +
                             (ec ? ec.message() : std::string("No such file or directory")),
                         "path_not_found"};
    }
    if (std::filesystem::is_directory(status)) {
        return ToolError{ErrorCategory::Input,
                         context_message + ": Path is a directory, not a file",
                         "not_a_file"};
    }

    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return ToolError{ErrorCategory::Execution, context_message + ": " + ec.message(),
                         "path_not_found"};
    }
    if (size > kMaxReadBytes) {
        return ToolError{ErrorCategory::Input,
                         context_message +
                             ": File too large (>1MB). Use file info to check size first.",
                         "file_too_large"};
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return ToolError{ErrorCategory::Execution, context_message + ": Failed to open file",
                         "path_not_found"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (!in.good() && !in.eof()) {
        return ToolError{ErrorCategory::Execution,
                         context_message + ": I/O error while reading file",
                         "path_not_found"};
    }

    return "# File Content: " + path + "\n\n" + code_block(buffer.str());
}

core::errors::Result<std::string> FilesystemTool::search_files(
    const std::string& pattern, const std::string& path, const bool recursive) const {
    const std::string script =
        "Get-ChildItem -Path " + powershell_quote(path) + " -Filter " +
        powershell_quote(pattern) + (recursive ? " -Recurse" : "") +
        " -ErrorAction SilentlyContinue | Select-Object FullName, Length, LastWriteTime"
        " | Format-Table -AutoSize";

    auto output = with_context(powershell(script), "File search failed");
    if (core::errors::is_error(output)) {
        return core::errors::get_error(output);
    }
    return "# File Search Results\n\nPattern: " + pattern + "\nPath: " + path +
           "\nRecursive: " + (recursive ? "true" : "false") + "\n\n" +
           code_block(core::errors::get_value(output));
}

core::errors::Result<std::string> FilesystemTool::get_file_info(const std::string& path) const {
    struct stat info{};
    if (::stat(path.c_str(), &info) != 0) {
        const std::error_code ec(errno, std::generic_category());
        return ToolError{ErrorCategory::Input,
                         "Cannot get file info for " + path + ": " + ec.message(),
                         "path_not_found"};
    }

    std::ostringstream out;
    out << "# File Information: " << path << "\n\n"
        << "- **Type**: " << file_type_label(info.st_mode) << "\n"
        << "- **Size**: " << format::format_bytes(static_cast<double>(info.st_size)) << "\n"
        << "- **Modified**: " << format::format_timestamp(info.st_mtime) << "\n"
        << "- **Accessed**: " << format::format_timestamp(info.st_atime) << "\n"
        << "- **Changed**: " << format::format_timestamp(info.st_ctime) << "\n"
        << "- **Permissions**: " << octal_mode(info.st_mode);
    return out.str();
}

core::errors::Result<std::string> FilesystemTool::find_large_files(
    const std::string& path, const std::int64_t threshold_mb) const {
    // Saturate instead of overflowing for absurd thresholds.
    const std::int64_t threshold_bytes =
        std::clamp(threshold_mb, std::numeric_limits<std::int64_t>::min() / kBytesPerMb,
                   std::numeric_limits<std::int64_t>::max() / kBytesPerMb) *
        kBytesPerMb;
    const std::string script =
        "Get-ChildItem -Path " + powershell_quote(path) +
        " -Recurse -File -ErrorAction SilentlyContinue | Where-Object {$_.Length -gt " +
        std::to_string(threshold_bytes) +
        "} | Sort-Object Length -Descending | Select-Object FullName, "
        "@{Name='SizeMB';Expression={[math]::Round($_.Length/1MB,2)}}, LastWriteTime"
        " | Format-Table -AutoSize";

    auto output = with_context(powershell(script), "Large file search failed");
    if (core::errors::is_error(output)) {
        return core::errors::get_error(output);
    }
    return "# Large Files (>" + std::to_string(threshold_mb) + "MB)\n\nSearch Path: " + path +
           "\n\n" + code_block(core::errors::get_value(output));
}

core::errors::Result<std::string> FilesystemTool::get_disk_usage() const {
    const std::string script =
        "Get-WmiObject -Class Win32_LogicalDisk | Select-Object DeviceID, "
        "@{Name='SizeGB';Expression={[math]::Round($_.Size/1GB,2)}}, "
        "@{Name='FreeSpaceGB';Expression={[math]::Round($_.FreeSpace/1GB,2)}}, "
        "@{Name='UsedSpaceGB';Expression={[math]::Round(($_.Size-$_.FreeSpace)/1GB,2)}}, "
        "@{Name='PercentFree';Expression={[math]::Round(($_.FreeSpace/$_.Size)*100,2)}}"
        " | Format-Table -AutoSize";

    auto output = with_context(powershell(script), "Disk usage query failed");
    if (core::errors::is_error(output)) {
        return core::errors::get_error(output);
    }
    return "# Disk Usage Information\n\n" + code_block(core::errors::get_value(output));
}

}  // namespace winsys::tools
