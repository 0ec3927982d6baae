#pragma once

#include <cstdint>
#include <string>
#include "tools/tool.hpp"

namespace winsys::tools {

enum class FilesystemAction {
    ListDirectory,
    ReadFile,
    SearchFiles,
    GetFileInfo,
    FindLargeFiles,
    GetDiskUsage
};

class FilesystemTool final : public Tool {
public:
    explicit FilesystemTool(const ToolContext& context);

    const protocol::ToolSpec& spec() const override;
    core::errors::Result<std::string> run(const std::string& action,
                                          const Arguments& args) const override;

private:
    core::errors::Result<std::string> list_directory(const std::string& path,
                                                     bool recursive,
                                                     std::int64_t max_depth) const;
    core::errors::Result<std::string> read_file(const std::string& path) const;
    core::errors::Result<std::string> search_files(const std::string& pattern,
                                                   const std::string& path,
                                                   bool recursive) const;
    core::errors::Result<std::string> get_file_info(const std::string& path) const;
    core::errors::Result<std::string> find_large_files(const std::string& path,
                                                       std::int64_t threshold_mb) const;
    core::errors::Result<std::string> get_disk_usage() const;
};

}  // namespace winsys::tools
