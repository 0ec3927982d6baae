#pragma once

#include <optional>
#include <string>
#include <vector>
#include "tools/tool.hpp"

namespace winsys::tools {

enum class SystemInfoAction {
    GetSystemOverview,
    GetHardwareInfo,
    GetOsInfo,
    GetEnvironmentVars,
    GetInstalledSoftware,
    GetSystemUptime,
    GetUserInfo,
    GetSystemPaths
};

class SystemInfoTool final : public Tool {
public:
    explicit SystemInfoTool(const ToolContext& context);

    const protocol::ToolSpec& spec() const override;
    core::errors::Result<std::string> run(const std::string& action,
                                          const Arguments& args) const override;

    // Splits a PATH value on ';' when present, otherwise on ':', keeping at
    // most `limit` entries.
    static std::vector<std::string> split_path_entries(const std::string& path_value,
                                                       std::size_t limit);

private:
    core::errors::Result<std::string> get_system_overview() const;
    core::errors::Result<std::string> get_hardware_info(const std::string& category) const;
    core::errors::Result<std::string> get_os_info() const;
    core::errors::Result<std::string> get_environment_vars(
        const std::optional<std::string>& filter) const;
    core::errors::Result<std::string> get_installed_software(
        const std::optional<std::string>& filter) const;
    core::errors::Result<std::string> get_system_uptime() const;
    core::errors::Result<std::string> get_user_info() const;
    core::errors::Result<std::string> get_system_paths() const;
};

}  // namespace winsys::tools
