#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "tools/tool.hpp"

namespace winsys::tools {

enum class RegistryAction {
    ReadKey,
    ReadValue,
    SearchKeys,
    ListSubkeys,
    GetStartupPrograms,
    GetInstalledPrograms,
    GetSystemInfoFromRegistry
};

class RegistryTool final : public Tool {
public:
    explicit RegistryTool(const ToolContext& context);

    const protocol::ToolSpec& spec() const override;
    core::errors::Result<std::string> run(const std::string& action,
                                          const Arguments& args) const override;

private:
    core::errors::Result<std::string> read_key(const std::string& key_path) const;
    core::errors::Result<std::string> read_value(const std::string& key_path,
                                                 const std::string& value_name) const;
    core::errors::Result<std::string> search_keys(const std::string& search_term,
                                                  const std::string& hive) const;
    core::errors::Result<std::string> list_subkeys(const std::string& key_path,
                                                   std::int64_t max_depth) const;
    core::errors::Result<std::string> get_startup_programs() const;
    core::errors::Result<std::string> get_installed_programs() const;
    core::errors::Result<std::string> get_system_info_from_registry() const;

    // One section per location; a failing location is reported in place
    // instead of failing the whole report.
    std::string render_locations(const std::string& title,
                                 const std::vector<std::string>& locations,
                                 const std::string& script_suffix) const;
};

}  // namespace winsys::tools
