#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include "tools/tool.hpp"

namespace winsys::tools {

enum class ProcessAction {
    ListProcesses,
    GetProcessDetails,
    KillProcess,
    FindProcess,
    GetTopProcesses,
    GetProcessTree
};

class ProcessTool final : public Tool {
public:
    explicit ProcessTool(const ToolContext& context);

    const protocol::ToolSpec& spec() const override;
    core::errors::Result<std::string> run(const std::string& action,
                                          const Arguments& args) const override;

    // cpu -> CPU, memory -> WorkingSet, name -> Name, pid -> Id
    static std::string sort_property(const std::string& sort_by);

private:
    core::errors::Result<std::string> list_processes(const std::string& sort_by,
                                                     std::int64_t limit,
                                                     bool include_system) const;
    core::errors::Result<std::string> get_process_details(
        const std::optional<std::int64_t>& process_id,
        const std::optional<std::string>& process_name) const;
    core::errors::Result<std::string> kill_process(
        const std::optional<std::int64_t>& process_id,
        const std::optional<std::string>& process_name) const;
    core::errors::Result<std::string> find_process(const std::string& process_name) const;
    core::errors::Result<std::string> get_top_processes(const std::string& sort_by,
                                                        std::int64_t limit) const;
    core::errors::Result<std::string> get_process_tree() const;
};

}  // namespace winsys::tools
