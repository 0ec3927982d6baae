#pragma once

#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "tools/tool.hpp"

namespace winsys::runtime {

// The fixed tool table, built once at startup in advertisement order:
// filesystem, process_manager, system_info, registry, service_manager,
// network, performance.
class ToolRegistry {
public:
    explicit ToolRegistry(const tools::ToolContext& context);

    const tools::Tool* find(const std::string& name) const;
    const std::vector<std::unique_ptr<tools::Tool>>& tools() const { return tools_; }

    // [{name, description, inputSchema}, ...] for tools/list.
    nlohmann::json describe() const;

private:
    std::vector<std::unique_ptr<tools::Tool>> tools_;
};

}  // namespace winsys::runtime
