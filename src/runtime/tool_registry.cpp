#include "runtime/tool_registry.hpp"

#include "tools/filesystem_tool.hpp"
#include "tools/network_tool.hpp"
#include "tools/performance_tool.hpp"
#include "tools/process_tool.hpp"
#include "tools/registry_tool.hpp"
#include "tools/service_tool.hpp"
#include "tools/system_info_tool.hpp"

namespace winsys::runtime {

ToolRegistry::ToolRegistry(const tools::ToolContext& context) {
    tools_.push_back(std::make_unique<tools::FilesystemTool>(context));
    tools_.push_back(std::make_unique<tools::ProcessTool>(context));
    tools_.push_back(std::make_unique<tools::SystemInfoTool>(context));
    tools_.push_back(std::make_unique<tools::RegistryTool>(context));
    tools_.push_back(std::make_unique<tools::ServiceTool>(context));
    tools_.push_back(std::make_unique<tools::NetworkTool>(context));
    tools_.push_back(std::make_unique<tools::PerformanceTool>(context));
}

const tools::Tool* ToolRegistry::find(const std::string& name) const {
    for (const auto& tool : tools_) {
        if (tool->spec().name == name) {
            return tool.get();
        }
    }
    return nullptr;
}

nlohmann::json ToolRegistry::describe() const {
    nlohmann::json listed = nlohmann::json::array();
    for (const auto& tool : tools_) {
        const auto& spec = tool->spec();
        listed.push_back({{"name", spec.name},
                          {"description", spec.description},
                          {"inputSchema", protocol::to_input_schema(spec)}});
    }
    return listed;
}

}  // namespace winsys::runtime
