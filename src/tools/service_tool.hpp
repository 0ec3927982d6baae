#pragma once

#include <cstdint>
#include <string>
#include "tools/tool.hpp"

namespace winsys::tools {

enum class ServiceAction {
    ListServices,
    GetServiceDetails,
    StartService,
    StopService,
    RestartService,
    GetServiceStatus,
    FindService,
    GetRunningServices,
    GetStartupServices
};

class ServiceTool final : public Tool {
public:
    explicit ServiceTool(const ToolContext& context);

    const protocol::ToolSpec& spec() const override;
    core::errors::Result<std::string> run(const std::string& action,
                                          const Arguments& args) const override;

    // running -> Running etc.; anything else maps to the first member.
    static std::string status_value(const std::string& filter);
    static std::string startup_type_value(const std::string& filter);

private:
    core::errors::Result<std::string> list_services(const std::string& status_filter,
                                                    const std::string& startup_type_filter,
                                                    std::int64_t limit) const;
    core::errors::Result<std::string> get_service_details(const std::string& service_name) const;
    core::errors::Result<std::string> change_service_state(ServiceAction action,
                                                           const std::string& service_name) const;
    core::errors::Result<std::string> get_service_status(const std::string& service_name) const;
    core::errors::Result<std::string> find_service(const std::string& search_term) const;
    core::errors::Result<std::string> get_running_services(std::int64_t limit) const;
    core::errors::Result<std::string> get_startup_services(std::int64_t limit) const;
};

}  // namespace winsys::tools
