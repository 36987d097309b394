#include "tools/AllTools.hpp"
#include "tools/IssueTools.hpp"
#include "tools/LabelTools.hpp"
#include "tools/MilestoneTools.hpp"
#include "tools/ProjectBoardTools.hpp"
#include "tools/ProjectTools.hpp"
#include <spdlog/spdlog.h>

namespace gitea_mcp {

std::shared_ptr<const ToolRegistry> build_default_registry() {
    auto registry = std::make_shared<ToolRegistry>();

    IssueTools::register_tools(*registry);
    LabelTools::register_tools(*registry);
    MilestoneTools::register_tools(*registry);
    ProjectTools::register_tools(*registry);
    ProjectBoardTools::register_tools(*registry);

    spdlog::debug("Built tool registry with {} tools", registry->size());
    return registry;
}

} // namespace gitea_mcp
