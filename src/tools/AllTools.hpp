#pragma once

#include "mcp/ToolRegistry.hpp"
#include <memory>

namespace gitea_mcp {

/**
 * @brief Build the registry holding every Gitea tool
 *
 * Order: issues, labels, milestones, projects, board columns and items.
 * tools/list reports the tools in this order.
 */
std::shared_ptr<const ToolRegistry> build_default_registry();

} // namespace gitea_mcp
