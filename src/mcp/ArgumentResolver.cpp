#include "mcp/ArgumentResolver.hpp"

namespace gitea_mcp {

ArgumentResolver::ArgumentResolver(std::string default_owner, std::string default_repo)
    : default_owner_(std::move(default_owner)), default_repo_(std::move(default_repo)) {}

json ArgumentResolver::resolve(const json& arguments) const {
    json resolved = arguments.is_object() ? arguments : json::object();

    if (!resolved.contains("owner") && !default_owner_.empty()) {
        resolved["owner"] = default_owner_;
    }
    if (!resolved.contains("repo") && !default_repo_.empty()) {
        resolved["repo"] = default_repo_;
    }

    return resolved;
}

} // namespace gitea_mcp
