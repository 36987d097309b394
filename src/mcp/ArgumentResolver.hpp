#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace gitea_mcp {

using json = nlohmann::json;

/**
 * @brief Normalizes tools/call arguments and injects owner/repo defaults
 */
class ArgumentResolver {
public:
    /**
     * @param default_owner Owner used when a call omits "owner" (empty: none)
     * @param default_repo Repository used when a call omits "repo" (empty: none)
     */
    ArgumentResolver(std::string default_owner, std::string default_repo);

    /**
     * @brief Produce the argument object handlers see
     *
     * A non-object value becomes an empty object. Caller-supplied owner/repo
     * keys are kept even when their value is empty or not a string.
     */
    json resolve(const json& arguments) const;

    const std::string& default_owner() const { return default_owner_; }
    const std::string& default_repo() const { return default_repo_; }

private:
    std::string default_owner_;
    std::string default_repo_;
};

} // namespace gitea_mcp
