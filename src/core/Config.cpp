#include "core/Config.hpp"
#include "core/Errors.hpp"
#include <array>
#include <string_view>

namespace gitea_mcp {

namespace {

bool starts_with(std::string_view value, std::string_view prefix) {
    return value.substr(0, prefix.size()) == prefix;
}

bool is_known_log_level(std::string_view level) {
    static constexpr std::array<std::string_view, 7> levels = {
        "trace", "debug", "info", "warn", "error", "critical", "off"
    };
    for (auto known : levels) {
        if (known == level) {
            return true;
        }
    }
    return false;
}

} // namespace

void ServerConfig::validate() const {
    if (base_url.empty()) {
        throw ConfigError("--url or GITEA_URL is required");
    }
    if (token.empty()) {
        throw ConfigError("--token or GITEA_TOKEN is required");
    }
    if (!starts_with(base_url, "http://") && !starts_with(base_url, "https://")) {
        throw ConfigError("Invalid URL '" + base_url + "': expected http:// or https:// scheme");
    }
    if (!is_known_log_level(log_level)) {
        throw ConfigError("Invalid log level: " + log_level);
    }
    if (timeout_ms < 0) {
        throw ConfigError("Timeout cannot be negative");
    }
    if (max_message_bytes < kMinMessageBytes) {
        throw ConfigError("Maximum message size must be at least " +
                          std::to_string(kMinMessageBytes) + " bytes");
    }
}

} // namespace gitea_mcp
