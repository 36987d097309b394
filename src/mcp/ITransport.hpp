#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace gitea_mcp {

using json = nlohmann::json;

/**
 * @brief Abstract interface for MCP transport mechanisms
 *
 * Transports only frame messages; parsing the payload is the server's job
 * so that malformed frames can still be answered with a parse error.
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    /**
     * @brief Read next raw message frame
     * @return Frame text, or std::nullopt at end of input
     * @throws TransportError on stream failure or an oversized frame
     */
    virtual std::optional<std::string> read_message() = 0;

    /**
     * @brief Write JSON-RPC message to transport and flush
     * @param message JSON message to write
     * @throws TransportError if the output stream failed
     */
    virtual void write_message(const json& message) = 0;

    /**
     * @brief Check if transport is still open
     * @return true if transport can read/write, false otherwise
     */
    virtual bool is_open() const = 0;
};

} // namespace gitea_mcp
