#pragma once

#include "core/Config.hpp"
#include "mcp/ITransport.hpp"
#include <cstddef>
#include <iostream>

namespace gitea_mcp {

/**
 * @brief Transport using standard input/output streams
 *
 * Reads one message per line from the input stream, skipping blank lines.
 * Writes one message per line to the output stream and flushes each one.
 */
class StdioTransport : public ITransport {
public:
    /**
     * @brief Construct stdio transport
     * @param in Input stream (default: std::cin)
     * @param out Output stream (default: std::cout)
     * @param max_message_bytes Longest accepted line, newline excluded
     */
    explicit StdioTransport(std::istream& in = std::cin, std::ostream& out = std::cout,
                            std::size_t max_message_bytes = kDefaultMaxMessageBytes);

    std::optional<std::string> read_message() override;
    void write_message(const json& message) override;
    bool is_open() const override;

private:
    /**
     * @brief Read one line without its terminator
     * @return false at end of input with nothing read
     */
    bool read_line(std::string& line);

    std::istream& in_;
    std::ostream& out_;
    std::size_t max_message_bytes_;
};

} // namespace gitea_mcp
