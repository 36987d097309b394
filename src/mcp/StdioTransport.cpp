#include "mcp/StdioTransport.hpp"
#include "core/Errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <string>

namespace gitea_mcp {

namespace {

bool is_blank(const std::string& line) {
    return std::all_of(line.begin(), line.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

} // namespace

StdioTransport::StdioTransport(std::istream& in, std::ostream& out, std::size_t max_message_bytes)
    : in_(in), out_(out), max_message_bytes_(max_message_bytes) {
    spdlog::debug("StdioTransport initialized (max message {} bytes)", max_message_bytes_);
}

std::optional<std::string> StdioTransport::read_message() {
    std::string line;

    while (read_line(line)) {
        if (is_blank(line)) {
            continue;
        }
        spdlog::trace("Read message: {} bytes", line.size());
        return line;
    }

    spdlog::debug("Reached end of input stream");
    return std::nullopt;
}

bool StdioTransport::read_line(std::string& line) {
    using traits = std::istream::traits_type;

    line.clear();
    if (in_.bad()) {
        throw TransportError("Error reading from input stream");
    }
    if (in_.eof()) {
        return false;
    }

    std::streambuf* buf = in_.rdbuf();
    if (!buf) {
        throw TransportError("Input stream has no buffer");
    }

    bool read_any = false;
    for (;;) {
        traits::int_type c = buf->sbumpc();
        if (traits::eq_int_type(c, traits::eof())) {
            in_.setstate(std::ios::eofbit);
            break;
        }
        read_any = true;

        char ch = traits::to_char_type(c);
        if (ch == '\n') {
            break;
        }
        if (line.size() >= max_message_bytes_) {
            throw TransportError("Message exceeds maximum size of " +
                                 std::to_string(max_message_bytes_) + " bytes");
        }
        line.push_back(ch);
    }

    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return read_any;
}

void StdioTransport::write_message(const json& message) {
    std::string serialized = message.dump(-1, ' ', false, json::error_handler_t::replace);
    out_ << serialized << '\n';
    out_.flush();
    if (!out_) {
        throw TransportError("Error writing to output stream");
    }
    spdlog::trace("Wrote message: {}", serialized);
}

bool StdioTransport::is_open() const {
    return !in_.bad() && out_.good();
}

} // namespace gitea_mcp
