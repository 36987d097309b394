#include "core/ApiClient.hpp"

namespace gitea_mcp {

std::string url_encode(std::string_view value) {
    static constexpr char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size() * 3);
    for (unsigned char c : value) {
        bool unreserved = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                          (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' ||
                          c == '~';
        if (unreserved) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[(c >> 4) & 0x0F]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

std::string encode_query(const QueryParams& query) {
    std::string encoded;
    for (const auto& [key, value] : query) {
        if (!encoded.empty()) {
            encoded += '&';
        }
        encoded += url_encode(key);
        encoded += '=';
        encoded += url_encode(value);
    }
    return encoded;
}

} // namespace gitea_mcp
