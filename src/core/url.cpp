#include <mcp_bridge/core/url.hpp>

#include <cctype>
#include <iomanip>
#include <sstream>

namespace mcp_bridge {

std::string UrlEncode(const std::string& value) {
    std::ostringstream encoded;
    encoded.fill('0');
    encoded << std::hex << std::uppercase;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << static_cast<int>(c);
        }
    }
    return encoded.str();
}

std::string JoinUrlPath(std::string_view base_path, std::string_view path) {
    std::string joined(base_path);
    while (!joined.empty() && joined.back() == '/') {
        joined.pop_back();
    }
    if (path.empty() || path.front() != '/') {
        joined += '/';
    }
    joined += path;
    return joined;
}

} // namespace mcp_bridge
