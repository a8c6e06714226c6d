#pragma once

#include <string>
#include <string_view>

namespace mcp_bridge {

// Percent-encode a string per RFC 3986.
// Unreserved characters (alphanumeric, '-', '_', '.', '~') pass through;
// everything else is replaced with %XX (uppercase hex).
std::string UrlEncode(const std::string& value);

// Join a base path ("" or "/api", no trailing slash) with a relative path
// ("tools" or "/tools"). Always returns an absolute path.
std::string JoinUrlPath(std::string_view base_path, std::string_view path);

} // namespace mcp_bridge
