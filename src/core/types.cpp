#include <mcp_bridge/core/types.hpp>

#include <algorithm>
#include <cctype>

namespace mcp_bridge {

namespace {

bool IsProviderNameChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 ||
           c == '-' || c == '_' || c == '.';
}

bool StartsWith(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// ProviderName
// ---------------------------------------------------------------------------
Result<ProviderName, std::string> ProviderName::Create(std::string_view name) {
    if (name.empty()) {
        return Result<ProviderName, std::string>::Err("Provider name must not be empty");
    }
    if (name.size() > 64) {
        return Result<ProviderName, std::string>::Err(
            "Provider name must be at most 64 characters, got " +
            std::to_string(name.size()));
    }
    if (!std::all_of(name.begin(), name.end(), IsProviderNameChar)) {
        return Result<ProviderName, std::string>::Err(
            "Provider name must contain only letters, digits, '-', '_' and '.'");
    }
    if (name == "meta") {
        return Result<ProviderName, std::string>::Err(
            "Provider name 'meta' is reserved");
    }
    return Result<ProviderName, std::string>::Ok(ProviderName(std::string(name)));
}

// ---------------------------------------------------------------------------
// ServerUrl
// ---------------------------------------------------------------------------
Result<ServerUrl, std::string> ServerUrl::Create(std::string_view url) {
    bool use_https = false;
    std::string_view rest;
    if (StartsWith(url, "https://")) {
        use_https = true;
        rest = url.substr(8);
    } else if (StartsWith(url, "http://")) {
        rest = url.substr(7);
    } else {
        return Result<ServerUrl, std::string>::Err(
            "Server URL must start with http:// or https://");
    }

    auto path_start = rest.find('/');
    auto authority = rest.substr(0, path_start);
    std::string base_path;
    if (path_start != std::string_view::npos) {
        base_path = std::string(rest.substr(path_start));
        while (!base_path.empty() && base_path.back() == '/') {
            base_path.pop_back();
        }
    }

    if (authority.empty()) {
        return Result<ServerUrl, std::string>::Err("Server URL must have a host");
    }

    std::string host;
    uint16_t port = use_https ? 443 : 80;
    auto colon = authority.rfind(':');
    if (colon != std::string_view::npos && authority.find(']') == std::string_view::npos) {
        host = std::string(authority.substr(0, colon));
        auto port_str = authority.substr(colon + 1);
        if (port_str.empty() ||
            !std::all_of(port_str.begin(), port_str.end(),
                         [](char c) { return c >= '0' && c <= '9'; }) ||
            port_str.size() > 5) {
            return Result<ServerUrl, std::string>::Err(
                "Invalid port in server URL: '" + std::string(port_str) + "'");
        }
        auto port_value = std::stoi(std::string(port_str));
        if (port_value <= 0 || port_value > 65535) {
            return Result<ServerUrl, std::string>::Err(
                "Port out of range in server URL: " + std::to_string(port_value));
        }
        port = static_cast<uint16_t>(port_value);
    } else {
        host = std::string(authority);
    }

    if (host.empty()) {
        return Result<ServerUrl, std::string>::Err("Server URL must have a host");
    }

    return Result<ServerUrl, std::string>::Ok(
        ServerUrl(std::string(url), std::move(host), port, use_https,
                  std::move(base_path)));
}

std::string ServerUrl::Origin() const {
    return (use_https_ ? "https://" : "http://") + host_ + ":" +
           std::to_string(port_);
}

} // namespace mcp_bridge
