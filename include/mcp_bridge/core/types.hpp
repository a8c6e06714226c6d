#pragma once

#include <mcp_bridge/core/result.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace mcp_bridge {

// ---------------------------------------------------------------------------
// ProviderName: validated tool-provider name.
//
// Rules:
//   - Non-empty, max 64 characters
//   - ASCII letters, digits, '-', '_' and '.'
//   - "meta" is reserved for the synthetic catalog tool
// ---------------------------------------------------------------------------
class ProviderName {
public:
    static Result<ProviderName, std::string> Create(std::string_view name);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    bool operator==(const ProviderName& other) const { return value_ == other.value_; }
    bool operator!=(const ProviderName& other) const { return value_ != other.value_; }
    bool operator<(const ProviderName& other) const { return value_ < other.value_; }

private:
    explicit ProviderName(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

// ---------------------------------------------------------------------------
// ServerUrl: validated http(s) base URL of a provider service.
//
// Parsed into origin ("http://host:port") and base path ("/api/mcp", no
// trailing slash, empty when absent) so that the HTTP client can be built
// from the origin and request paths prefixed with the base path.
// ---------------------------------------------------------------------------
class ServerUrl {
public:
    static Result<ServerUrl, std::string> Create(std::string_view url);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }
    [[nodiscard]] const std::string& Host() const noexcept { return host_; }
    [[nodiscard]] uint16_t Port() const noexcept { return port_; }
    [[nodiscard]] bool UseHttps() const noexcept { return use_https_; }
    [[nodiscard]] const std::string& BasePath() const noexcept { return base_path_; }

    /// "scheme://host:port", the origin the HTTP client connects to.
    [[nodiscard]] std::string Origin() const;

    bool operator==(const ServerUrl& other) const { return value_ == other.value_; }
    bool operator!=(const ServerUrl& other) const { return value_ != other.value_; }

private:
    ServerUrl(std::string value, std::string host, uint16_t port,
              bool use_https, std::string base_path)
        : value_(std::move(value)), host_(std::move(host)), port_(port),
          use_https_(use_https), base_path_(std::move(base_path)) {}

    std::string value_;
    std::string host_;
    uint16_t port_;
    bool use_https_;
    std::string base_path_;
};

} // namespace mcp_bridge
