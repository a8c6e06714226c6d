#pragma once

#include <mcp_bridge/core/result.hpp>

#include <nlohmann/json.hpp>

#include <iostream>
#include <string>
#include <vector>

namespace mcp_bridge {

// ---------------------------------------------------------------------------
// OutputFormatter: human-readable and JSON output for CLI commands.
//
// json_mode prints machine-readable JSON on stdout and errors as JSON on
// stderr. color_mode (ignored in json mode) renders tables with FTXUI and
// decorates messages with ANSI codes.
// ---------------------------------------------------------------------------
class OutputFormatter {
public:
    explicit OutputFormatter(bool json_mode, bool color_mode = false,
                             std::ostream& out = std::cout,
                             std::ostream& err = std::cerr)
        : json_mode_(json_mode), color_mode_(color_mode && !json_mode),
          out_(out), err_(err) {}

    [[nodiscard]] bool IsJsonMode() const noexcept { return json_mode_; }
    [[nodiscard]] bool IsColorMode() const noexcept { return color_mode_; }

    // Table in human mode; JSON array of objects keyed by header in json mode.
    void PrintTable(const std::vector<std::string>& headers,
                    const std::vector<std::vector<std::string>>& rows) const;

    void PrintJson(const nlohmann::json& value) const;

    // Tool output: strings verbatim, anything else pretty-printed.
    // In json mode the value is wrapped as {"result": value}.
    void PrintToolOutput(const nlohmann::json& payload) const;

    // A tool that ran but reported a failure (not a bridge error).
    void PrintToolFailure(const std::string& message) const;

    void PrintError(const Error& error) const;

    // Non-fatal notice on stderr (e.g. a degraded provider).
    void PrintWarning(const std::string& message) const;

private:
    // `text` wrapped in an ANSI color in color mode, unchanged otherwise.
    std::string Paint(const char* color, const std::string& text) const;

    bool json_mode_;
    bool color_mode_;
    std::ostream& out_;
    std::ostream& err_;
};

} // namespace mcp_bridge
