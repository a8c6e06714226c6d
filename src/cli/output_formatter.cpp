#include <mcp_bridge/cli/output_formatter.hpp>
#include <mcp_bridge/core/ansi.hpp>

#include <algorithm>
#include <iomanip>
#include <sstream>

#include <ftxui/dom/elements.hpp>
#include <ftxui/dom/table.hpp>
#include <ftxui/screen/screen.hpp>

namespace mcp_bridge {

namespace {

using Grid = std::vector<std::vector<std::string>>;

// Every row gets exactly one cell per header, each on a single line.
Grid NormalizeRows(size_t columns, const Grid& rows) {
    Grid grid;
    grid.reserve(rows.size());
    for (const auto& row : rows) {
        std::vector<std::string> cells(columns);
        for (size_t c = 0; c < columns && c < row.size(); ++c) {
            cells[c] = row[c];
            std::replace(cells[c].begin(), cells[c].end(), '\n', ' ');
            std::replace(cells[c].begin(), cells[c].end(), '\r', ' ');
        }
        grid.push_back(std::move(cells));
    }
    return grid;
}

nlohmann::json GridToJson(const std::vector<std::string>& headers, const Grid& grid) {
    auto array = nlohmann::json::array();
    for (const auto& cells : grid) {
        auto object = nlohmann::json::object();
        for (size_t c = 0; c < headers.size(); ++c) {
            object[headers[c]] = cells[c];
        }
        array.push_back(std::move(object));
    }
    return array;
}

std::string RenderFramed(const std::vector<std::string>& headers, const Grid& grid) {
    Grid data;
    data.reserve(grid.size() + 1);
    data.push_back(headers);
    data.insert(data.end(), grid.begin(), grid.end());

    auto table = ftxui::Table(std::move(data));
    auto header = table.SelectRow(0);
    header.Decorate(ftxui::bold);
    header.SeparatorVertical(ftxui::LIGHT);
    header.BorderBottom(ftxui::LIGHT);

    auto document = table.Render();
    auto screen = ftxui::Screen::Create(ftxui::Dimension::Fit(document));
    ftxui::Render(screen, document);
    return screen.ToString();
}

// Two-space gutters; the last column is never padded.
std::string RenderAligned(const std::vector<std::string>& headers, const Grid& grid) {
    std::vector<size_t> widths;
    widths.reserve(headers.size());
    for (const auto& header : headers) {
        widths.push_back(header.size());
    }
    for (const auto& cells : grid) {
        for (size_t c = 0; c < cells.size(); ++c) {
            widths[c] = std::max(widths[c], cells[c].size());
        }
    }

    std::ostringstream text;
    auto write_line = [&](const std::vector<std::string>& cells) {
        const size_t last = cells.size() - 1;
        for (size_t c = 0; c <= last; ++c) {
            text << (c == 0 ? "" : "  ");
            if (c == last) {
                text << cells[c];
            } else {
                text << std::left << std::setw(static_cast<int>(widths[c])) << cells[c];
            }
        }
        text << '\n';
    };

    write_line(headers);
    std::vector<std::string> rule;
    rule.reserve(widths.size());
    for (size_t width : widths) {
        rule.emplace_back(width, '-');
    }
    write_line(rule);
    for (const auto& cells : grid) {
        write_line(cells);
    }
    return text.str();
}

} // anonymous namespace

std::string OutputFormatter::Paint(const char* color, const std::string& text) const {
    if (!color_mode_) {
        return text;
    }
    return std::string(color) + text + ansi::kReset;
}

void OutputFormatter::PrintTable(
    const std::vector<std::string>& headers,
    const std::vector<std::vector<std::string>>& rows) const {
    if (headers.empty()) {
        return;
    }
    const auto grid = NormalizeRows(headers.size(), rows);

    if (json_mode_) {
        out_ << GridToJson(headers, grid).dump() << "\n";
    } else if (color_mode_) {
        out_ << RenderFramed(headers, grid) << "\n";
    } else {
        out_ << RenderAligned(headers, grid);
    }
}

void OutputFormatter::PrintJson(const nlohmann::json& value) const {
    out_ << value.dump(json_mode_ ? -1 : 2) << "\n";
}

void OutputFormatter::PrintToolOutput(const nlohmann::json& payload) const {
    if (json_mode_) {
        out_ << nlohmann::json{{"result", payload}}.dump() << "\n";
    } else if (payload.is_string()) {
        out_ << payload.get_ref<const std::string&>() << "\n";
    } else {
        out_ << payload.dump(2) << "\n";
    }
}

// In json mode a tool failure is the command's result, so it goes to stdout.
void OutputFormatter::PrintToolFailure(const std::string& message) const {
    if (json_mode_) {
        out_ << nlohmann::json{{"error", message}}.dump() << "\n";
        return;
    }
    err_ << Paint(ansi::kRed, "Tool failed: ") << message << "\n";
}

// "Error: <operation> <endpoint> [<category>] (HTTP <status>)", then the
// message indented on its own line.
void OutputFormatter::PrintError(const Error& error) const {
    if (json_mode_) {
        err_ << error.ToJson() << "\n";
        return;
    }

    std::string qualifiers = " [" + error.CategoryName() + "]";
    if (error.http_status.has_value()) {
        qualifiers += " (HTTP " + std::to_string(*error.http_status) + ")";
    }

    err_ << Paint(ansi::kRed, "Error: ") << Paint(ansi::kBold, error.operation);
    if (!error.endpoint.empty()) {
        err_ << " " << error.endpoint;
    }
    err_ << Paint(ansi::kDim, qualifiers) << "\n"
         << "  " << error.message << "\n";
}

void OutputFormatter::PrintWarning(const std::string& message) const {
    if (json_mode_) {
        err_ << nlohmann::json{{"warning", message}}.dump() << "\n";
        return;
    }
    err_ << Paint(ansi::kYellow, "Warning: ") << message << "\n";
}

} // namespace mcp_bridge
