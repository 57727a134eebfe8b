#include <vsearch_deploy/cli/output_formatter.hpp>
#include <vsearch_deploy/core/terminal.hpp>

#include <algorithm>
#include <iomanip>
#include <sstream>

#include <ftxui/dom/elements.hpp>
#include <ftxui/dom/table.hpp>
#include <ftxui/screen/screen.hpp>
#include <nlohmann/json.hpp>

namespace vsearch_deploy {

namespace {

using namespace vsearch_deploy::ansi;

// Indent every line of an external diagnostic under the error block.
void PrintIndented(std::ostream& os, const std::string& text,
                   const char* prefix) {
    std::istringstream lines(text);
    std::string line;
    while (std::getline(lines, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        os << prefix << line << "\n";
    }
}

} // anonymous namespace

void OutputFormatter::PrintTable(
    const std::vector<std::string>& headers,
    const std::vector<std::vector<std::string>>& rows) const {

    if (json_mode_) {
        auto arr = nlohmann::json::array();
        for (const auto& row : rows) {
            nlohmann::json obj = nlohmann::json::object();
            for (size_t c = 0; c < headers.size() && c < row.size(); ++c) {
                obj[headers[c]] = row[c];
            }
            arr.push_back(std::move(obj));
        }
        out_ << arr.dump() << "\n";
        return;
    }

    if (color_mode_) {
        std::vector<std::vector<std::string>> table_data;
        table_data.push_back(headers);
        for (const auto& row : rows) {
            table_data.push_back(row);
        }

        auto table = ftxui::Table(table_data);
        table.SelectRow(0).Decorate(ftxui::bold);
        table.SelectRow(0).SeparatorVertical(ftxui::LIGHT);
        table.SelectRow(0).BorderBottom(ftxui::LIGHT);

        auto element = table.Render();
        auto screen = ftxui::Screen::Create(ftxui::Dimension::Fit(element));
        ftxui::Render(screen, element);
        out_ << screen.ToString() << "\n";
        return;
    }

    // Plain table: compute column widths.
    std::vector<size_t> widths(headers.size(), 0);
    for (size_t c = 0; c < headers.size(); ++c) {
        widths[c] = headers[c].size();
    }
    for (const auto& row : rows) {
        for (size_t c = 0; c < headers.size() && c < row.size(); ++c) {
            widths[c] = std::max(widths[c], row[c].size());
        }
    }

    auto print_row = [&](const std::vector<std::string>& cells) {
        for (size_t c = 0; c < headers.size() && c < cells.size(); ++c) {
            if (c > 0) out_ << "  ";
            out_ << std::left << std::setw(static_cast<int>(widths[c]))
                 << cells[c];
        }
        out_ << "\n";
    };

    print_row(headers);
    for (size_t c = 0; c < headers.size(); ++c) {
        if (c > 0) out_ << "  ";
        out_ << std::string(widths[c], '-');
    }
    out_ << "\n";
    for (const auto& row : rows) {
        print_row(row);
    }
}

void OutputFormatter::PrintJson(const std::string& json) const {
    out_ << json << "\n";
}

void OutputFormatter::PrintError(const Error& error) const {
    if (json_mode_) {
        err_ << error.ToJson() << "\n";
        return;
    }

    if (color_mode_) {
        err_ << kRed << "Error: " << kReset;
        err_ << kBold << error.operation << kReset;
        if (!error.target.empty()) {
            err_ << kDim << " [" << error.target << "]" << kReset;
        }
        err_ << "\n";
        err_ << "  " << error.message << "\n";
        if (error.detail.has_value() && !error.detail->empty()) {
            err_ << "  " << kDim << "Output:" << kReset << "\n";
            PrintIndented(err_, *error.detail, "    ");
        }
        if (error.hint.has_value() && !error.hint->empty()) {
            err_ << "  " << kYellow << "Hint: " << kReset
                 << error.hint.value() << "\n";
        }
        return;
    }

    err_ << "Error: " << error.operation;
    if (!error.target.empty()) {
        err_ << " [" << error.target << "]";
    }
    err_ << "\n";
    err_ << "  " << error.message << "\n";
    if (error.detail.has_value() && !error.detail->empty()) {
        err_ << "  Output:\n";
        PrintIndented(err_, *error.detail, "    ");
    }
    if (error.hint.has_value() && !error.hint->empty()) {
        err_ << "  Hint: " << error.hint.value() << "\n";
    }
}

void OutputFormatter::PrintSuccess(const std::string& message) const {
    if (json_mode_) {
        out_ << nlohmann::json{{"success", true}, {"message", message}}.dump() << "\n";
        return;
    }

    if (color_mode_) {
        out_ << kGreen << "OK" << kReset << " " << message << "\n";
        return;
    }

    out_ << message << "\n";
}

void OutputFormatter::PrintNotice(const std::string& message) const {
    if (json_mode_) {
        out_ << nlohmann::json{{"notice", message}}.dump() << "\n";
        return;
    }
    if (color_mode_) {
        out_ << kYellow << message << kReset << "\n";
        return;
    }
    out_ << message << "\n";
}

} // namespace vsearch_deploy
