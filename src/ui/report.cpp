#include "sanitizer/ui/report.hpp"
#include "sanitizer/core/marker.hpp"
#include <ftxui/screen/screen.hpp>
#include <sstream>

namespace sanitizer {

namespace {

auto header(const std::vector<FileWithErrors>& files) -> std::string {
    return "Syntax errors detected in " + std::to_string(files.size()) + " file(s):";
}

auto location(const SyntaxError& error) -> std::string {
    if (error.line_number == 0) {
        return "Global: ";
    }
    return "Line " + std::to_string(error.line_number) + ": ";
}

} // namespace

auto format_error_report(const std::vector<FileWithErrors>& files) -> std::string {
    std::ostringstream oss;
    oss << header(files) << "\n";

    for (const auto& file : files) {
        oss << "\n" << file.relative_path << "\n";
        for (const auto& error : file.errors) {
            oss << "    " << describe(error) << "\n";
        }
    }

    return oss.str();
}

auto render_error_report(const std::vector<FileWithErrors>& files) -> ftxui::Element {
    using namespace ftxui;

    Elements rows;
    rows.push_back(text(header(files)) | bold | color(Color::Red));

    for (const auto& file : files) {
        rows.push_back(text(""));
        rows.push_back(text(file.relative_path) | bold);
        for (const auto& error : file.errors) {
            rows.push_back(hbox({
                text("    "),
                text(location(error)) | color(Color::Red),
                text(error.message),
                text(" [" + error_kind_name(error.kind) + "]") | dim,
            }));
            if (!error.line_text.empty()) {
                rows.push_back(
                    text("        " + std::string(trim_trailing_whitespace(error.line_text))) | dim);
            }
        }
    }

    return vbox(std::move(rows));
}

auto print_error_report(const std::vector<FileWithErrors>& files, std::ostream& out, bool color)
    -> void {
    if (!color) {
        out << format_error_report(files);
        return;
    }

    auto document = render_error_report(files);
    auto screen = ftxui::Screen::Create(ftxui::Dimension::Full(), ftxui::Dimension::Fit(document));
    ftxui::Render(screen, document);
    out << screen.ToString() << "\n";
}

} // namespace sanitizer
