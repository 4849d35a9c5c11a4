#include "sanitizer/string_utils.hpp"
#include <algorithm>

namespace sanitizer {

auto StringUtils::split_lines(std::string_view text) -> std::vector<std::string> {
    std::vector<std::string> lines;
    size_t start = 0;
    while (true) {
        auto newline = text.find('\n', start);
        if (newline == std::string_view::npos) {
            lines.emplace_back(text.substr(start));
            break;
        }
        lines.emplace_back(text.substr(start, newline - start));
        start = newline + 1;
    }
    return lines;
}

auto StringUtils::join_lines(const std::vector<std::string>& lines) -> std::string {
    std::string text;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) {
            text += '\n';
        }
        text += lines[i];
    }
    return text;
}

auto StringUtils::trim(std::string_view text) -> std::string {
    auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return "";
    }
    auto last = text.find_last_not_of(" \t\r\n");
    return std::string(text.substr(first, last - first + 1));
}

auto StringUtils::looks_binary(std::string_view content) -> bool {
    auto window = content.substr(0, std::min<size_t>(content.size(), 8000));
    return window.find('\0') != std::string_view::npos;
}

} // namespace sanitizer
