#include "sanitizer/core/marker.hpp"
#include <array>
#include <cctype>

namespace sanitizer {

namespace {

constexpr std::array<MarkerKind, 4> ALL_MARKERS{
    MarkerKind::START, MarkerKind::REPLACE_WITH, MarkerKind::END, MarkerKind::SHRED};

auto to_upper(std::string_view text) -> std::string {
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        result.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    return result;
}

// Namespace in any case, whatever follows it
auto has_namespace(std::string_view text) -> bool {
    return to_upper(text).find(MARKER_NAMESPACE) != std::string::npos;
}

} // namespace

auto classify(const std::string& line, size_t line_number) -> ClassifiedLine {
    ClassifiedLine classified{.line_number = line_number,
                              .kind = std::nullopt,
                              .suspected_marker = false,
                              .prefix = "",
                              .raw = line};

    std::string_view view(line);
    auto pos = view.find(MARKER_NAMESPACE);
    while (pos != std::string_view::npos) {
        auto candidate = trim_trailing_whitespace(view.substr(pos));
        for (auto kind : ALL_MARKERS) {
            if (candidate == marker_spelling(kind)) {
                classified.kind = kind;
                classified.prefix = line.substr(0, pos);
                return classified;
            }
        }
        pos = view.find(MARKER_NAMESPACE, pos + 1);
    }

    classified.suspected_marker = has_namespace(view);
    return classified;
}

auto contains_marker(std::string_view text) -> bool {
    return has_namespace(text);
}

auto marker_spelling(MarkerKind kind) -> std::string_view {
    switch (kind) {
    case MarkerKind::START:
        return "REPOBEE-SANITIZER-START";
    case MarkerKind::REPLACE_WITH:
        return "REPOBEE-SANITIZER-REPLACE-WITH";
    case MarkerKind::END:
        return "REPOBEE-SANITIZER-END";
    case MarkerKind::SHRED:
        return "REPOBEE-SANITIZER-SHRED";
    }
    return "";
}

auto marker_display_name(MarkerKind kind) -> std::string {
    switch (kind) {
    case MarkerKind::START:
        return "START";
    case MarkerKind::REPLACE_WITH:
        return "REPLACE-WITH";
    case MarkerKind::END:
        return "END";
    case MarkerKind::SHRED:
        return "SHRED";
    }
    return "UNKNOWN";
}

auto trim_trailing_whitespace(std::string_view text) -> std::string_view {
    auto last = text.find_last_not_of(" \t\r");
    if (last == std::string_view::npos) {
        return text.substr(0, 0);
    }
    return text.substr(0, last + 1);
}

} // namespace sanitizer
