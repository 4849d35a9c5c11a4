#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace sanitizer {

enum class MarkerKind {
    START,         // REPOBEE-SANITIZER-START
    REPLACE_WITH,  // REPOBEE-SANITIZER-REPLACE-WITH
    END,           // REPOBEE-SANITIZER-END
    SHRED          // REPOBEE-SANITIZER-SHRED
};

inline constexpr std::string_view MARKER_NAMESPACE = "REPOBEE-SANITIZER-";

// One input line after marker recognition
struct ClassifiedLine {
    size_t line_number{};                // 1-based
    std::optional<MarkerKind> kind;      // Empty for content lines
    bool suspected_marker = false;       // Looks like a marker but is not one
    std::string prefix;                  // Text before the marker token
    std::string raw;                     // Original line, unmodified

    auto is_marker() const -> bool { return kind.has_value(); }
    auto is_content() const -> bool { return !kind.has_value() && !suspected_marker; }

    auto operator==(const ClassifiedLine& other) const -> bool = default;
};

// Classify a single line. Performs no cross-line reasoning.
auto classify(const std::string& line, size_t line_number = 0) -> ClassifiedLine;

// True if the text contains any marker or suspected marker
auto contains_marker(std::string_view text) -> bool;

auto marker_spelling(MarkerKind kind) -> std::string_view;
auto marker_display_name(MarkerKind kind) -> std::string;

// Strip trailing spaces, tabs and carriage returns
auto trim_trailing_whitespace(std::string_view text) -> std::string_view;

} // namespace sanitizer
