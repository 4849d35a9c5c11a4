#pragma once

#include <string>
#include <vector>

namespace sanitizer {

enum class ErrorKind {
    ORPHAN_MARKER,        // REPLACE-WITH or END outside a block
    NESTED_BLOCK,         // START inside a block
    MALFORMED_BLOCK,      // START or REPLACE-WITH after REPLACE-WITH
    UNTERMINATED_BLOCK,   // End of file inside a block
    PREFIX_MISMATCH,      // Line does not carry the block's prefix
    UNRECOGNIZED_MARKER,  // Marker namespace with an unknown suffix
    MISPLACED_SHRED       // SHRED off line one, or SHRED with other markers
};

struct SyntaxError {
    ErrorKind kind{};
    size_t line_number{};  // 1-based, 0 for file-global errors
    std::string message;
    std::string line_text;

    auto operator==(const SyntaxError& other) const -> bool = default;
};

struct FileWithErrors {
    std::string relative_path;
    std::vector<SyntaxError> errors;
};

auto error_kind_name(ErrorKind kind) -> std::string;

// "Line 4: END marker without an open block" or "Global: ..."
auto describe(const SyntaxError& error) -> std::string;

// Stable sort by line number
auto sort_by_line(std::vector<SyntaxError> errors) -> std::vector<SyntaxError>;

} // namespace sanitizer
