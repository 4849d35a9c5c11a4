#include "sanitizer/core/syntax_error.hpp"
#include <algorithm>

namespace sanitizer {

auto error_kind_name(ErrorKind kind) -> std::string {
    switch (kind) {
    case ErrorKind::ORPHAN_MARKER:
        return "orphan-marker";
    case ErrorKind::NESTED_BLOCK:
        return "nested-block";
    case ErrorKind::MALFORMED_BLOCK:
        return "malformed-block";
    case ErrorKind::UNTERMINATED_BLOCK:
        return "unterminated-block";
    case ErrorKind::PREFIX_MISMATCH:
        return "prefix-mismatch";
    case ErrorKind::UNRECOGNIZED_MARKER:
        return "unrecognized-marker";
    case ErrorKind::MISPLACED_SHRED:
        return "misplaced-shred";
    }
    return "unknown";
}

auto describe(const SyntaxError& error) -> std::string {
    if (error.line_number == 0) {
        return "Global: " + error.message;
    }
    return "Line " + std::to_string(error.line_number) + ": " + error.message;
}

auto sort_by_line(std::vector<SyntaxError> errors) -> std::vector<SyntaxError> {
    std::stable_sort(errors.begin(), errors.end(),
                     [](const SyntaxError& lhs, const SyntaxError& rhs) {
                         return lhs.line_number < rhs.line_number;
                     });
    return errors;
}

} // namespace sanitizer
