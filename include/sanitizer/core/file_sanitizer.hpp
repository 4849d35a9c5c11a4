#pragma once

#include "sanitizer/core/syntax_error.hpp"
#include "sanitizer/core/transformer.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace sanitizer {

struct SanitizedText {
    std::string text;
};

// Directive to delete the file instead of rewriting it
struct ShredFile {};

struct SyntaxErrors {
    std::vector<SyntaxError> errors;
};

using SanitizeResult = std::variant<SanitizedText, ShredFile, SyntaxErrors>;

// All-or-nothing: any syntax error means no output at all
auto sanitize_text(std::string_view text, Mode mode) -> SanitizeResult;

// Per-file entry point for raw file contents. Empty for binary content,
// which is never sanitized.
auto sanitize_file_bytes(std::string_view bytes, Mode mode) -> std::optional<SanitizeResult>;

// Text content containing at least one marker
auto needs_sanitizing(std::string_view bytes) -> bool;

// Empty when the text is valid
auto check_syntax(std::string_view text) -> std::vector<SyntaxError>;

auto is_rewrite(const SanitizeResult& result) -> bool;
auto is_shred(const SanitizeResult& result) -> bool;
auto has_errors(const SanitizeResult& result) -> bool;

} // namespace sanitizer
