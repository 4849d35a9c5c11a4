#include "sanitizer/core/file_sanitizer.hpp"
#include "sanitizer/core/block_parser.hpp"
#include "sanitizer/core/marker.hpp"
#include "sanitizer/string_utils.hpp"

namespace sanitizer {

namespace {

auto parse_text(std::string_view text) -> FileOutcome {
    return parse(classify_lines(StringUtils::split_lines(text)));
}

} // namespace

auto sanitize_text(std::string_view text, Mode mode) -> SanitizeResult {
    auto outcome = parse_text(text);

    if (auto* invalid = std::get_if<Invalid>(&outcome)) {
        return SyntaxErrors{.errors = std::move(invalid->errors)};
    }
    if (std::holds_alternative<Shredded>(outcome)) {
        return ShredFile{};
    }

    const auto& tree = std::get<Validated>(outcome).tree;
    return SanitizedText{.text = StringUtils::join_lines(render(tree, mode))};
}

auto sanitize_file_bytes(std::string_view bytes, Mode mode) -> std::optional<SanitizeResult> {
    if (StringUtils::looks_binary(bytes)) {
        return std::nullopt;
    }
    return sanitize_text(bytes, mode);
}

auto needs_sanitizing(std::string_view bytes) -> bool {
    return !StringUtils::looks_binary(bytes) && contains_marker(bytes);
}

auto check_syntax(std::string_view text) -> std::vector<SyntaxError> {
    auto outcome = parse_text(text);
    if (auto* invalid = std::get_if<Invalid>(&outcome)) {
        return std::move(invalid->errors);
    }
    return {};
}

auto is_rewrite(const SanitizeResult& result) -> bool {
    return std::holds_alternative<SanitizedText>(result);
}

auto is_shred(const SanitizeResult& result) -> bool {
    return std::holds_alternative<ShredFile>(result);
}

auto has_errors(const SanitizeResult& result) -> bool {
    return std::holds_alternative<SyntaxErrors>(result);
}

} // namespace sanitizer
