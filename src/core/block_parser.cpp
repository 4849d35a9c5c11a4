#include "sanitizer/core/block_parser.hpp"

namespace sanitizer {

namespace {

auto quoted(const std::string& text) -> std::string {
    return "'" + text + "'";
}

auto parse_shredded(const std::vector<ClassifiedLine>& lines) -> FileOutcome {
    std::vector<SyntaxError> errors;

    for (size_t i = 1; i < lines.size(); ++i) {
        const auto& line = lines[i];
        if (line.is_content()) {
            continue;
        }

        std::string what = line.kind ? marker_display_name(*line.kind) + " marker"
                                     : std::string("Marker-like text");
        errors.push_back(SyntaxError{
            .kind = ErrorKind::MISPLACED_SHRED,
            .line_number = line.line_number,
            .message = what + " in a file shredded on line 1; SHRED must be the only marker",
            .line_text = line.raw});
    }

    if (!errors.empty()) {
        return Invalid{.errors = std::move(errors)};
    }
    return Shredded{};
}

} // namespace

auto BlockParser::feed(const ClassifiedLine& line) -> void {
    if (line.suspected_marker) {
        report(ErrorKind::UNRECOGNIZED_MARKER, line,
               "Unrecognized marker " + quoted(std::string(trim_trailing_whitespace(line.raw)))
                   + ", expected one of START, REPLACE-WITH, END or SHRED");
        return;
    }

    if (line.kind == MarkerKind::SHRED) {
        report(ErrorKind::MISPLACED_SHRED, line, "SHRED marker must be on the first line of the file");
        return;
    }

    switch (state_) {
    case ParserState::OUTSIDE:
        feed_outside(line);
        break;
    case ParserState::IN_BLOCK:
        feed_in_block(line);
        break;
    case ParserState::IN_REPLACE:
        feed_in_replace(line);
        break;
    }
}

auto BlockParser::finish() -> FileOutcome {
    if (state_ != ParserState::OUTSIDE && open_block_) {
        errors_.push_back(SyntaxError{
            .kind = ErrorKind::UNTERMINATED_BLOCK,
            .line_number = open_block_->start_line,
            .message = "START marker has no matching END before end of file",
            .line_text = ""});
        abandon_block();
    }

    if (!errors_.empty()) {
        return Invalid{.errors = sort_by_line(std::move(errors_))};
    }
    return Validated{.tree = std::move(tree_)};
}

auto BlockParser::feed_outside(const ClassifiedLine& line) -> void {
    if (line.is_content()) {
        append_plain(line);
        return;
    }

    switch (*line.kind) {
    case MarkerKind::START:
        open_block(line);
        break;
    case MarkerKind::REPLACE_WITH:
    case MarkerKind::END:
        report(ErrorKind::ORPHAN_MARKER, line,
               marker_display_name(*line.kind) + " marker without an open block");
        break;
    case MarkerKind::SHRED:
        break;  // Rejected in feed()
    }
}

auto BlockParser::feed_in_block(const ClassifiedLine& line) -> void {
    if (line.is_content()) {
        append_body(line, open_block_->removed_lines);
        return;
    }

    switch (*line.kind) {
    case MarkerKind::START:
        report(ErrorKind::NESTED_BLOCK, line,
               "START marker inside the block opened on line "
                   + std::to_string(open_block_->start_line) + "; blocks do not nest");
        abandon_block();
        break;
    case MarkerKind::REPLACE_WITH:
        check_marker_prefix(line);
        open_block_->has_replacement = true;
        state_ = ParserState::IN_REPLACE;
        break;
    case MarkerKind::END:
        check_marker_prefix(line);
        close_block();
        break;
    case MarkerKind::SHRED:
        break;
    }
}

auto BlockParser::feed_in_replace(const ClassifiedLine& line) -> void {
    if (line.is_content()) {
        append_body(line, open_block_->replacement_lines);
        return;
    }

    switch (*line.kind) {
    case MarkerKind::START:
    case MarkerKind::REPLACE_WITH:
        report(ErrorKind::MALFORMED_BLOCK, line,
               marker_display_name(*line.kind) + " marker after REPLACE-WITH in the block opened on line "
                   + std::to_string(open_block_->start_line));
        abandon_block();
        break;
    case MarkerKind::END:
        check_marker_prefix(line);
        close_block();
        break;
    case MarkerKind::SHRED:
        break;
    }
}

auto BlockParser::open_block(const ClassifiedLine& line) -> void {
    open_block_ = Block{.prefix = line.prefix,
                        .start_line = line.line_number,
                        .removed_lines = {},
                        .replacement_lines = {},
                        .has_replacement = false};
    state_ = ParserState::IN_BLOCK;
}

auto BlockParser::close_block() -> void {
    tree_.segments.emplace_back(std::move(*open_block_));
    open_block_.reset();
    state_ = ParserState::OUTSIDE;
}

auto BlockParser::abandon_block() -> void {
    open_block_.reset();
    state_ = ParserState::OUTSIDE;
}

auto BlockParser::append_plain(const ClassifiedLine& line) -> void {
    if (tree_.segments.empty() || !std::holds_alternative<PlainRun>(tree_.segments.back())) {
        tree_.segments.emplace_back(PlainRun{});
    }
    std::get<PlainRun>(tree_.segments.back()).lines.push_back(line);
}

auto BlockParser::append_body(const ClassifiedLine& line, std::vector<ClassifiedLine>& body)
    -> void {
    if (!line.raw.starts_with(open_block_->prefix)) {
        report(ErrorKind::PREFIX_MISMATCH, line,
               "Missing prefix " + quoted(open_block_->prefix) + " of the block opened on line "
                   + std::to_string(open_block_->start_line));
    }
    body.push_back(line);
}

auto BlockParser::check_marker_prefix(const ClassifiedLine& line) -> void {
    if (line.prefix != open_block_->prefix) {
        report(ErrorKind::PREFIX_MISMATCH, line,
               marker_display_name(*line.kind) + " marker prefix " + quoted(line.prefix)
                   + " differs from the block prefix " + quoted(open_block_->prefix));
    }
}

auto BlockParser::report(ErrorKind kind, const ClassifiedLine& line, std::string message) -> void {
    errors_.push_back(SyntaxError{.kind = kind,
                                  .line_number = line.line_number,
                                  .message = std::move(message),
                                  .line_text = line.raw});
}

auto classify_lines(const std::vector<std::string>& lines) -> std::vector<ClassifiedLine> {
    std::vector<ClassifiedLine> classified;
    classified.reserve(lines.size());

    for (size_t i = 0; i < lines.size(); ++i) {
        classified.push_back(classify(lines[i], i + 1));
    }

    return classified;
}

auto parse(const std::vector<ClassifiedLine>& lines) -> FileOutcome {
    if (!lines.empty() && lines.front().kind == MarkerKind::SHRED) {
        return parse_shredded(lines);
    }

    BlockParser parser;
    for (const auto& line : lines) {
        parser.feed(line);
    }
    return parser.finish();
}

} // namespace sanitizer
