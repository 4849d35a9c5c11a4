#pragma once

#include "sanitizer/core/marker.hpp"
#include "sanitizer/core/syntax_error.hpp"
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sanitizer {

// START ... [REPLACE-WITH ...] END
struct Block {
    std::string prefix;                               // Bound by the START line
    size_t start_line{};
    std::vector<ClassifiedLine> removed_lines;        // START .. REPLACE-WITH/END
    std::vector<ClassifiedLine> replacement_lines;    // REPLACE-WITH .. END
    bool has_replacement = false;

    auto operator==(const Block& other) const -> bool = default;
};

struct PlainRun {
    std::vector<ClassifiedLine> lines;

    auto operator==(const PlainRun& other) const -> bool = default;
};

using Segment = std::variant<PlainRun, Block>;

// Segments in original line order
struct ParseTree {
    std::vector<Segment> segments;

    auto operator==(const ParseTree& other) const -> bool = default;
};

struct Validated {
    ParseTree tree;
};

struct Invalid {
    std::vector<SyntaxError> errors;  // Ordered by line, never empty
};

// Lone SHRED on line one: the whole file goes away
struct Shredded {};

using FileOutcome = std::variant<Validated, Invalid, Shredded>;

enum class ParserState {
    OUTSIDE,
    IN_BLOCK,
    IN_REPLACE
};

// Line-at-a-time block state machine. Errors accumulate; structural errors
// drop the open block and fall back to OUTSIDE so scanning can go on.
class BlockParser {
public:
    auto feed(const ClassifiedLine& line) -> void;
    auto finish() -> FileOutcome;

    auto state() const -> ParserState { return state_; }
    auto errors() const -> const std::vector<SyntaxError>& { return errors_; }

private:
    auto feed_outside(const ClassifiedLine& line) -> void;
    auto feed_in_block(const ClassifiedLine& line) -> void;
    auto feed_in_replace(const ClassifiedLine& line) -> void;

    auto open_block(const ClassifiedLine& line) -> void;
    auto close_block() -> void;
    auto abandon_block() -> void;
    auto append_plain(const ClassifiedLine& line) -> void;
    auto append_body(const ClassifiedLine& line, std::vector<ClassifiedLine>& body) -> void;
    auto check_marker_prefix(const ClassifiedLine& line) -> void;
    auto report(ErrorKind kind, const ClassifiedLine& line, std::string message) -> void;

    ParserState state_ = ParserState::OUTSIDE;
    ParseTree tree_;
    std::optional<Block> open_block_;
    std::vector<SyntaxError> errors_;
};

auto classify_lines(const std::vector<std::string>& lines) -> std::vector<ClassifiedLine>;

// SHRED pre-pass, then the block state machine
auto parse(const std::vector<ClassifiedLine>& lines) -> FileOutcome;

} // namespace sanitizer
