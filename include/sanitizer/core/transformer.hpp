#pragma once

#include "sanitizer/core/block_parser.hpp"
#include <string>
#include <vector>

namespace sanitizer {

enum class Mode {
    SANITIZE,  // Drop removed bodies, surface replacements without their prefix
    STRIP      // Drop marker lines only
};

// Render a validated parse tree. Marker lines are never emitted.
auto render(const ParseTree& tree, Mode mode) -> std::vector<std::string>;

// Remove a block prefix from the front of a line. Lines that do not carry
// the prefix come back untouched.
auto strip_prefix(const std::string& line, const std::string& prefix) -> std::string;

auto mode_name(Mode mode) -> std::string;

} // namespace sanitizer
