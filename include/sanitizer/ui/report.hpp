#pragma once

#include "sanitizer/core/syntax_error.hpp"
#include <ftxui/dom/elements.hpp>
#include <ostream>
#include <string>
#include <vector>

namespace sanitizer {

// Plain-text report:
//
//   Syntax errors detected in 1 file(s):
//
//   src/Main.java
//       Line 3: END marker without an open block
auto format_error_report(const std::vector<FileWithErrors>& files) -> std::string;

// Same report as an FTXUI document for colored terminal output. Each error
// also carries its kind, e.g. [orphan-marker].
auto render_error_report(const std::vector<FileWithErrors>& files) -> ftxui::Element;

auto print_error_report(const std::vector<FileWithErrors>& files, std::ostream& out, bool color)
    -> void;

} // namespace sanitizer
