#pragma once

#include "sanitizer/application/sanitizer_app.hpp"
#include <optional>
#include <string>
#include <vector>

namespace sanitizer {

struct CommandLine {
    std::optional<Config> config;  // Empty on help or error
    bool show_help = false;
    std::string error;
};

// Arguments without the program name
auto parse_command_line(const std::vector<std::string>& args) -> CommandLine;

auto usage_text() -> std::string;

} // namespace sanitizer
