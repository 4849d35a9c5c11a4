#pragma once

#include <string>
#include <vector>

namespace sanitizer {

struct ProcessResult {
    std::string output;  // stdout and stderr interleaved
    int exit_code{};
    bool success = false;
};

class SubProcess {
public:
    // Runs argv through /bin/sh with every argument quoted
    static auto run(const std::vector<std::string>& argv) -> ProcessResult;

    static auto shell_quote(const std::string& argument) -> std::string;
};

} // namespace sanitizer
