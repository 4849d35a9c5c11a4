#include "sanitizer/utils/sub_process.hpp"
#include <array>
#include <cstdio>
#include <stdexcept>
#include <sys/wait.h>

namespace sanitizer {

auto SubProcess::run(const std::vector<std::string>& argv) -> ProcessResult {
    std::string command;
    for (const auto& argument : argv) {
        if (!command.empty()) {
            command += ' ';
        }
        command += shell_quote(argument);
    }

    // Redirect stderr to stdout to capture everything
    command += " 2>&1";

    FILE* pipe = popen(command.c_str(), "r");
    if (pipe == nullptr) {
        throw std::runtime_error("popen() failed for: " + command);
    }

    std::array<char, 4096> buffer{};
    std::string output;
    size_t count = 0;
    while ((count = fread(buffer.data(), 1, buffer.size(), pipe)) > 0) {
        output.append(buffer.data(), count);
    }

    int status = pclose(pipe);
    int exit_code = (status != -1 && WIFEXITED(status)) ? WEXITSTATUS(status) : -1;

    return ProcessResult{.output = std::move(output), .exit_code = exit_code, .success = exit_code == 0};
}

auto SubProcess::shell_quote(const std::string& argument) -> std::string {
    std::string quoted = "'";
    for (char c : argument) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

} // namespace sanitizer
