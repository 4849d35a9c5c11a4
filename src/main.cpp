#include "sanitizer/application/command_line.hpp"
#include "sanitizer/application/sanitizer_app.hpp"
#include "sanitizer/io/file_system.hpp"
#include "sanitizer/io/git_repository.hpp"

#include <cstdio>
#include <exception>
#include <iostream>
#include <unistd.h>

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    auto command_line = sanitizer::parse_command_line(args);

    if (command_line.show_help) {
        std::cout << sanitizer::usage_text();
        return sanitizer::EXIT_OK;
    }
    if (!command_line.config) {
        std::cerr << "Error: " << command_line.error << "\n\n" << sanitizer::usage_text();
        return sanitizer::EXIT_USAGE;
    }

    auto config = *command_line.config;
    // Colored report only when stderr is a terminal
    config.color = config.color && isatty(fileno(stderr));

    sanitizer::SanitizerApp app(std::make_unique<sanitizer::FileSystem>(),
                                std::make_unique<sanitizer::GitRepository>());

    try {
        return app.run(config);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return sanitizer::EXIT_IO_FAILURE;
    }
}
