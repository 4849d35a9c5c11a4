#pragma once

#include "sanitizer/application/repo_sanitizer.hpp"
#include "sanitizer/core/transformer.hpp"
#include "sanitizer/interfaces.hpp"
#include <memory>
#include <string>

namespace sanitizer {

inline constexpr int EXIT_OK = 0;
inline constexpr int EXIT_SYNTAX_ERRORS = 1;
inline constexpr int EXIT_USAGE = 2;
inline constexpr int EXIT_IO_FAILURE = 3;

enum class Command {
    SANITIZE_FILE,
    SANITIZE_REPO
};

struct Config {
    Command command = Command::SANITIZE_FILE;
    Mode mode = Mode::SANITIZE;
    std::string input_file;    // sanitize-file
    std::string output_file;   // sanitize-file
    RepoOptions repo;          // sanitize-repo
    bool color = true;
    bool verbose = false;
};

class SanitizerApp {
private:
    std::unique_ptr<IFileSystem> filesystem_;
    std::unique_ptr<IVersionControl> vcs_;

public:
    SanitizerApp(std::unique_ptr<IFileSystem> filesystem, std::unique_ptr<IVersionControl> vcs);

    auto run(const Config& config) -> int;

private:
    auto run_sanitize_file(const Config& config) -> int;
    auto run_sanitize_repo(const Config& config) -> int;
    auto show_repo_summary(const RepoReport& report, const Config& config) -> void;
};

} // namespace sanitizer
