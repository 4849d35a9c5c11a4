#include "sanitizer/application/command_line.hpp"
#include <charconv>

namespace sanitizer {

namespace {

auto error_result(std::string message) -> CommandLine {
    return CommandLine{.config = std::nullopt, .show_help = false, .error = std::move(message)};
}

// Options shared by both commands; true if the argument was consumed
auto parse_common_flag(const std::string& arg, Config& config) -> bool {
    if (arg == "--strip") {
        config.mode = Mode::STRIP;
    } else if (arg == "--no-color") {
        config.color = false;
    } else if (arg == "-v" || arg == "--verbose") {
        config.verbose = true;
    } else {
        return false;
    }
    return true;
}

auto parse_sanitize_file(const std::vector<std::string>& args) -> CommandLine {
    Config config;
    config.command = Command::SANITIZE_FILE;
    std::vector<std::string> positionals;

    for (size_t i = 1; i < args.size(); ++i) {
        const auto& arg = args[i];
        if (arg == "-h" || arg == "--help") {
            return CommandLine{.config = std::nullopt, .show_help = true, .error = ""};
        }
        if (parse_common_flag(arg, config)) {
            continue;
        }
        if (arg.starts_with("-") && arg != "-") {
            return error_result("Unknown option for sanitize-file: " + arg);
        }
        positionals.push_back(arg);
    }

    if (positionals.size() != 2) {
        return error_result("sanitize-file expects <infile> <outfile>");
    }

    config.input_file = positionals[0];
    config.output_file = positionals[1];
    return CommandLine{.config = config, .show_help = false, .error = ""};
}

auto parse_sanitize_repo(const std::vector<std::string>& args) -> CommandLine {
    Config config;
    config.command = Command::SANITIZE_REPO;

    for (size_t i = 1; i < args.size(); ++i) {
        const auto& arg = args[i];
        bool has_value = i + 1 < args.size();

        if (arg == "-h" || arg == "--help") {
            return CommandLine{.config = std::nullopt, .show_help = true, .error = ""};
        }
        if (parse_common_flag(arg, config)) {
            continue;
        }

        if (arg == "--dry-run") {
            config.repo.dry_run = true;
        } else if (arg == "-f" || arg == "--force") {
            config.repo.force = true;
        } else if (arg == "--create-pr-branch") {
            config.repo.create_pr_branch = true;
        } else if ((arg == "-r" || arg == "--repo-root") && has_value) {
            config.repo.repo_root = args[++i];
        } else if ((arg == "-t" || arg == "--target-branch") && has_value) {
            config.repo.target_branch = args[++i];
        } else if ((arg == "-m" || arg == "--commit-message") && has_value) {
            config.repo.commit_message = args[++i];
        } else if (arg == "--file-list" && has_value) {
            config.repo.file_list = args[++i];
        } else if ((arg == "-j" || arg == "--jobs") && has_value) {
            const auto& value = args[++i];
            size_t jobs = 0;
            auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), jobs);
            if (ec != std::errc{} || end != value.data() + value.size()) {
                return error_result("Invalid value for --jobs: " + value);
            }
            config.repo.jobs = jobs;
        } else {
            return error_result("Unknown or incomplete option for sanitize-repo: " + arg);
        }
    }

    if (config.repo.create_pr_branch && config.repo.target_branch.empty()) {
        return error_result("--create-pr-branch requires --target-branch");
    }
    if (config.repo.target_branch.empty()
        && config.repo.commit_message != DEFAULT_COMMIT_MESSAGE) {
        return error_result("--commit-message requires --target-branch");
    }

    return CommandLine{.config = config, .show_help = false, .error = ""};
}

} // namespace

auto parse_command_line(const std::vector<std::string>& args) -> CommandLine {
    if (args.empty()) {
        return error_result("Missing command");
    }

    const auto& command = args.front();
    if (command == "-h" || command == "--help") {
        return CommandLine{.config = std::nullopt, .show_help = true, .error = ""};
    }
    if (command == "sanitize-file") {
        return parse_sanitize_file(args);
    }
    if (command == "sanitize-repo") {
        return parse_sanitize_repo(args);
    }
    return error_result("Unknown command: " + command);
}

auto usage_text() -> std::string {
    return "Usage: sanitizer <command> [options]\n"
           "\n"
           "Commands:\n"
           "  sanitize-file <infile> <outfile>   Sanitize a single file\n"
           "  sanitize-repo                      Sanitize every file of a git repository\n"
           "\n"
           "Common options:\n"
           "      --strip                  Only remove marker lines, keep all content\n"
           "      --no-color               Plain error report\n"
           "  -v, --verbose                Print every processed file\n"
           "  -h, --help                   Show this help\n"
           "\n"
           "sanitize-repo options:\n"
           "  -r, --repo-root <dir>        Repository to sanitize (default: .)\n"
           "  -t, --target-branch <name>   Commit the result to this branch\n"
           "  -m, --commit-message <msg>   Commit message (default: \"Update task template\")\n"
           "      --create-pr-branch       Also create <target>-pr-<timestamp> from the target\n"
           "      --file-list <path>       Only sanitize the files listed (one per line)\n"
           "      --dry-run                Validate and report without writing\n"
           "  -f, --force                  Ignore uncommitted changes and empty commits\n"
           "  -j, --jobs <n>               Validation workers (default: all cores)\n"
           "\n"
           "Examples:\n"
           "  sanitizer sanitize-file Solution.java Task.java\n"
           "  sanitizer sanitize-repo --target-branch student --create-pr-branch\n"
           "  sanitizer sanitize-repo --dry-run --file-list files.txt\n";
}

} // namespace sanitizer
