#include "sanitizer/application/sanitizer_app.hpp"
#include "sanitizer/core/file_sanitizer.hpp"
#include "sanitizer/ui/report.hpp"
#include <iostream>

namespace sanitizer {

SanitizerApp::SanitizerApp(std::unique_ptr<IFileSystem> filesystem,
                           std::unique_ptr<IVersionControl> vcs)
    : filesystem_(std::move(filesystem)), vcs_(std::move(vcs)) {}

auto SanitizerApp::run(const Config& config) -> int {
    switch (config.command) {
    case Command::SANITIZE_FILE:
        return run_sanitize_file(config);
    case Command::SANITIZE_REPO:
        return run_sanitize_repo(config);
    }
    return EXIT_USAGE;
}

auto SanitizerApp::run_sanitize_file(const Config& config) -> int {
    auto content = filesystem_->read_file(config.input_file);
    if (!content) {
        std::cerr << "Error: Could not read " << config.input_file << "\n";
        return EXIT_IO_FAILURE;
    }

    auto result = sanitize_file_bytes(*content, config.mode);
    if (!result) {
        std::cerr << "Error: " << config.input_file << " is a binary file\n";
        return EXIT_IO_FAILURE;
    }

    if (const auto* syntax = std::get_if<SyntaxErrors>(&*result)) {
        print_error_report({FileWithErrors{.relative_path = config.input_file, .errors = syntax->errors}},
                           std::cerr, config.color);
        return EXIT_SYNTAX_ERRORS;
    }

    if (is_shred(*result)) {
        std::cout << config.input_file << " is marked for shredding; nothing written to "
                  << config.output_file << "\n";
        return EXIT_OK;
    }

    const auto& sanitized = std::get<SanitizedText>(*result);
    if (!filesystem_->write_file(config.output_file, sanitized.text)) {
        std::cerr << "Error: Could not write " << config.output_file << "\n";
        return EXIT_IO_FAILURE;
    }

    if (config.verbose) {
        std::cout << "Wrote " << mode_name(config.mode) << " output of " << config.input_file
                  << " to " << config.output_file << "\n";
    }
    return EXIT_OK;
}

auto SanitizerApp::run_sanitize_repo(const Config& config) -> int {
    auto options = config.repo;
    options.mode = config.mode;

    RepoSanitizer repo_sanitizer(*filesystem_, *vcs_);
    auto report = repo_sanitizer.run(options);

    switch (report.status) {
    case RepoStatus::SYNTAX_ERRORS:
        print_error_report(report.files_with_errors, std::cerr, config.color);
        std::cerr << "Error: No files were changed\n";
        return EXIT_SYNTAX_ERRORS;
    case RepoStatus::DIRTY_WORKING_TREE:
    case RepoStatus::FAILED:
        std::cerr << "Error: " << report.message << "\n";
        return EXIT_IO_FAILURE;
    case RepoStatus::NOTHING_TO_DO:
        std::cout << report.message << "\n";
        return EXIT_OK;
    case RepoStatus::DRY_RUN:
    case RepoStatus::SANITIZED:
        show_repo_summary(report, config);
        return EXIT_OK;
    }
    return EXIT_OK;
}

auto SanitizerApp::show_repo_summary(const RepoReport& report, const Config& config) -> void {
    bool dry_run = report.status == RepoStatus::DRY_RUN;

    if (config.verbose || dry_run) {
        for (const auto& path : report.rewritten) {
            std::cout << (dry_run ? "Would rewrite " : "Rewrote ") << path << "\n";
        }
        for (const auto& path : report.shredded) {
            std::cout << (dry_run ? "Would delete " : "Deleted ") << path << "\n";
        }
    }

    if (dry_run) {
        std::cout << "Dry run - no files modified. " << report.rewritten.size()
                  << " file(s) to rewrite, " << report.shredded.size() << " to delete.\n";
        return;
    }

    std::cout << "Sanitized " << report.rewritten.size() << " file(s), deleted "
              << report.shredded.size() << ".\n";

    if (!report.committed_branch.empty()) {
        std::cout << "Committed to branch " << report.committed_branch << "\n";
    }
    if (!report.pr_branch.empty()) {
        std::cout << "Created pull request branch " << report.pr_branch << "\n";
    }
}

} // namespace sanitizer
