#pragma once

#include "sanitizer/core/file_sanitizer.hpp"
#include "sanitizer/core/syntax_error.hpp"
#include "sanitizer/interfaces.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sanitizer {

inline constexpr const char* DEFAULT_COMMIT_MESSAGE = "Update task template";

struct RepoOptions {
    std::string repo_root = ".";
    Mode mode = Mode::SANITIZE;
    std::string target_branch;          // Empty: rewrite the working tree in place
    std::string commit_message = DEFAULT_COMMIT_MESSAGE;
    bool create_pr_branch = false;
    std::string file_list;              // Empty: every tracked file
    bool dry_run = false;
    bool force = false;                 // Skip clean-tree and empty-commit checks
    size_t jobs = 0;                    // 0: one worker per hardware thread
};

enum class RepoStatus {
    SANITIZED,
    DRY_RUN,
    NOTHING_TO_DO,
    SYNTAX_ERRORS,
    DIRTY_WORKING_TREE,
    FAILED
};

struct FileResult {
    std::string relative_path;
    SanitizeResult result;
};

struct RepoReport {
    RepoStatus status = RepoStatus::NOTHING_TO_DO;
    std::vector<std::string> rewritten;
    std::vector<std::string> shredded;
    std::vector<FileWithErrors> files_with_errors;
    std::string committed_branch;
    std::string pr_branch;
    std::string message;
};

// Sanitizes every dirty file of a working tree. Either every file is valid and
// all results are applied, or nothing is written and nothing is committed.
class RepoSanitizer {
public:
    RepoSanitizer(IFileSystem& filesystem, IVersionControl& vcs);

    auto run(const RepoOptions& options) -> RepoReport;

    // Pure part: sanitizes the given contents on a bounded set of workers.
    // Results keep the order of the input.
    static auto sanitize_all(const std::vector<std::pair<std::string, std::string>>& files,
                             Mode mode, size_t jobs) -> std::vector<FileResult>;

private:
    auto collect_paths(const RepoOptions& options, RepoReport& report)
        -> std::optional<std::vector<std::string>>;
    auto read_dirty_files(const std::string& repo_root, const std::vector<std::string>& paths,
                          RepoReport& report)
        -> std::optional<std::vector<std::pair<std::string, std::string>>>;
    // Writes and deletes under root. On failure in the working tree the
    // message names the files that were already changed.
    auto apply_results(const std::string& root, const std::vector<FileResult>& results,
                       bool in_place, RepoReport& report) -> bool;
    auto commit_to_target(const RepoOptions& options, const std::vector<FileResult>& results,
                          RepoReport& report) -> void;

    IFileSystem& filesystem_;
    IVersionControl& vcs_;
};

// "<target>-pr-2024/05/01_13.45.10"
auto pr_branch_name(const std::string& target_branch,
                    std::chrono::system_clock::time_point when) -> std::string;

auto join_path(const std::string& root, const std::string& relative_path) -> std::string;

} // namespace sanitizer
