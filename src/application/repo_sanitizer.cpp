#include "sanitizer/application/repo_sanitizer.hpp"
#include "sanitizer/string_utils.hpp"
#include <algorithm>
#include <atomic>
#include <ctime>
#include <filesystem>
#include <future>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <thread>

namespace sanitizer {

namespace {

// RAII wrapper for the temporary clone
class ScopedDirectory {
    IFileSystem& filesystem_;
    std::string path_;

public:
    ScopedDirectory(IFileSystem& filesystem, std::string path)
        : filesystem_(filesystem), path_(std::move(path)) {}

    ~ScopedDirectory() {
        if (!filesystem_.remove_directory(path_)) {
            std::cerr << "Warning: Could not remove temporary directory " << path_ << "\n";
        }
    }

    ScopedDirectory(const ScopedDirectory&) = delete;
    auto operator=(const ScopedDirectory&) -> ScopedDirectory& = delete;
};

auto join_names(const std::vector<std::string>& names) -> std::string {
    std::string joined;
    for (const auto& name : names) {
        if (!joined.empty()) {
            joined += ", ";
        }
        joined += name;
    }
    return joined;
}

auto fail(RepoReport& report, std::string message) -> void {
    report.status = RepoStatus::FAILED;
    report.message = std::move(message);
}

} // namespace

RepoSanitizer::RepoSanitizer(IFileSystem& filesystem, IVersionControl& vcs)
    : filesystem_(filesystem), vcs_(vcs) {}

auto RepoSanitizer::run(const RepoOptions& options) -> RepoReport {
    RepoReport report;

    if (options.create_pr_branch && options.target_branch.empty()) {
        fail(report, "--create-pr-branch requires a target branch");
        return report;
    }

    try {
        if (!options.force && !vcs_.is_clean(options.repo_root)) {
            report.status = RepoStatus::DIRTY_WORKING_TREE;
            report.message = "There are uncommitted changes in the repository; "
                             "commit them or use --force";
            return report;
        }

        auto paths = collect_paths(options, report);
        if (!paths) {
            return report;
        }

        auto files = read_dirty_files(options.repo_root, *paths, report);
        if (!files) {
            return report;
        }

        auto results = sanitize_all(*files, options.mode, options.jobs);

        for (const auto& file : results) {
            if (const auto* errors = std::get_if<SyntaxErrors>(&file.result)) {
                report.files_with_errors.push_back(
                    FileWithErrors{.relative_path = file.relative_path, .errors = errors->errors});
            } else if (is_shred(file.result)) {
                report.shredded.push_back(file.relative_path);
            } else {
                report.rewritten.push_back(file.relative_path);
            }
        }

        // Nothing may be written while any file is invalid
        if (!report.files_with_errors.empty()) {
            report.status = RepoStatus::SYNTAX_ERRORS;
            report.rewritten.clear();
            report.shredded.clear();
            return report;
        }

        if (results.empty() && options.target_branch.empty()) {
            report.status = RepoStatus::NOTHING_TO_DO;
            report.message = "No files contain sanitizer markers";
            return report;
        }

        if (options.dry_run) {
            report.status = RepoStatus::DRY_RUN;
            return report;
        }

        if (options.target_branch.empty()) {
            if (apply_results(options.repo_root, results, true, report)) {
                report.status = RepoStatus::SANITIZED;
            }
            return report;
        }

        commit_to_target(options, results, report);
    } catch (const VcsError& e) {
        fail(report, e.what());
    }

    return report;
}

auto RepoSanitizer::sanitize_all(const std::vector<std::pair<std::string, std::string>>& files,
                                 Mode mode, size_t jobs) -> std::vector<FileResult> {
    std::vector<FileResult> results(files.size());
    if (files.empty()) {
        return results;
    }

    size_t workers = jobs > 0 ? jobs : std::max<size_t>(1, std::thread::hardware_concurrency());
    workers = std::min(workers, files.size());

    // One result slot per file; a slot is only ever written by one worker
    std::atomic<size_t> next{0};
    auto worker = [&]() {
        for (size_t i = next++; i < files.size(); i = next++) {
            results[i] = FileResult{.relative_path = files[i].first,
                                    .result = sanitize_text(files[i].second, mode)};
        }
    };

    std::vector<std::future<void>> pending;
    pending.reserve(workers);
    for (size_t w = 0; w < workers; ++w) {
        pending.push_back(std::async(std::launch::async, worker));
    }

    // Every file must be finished before anything is applied
    for (auto& task : pending) {
        task.get();
    }

    return results;
}

auto RepoSanitizer::collect_paths(const RepoOptions& options, RepoReport& report)
    -> std::optional<std::vector<std::string>> {
    if (options.file_list.empty()) {
        return vcs_.list_tracked_files(options.repo_root);
    }

    if (!filesystem_.file_exists(options.file_list)) {
        fail(report, "No such file: " + options.file_list);
        return std::nullopt;
    }

    auto content = filesystem_.read_file(options.file_list);
    if (!content) {
        fail(report, "Could not read " + options.file_list);
        return std::nullopt;
    }

    std::vector<std::string> paths;
    for (const auto& line : StringUtils::split_lines(*content)) {
        auto path = StringUtils::trim(line);
        if (!path.empty()) {
            paths.push_back(path);
        }
    }
    return paths;
}

auto RepoSanitizer::read_dirty_files(const std::string& repo_root,
                                     const std::vector<std::string>& paths, RepoReport& report)
    -> std::optional<std::vector<std::pair<std::string, std::string>>> {
    std::vector<std::pair<std::string, std::string>> files;

    for (const auto& path : paths) {
        auto content = filesystem_.read_file(join_path(repo_root, path));
        if (!content) {
            fail(report, "Could not read " + path);
            return std::nullopt;
        }

        if (!needs_sanitizing(*content)) {
            continue;
        }
        files.emplace_back(path, std::move(*content));
    }

    return files;
}

auto RepoSanitizer::apply_results(const std::string& root, const std::vector<FileResult>& results,
                                  bool in_place, RepoReport& report) -> bool {
    std::vector<std::string> changed;

    for (const auto& file : results) {
        auto path = join_path(root, file.relative_path);

        bool ok = true;
        std::string action;
        if (const auto* sanitized = std::get_if<SanitizedText>(&file.result)) {
            ok = filesystem_.write_file(path, sanitized->text);
            action = "write";
        } else if (is_shred(file.result)) {
            ok = filesystem_.remove_file(path);
            action = "delete";
        } else {
            continue;
        }

        if (!ok) {
            auto message = "Could not " + action + " " + file.relative_path;
            // A temporary clone is thrown away, the working tree is not
            if (in_place && !changed.empty()) {
                message += "; already changed: " + join_names(changed);
            }
            fail(report, std::move(message));
            return false;
        }
        changed.push_back(file.relative_path);
    }
    return true;
}

auto RepoSanitizer::commit_to_target(const RepoOptions& options,
                                     const std::vector<FileResult>& results, RepoReport& report)
    -> void {
    const auto& target = options.target_branch;

    if (vcs_.current_branch(options.repo_root) == target) {
        fail(report, "Target branch '" + target + "' is checked out; switch to the solution branch first");
        return;
    }

    auto temp_dir = filesystem_.make_temp_directory();
    if (!temp_dir) {
        fail(report, "Could not create a temporary directory");
        return;
    }
    ScopedDirectory cleanup(filesystem_, *temp_dir);

    auto clone_root = join_path(*temp_dir, "repo");
    vcs_.clone(options.repo_root, clone_root);
    if (vcs_.branch_exists(options.repo_root, target)) {
        vcs_.fetch_branch(options.repo_root, target, clone_root, target);
    }
    vcs_.point_head_at(clone_root, target);

    if (!apply_results(clone_root, results, false, report)) {
        return;
    }

    if (vcs_.commit_all(clone_root, options.commit_message, options.force)
        == CommitStatus::NOTHING_TO_COMMIT) {
        fail(report, "Nothing to commit on branch '" + target
                         + "'; the sanitized tree is unchanged (use --force to commit anyway)");
        return;
    }

    vcs_.fetch_branch(clone_root, target, options.repo_root, target);
    report.committed_branch = target;

    if (options.create_pr_branch) {
        auto name = pr_branch_name(target, std::chrono::system_clock::now());
        vcs_.create_branch(options.repo_root, name, target);
        report.pr_branch = name;
    }

    report.status = RepoStatus::SANITIZED;
}

auto pr_branch_name(const std::string& target_branch, std::chrono::system_clock::time_point when)
    -> std::string {
    auto time = std::chrono::system_clock::to_time_t(when);
    std::tm local{};
    localtime_r(&time, &local);

    std::ostringstream oss;
    oss << target_branch << "-pr-" << std::put_time(&local, "%Y/%m/%d_%H.%M.%S");
    return oss.str();
}

auto join_path(const std::string& root, const std::string& relative_path) -> std::string {
    return (std::filesystem::path(root) / relative_path).string();
}

} // namespace sanitizer
