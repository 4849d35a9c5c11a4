#include "sanitizer/io/git_repository.hpp"
#include "sanitizer/string_utils.hpp"
#include <filesystem>

namespace sanitizer {

auto GitRepository::is_clean(const std::string& repo_root) -> bool {
    auto output = git_checked(repo_root, {"status", "--porcelain"});
    return StringUtils::trim(output).empty();
}

auto GitRepository::list_tracked_files(const std::string& repo_root) -> std::vector<std::string> {
    auto output = git_checked(repo_root, {"-c", "core.quotepath=off", "ls-files"});

    std::vector<std::string> files;
    for (const auto& line : StringUtils::split_lines(output)) {
        if (!line.empty()) {
            files.push_back(line);
        }
    }
    return files;
}

auto GitRepository::current_branch(const std::string& repo_root) -> std::string {
    return StringUtils::trim(git_checked(repo_root, {"rev-parse", "--abbrev-ref", "HEAD"}));
}

auto GitRepository::branch_exists(const std::string& repo_root, const std::string& branch)
    -> bool {
    return git(repo_root, {"rev-parse", "--verify", "--quiet", "refs/heads/" + branch}).success;
}

auto GitRepository::clone(const std::string& source_root, const std::string& destination)
    -> void {
    auto result = SubProcess::run({"git", "clone", "--quiet", source_root, destination});
    if (!result.success) {
        throw VcsError("git clone of " + source_root + " failed: " + StringUtils::trim(result.output));
    }
}

auto GitRepository::fetch_branch(const std::string& source_root, const std::string& source_branch,
                                 const std::string& destination_root,
                                 const std::string& destination_branch) -> void {
    auto source_uri = "file://" + std::filesystem::absolute(source_root).string();
    git_checked(destination_root,
                {"fetch", "--quiet", source_uri, source_branch + ":" + destination_branch});
}

auto GitRepository::point_head_at(const std::string& repo_root, const std::string& branch)
    -> void {
    git_checked(repo_root, {"symbolic-ref", "HEAD", "refs/heads/" + branch});
}

auto GitRepository::commit_all(const std::string& repo_root, const std::string& message,
                               bool allow_empty) -> CommitStatus {
    git_checked(repo_root, {"add", ".", "--force"});

    // Exit code 0: the index matches HEAD
    if (!allow_empty && git(repo_root, {"diff", "--cached", "--quiet"}).success) {
        return CommitStatus::NOTHING_TO_COMMIT;
    }

    std::vector<std::string> arguments{"commit", "--quiet", "-m", message};
    if (allow_empty) {
        arguments.emplace_back("--allow-empty");
    }

    auto result = git(repo_root, std::move(arguments));
    if (result.success) {
        return CommitStatus::COMMITTED;
    }
    if (result.output.find("nothing to commit") != std::string::npos) {
        return CommitStatus::NOTHING_TO_COMMIT;
    }
    throw VcsError("git commit failed: " + StringUtils::trim(result.output));
}

auto GitRepository::create_branch(const std::string& repo_root, const std::string& branch,
                                  const std::string& start_point) -> void {
    git_checked(repo_root, {"branch", branch, start_point});
}

auto GitRepository::git(const std::string& repo_root, std::vector<std::string> arguments)
    -> ProcessResult {
    std::vector<std::string> argv{"git", "-C", repo_root};
    argv.insert(argv.end(), std::make_move_iterator(arguments.begin()),
                std::make_move_iterator(arguments.end()));
    return SubProcess::run(argv);
}

auto GitRepository::git_checked(const std::string& repo_root, std::vector<std::string> arguments)
    -> std::string {
    std::string command = arguments.empty() ? "" : arguments.front();
    auto result = git(repo_root, std::move(arguments));
    if (!result.success) {
        throw VcsError("git " + command + " in " + repo_root + " failed: "
                       + StringUtils::trim(result.output));
    }
    return result.output;
}

} // namespace sanitizer
