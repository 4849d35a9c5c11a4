#pragma once

#include "sanitizer/interfaces.hpp"
#include "sanitizer/utils/sub_process.hpp"
#include <string>
#include <vector>

namespace sanitizer {

// IVersionControl backed by the git command line
class GitRepository : public IVersionControl {
public:
    auto is_clean(const std::string& repo_root) -> bool override;
    auto list_tracked_files(const std::string& repo_root) -> std::vector<std::string> override;
    auto current_branch(const std::string& repo_root) -> std::string override;
    auto branch_exists(const std::string& repo_root, const std::string& branch) -> bool override;
    auto clone(const std::string& source_root, const std::string& destination) -> void override;
    auto fetch_branch(const std::string& source_root, const std::string& source_branch,
                      const std::string& destination_root,
                      const std::string& destination_branch) -> void override;
    auto point_head_at(const std::string& repo_root, const std::string& branch) -> void override;
    auto commit_all(const std::string& repo_root, const std::string& message, bool allow_empty)
        -> CommitStatus override;
    auto create_branch(const std::string& repo_root, const std::string& branch,
                       const std::string& start_point) -> void override;

private:
    auto git(const std::string& repo_root, std::vector<std::string> arguments) -> ProcessResult;
    auto git_checked(const std::string& repo_root, std::vector<std::string> arguments)
        -> std::string;
};

} // namespace sanitizer
