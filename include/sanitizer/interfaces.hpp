#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace sanitizer {

// Raised by version control adapters when a command fails
class VcsError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class CommitStatus {
    COMMITTED,
    NOTHING_TO_COMMIT
};

// Abstract interfaces for dependency injection
class IFileSystem {
public:
    virtual ~IFileSystem() = default;
    virtual auto read_file(const std::string& path) -> std::optional<std::string> = 0;
    virtual auto write_file(const std::string& path, const std::string& content) -> bool = 0;
    virtual auto remove_file(const std::string& path) -> bool = 0;
    virtual auto file_exists(const std::string& path) -> bool = 0;
    virtual auto make_temp_directory() -> std::optional<std::string> = 0;
    virtual auto remove_directory(const std::string& path) -> bool = 0;
};

class IVersionControl {
public:
    virtual ~IVersionControl() = default;
    virtual auto is_clean(const std::string& repo_root) -> bool = 0;
    virtual auto list_tracked_files(const std::string& repo_root) -> std::vector<std::string> = 0;
    virtual auto current_branch(const std::string& repo_root) -> std::string = 0;
    virtual auto branch_exists(const std::string& repo_root, const std::string& branch) -> bool = 0;
    virtual auto clone(const std::string& source_root, const std::string& destination) -> void = 0;
    virtual auto fetch_branch(const std::string& source_root, const std::string& source_branch,
                              const std::string& destination_root,
                              const std::string& destination_branch) -> void = 0;
    virtual auto point_head_at(const std::string& repo_root, const std::string& branch) -> void = 0;
    virtual auto commit_all(const std::string& repo_root, const std::string& message,
                            bool allow_empty) -> CommitStatus = 0;
    virtual auto create_branch(const std::string& repo_root, const std::string& branch,
                               const std::string& start_point) -> void = 0;
};

} // namespace sanitizer
