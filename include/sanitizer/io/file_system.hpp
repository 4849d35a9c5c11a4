#pragma once

#include "sanitizer/interfaces.hpp"
#include <string>

namespace sanitizer {

class FileSystem : public IFileSystem {
public:
    auto read_file(const std::string& path) -> std::optional<std::string> override;
    auto write_file(const std::string& path, const std::string& content) -> bool override;
    auto remove_file(const std::string& path) -> bool override;
    auto file_exists(const std::string& path) -> bool override;
    auto make_temp_directory() -> std::optional<std::string> override;
    auto remove_directory(const std::string& path) -> bool override;

private:
    auto write_atomic(const std::string& content, const std::string& path) -> bool;
};

} // namespace sanitizer
