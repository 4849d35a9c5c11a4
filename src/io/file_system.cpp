#include "sanitizer/io/file_system.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

namespace sanitizer {

auto FileSystem::read_file(const std::string& path) -> std::optional<std::string> {
    std::ifstream file(path, std::ios::binary);

    if (!file.is_open()) {
        return std::nullopt;
    }

    std::ostringstream content;
    content << file.rdbuf();
    if (file.bad()) {
        return std::nullopt;
    }

    return content.str();
}

auto FileSystem::write_file(const std::string& path, const std::string& content) -> bool {
    return write_atomic(content, path);
}

auto FileSystem::remove_file(const std::string& path) -> bool {
    std::error_code ec;
    return std::filesystem::remove(path, ec) && !ec;
}

auto FileSystem::file_exists(const std::string& path) -> bool {
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec);
}

auto FileSystem::make_temp_directory() -> std::optional<std::string> {
    std::error_code ec;
    auto base = std::filesystem::temp_directory_path(ec);
    if (ec) {
        return std::nullopt;
    }

    std::string pattern = (base / "sanitizer-XXXXXX").string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    if (mkdtemp(buffer.data()) == nullptr) {
        return std::nullopt;
    }
    return std::string(buffer.data());
}

auto FileSystem::remove_directory(const std::string& path) -> bool {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    return !ec;
}

auto FileSystem::write_atomic(const std::string& content, const std::string& path) -> bool {
    // Write to temporary file first for atomic operation
    std::string temp_path = path + ".tmp";

    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            return false;
        }

        file << content;

        if (file.fail()) {
            file.close();
            std::error_code ignored;
            std::filesystem::remove(temp_path, ignored);
            return false;
        }
    } // File automatically closed here

    std::error_code ec;
    auto status = std::filesystem::status(path, ec);
    if (!ec && std::filesystem::exists(status)) {
        // Keep the executable bit of scripts
        std::filesystem::permissions(temp_path, status.permissions(), ec);
    }

    // Atomically replace original file
    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp_path, ignored);
        return false;
    }
    return true;
}

} // namespace sanitizer
