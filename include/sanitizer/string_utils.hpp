#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace sanitizer {

class StringUtils {
public:
    // Split on '\n' only; "a\nb\n" gives {"a", "b", ""}
    static auto split_lines(std::string_view text) -> std::vector<std::string>;

    // Inverse of split_lines
    static auto join_lines(const std::vector<std::string>& lines) -> std::string;

    // Trim spaces, tabs, carriage returns and newlines at both ends
    static auto trim(std::string_view text) -> std::string;

    // A NUL byte within the first 8000 bytes marks content as binary
    static auto looks_binary(std::string_view content) -> bool;
};

} // namespace sanitizer
