#include "sanitizer/core/transformer.hpp"
#include <type_traits>

namespace sanitizer {

namespace {

auto count_lines(const ParseTree& tree) -> size_t {
    size_t count = 0;
    for (const auto& segment : tree.segments) {
        if (const auto* run = std::get_if<PlainRun>(&segment)) {
            count += run->lines.size();
        } else {
            const auto& block = std::get<Block>(segment);
            count += block.removed_lines.size() + block.replacement_lines.size();
        }
    }
    return count;
}

auto render_block(const Block& block, Mode mode, std::vector<std::string>& output) -> void {
    switch (mode) {
    case Mode::SANITIZE:
        for (const auto& line : block.replacement_lines) {
            output.push_back(strip_prefix(line.raw, block.prefix));
        }
        break;
    case Mode::STRIP:
        for (const auto& line : block.removed_lines) {
            output.push_back(line.raw);
        }
        for (const auto& line : block.replacement_lines) {
            output.push_back(line.raw);
        }
        break;
    }
}

} // namespace

auto render(const ParseTree& tree, Mode mode) -> std::vector<std::string> {
    std::vector<std::string> output;
    output.reserve(count_lines(tree));

    for (const auto& segment : tree.segments) {
        std::visit(
            [&](const auto& item) {
                using T = std::decay_t<decltype(item)>;
                if constexpr (std::is_same_v<T, PlainRun>) {
                    for (const auto& line : item.lines) {
                        output.push_back(line.raw);
                    }
                } else {
                    render_block(item, mode, output);
                }
            },
            segment);
    }

    return output;
}

auto strip_prefix(const std::string& line, const std::string& prefix) -> std::string {
    if (!line.starts_with(prefix)) {
        return line;
    }
    return line.substr(prefix.size());
}

auto mode_name(Mode mode) -> std::string {
    switch (mode) {
    case Mode::SANITIZE:
        return "sanitize";
    case Mode::STRIP:
        return "strip";
    }
    return "unknown";
}

} // namespace sanitizer
