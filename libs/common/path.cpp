/**
 * @file path.cpp
 * @brief Path value normalization
 *
 * Paths are normalized lexically, the way a POSIX pure path is: no
 * filesystem access and no resolution of "..".
 */

#include "objfmt/value.hpp"

#include <ranges>
#include <string>
#include <vector>

namespace objfmt {

namespace {

/**
 * @brief Split a path into its non-empty, non-"." segments
 */
[[nodiscard]] std::vector<std::string> split_segments(std::string_view path)
{
    std::vector<std::string> parts;
    for (auto part : path | std::views::split('/')) {
        std::string_view segment(part.begin(), part.end());
        if (segment.empty() || segment == ".") {
            continue;
        }
        parts.emplace_back(segment);
    }
    return parts;
}

[[nodiscard]] std::string join_segments(const std::vector<std::string>& parts, bool absolute)
{
    std::string result = absolute ? "/" : "";
    bool first = true;
    for (const auto& part : parts) {
        if (!first) {
            result += '/';
        }
        first = false;
        result += part;
    }
    if (result.empty()) {
        return ".";
    }
    return result;
}

}  // namespace

PathValue::PathValue(std::string_view text)
    : m_text(join_segments(split_segments(text), text.starts_with('/')))
{}

}  // namespace objfmt
