/**
 * @file format_detail.cpp
 * @brief Helpers shared by the stage walkers
 */

#include "format_detail.hpp"

#include "objfmt/vocabulary.hpp"

#include <format>

namespace objfmt::formats::detail {

namespace {

[[nodiscard]] std::string replace_all(std::string_view input,
                                      std::string_view from,
                                      std::string_view to)
{
    std::string result;
    result.reserve(input.size());
    std::size_t pos = 0;
    while (pos < input.size()) {
        std::size_t found = input.find(from, pos);
        if (found == std::string_view::npos) {
            result.append(input.substr(pos));
            break;
        }
        result.append(input.substr(pos, found - pos));
        result.append(to);
        pos = found + from.size();
    }
    return result;
}

}  // namespace

std::string escape_dots(std::string_view key)
{
    return replace_all(key, ".", vocab::kDotSubstitute);
}

std::string restore_dots(std::string_view key)
{
    return replace_all(key, vocab::kDotSubstitute, ".");
}

std::string child_path(std::string_view path, std::string_view key)
{
    return std::format("{}.{}", path, key);
}

std::string index_path(std::string_view path, std::size_t index)
{
    return std::format("{}[{}]", path, index);
}

Error at_path(Error error, std::string_view path)
{
    if (error.message.starts_with("$")) {
        return error;
    }
    error.message = std::format("{}: {}", path, error.message);
    return error;
}

std::optional<SetKind> stored_set_kind(const nlohmann::json& node)
{
    auto it = node.find(vocab::kTypeKey);
    if (it == node.end() || !it->is_string()) {
        return std::nullopt;
    }
    const auto& tag = it->get_ref<const std::string&>();
    if (tag == vocab::kSetTag) {
        return SetKind::kSet;
    }
    if (tag == vocab::kFrozenSetTag) {
        return SetKind::kFrozenSet;
    }
    return std::nullopt;
}

const std::string* type_tag_of(const Map& map)
{
    const Value* tag = map.find(vocab::kTypeKey);
    return tag != nullptr ? tag->as_string() : nullptr;
}

}  // namespace objfmt::formats::detail
