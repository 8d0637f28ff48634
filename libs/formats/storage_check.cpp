/**
 * @file storage_check.cpp
 * @brief Structural check of Storage documents
 */

#include "objfmt/storage_check.hpp"

#include "format_detail.hpp"
#include "objfmt/vocabulary.hpp"

#include <cmath>
#include <format>
#include <string>

namespace objfmt {

namespace {

namespace detail = formats::detail;
using nlohmann::json;

[[nodiscard]] VoidResult check_tag_shape(const json& node, const std::string& path)
{
    auto tag = node.find(vocab::kTypeKey);
    if (tag == node.end() || !tag->is_string()) {
        return {};
    }
    auto payload = node.find(vocab::kValueKey);
    if (detail::stored_set_kind(node)) {
        if (payload == node.end() || !payload->is_array()) {
            return make_error(errc::kMalformedTag,
                              std::format("{}: {} mapping needs an array {}",
                                          path,
                                          tag->get_ref<const std::string&>(),
                                          vocab::kValueKey));
        }
    } else if (tag->get_ref<const std::string&>() == vocab::kPathTag) {
        if (payload == node.end() || !payload->is_string()) {
            return make_error(errc::kMalformedTag,
                              std::format("{}: Path mapping needs a string {}", path, vocab::kValueKey));
        }
    }
    return {};
}

VoidResult check_node(const json& node, const std::string& path)
{
    if (node.is_number_float() && !std::isfinite(node.get<double>())) {
        return make_error(errc::kInvalidNumber, std::format("{}: non-finite number", path));
    }
    if (node.is_array()) {
        std::size_t index = 0;
        for (const auto& element : node) {
            if (auto checked = check_node(element, detail::index_path(path, index)); !checked) {
                return checked;
            }
            ++index;
        }
        return {};
    }
    if (!node.is_object()) {
        return {};
    }

    if (auto shape = check_tag_shape(node, path); !shape) {
        return shape;
    }
    for (const auto& [key, child] : node.items()) {
        if (key.find('.') != std::string::npos) {
            return make_error(errc::kReservedCharacter,
                              std::format("{}: key '{}' contains '.'", path, key));
        }
        if (key == vocab::kHashKey && !child.is_number_integer()) {
            return make_error(errc::kMalformedTag,
                              std::format("{}: {} must be an integer", path, vocab::kHashKey));
        }
        if (auto checked = check_node(child, detail::child_path(path, key)); !checked) {
            return checked;
        }
    }
    return {};
}

}  // namespace

VoidResult check_storage_document(const nlohmann::json& document)
{
    return check_node(document, "$");
}

}  // namespace objfmt
