/**
 * @file storage_format.cpp
 * @brief Storage stage: conversion to Working and plain JSON export
 */

#include "objfmt/formats.hpp"

#include "format_detail.hpp"
#include "objfmt/vocabulary.hpp"

#include <cstdint>
#include <format>
#include <limits>
#include <string>
#include <utility>
#include <vector>

namespace objfmt {

namespace {

namespace detail = formats::detail;
using nlohmann::json;

[[nodiscard]] const json* find_field(const json& node, std::string_view key)
{
    auto it = node.find(key);
    return it == node.end() ? nullptr : &*it;
}

[[nodiscard]] Result<const json*> set_payload(const json& node, std::string_view path)
{
    const json* payload = find_field(node, vocab::kValueKey);
    if (payload == nullptr) {
        return make_error(errc::kMalformedTag,
                          std::format("{}: set mapping without {}", path, vocab::kValueKey));
    }
    if (!payload->is_array()) {
        return make_error(errc::kMalformedTag,
                          std::format("{}: set mapping {} must be an array, got {}",
                                      path,
                                      vocab::kValueKey,
                                      payload->type_name()));
    }
    return payload;
}

// ============================================================================
// Storage -> Working
// ============================================================================

Result<Value> to_working(const json& node, const std::string& path);

[[nodiscard]] Result<Value> set_to_working(const json& node, SetKind kind, const std::string& path)
{
    auto payload = set_payload(node, path);
    if (!payload) {
        return std::unexpected(payload.error());
    }

    const std::string value_path = detail::child_path(path, vocab::kValueKey);
    std::vector<Value> elements;
    elements.reserve((*payload)->size());
    std::size_t index = 0;
    for (const auto& element : **payload) {
        auto converted = to_working(element, detail::index_path(value_path, index));
        if (!converted) {
            return std::unexpected(converted.error());
        }
        elements.push_back(std::move(*converted));
        ++index;
    }

    auto set = Set::from_elements(kind, std::move(elements));
    if (!set) {
        return std::unexpected(detail::at_path(set.error(), path));
    }
    return Value(std::move(*set));
}

[[nodiscard]] Result<Value> map_to_working(const json& node, const std::string& path)
{
    Map map;
    for (const auto& [key, child] : node.items()) {
        auto converted = to_working(child, detail::child_path(path, key));
        if (!converted) {
            return std::unexpected(converted.error());
        }
        map.insert_or_assign(Key(detail::restore_dots(key)), std::move(*converted));
    }

    if (const Value* hash = map.find(vocab::kHashKey); hash != nullptr) {
        if (hash->as_int() == nullptr) {
            return make_error(errc::kMalformedTag,
                              std::format("{}: {} must be an integer", path, vocab::kHashKey));
        }
        map.set_hash_bearing(true);
    }
    return Value(std::move(map));
}

Result<Value> to_working(const json& node, const std::string& path)
{
    switch (node.type()) {
        case json::value_t::null:
            return Value();
        case json::value_t::boolean:
            return Value(node.get<bool>());
        case json::value_t::number_integer:
            return Value(node.get<std::int64_t>());
        case json::value_t::number_unsigned: {
            const auto value = node.get<std::uint64_t>();
            if (value > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                return make_error(errc::kIntegerOverflow,
                                  std::format("{}: integer {} exceeds int64 range", path, value));
            }
            return Value(static_cast<std::int64_t>(value));
        }
        case json::value_t::number_float:
            return Value(node.get<double>());
        case json::value_t::string:
            return Value(node.get<std::string>());
        case json::value_t::array: {
            List list;
            list.reserve(node.size());
            std::size_t index = 0;
            for (const auto& element : node) {
                auto converted = to_working(element, detail::index_path(path, index));
                if (!converted) {
                    return std::unexpected(converted.error());
                }
                list.push_back(std::move(*converted));
                ++index;
            }
            return Value(std::move(list));
        }
        case json::value_t::object:
            if (auto kind = detail::stored_set_kind(node)) {
                return set_to_working(node, *kind, path);
            }
            return map_to_working(node, path);
        case json::value_t::binary:
        case json::value_t::discarded:
            break;
    }
    return make_error(errc::kStageViolation,
                      std::format("{}: {} values cannot be stored", path, node.type_name()));
}

// ============================================================================
// Storage -> plain JSON
// ============================================================================

Result<json> to_plain(const json& node, const std::string& path)
{
    if (node.is_array()) {
        json result = json::array();
        std::size_t index = 0;
        for (const auto& element : node) {
            auto converted = to_plain(element, detail::index_path(path, index));
            if (!converted) {
                return std::unexpected(converted.error());
            }
            result.push_back(std::move(*converted));
            ++index;
        }
        return result;
    }
    if (!node.is_object()) {
        return node;
    }

    if (detail::stored_set_kind(node)) {
        auto payload = set_payload(node, path);
        if (!payload) {
            return std::unexpected(payload.error());
        }
        return to_plain(**payload, detail::child_path(path, vocab::kValueKey));
    }

    const json* tag = find_field(node, vocab::kTypeKey);
    if (tag != nullptr && tag->is_string()
        && tag->get_ref<const std::string&>() == vocab::kPathTag) {
        const json* text = find_field(node, vocab::kValueKey);
        if (text == nullptr || !text->is_string()) {
            return make_error(errc::kMalformedTag,
                              std::format("{}: Path mapping needs a string {}", path, vocab::kValueKey));
        }
        return *text;
    }

    json result = json::object();
    for (const auto& [key, child] : node.items()) {
        if (key == vocab::kHashKey) {
            continue;
        }
        auto converted = to_plain(child, detail::child_path(path, key));
        if (!converted) {
            return std::unexpected(converted.error());
        }
        result[detail::restore_dots(key)] = std::move(*converted);
    }
    return result;
}

}  // namespace

StorageFormat::StorageFormat(nlohmann::json document)
    : m_document(std::move(document))
{}

Result<WorkingFormat> StorageFormat::to_working_format() const
{
    auto working = to_working(m_document, "$");
    if (!working) {
        return std::unexpected(working.error());
    }
    return WorkingFormat(std::move(*working));
}

Result<nlohmann::json> StorageFormat::to_json_mapping() const
{
    return to_plain(m_document, "$");
}

}  // namespace objfmt
