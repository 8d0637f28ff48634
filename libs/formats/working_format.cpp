/**
 * @file working_format.cpp
 * @brief Working stage: conversion to Storage and to Raw
 */

#include "objfmt/formats.hpp"

#include "format_detail.hpp"
#include "objfmt/vocabulary.hpp"

#include <cmath>
#include <format>
#include <string>
#include <utility>
#include <vector>

namespace objfmt {

namespace {

namespace detail = formats::detail;
using nlohmann::json;

[[nodiscard]] std::unexpected<Error> stage_violation(Value::Kind kind, std::string_view path)
{
    return make_error(errc::kStageViolation,
                      std::format("{}: {} values are not permitted at the working stage",
                                  path,
                                  kind_name(kind)));
}

// ============================================================================
// Working -> Storage
// ============================================================================

[[nodiscard]] Result<std::string> storage_key(const Key& key, std::string_view path)
{
    if (key.is_symbol()) {
        return detail::escape_dots(std::format("__{}__", key.text()));
    }
    if (key.text().find(vocab::kDotSubstitute) != std::string::npos) {
        return make_error(errc::kReservedCharacter,
                          std::format("{}: key '{}' contains the reserved dot substitute U+FF0E",
                                      path,
                                      key.text()));
    }
    return detail::escape_dots(key.text());
}

Result<json> to_storage(const Value& node, const std::string& path);

[[nodiscard]] Result<json> map_to_storage(const Map& map, const std::string& path)
{
    json result = json::object();
    for (const auto& [key, child] : map) {
        auto stored_key = storage_key(key, path);
        if (!stored_key) {
            return std::unexpected(stored_key.error());
        }
        if (result.contains(*stored_key)) {
            return make_error(errc::kReservedCharacter,
                              std::format("{}: keys collide on the stored key '{}'", path, *stored_key));
        }
        auto converted = to_storage(child, detail::child_path(path, key.text()));
        if (!converted) {
            return std::unexpected(converted.error());
        }
        result[*stored_key] = std::move(*converted);
    }
    return result;
}

[[nodiscard]] Result<json> set_to_storage(const Set& set, const std::string& path)
{
    const std::string value_path = detail::child_path(path, vocab::kValueKey);
    json elements = json::array();
    std::size_t index = 0;
    for (const auto& element : set) {
        auto converted = to_storage(element, detail::index_path(value_path, index));
        if (!converted) {
            return std::unexpected(converted.error());
        }
        elements.push_back(std::move(*converted));
        ++index;
    }

    json result = json::object();
    result[std::string(vocab::kTypeKey)] =
        std::string(set.frozen() ? vocab::kFrozenSetTag : vocab::kSetTag);
    result[std::string(vocab::kValueKey)] = std::move(elements);
    return result;
}

Result<json> to_storage(const Value& node, const std::string& path)
{
    switch (node.kind()) {
        case Value::Kind::kNull:
            return json(nullptr);
        case Value::Kind::kBool:
            return json(*node.as_bool());
        case Value::Kind::kInt:
            return json(*node.as_int());
        case Value::Kind::kFloat:
            if (!std::isfinite(*node.as_float())) {
                return make_error(errc::kInvalidNumber,
                                  std::format("{}: non-finite number cannot be stored", path));
            }
            return json(*node.as_float());
        case Value::Kind::kString:
            return json(*node.as_string());
        case Value::Kind::kList: {
            json result = json::array();
            std::size_t index = 0;
            for (const auto& element : *node.as_list()) {
                auto converted = to_storage(element, detail::index_path(path, index));
                if (!converted) {
                    return std::unexpected(converted.error());
                }
                result.push_back(std::move(*converted));
                ++index;
            }
            return result;
        }
        case Value::Kind::kMap:
            return map_to_storage(*node.as_map(), path);
        case Value::Kind::kSet:
            return set_to_storage(*node.as_set(), path);
        case Value::Kind::kPath:
        case Value::Kind::kObject:
            break;
    }
    return stage_violation(node.kind(), path);
}

// ============================================================================
// Working -> Raw
// ============================================================================

[[nodiscard]] bool is_path_mapping(const Map& map)
{
    const std::string* tag = detail::type_tag_of(map);
    return tag != nullptr && *tag == vocab::kPathTag;
}

[[nodiscard]] Result<Value> path_to_raw(const Map& map, std::string_view path)
{
    const Value* text = map.find(vocab::kValueKey);
    if (text == nullptr || text->as_string() == nullptr) {
        return make_error(errc::kMalformedTag,
                          std::format("{}: Path mapping needs a string {}", path, vocab::kValueKey));
    }
    return Value(PathValue(*text->as_string()));
}

Result<Value> to_raw(const Value& node, const std::string& path)
{
    switch (node.kind()) {
        case Value::Kind::kList: {
            List list;
            list.reserve(node.as_list()->size());
            std::size_t index = 0;
            for (const auto& element : *node.as_list()) {
                auto converted = to_raw(element, detail::index_path(path, index));
                if (!converted) {
                    return std::unexpected(converted.error());
                }
                list.push_back(std::move(*converted));
                ++index;
            }
            return Value(std::move(list));
        }
        case Value::Kind::kMap: {
            const Map& source = *node.as_map();
            if (is_path_mapping(source)) {
                return path_to_raw(source, path);
            }
            Map map;
            map.set_hash_bearing(source.hash_bearing());
            for (const auto& [key, child] : source) {
                auto converted = to_raw(child, detail::child_path(path, key.text()));
                if (!converted) {
                    return std::unexpected(converted.error());
                }
                map.insert_or_assign(key, std::move(*converted));
            }
            return Value(std::move(map));
        }
        case Value::Kind::kSet: {
            const Set& source = *node.as_set();
            std::vector<Value> elements;
            elements.reserve(source.size());
            std::size_t index = 0;
            for (const auto& element : source) {
                auto converted = to_raw(element, detail::index_path(path, index));
                if (!converted) {
                    return std::unexpected(converted.error());
                }
                elements.push_back(std::move(*converted));
                ++index;
            }
            auto set = Set::from_elements(source.kind(), std::move(elements));
            if (!set) {
                return std::unexpected(detail::at_path(set.error(), path));
            }
            return Value(std::move(*set));
        }
        case Value::Kind::kPath:
        case Value::Kind::kObject:
            return stage_violation(node.kind(), path);
        default:
            return node;
    }
}

}  // namespace

WorkingFormat::WorkingFormat(Value document)
    : m_document(std::move(document))
{}

Result<StorageFormat> WorkingFormat::to_storage_format() const
{
    auto stored = to_storage(m_document, "$");
    if (!stored) {
        return std::unexpected(stored.error());
    }
    return StorageFormat(std::move(*stored));
}

Result<RawFormat> WorkingFormat::to_raw_format() const
{
    auto raw = to_raw(m_document, "$");
    if (!raw) {
        return std::unexpected(raw.error());
    }
    return RawFormat(std::move(*raw));
}

}  // namespace objfmt
