/**
 * @file raw_format.cpp
 * @brief Raw stage: conversion to Working and resolution into domain objects
 */

#include "objfmt/formats.hpp"

#include "format_detail.hpp"
#include "objfmt/hash.hpp"
#include "objfmt/vocabulary.hpp"

#include <format>
#include <string>
#include <utility>
#include <vector>

namespace objfmt {

namespace {

namespace detail = formats::detail;

[[nodiscard]] std::unexpected<Error> object_not_raw(std::string_view path)
{
    return make_error(errc::kStageViolation,
                      std::format("{}: domain objects are not permitted at the raw stage", path));
}

/**
 * @brief Rebuild a set from converted elements, keeping its kind
 */
template <typename Convert>
[[nodiscard]] Result<Value> convert_set(const Set& source, const std::string& path, Convert&& convert)
{
    std::vector<Value> elements;
    elements.reserve(source.size());
    std::size_t index = 0;
    for (const auto& element : source) {
        auto converted = convert(element, detail::index_path(path, index));
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

template <typename Convert>
[[nodiscard]] Result<Value> convert_list(const List& source, const std::string& path, Convert&& convert)
{
    List list;
    list.reserve(source.size());
    std::size_t index = 0;
    for (const auto& element : source) {
        auto converted = convert(element, detail::index_path(path, index));
        if (!converted) {
            return std::unexpected(converted.error());
        }
        list.push_back(std::move(*converted));
        ++index;
    }
    return Value(std::move(list));
}

template <typename Convert>
[[nodiscard]] Result<Map> convert_entries(const Map& source, const std::string& path, Convert&& convert)
{
    Map map;
    for (const auto& [key, child] : source) {
        auto converted = convert(child, detail::child_path(path, key.text()));
        if (!converted) {
            return std::unexpected(converted.error());
        }
        map.insert_or_assign(key, std::move(*converted));
    }
    return map;
}

// ============================================================================
// Raw -> Working
// ============================================================================

[[nodiscard]] Result<Value> path_to_working(const PathValue& path_value)
{
    auto hash = identity_hash(Value(path_value));
    if (!hash) {
        return std::unexpected(hash.error());
    }
    Map map{
        { vocab::kTypeKey,  vocab::kPathTag},
        {vocab::kValueKey, path_value.str()},
        { vocab::kHashKey,            *hash}
    };
    map.set_hash_bearing(true);
    return Value(std::move(map));
}

Result<Value> to_working(const Value& node, const std::string& path)
{
    switch (node.kind()) {
        case Value::Kind::kList:
            return convert_list(*node.as_list(), path, to_working);
        case Value::Kind::kMap: {
            auto map = convert_entries(*node.as_map(), path, to_working);
            if (!map) {
                return std::unexpected(map.error());
            }
            if (const Value* hash = map->find(vocab::kHashKey); hash != nullptr) {
                if (hash->as_int() == nullptr) {
                    return make_error(errc::kMalformedTag,
                                      std::format("{}: {} must be an integer", path, vocab::kHashKey));
                }
                map->set_hash_bearing(true);
            }
            return Value(std::move(*map));
        }
        case Value::Kind::kSet:
            return convert_set(*node.as_set(), path, to_working);
        case Value::Kind::kPath:
            return path_to_working(*node.as_path());
        case Value::Kind::kObject:
            return object_not_raw(path);
        default:
            return node;
    }
}

// ============================================================================
// Raw -> Object
// ============================================================================

class ObjectResolver
{
public:
    explicit ObjectResolver(const TypeRegistry& registry)
        : m_registry(registry)
    {}

    [[nodiscard]] Result<Value> operator()(const Value& node, const std::string& path) const
    {
        switch (node.kind()) {
            case Value::Kind::kList:
                return convert_list(*node.as_list(), path, *this);
            case Value::Kind::kMap:
                return resolve_map(*node.as_map(), path);
            case Value::Kind::kSet:
                return convert_set(*node.as_set(), path, *this);
            case Value::Kind::kObject:
                return object_not_raw(path);
            default:
                return node;
        }
    }

private:
    [[nodiscard]] Result<Value> resolve_map(const Map& source, const std::string& path) const
    {
        // Children first, so nested objects exist before their container is decoded
        auto map = convert_entries(source, path, *this);
        if (!map) {
            return std::unexpected(map.error());
        }
        map->set_hash_bearing(source.hash_bearing());

        const std::string* tag = detail::type_tag_of(*map);
        const TypeDescriptor* descriptor = tag != nullptr ? m_registry.resolve(*tag) : nullptr;
        if (descriptor == nullptr) {
            return Value(std::move(*map));
        }

        map->erase(vocab::kTypeKey);
        map->erase(vocab::kHashKey);
        map->set_hash_bearing(false);
        auto object = descriptor->decode(*map);
        if (!object) {
            return std::unexpected(detail::at_path(object.error(), path));
        }
        return Value(std::move(*object));
    }

    const TypeRegistry& m_registry;
};

}  // namespace

RawFormat::RawFormat(Value document)
    : m_document(std::move(document))
{}

Result<WorkingFormat> RawFormat::to_working_format() const
{
    auto working = to_working(m_document, "$");
    if (!working) {
        return std::unexpected(working.error());
    }
    return WorkingFormat(std::move(*working));
}

Result<ObjFormat> RawFormat::to_obj_format(const TypeRegistry& registry) const
{
    const ObjectResolver resolve(registry);
    auto resolved = resolve(m_document, "$");
    if (!resolved) {
        return std::unexpected(resolved.error());
    }
    return ObjFormat(std::move(*resolved));
}

}  // namespace objfmt
