/**
 * @file obj_format.cpp
 * @brief Object stage: encoding domain instances as tagged mappings
 */

#include "objfmt/formats.hpp"

#include "format_detail.hpp"
#include "objfmt/vocabulary.hpp"

#include <array>
#include <format>
#include <string>
#include <utility>
#include <vector>

namespace objfmt {

namespace {

namespace detail = formats::detail;

constexpr std::array kReservedFieldKeys = {vocab::kTypeKey, vocab::kHashKey};

class ObjectEncoder
{
public:
    explicit ObjectEncoder(const TypeRegistry& registry)
        : m_registry(registry)
    {}

    [[nodiscard]] Result<Value> operator()(const Value& node, const std::string& path) const
    {
        switch (node.kind()) {
            case Value::Kind::kList:
                return encode_list(*node.as_list(), path);
            case Value::Kind::kMap: {
                auto map = encode_entries(*node.as_map(), path);
                if (!map) {
                    return std::unexpected(map.error());
                }
                return Value(std::move(*map));
            }
            case Value::Kind::kSet:
                return encode_set(*node.as_set(), path);
            case Value::Kind::kObject:
                return encode_object(*node.as_object(), path);
            default:
                return node;
        }
    }

private:
    [[nodiscard]] Result<Value> encode_list(const List& source, const std::string& path) const
    {
        List list;
        list.reserve(source.size());
        std::size_t index = 0;
        for (const auto& element : source) {
            auto converted = (*this)(element, detail::index_path(path, index));
            if (!converted) {
                return std::unexpected(converted.error());
            }
            list.push_back(std::move(*converted));
            ++index;
        }
        return Value(std::move(list));
    }

    [[nodiscard]] Result<Map> encode_entries(const Map& source, const std::string& path) const
    {
        Map map;
        map.set_hash_bearing(source.hash_bearing());
        for (const auto& [key, child] : source) {
            auto converted = (*this)(child, detail::child_path(path, key.text()));
            if (!converted) {
                return std::unexpected(converted.error());
            }
            map.insert_or_assign(key, std::move(*converted));
        }
        return map;
    }

    [[nodiscard]] Result<Value> encode_set(const Set& source, const std::string& path) const
    {
        std::vector<Value> elements;
        elements.reserve(source.size());
        std::size_t index = 0;
        for (const auto& element : source) {
            auto converted = (*this)(element, detail::index_path(path, index));
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

    [[nodiscard]] Result<Value> encode_object(const ObjectPtr& object, const std::string& path) const
    {
        if (!object) {
            return Value();
        }
        const std::string_view tag = object->type_tag();
        const TypeDescriptor* descriptor = m_registry.resolve(tag);
        if (descriptor == nullptr) {
            return make_error(errc::kUnknownType,
                              std::format("{}: type '{}' is not registered", path, tag));
        }

        auto fields = descriptor->encode(*object);
        if (!fields) {
            return std::unexpected(detail::at_path(fields.error(), path));
        }
        for (const auto reserved : kReservedFieldKeys) {
            if (fields->contains(reserved)) {
                return make_error(errc::kMalformedTag,
                                  std::format("{}: type '{}' encodes the reserved field {}",
                                              path,
                                              tag,
                                              reserved));
            }
        }

        Map map{
            {vocab::kTypeKey, tag}
        };
        for (const auto& [key, child] : *fields) {
            auto converted = (*this)(child, detail::child_path(path, key.text()));
            if (!converted) {
                return std::unexpected(converted.error());
            }
            map.insert_or_assign(key, std::move(*converted));
        }

        if (descriptor->hash != nullptr) {
            auto hash = descriptor->hash(*object);
            if (hash) {
                map.insert_or_assign(Key(vocab::kHashKey), Value(*hash));
                map.set_hash_bearing(true);
            } else if (hash.error().code != errc::kUnhashable) {
                return std::unexpected(detail::at_path(hash.error(), path));
            }
        }
        return Value(std::move(map));
    }

    const TypeRegistry& m_registry;
};

}  // namespace

ObjFormat::ObjFormat(Value document)
    : m_document(std::move(document))
{}

Result<RawFormat> ObjFormat::to_raw_format(const TypeRegistry& registry) const
{
    const ObjectEncoder encode(registry);
    auto raw = encode(m_document, "$");
    if (!raw) {
        return std::unexpected(raw.error());
    }
    return RawFormat(std::move(*raw));
}

}  // namespace objfmt
