#pragma once

/**
 * @file registry.hpp
 * @brief Type registry mapping type tags to domain-type descriptors
 *
 * Domain types participate in Object-stage resolution by satisfying
 * ComplexSerializable and being registered once, at startup, before any
 * conversion runs. The registry is read-only afterwards; hold it const and
 * pass it to the conversions that need it.
 */

#include "objfmt/common.hpp"
#include "objfmt/value.hpp"

#include <concepts>
#include <cstdint>
#include <format>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace objfmt {

/**
 * @brief Contract for a domain type resolvable from a tagged mapping
 *
 * - T::kTypeTag: stable, globally unique tag
 * - to_map(): fields of the instance (tag not included)
 * - from_map(): rebuild from fields, errc::kDecodeError on missing or malformed fields
 */
template <typename T>
concept ComplexSerializable = std::equality_comparable<T>
                           && requires(const T& value, const Map& fields) {
                                  { T::kTypeTag } -> std::convertible_to<std::string_view>;
                                  { value.to_map() } -> std::same_as<Map>;
                                  { T::from_map(fields) } -> std::same_as<Result<T>>;
                              };

/**
 * @brief Optional identity-hash part of the contract
 *
 * identity_hash() returns a stable integer, or errc::kUnhashable.
 */
template <typename T>
concept IdentityHashable = requires(const T& value) {
    { value.identity_hash() } -> std::same_as<Result<std::int64_t>>;
};

/**
 * @brief Function table describing one domain type
 */
struct TypeDescriptor
{
    using EncodeFn = Result<Map> (*)(const ComplexObject&);
    using DecodeFn = Result<ObjectPtr> (*)(const Map&);
    using HashFn = Result<std::int64_t> (*)(const ComplexObject&);

    std::string tag;
    EncodeFn encode = nullptr;
    DecodeFn decode = nullptr;
    HashFn hash = nullptr;  ///< nullptr when the type has no identity hash

    friend bool operator==(const TypeDescriptor&, const TypeDescriptor&) = default;
};

/**
 * @brief Immutable holder of one domain instance
 */
template <ComplexSerializable T>
class Complex final : public ComplexObject
{
public:
    explicit Complex(T value)
        : m_value(std::move(value))
    {}

    [[nodiscard]] const T& value() const noexcept { return m_value; }

    [[nodiscard]] std::string_view type_tag() const noexcept override { return T::kTypeTag; }

    [[nodiscard]] bool equals(const ComplexObject& other) const override
    {
        const auto* typed = dynamic_cast<const Complex<T>*>(&other);
        return typed != nullptr && typed->m_value == m_value;
    }

    [[nodiscard]] Result<std::int64_t> identity_hash() const override
    {
        if constexpr (IdentityHashable<T>) {
            return m_value.identity_hash();
        } else {
            return make_error(errc::kUnhashable, std::format("{} is not hashable", T::kTypeTag));
        }
    }

private:
    T m_value;
};

/**
 * Wrap a domain instance as an Object-stage value.
 */
template <ComplexSerializable T>
[[nodiscard]] Value make_object(T value)
{
    return Value(ObjectPtr(std::make_shared<const Complex<T>>(std::move(value))));
}

/**
 * Access the domain instance held by value.
 * @return Pointer to the instance, or nullptr if value does not hold a T
 */
template <ComplexSerializable T>
[[nodiscard]] const T* object_cast(const Value& value)
{
    const ObjectPtr* object = value.as_object();
    if (object == nullptr) {
        return nullptr;
    }
    const auto* typed = dynamic_cast<const Complex<T>*>(object->get());
    return typed != nullptr ? &typed->value() : nullptr;
}

namespace detail {

template <ComplexSerializable T>
[[nodiscard]] Result<Map> encode_as(const ComplexObject& object)
{
    const auto* typed = dynamic_cast<const Complex<T>*>(&object);
    if (typed == nullptr) {
        return make_error(errc::kUnknownType,
                          std::format("instance tagged {} is not a {}", object.type_tag(), T::kTypeTag));
    }
    return typed->value().to_map();
}

template <ComplexSerializable T>
[[nodiscard]] Result<ObjectPtr> decode_as(const Map& fields)
{
    auto decoded = T::from_map(fields);
    if (!decoded) {
        return std::unexpected(decoded.error());
    }
    return ObjectPtr(std::make_shared<const Complex<T>>(std::move(*decoded)));
}

template <ComplexSerializable T>
[[nodiscard]] Result<std::int64_t> hash_as(const ComplexObject& object)
{
    const auto* typed = dynamic_cast<const Complex<T>*>(&object);
    if (typed == nullptr) {
        return make_error(errc::kUnknownType,
                          std::format("instance tagged {} is not a {}", object.type_tag(), T::kTypeTag));
    }
    return typed->identity_hash();
}

}  // namespace detail

/**
 * Derive the descriptor of a ComplexSerializable type.
 *
 * Repeated calls for the same T yield equal descriptors, so registering a
 * type twice is a no-op.
 */
template <ComplexSerializable T>
[[nodiscard]] TypeDescriptor make_descriptor()
{
    TypeDescriptor descriptor{.tag = std::string(T::kTypeTag),
                              .encode = &detail::encode_as<T>,
                              .decode = &detail::decode_as<T>};
    if constexpr (IdentityHashable<T>) {
        descriptor.hash = &detail::hash_as<T>;
    }
    return descriptor;
}

class TypeRegistry
{
public:
    /**
     * @brief Register a descriptor under its tag
     *
     * Registering an identical descriptor again is a no-op.
     * @return errc::kTagConflict if a different descriptor holds the tag or
     *         the tag is a reserved stage tag; errc::kInvalidDescriptor if the tag
     *         is empty or encode/decode is missing
     */
    [[nodiscard]] VoidResult register_type(TypeDescriptor descriptor);

    template <ComplexSerializable T>
    [[nodiscard]] VoidResult register_type()
    {
        return register_type(make_descriptor<T>());
    }

    /**
     * @brief Look up the descriptor for a tag
     * @return Descriptor, or nullptr if the tag is unknown
     */
    [[nodiscard]] const TypeDescriptor* resolve(std::string_view tag) const noexcept;

    /// Registered tags in lexicographic order
    [[nodiscard]] std::vector<std::string> tags() const;

    [[nodiscard]] std::size_t size() const noexcept { return m_descriptors.size(); }

private:
    std::map<std::string, TypeDescriptor, std::less<>> m_descriptors;
};

}  // namespace objfmt
