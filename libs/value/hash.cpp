/**
 * @file hash.cpp
 * @brief Identity hashing of document values
 */

#include "objfmt/hash.hpp"

#include "objfmt/vocabulary.hpp"

#include <cmath>
#include <format>
#include <limits>
#include <string>

namespace objfmt {

namespace {

[[nodiscard]] std::int64_t hash_tagged(std::string_view prefix, std::string_view payload)
{
    std::string encoded;
    encoded.reserve(prefix.size() + 1 + payload.size());
    encoded.append(prefix);
    encoded.push_back(':');
    encoded.append(payload);
    return common::sha256_int64(encoded);
}

[[nodiscard]] std::int64_t hash_int(std::int64_t value)
{
    return hash_tagged("i", std::to_string(value));
}

[[nodiscard]] std::int64_t hash_float(double value)
{
    // 2^63 is exactly representable; anything in [-2^63, 2^63) converts without overflow
    constexpr double kInt64Bound = 9223372036854775808.0;
    if (std::isfinite(value) && std::trunc(value) == value && value >= -kInt64Bound
        && value < kInt64Bound) {
        return hash_int(static_cast<std::int64_t>(value));
    }
    return hash_tagged("f", std::format("{}", value));
}

[[nodiscard]] Result<std::int64_t> hash_frozenset(const Set& set)
{
    // Wrapping sum keeps the result independent of element order
    std::uint64_t accumulated = 0;
    for (const auto& element : set) {
        auto element_hash = identity_hash(element);
        if (!element_hash) {
            return std::unexpected(element_hash.error());
        }
        accumulated += static_cast<std::uint64_t>(*element_hash);
    }
    return hash_tagged("frozenset", std::format("{}:{}", set.size(), accumulated));
}

[[nodiscard]] Result<std::int64_t> hash_map(const Map& map)
{
    if (!map.hash_bearing()) {
        return make_error(errc::kUnhashable, "mapping without _hash is not hashable");
    }
    const Value* stored = map.find(vocab::kHashKey);
    if (stored == nullptr || stored->as_int() == nullptr) {
        return make_error(errc::kMalformedTag, "hash-bearing mapping has no integer _hash");
    }
    return *stored->as_int();
}

}  // namespace

Result<std::int64_t> identity_hash(const Value& value)
{
    switch (value.kind()) {
        case Value::Kind::kNull:
            return hash_tagged("n", "");
        case Value::Kind::kBool:
            return hash_tagged("b", *value.as_bool() ? "1" : "0");
        case Value::Kind::kInt:
            return hash_int(*value.as_int());
        case Value::Kind::kFloat:
            return hash_float(*value.as_float());
        case Value::Kind::kString:
            return hash_tagged("s", *value.as_string());
        case Value::Kind::kPath:
            return hash_tagged("p", value.as_path()->str());
        case Value::Kind::kMap:
            return hash_map(*value.as_map());
        case Value::Kind::kSet:
            if (!value.as_set()->frozen()) {
                return make_error(errc::kUnhashable, "mutable set is not hashable");
            }
            return hash_frozenset(*value.as_set());
        case Value::Kind::kObject:
            if (const ObjectPtr& object = *value.as_object(); object != nullptr) {
                return object->identity_hash();
            }
            break;
        case Value::Kind::kList:
            break;
    }
    return make_error(errc::kUnhashable,
                      std::format("{} is not hashable", kind_name(value.kind())));
}

bool is_hashable(const Value& value)
{
    return identity_hash(value).has_value();
}

}  // namespace objfmt
