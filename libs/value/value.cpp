/**
 * @file value.cpp
 * @brief Map, Set and Value structural operations
 */

#include "objfmt/value.hpp"

#include "objfmt/hash.hpp"

#include <algorithm>
#include <cmath>
#include <format>

namespace objfmt {

// ============================================================================
// Map
// ============================================================================

Map::Map(std::initializer_list<Entry> entries)
{
    m_entries.reserve(entries.size());
    for (const auto& [key, value] : entries) {
        insert_or_assign(key, value);
    }
}

std::size_t Map::size() const noexcept
{
    return m_entries.size();
}

bool Map::empty() const noexcept
{
    return m_entries.empty();
}

Map::const_iterator Map::begin() const noexcept
{
    return m_entries.begin();
}

Map::const_iterator Map::end() const noexcept
{
    return m_entries.end();
}

const Value* Map::find(const Key& key) const noexcept
{
    auto it = std::ranges::find(m_entries, key, &Entry::first);
    return it == m_entries.end() ? nullptr : &it->second;
}

const Value* Map::find(std::string_view key) const noexcept
{
    auto it = std::ranges::find_if(m_entries,
                                   [key](const Entry& entry) { return entry.first.is(key); });
    return it == m_entries.end() ? nullptr : &it->second;
}

bool Map::contains(std::string_view key) const noexcept
{
    return find(key) != nullptr;
}

void Map::insert_or_assign(Key key, Value value)
{
    auto it = std::ranges::find(m_entries, key, &Entry::first);
    if (it != m_entries.end()) {
        it->second = std::move(value);
        return;
    }
    m_entries.emplace_back(std::move(key), std::move(value));
}

bool Map::erase(std::string_view key)
{
    auto removed = std::erase_if(m_entries, [key](const Entry& entry) { return entry.first.is(key); });
    return removed > 0;
}

bool operator==(const Map& lhs, const Map& rhs)
{
    if (lhs.size() != rhs.size()) {
        return false;
    }
    return std::ranges::all_of(lhs.m_entries, [&rhs](const Map::Entry& entry) {
        const Value* other = rhs.find(entry.first);
        return other != nullptr && *other == entry.second;
    });
}

// ============================================================================
// Set
// ============================================================================

Result<Set> Set::from_elements(SetKind kind, std::vector<Value> elements)
{
    Set set(kind);
    set.m_items.reserve(elements.size());
    set.m_hashes.reserve(elements.size());
    for (auto& element : elements) {
        if (auto added = set.add(std::move(element)); !added) {
            return std::unexpected(added.error());
        }
    }
    return set;
}

Result<bool> Set::insert(Value element)
{
    if (frozen()) {
        return make_error(errc::kImmutableSet, "cannot insert into a frozenset");
    }
    return add(std::move(element));
}

Result<bool> Set::add(Value element)
{
    auto hash = identity_hash(element);
    if (!hash) {
        return make_error(hash.error().code,
                          std::format("set element rejected: {}", hash.error().message));
    }
    if (contains_hashed(element, *hash)) {
        return false;
    }
    m_items.push_back(std::move(element));
    m_hashes.push_back(*hash);
    return true;
}

bool Set::contains(const Value& element) const
{
    auto hash = identity_hash(element);
    return hash && contains_hashed(element, *hash);
}

bool Set::contains_hashed(const Value& element, std::int64_t hash) const
{
    for (std::size_t i = 0; i < m_items.size(); ++i) {
        if (m_hashes[i] == hash && m_items[i] == element) {
            return true;
        }
    }
    return false;
}

std::size_t Set::size() const noexcept
{
    return m_items.size();
}

bool Set::empty() const noexcept
{
    return m_items.empty();
}

Set::const_iterator Set::begin() const noexcept
{
    return m_items.begin();
}

Set::const_iterator Set::end() const noexcept
{
    return m_items.end();
}

bool operator==(const Set& lhs, const Set& rhs)
{
    if (lhs.m_kind != rhs.m_kind || lhs.size() != rhs.size()) {
        return false;
    }
    for (std::size_t i = 0; i < lhs.m_items.size(); ++i) {
        if (!rhs.contains_hashed(lhs.m_items[i], lhs.m_hashes[i])) {
            return false;
        }
    }
    return true;
}

// ============================================================================
// Value
// ============================================================================

namespace {

/// An int equals a float only when the float holds exactly that integer
[[nodiscard]] bool int_equals_float(std::int64_t integer, double number)
{
    constexpr double kInt64Bound = 9223372036854775808.0;
    if (!std::isfinite(number) || std::trunc(number) != number || number < -kInt64Bound
        || number >= kInt64Bound) {
        return false;
    }
    return static_cast<std::int64_t>(number) == integer;
}

[[nodiscard]] bool numbers_equal(const Value& lhs, const Value& rhs)
{
    const std::int64_t* left_int = lhs.as_int();
    const std::int64_t* right_int = rhs.as_int();
    if (left_int != nullptr && right_int != nullptr) {
        return *left_int == *right_int;
    }
    if (left_int != nullptr) {
        return int_equals_float(*left_int, *rhs.as_float());
    }
    if (right_int != nullptr) {
        return int_equals_float(*right_int, *lhs.as_float());
    }
    return *lhs.as_float() == *rhs.as_float();
}

[[nodiscard]] bool is_number(Value::Kind kind) noexcept
{
    return kind == Value::Kind::kInt || kind == Value::Kind::kFloat;
}

}  // namespace

bool operator==(const Value& lhs, const Value& rhs)
{
    if (is_number(lhs.kind()) && is_number(rhs.kind())) {
        return numbers_equal(lhs, rhs);
    }
    if (lhs.kind() != rhs.kind()) {
        return false;
    }
    if (lhs.kind() == Value::Kind::kObject) {
        const ObjectPtr& left = *lhs.as_object();
        const ObjectPtr& right = *rhs.as_object();
        if (left == nullptr || right == nullptr) {
            return left == right;
        }
        return left->type_tag() == right->type_tag() && left->equals(*right);
    }
    return lhs.m_data == rhs.m_data;
}

std::string_view kind_name(Value::Kind kind) noexcept
{
    switch (kind) {
        case Value::Kind::kNull:
            return "null";
        case Value::Kind::kBool:
            return "bool";
        case Value::Kind::kInt:
            return "int";
        case Value::Kind::kFloat:
            return "float";
        case Value::Kind::kString:
            return "string";
        case Value::Kind::kList:
            return "list";
        case Value::Kind::kMap:
            return "map";
        case Value::Kind::kSet:
            return "set";
        case Value::Kind::kPath:
            return "path";
        case Value::Kind::kObject:
            return "object";
    }
    return "unknown";
}

}  // namespace objfmt
