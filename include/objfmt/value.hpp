#pragma once

/**
 * @file value.hpp
 * @brief Recursive document value shared by the Working, Raw and Object stages
 *
 * A Value is one of: null, bool, int, float, string, list, map, set, path or
 * domain object. The stages differ only in which kinds they permit; see
 * formats.hpp for the conversions between them.
 */

#include "objfmt/common.hpp"

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace objfmt {

class Value;

using List = std::vector<Value>;

/**
 * @brief Sentinel mapping key produced by diff/patch machinery
 */
struct Symbol
{
    std::string label;

    friend bool operator==(const Symbol&, const Symbol&) = default;
};

/**
 * @brief Mapping key: a string or a Symbol
 */
class Key
{
public:
    Key(std::string text)
        : m_repr(std::move(text))
    {}
    Key(std::string_view text)
        : m_repr(std::string(text))
    {}
    Key(const char* text)
        : m_repr(std::string(text))
    {}
    Key(Symbol symbol)
        : m_repr(std::move(symbol))
    {}

    [[nodiscard]] bool is_symbol() const noexcept { return std::holds_alternative<Symbol>(m_repr); }

    /// The key string, or the label of a symbol key
    [[nodiscard]] const std::string& text() const noexcept
    {
        if (const auto* symbol = std::get_if<Symbol>(&m_repr)) {
            return symbol->label;
        }
        return std::get<std::string>(m_repr);
    }

    /// True for a string key equal to name (never for a symbol)
    [[nodiscard]] bool is(std::string_view name) const noexcept
    {
        const auto* text = std::get_if<std::string>(&m_repr);
        return text != nullptr && *text == name;
    }

    friend bool operator==(const Key&, const Key&) = default;

private:
    std::variant<std::string, Symbol> m_repr;
};

/**
 * @brief Insertion-ordered mapping from Key to Value
 *
 * A hash-bearing map carries a precomputed identity hash in its integer
 * "_hash" field and may therefore be placed in a Set.
 */
class Map
{
public:
    using Entry = std::pair<Key, Value>;
    using const_iterator = std::vector<Entry>::const_iterator;

    Map() = default;
    Map(std::initializer_list<Entry> entries);

    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] bool empty() const noexcept;
    [[nodiscard]] const_iterator begin() const noexcept;
    [[nodiscard]] const_iterator end() const noexcept;

    [[nodiscard]] const Value* find(const Key& key) const noexcept;
    [[nodiscard]] const Value* find(std::string_view key) const noexcept;
    [[nodiscard]] const Value* find(const char* key) const noexcept
    {
        return find(std::string_view(key));
    }
    [[nodiscard]] bool contains(std::string_view key) const noexcept;

    /// Insert a new key at the end, or replace the value of an existing key in place
    void insert_or_assign(Key key, Value value);

    /// Remove a string key. Returns true if it was present.
    bool erase(std::string_view key);

    [[nodiscard]] bool hash_bearing() const noexcept { return m_hash_bearing; }
    void set_hash_bearing(bool hash_bearing) noexcept { m_hash_bearing = hash_bearing; }

    /// Equality ignores entry order and the hash-bearing flag
    friend bool operator==(const Map& lhs, const Map& rhs);

private:
    std::vector<Entry> m_entries;
    bool m_hash_bearing = false;
};

enum class SetKind {
    kSet,
    kFrozenSet
};

/**
 * @brief Unordered collection of unique hashable values
 *
 * Elements keep their insertion order so that conversions emit them in a
 * stable order. A frozenset cannot be modified once built.
 */
class Set
{
public:
    using const_iterator = std::vector<Value>::const_iterator;

    explicit Set(SetKind kind = SetKind::kSet) noexcept
        : m_kind(kind)
    {}

    /**
     * Build a set from elements, collapsing duplicates by equality.
     * @return The set, or errc::kUnhashable if an element has no identity hash
     */
    [[nodiscard]] static Result<Set> from_elements(SetKind kind, std::vector<Value> elements);

    /**
     * Insert into a mutable set.
     * @return true if inserted, false if an equal element was present;
     *         errc::kImmutableSet for a frozenset, errc::kUnhashable for an unhashable element
     */
    [[nodiscard]] Result<bool> insert(Value element);

    /// Membership test; an unhashable value is never a member
    [[nodiscard]] bool contains(const Value& element) const;

    [[nodiscard]] SetKind kind() const noexcept { return m_kind; }
    [[nodiscard]] bool frozen() const noexcept { return m_kind == SetKind::kFrozenSet; }
    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] bool empty() const noexcept;
    [[nodiscard]] const_iterator begin() const noexcept;
    [[nodiscard]] const_iterator end() const noexcept;

    friend bool operator==(const Set& lhs, const Set& rhs);

private:
    [[nodiscard]] Result<bool> add(Value element);
    [[nodiscard]] bool contains_hashed(const Value& element, std::int64_t hash) const;

    SetKind m_kind;
    std::vector<Value> m_items;
    std::vector<std::int64_t> m_hashes;
};

/**
 * @brief Filesystem path value
 *
 * Normalized on construction: repeated separators collapse, "." segments
 * are dropped, a trailing separator is removed and the empty path becomes ".".
 * ".." segments are kept as written.
 */
class PathValue
{
public:
    explicit PathValue(std::string_view text);

    [[nodiscard]] const std::string& str() const noexcept { return m_text; }

    friend bool operator==(const PathValue&, const PathValue&) = default;

private:
    std::string m_text;
};

/**
 * @brief Type-erased immutable domain instance
 *
 * Concrete instances are created through make_object() (registry.hpp).
 */
class ComplexObject
{
public:
    virtual ~ComplexObject() = default;

    [[nodiscard]] virtual std::string_view type_tag() const noexcept = 0;
    [[nodiscard]] virtual bool equals(const ComplexObject& other) const = 0;

    /// Identity hash, or an error with code errc::kUnhashable
    [[nodiscard]] virtual Result<std::int64_t> identity_hash() const = 0;
};

using ObjectPtr = std::shared_ptr<const ComplexObject>;

class Value
{
public:
    /// Order matches the alternatives of the underlying variant
    enum class Kind {
        kNull,
        kBool,
        kInt,
        kFloat,
        kString,
        kList,
        kMap,
        kSet,
        kPath,
        kObject
    };

    Value() noexcept = default;
    Value(std::nullptr_t) noexcept {}
    Value(bool value) noexcept
        : m_data(value)
    {}
    template <std::integral T>
        requires(!std::same_as<T, bool>)
    Value(T value) noexcept
        : m_data(static_cast<std::int64_t>(value))
    {}
    Value(double value) noexcept
        : m_data(value)
    {}
    Value(const char* value)
        : m_data(std::string(value))
    {}
    Value(std::string_view value)
        : m_data(std::string(value))
    {}
    Value(std::string value)
        : m_data(std::move(value))
    {}
    Value(List value)
        : m_data(std::move(value))
    {}
    Value(Map value)
        : m_data(std::move(value))
    {}
    Value(Set value)
        : m_data(std::move(value))
    {}
    Value(PathValue value)
        : m_data(std::move(value))
    {}
    Value(ObjectPtr value)
        : m_data(std::move(value))
    {}

    [[nodiscard]] Kind kind() const noexcept { return static_cast<Kind>(m_data.index()); }
    [[nodiscard]] bool is_null() const noexcept { return kind() == Kind::kNull; }

    [[nodiscard]] const bool* as_bool() const noexcept { return std::get_if<bool>(&m_data); }
    [[nodiscard]] const std::int64_t* as_int() const noexcept
    {
        return std::get_if<std::int64_t>(&m_data);
    }
    [[nodiscard]] const double* as_float() const noexcept { return std::get_if<double>(&m_data); }
    [[nodiscard]] const std::string* as_string() const noexcept
    {
        return std::get_if<std::string>(&m_data);
    }
    [[nodiscard]] const List* as_list() const noexcept { return std::get_if<List>(&m_data); }
    [[nodiscard]] const Map* as_map() const noexcept { return std::get_if<Map>(&m_data); }
    [[nodiscard]] const Set* as_set() const noexcept { return std::get_if<Set>(&m_data); }
    [[nodiscard]] const PathValue* as_path() const noexcept
    {
        return std::get_if<PathValue>(&m_data);
    }
    [[nodiscard]] const ObjectPtr* as_object() const noexcept
    {
        return std::get_if<ObjectPtr>(&m_data);
    }

    /**
     * Structural equality. Maps compare regardless of key order, sets by
     * kind and membership, an int equals a float of the same numeric value
     * and domain objects compare through their own equality.
     */
    friend bool operator==(const Value& lhs, const Value& rhs);

private:
    std::variant<std::monostate,
                 bool,
                 std::int64_t,
                 double,
                 std::string,
                 List,
                 Map,
                 Set,
                 PathValue,
                 ObjectPtr>
        m_data;
};

/// Human-readable kind name for diagnostics
[[nodiscard]] std::string_view kind_name(Value::Kind kind) noexcept;

}  // namespace objfmt
