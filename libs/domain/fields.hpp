#pragma once

/**
 * @file fields.hpp
 * @brief Field sanitization and typed field access shared by the domain types
 */

#include "objfmt/common.hpp"
#include "objfmt/value.hpp"

#include <chrono>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace objfmt::cert::detail {

/// Trim and collapse whitespace runs to a single space; null stays null
[[nodiscard]] std::optional<std::string> sanitize_string(std::optional<std::string> text);

/// Trim; an empty link becomes null
[[nodiscard]] std::optional<std::string> sanitize_link(std::optional<std::string> link);

/// Parse "YYYY-MM-DD" into a valid calendar date
[[nodiscard]] std::optional<std::chrono::year_month_day> parse_date(std::string_view text);
[[nodiscard]] std::string format_date(const std::chrono::year_month_day& date);

[[nodiscard]] Value optional_value(const std::optional<std::string>& text);
[[nodiscard]] nlohmann::json optional_json(const std::optional<std::string>& text);

/**
 * @brief Typed reader over the decoded fields of one domain type
 *
 * Every failure is reported as errc::kDecodeError naming the type and field.
 */
class FieldReader
{
public:
    FieldReader(const Map& fields, std::string_view type_tag)
        : m_fields(fields)
        , m_type_tag(type_tag)
    {}

    /// Reject fields not in the given list
    [[nodiscard]] VoidResult expect_only(std::initializer_list<std::string_view> names) const;

    [[nodiscard]] Result<std::string> string(std::string_view name) const;
    [[nodiscard]] Result<std::optional<std::string>> optional_string(std::string_view name) const;

    /// A set, frozenset or list of strings, or null
    [[nodiscard]] Result<std::optional<std::vector<std::string>>>
    optional_string_collection(std::string_view name) const;

    [[nodiscard]] Result<std::optional<std::chrono::year_month_day>>
    optional_date(std::string_view name) const;

private:
    [[nodiscard]] Result<const Value*> require(std::string_view name) const;
    [[nodiscard]] std::unexpected<Error> mistyped(std::string_view name,
                                                  std::string_view expected,
                                                  const Value& actual) const;

    const Map& m_fields;
    std::string_view m_type_tag;
};

}  // namespace objfmt::cert::detail
