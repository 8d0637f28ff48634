/**
 * @file fields.cpp
 * @brief Field sanitization and typed field access shared by the domain types
 */

#include "fields.hpp"

#include <algorithm>
#include <charconv>
#include <format>

namespace objfmt::cert::detail {

namespace {

[[nodiscard]] bool is_space(char c) noexcept
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

[[nodiscard]] std::string trim(std::string_view text)
{
    auto first = std::ranges::find_if_not(text, is_space);
    auto last = std::find_if_not(text.rbegin(), text.rend(), is_space).base();
    if (first >= last) {
        return {};
    }
    return std::string(first, last);
}

template <typename T>
[[nodiscard]] bool parse_number(std::string_view text, T& out)
{
    if (text.empty() || !std::ranges::all_of(text, [](char c) { return c >= '0' && c <= '9'; })) {
        return false;
    }
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc{} && ptr == text.data() + text.size();
}

}  // namespace

std::optional<std::string> sanitize_string(std::optional<std::string> text)
{
    if (!text) {
        return std::nullopt;
    }
    std::string collapsed;
    collapsed.reserve(text->size());
    bool in_space = false;
    for (char c : trim(*text)) {
        if (is_space(c)) {
            in_space = true;
            continue;
        }
        if (in_space) {
            collapsed.push_back(' ');
            in_space = false;
        }
        collapsed.push_back(c);
    }
    return collapsed;
}

std::optional<std::string> sanitize_link(std::optional<std::string> link)
{
    if (!link) {
        return std::nullopt;
    }
    std::string trimmed = trim(*link);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    return trimmed;
}

std::optional<std::chrono::year_month_day> parse_date(std::string_view text)
{
    // YYYY-MM-DD
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }
    int year = 0;
    unsigned month = 0;
    unsigned day = 0;
    if (!parse_number(text.substr(0, 4), year) || !parse_number(text.substr(5, 2), month)
        || !parse_number(text.substr(8, 2), day)) {
        return std::nullopt;
    }
    const std::chrono::year_month_day date{std::chrono::year{year},
                                           std::chrono::month{month},
                                           std::chrono::day{day}};
    if (!date.ok()) {
        return std::nullopt;
    }
    return date;
}

std::string format_date(const std::chrono::year_month_day& date)
{
    return std::format("{:04}-{:02}-{:02}",
                       static_cast<int>(date.year()),
                       static_cast<unsigned>(date.month()),
                       static_cast<unsigned>(date.day()));
}

Value optional_value(const std::optional<std::string>& text)
{
    return text ? Value(*text) : Value();
}

nlohmann::json optional_json(const std::optional<std::string>& text)
{
    return text ? nlohmann::json(*text) : nlohmann::json(nullptr);
}

// ============================================================================
// FieldReader
// ============================================================================

VoidResult FieldReader::expect_only(std::initializer_list<std::string_view> names) const
{
    for (const auto& [key, _] : m_fields) {
        const bool known = !key.is_symbol() && std::ranges::find(names, key.text()) != names.end();
        if (!known) {
            return make_error(errc::kDecodeError,
                              std::format("{}: unexpected field '{}'", m_type_tag, key.text()));
        }
    }
    return {};
}

Result<const Value*> FieldReader::require(std::string_view name) const
{
    const Value* value = m_fields.find(name);
    if (value == nullptr) {
        return make_error(errc::kDecodeError,
                          std::format("{}: missing field '{}'", m_type_tag, name));
    }
    return value;
}

std::unexpected<Error> FieldReader::mistyped(std::string_view name,
                                             std::string_view expected,
                                             const Value& actual) const
{
    return make_error(errc::kDecodeError,
                      std::format("{}: field '{}' must be {}, got {}",
                                  m_type_tag,
                                  name,
                                  expected,
                                  kind_name(actual.kind())));
}

Result<std::string> FieldReader::string(std::string_view name) const
{
    auto value = require(name);
    if (!value) {
        return std::unexpected(value.error());
    }
    const std::string* text = (*value)->as_string();
    if (text == nullptr) {
        return mistyped(name, "a string", **value);
    }
    return *text;
}

Result<std::optional<std::string>> FieldReader::optional_string(std::string_view name) const
{
    auto value = require(name);
    if (!value) {
        return std::unexpected(value.error());
    }
    if ((*value)->is_null()) {
        return std::optional<std::string>();
    }
    const std::string* text = (*value)->as_string();
    if (text == nullptr) {
        return mistyped(name, "a string or null", **value);
    }
    return std::optional<std::string>(*text);
}

Result<std::optional<std::vector<std::string>>>
FieldReader::optional_string_collection(std::string_view name) const
{
    auto value = require(name);
    if (!value) {
        return std::unexpected(value.error());
    }
    const Value& field = **value;
    if (field.is_null()) {
        return std::optional<std::vector<std::string>>();
    }

    std::vector<std::string> items;
    auto collect = [&](const auto& elements) -> VoidResult {
        for (const auto& element : elements) {
            const std::string* text = element.as_string();
            if (text == nullptr) {
                return mistyped(name, "a collection of strings", element);
            }
            items.push_back(*text);
        }
        return {};
    };

    VoidResult collected;
    if (const Set* set = field.as_set()) {
        collected = collect(*set);
    } else if (const List* list = field.as_list()) {
        collected = collect(*list);
    } else {
        return mistyped(name, "a set of strings or null", field);
    }
    if (!collected) {
        return std::unexpected(collected.error());
    }
    return std::optional<std::vector<std::string>>(std::move(items));
}

Result<std::optional<std::chrono::year_month_day>>
FieldReader::optional_date(std::string_view name) const
{
    auto text = optional_string(name);
    if (!text) {
        return std::unexpected(text.error());
    }
    if (!*text) {
        return std::optional<std::chrono::year_month_day>();
    }
    const std::string trimmed = trim(**text);
    if (trimmed.empty()) {
        return std::optional<std::chrono::year_month_day>();
    }
    auto date = parse_date(trimmed);
    if (!date) {
        return make_error(errc::kDecodeError,
                          std::format("{}: field '{}' is not a YYYY-MM-DD date: '{}'",
                                      m_type_tag,
                                      name,
                                      trimmed));
    }
    return date;
}

}  // namespace objfmt::cert::detail
