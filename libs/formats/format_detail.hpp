#pragma once

/**
 * @file format_detail.hpp
 * @brief Helpers shared by the stage walkers: key escaping, JSON paths, tag lookups
 */

#include "objfmt/common.hpp"
#include "objfmt/value.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace objfmt::formats::detail {

/// Replace every '.' with the dot substitute
[[nodiscard]] std::string escape_dots(std::string_view key);

/// Replace every dot substitute with '.'
[[nodiscard]] std::string restore_dots(std::string_view key);

[[nodiscard]] std::string child_path(std::string_view path, std::string_view key);
[[nodiscard]] std::string index_path(std::string_view path, std::size_t index);

/// Prefix an error message with the JSON path of the node being converted
[[nodiscard]] Error at_path(Error error, std::string_view path);

/// Set kind named by a storage mapping's "_type", if it names one
[[nodiscard]] std::optional<SetKind> stored_set_kind(const nlohmann::json& node);

/// String value of a mapping's "_type", if present and a string
[[nodiscard]] const std::string* type_tag_of(const Map& map);

}  // namespace objfmt::formats::detail
