#pragma once

/**
 * @file schema_validate.hpp
 * @brief JSON Schema validation utilities
 */

#include "objfmt/common.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace objfmt::common {

/**
 * Validate JSON against a JSON Schema file.
 *
 * "$defs" sections and "#/$defs/..." references are accepted alongside the
 * draft-07 "definitions" spelling.
 *
 * @param j JSON document to validate
 * @param schema_path Path to JSON Schema file
 * @return Empty on success, error on failure
 */
[[nodiscard]] objfmt::VoidResult validate_json(const nlohmann::json& j,
                                               const std::string& schema_path);

}  // namespace objfmt::common
