#pragma once

/**
 * @file storage_check.hpp
 * @brief Structural check of Storage documents
 */

#include "objfmt/common.hpp"

#include <nlohmann/json.hpp>

namespace objfmt {

/**
 * Check that a document is a well-formed Storage document.
 *
 * Mirrors schemas/storage_doc.v1.schema.json: no mapping key contains '.',
 * "set"/"frozenset" mappings carry an array "_value", "Path" mappings carry
 * a string "_value" and "_hash" fields are integers.
 *
 * @return Empty on success, otherwise the first violation in document order
 *         (errc::kReservedCharacter, errc::kMalformedTag or errc::kInvalidNumber)
 */
[[nodiscard]] VoidResult check_storage_document(const nlohmann::json& document);

}  // namespace objfmt
