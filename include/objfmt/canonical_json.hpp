#pragma once

/**
 * @file canonical_json.hpp
 * @brief Canonical JSON serialization for deterministic hashing and output
 *
 * Rules:
 * - UTF-8 encoding (invalid sequences are an error)
 * - Object keys in lexicographic order
 * - No whitespace (minimal representation)
 * - Finite numbers only
 */

#include "objfmt/common.hpp"

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace objfmt::canonical {

/**
 * Serialize JSON to canonical form
 * @param j JSON value
 * @return Canonical byte string or error
 */
[[nodiscard]] objfmt::Result<std::string> canonicalize(const nlohmann::json& j);

/**
 * Compute SHA-256 hash of canonical JSON
 * @param j JSON value
 * @return "sha256:" + hex hash or error
 */
[[nodiscard]] objfmt::Result<std::string> hash_canonical(const nlohmann::json& j);

/**
 * Compute a 64-bit identity hash of canonical JSON, suitable for "_hash"
 * @param j JSON value
 * @return Signed hash or error
 */
[[nodiscard]] objfmt::Result<std::int64_t> identity_hash_canonical(const nlohmann::json& j);

}  // namespace objfmt::canonical
