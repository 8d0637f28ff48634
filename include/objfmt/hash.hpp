#pragma once

/**
 * @file hash.hpp
 * @brief Identity hashing of document values
 *
 * Identity hashes are stable across processes: they derive from SHA-256 of a
 * type-prefixed encoding rather than from addresses or a seeded hasher, so a
 * "_hash" written to storage stays valid when the document is read back.
 */

#include "objfmt/common.hpp"
#include "objfmt/value.hpp"

#include <cstdint>

namespace objfmt {

/**
 * Compute the identity hash of a value.
 *
 * Hashable kinds: null, bool, int, float, string, path, frozenset of
 * hashables, hash-bearing map (its "_hash" field) and domain objects whose
 * type supplies an identity hash. Numerically equal ints and floats hash
 * equally; frozensets hash independently of element order.
 *
 * @return Hash, or errc::kUnhashable for list, plain map, mutable set and
 *         objects without identity hash; errc::kMalformedTag for a
 *         hash-bearing map whose "_hash" is not an integer
 */
[[nodiscard]] Result<std::int64_t> identity_hash(const Value& value);

/**
 * Check whether identity_hash() would succeed for value.
 */
[[nodiscard]] bool is_hashable(const Value& value);

}  // namespace objfmt
