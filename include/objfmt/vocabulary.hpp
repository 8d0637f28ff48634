#pragma once

/**
 * @file vocabulary.hpp
 * @brief Reserved keys, type tags and the dot substitute shared by every stage
 *
 * These names are reserved at every stage boundary and must not be used as
 * ordinary application field names.
 */

#include <string_view>

namespace objfmt::vocab {

/// Key naming the extended kind encoded by a tagged mapping
inline constexpr std::string_view kTypeKey = "_type";
/// Key holding the payload of a set or path tagged mapping
inline constexpr std::string_view kValueKey = "_value";
/// Key holding a precomputed identity hash
inline constexpr std::string_view kHashKey = "_hash";

inline constexpr std::string_view kSetTag = "set";
inline constexpr std::string_view kFrozenSetTag = "frozenset";
inline constexpr std::string_view kPathTag = "Path";

/// U+FF0E FULLWIDTH FULL STOP (UTF-8), stands in for '.' in stored keys
inline constexpr std::string_view kDotSubstitute = "\xEF\xBC\x8E";

}  // namespace objfmt::vocab
