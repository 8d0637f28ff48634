#pragma once

/**
 * @file common.hpp
 * @brief Common utilities: error model, error codes, SHA-256 digests
 */

#include <array>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace objfmt {

/**
 * @brief Error information for Result types
 */
struct Error
{
    std::string code;     ///< Machine-readable error code
    std::string message;  ///< Human-readable error message

    [[nodiscard]] static Error make(std::string code, std::string message)
    {
        return Error{.code = std::move(code), .message = std::move(message)};
    }
};

/**
 * @brief Result type using std::expected (C++23)
 * @tparam T Success value type
 */
template <typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Result type for void success using std::expected (C++23)
 */
using VoidResult = std::expected<void, Error>;

/**
 * Error codes shared by the conversion pipeline.
 *
 * Naming convention: kPascalCase for constants (Google C++ Style Guide)
 */
namespace errc {

/// A value without an identity hash was required to be hashable.
inline constexpr std::string_view kUnhashable = "Unhashable";
/// A tagged mapping is missing a reserved field or carries one of the wrong type.
inline constexpr std::string_view kMalformedTag = "MalformedTag";
/// Two different descriptors were registered under one tag.
inline constexpr std::string_view kTagConflict = "TagConflict";
/// A descriptor lacks its tag or its encode/decode functions.
inline constexpr std::string_view kInvalidDescriptor = "InvalidDescriptor";
/// A domain instance has no descriptor in the registry.
inline constexpr std::string_view kUnknownType = "UnknownType";
/// A descriptor could not rebuild an instance from its fields.
inline constexpr std::string_view kDecodeError = "DecodeError";
/// A value kind is not permitted at the stage being converted.
inline constexpr std::string_view kStageViolation = "StageViolation";
/// A mapping key contains the reserved dot substitute, or two keys share one stored key.
inline constexpr std::string_view kReservedCharacter = "ReservedCharacter";
inline constexpr std::string_view kInvalidNumber = "InvalidNumber";
inline constexpr std::string_view kIntegerOverflow = "IntegerOverflow";
inline constexpr std::string_view kImmutableSet = "ImmutableSet";
/// A string is not valid UTF-8 and cannot be serialized.
inline constexpr std::string_view kInvalidUtf8 = "InvalidUtf8";

// Schema validation and file I/O
inline constexpr std::string_view kSchemaFileOpenFailed = "SchemaFileOpenFailed";
inline constexpr std::string_view kSchemaParseFailed = "SchemaParseFailed";
inline constexpr std::string_view kSchemaBuildFailed = "SchemaBuildFailed";
inline constexpr std::string_view kSchemaValidationFailed = "SchemaValidationFailed";
inline constexpr std::string_view kFileOpenFailed = "FileOpenFailed";
inline constexpr std::string_view kJsonParseFailed = "JsonParseFailed";

// Command-line parsing
inline constexpr std::string_view kMissingArgument = "MissingArgument";
inline constexpr std::string_view kInvalidArgument = "InvalidArgument";

}  // namespace errc

/**
 * @brief Build an unexpected Result from an error code and message
 */
[[nodiscard]] inline std::unexpected<Error> make_error(std::string_view code, std::string message)
{
    return std::unexpected(Error::make(std::string(code), std::move(message)));
}

}  // namespace objfmt

namespace objfmt::common {

// ============================================================================
// SHA-256 Hash
// ============================================================================

using Sha256Digest = std::array<std::uint8_t, 32>;

/**
 * Incremental SHA-256 hasher
 */
class Sha256
{
public:
    Sha256() noexcept;

    void update(std::string_view data) noexcept;

    /**
     * Finish the computation. The hasher must not be updated afterwards.
     */
    [[nodiscard]] Sha256Digest finish() noexcept;

private:
    void compress(const std::uint8_t* block) noexcept;

    std::array<std::uint32_t, 8> m_state;
    std::array<std::uint8_t, 64> m_buffer{};
    std::size_t m_buffered = 0;
    std::uint64_t m_total_bytes = 0;
};

/**
 * Compute SHA-256 hash of data
 * @param data Input bytes
 * @return Hex-encoded hash string (64 characters)
 */
[[nodiscard]] std::string sha256(std::string_view data);

/**
 * Compute SHA-256 hash of data with prefix
 * @param data Input bytes
 * @return "sha256:" + hex-encoded hash
 */
[[nodiscard]] std::string sha256_prefixed(std::string_view data);

/**
 * Fold a SHA-256 digest of data into a signed 64-bit identity hash
 * (first eight digest bytes, big-endian).
 */
[[nodiscard]] std::int64_t sha256_int64(std::string_view data);

}  // namespace objfmt::common
