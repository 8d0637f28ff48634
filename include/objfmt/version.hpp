#pragma once

/**
 * @file version.hpp
 * @brief objfmt version information
 *
 * Naming convention: kPascalCase for constants (Google C++ Style Guide)
 */

namespace objfmt {

/// objfmt version string
constexpr const char* kVersion = "0.1.0";

/// Build identifier
constexpr const char* kBuildId = "dev";

/// Version of the storage document encoding (tags, reserved keys, dot substitute)
constexpr const char* kStorageEncodingVersion = "storage_doc.v1";

}  // namespace objfmt
