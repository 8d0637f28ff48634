/**
 * @file canonical_json.cpp
 * @brief Canonical JSON serialization
 */

#include "objfmt/canonical_json.hpp"

#include "objfmt/common.hpp"

#include <cmath>
#include <exception>
#include <format>

namespace objfmt::canonical {

namespace {

objfmt::VoidResult validate_finite(const nlohmann::json& j, std::string_view path)
{
    if (j.is_number_float() && !std::isfinite(j.get<double>())) {
        return make_error(errc::kInvalidNumber,
                          std::format("Non-finite number not allowed in canonical JSON at: {}", path));
    }
    if (j.is_object()) {
        for (const auto& [key, val] : j.items()) {
            if (auto result = validate_finite(val, std::string(path) + "." + key); !result) {
                return result;
            }
        }
    } else if (j.is_array()) {
        std::size_t index = 0;
        for (const auto& elem : j) {
            if (auto result = validate_finite(elem, std::format("{}[{}]", path, index)); !result) {
                return result;
            }
            ++index;
        }
    }
    return {};
}

}  // namespace

objfmt::Result<std::string> canonicalize(const nlohmann::json& j)
{
    if (auto result = validate_finite(j, "$"); !result) {
        return std::unexpected(result.error());
    }

    // nlohmann::json objects are std::map backed, so dump() already emits sorted keys
    try {
        return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::strict);
    } catch (const std::exception& ex) {
        return make_error(errc::kInvalidUtf8,
                          std::string("Failed to serialize canonical JSON: ") + ex.what());
    }
}

objfmt::Result<std::string> hash_canonical(const nlohmann::json& j)
{
    auto canonical = canonicalize(j);
    if (!canonical) {
        return std::unexpected(canonical.error());
    }
    return common::sha256_prefixed(*canonical);
}

objfmt::Result<std::int64_t> identity_hash_canonical(const nlohmann::json& j)
{
    auto canonical = canonicalize(j);
    if (!canonical) {
        return std::unexpected(canonical.error());
    }
    return common::sha256_int64(*canonical);
}

}  // namespace objfmt::canonical
