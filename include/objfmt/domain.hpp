#pragma once

/**
 * @file domain.hpp
 * @brief Built-in certificate domain types resolvable at the Object stage
 *
 * Instances are built through their make() factories, which sanitize the
 * fields once; the stored fields are already normalized. from_map() applies
 * the same sanitization to decoded fields.
 */

#include "objfmt/common.hpp"
#include "objfmt/registry.hpp"
#include "objfmt/value.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace objfmt::cert {

/**
 * @brief Protection profile a certificate claims conformance to
 *
 * Equality and identity hash consider name and link only; pp_ids is
 * informational.
 */
struct ProtectionProfile
{
    static constexpr std::string_view kTypeTag = "ProtectionProfile";

    std::optional<std::string> pp_name;
    std::optional<std::string> pp_link;
    std::optional<std::set<std::string>> pp_ids;  ///< nullopt when no ids are known

    /// Empty pp_ids collapse to nullopt
    [[nodiscard]] static ProtectionProfile make(std::optional<std::string> name,
                                                std::optional<std::string> link = std::nullopt,
                                                std::optional<std::set<std::string>> ids = std::nullopt);

    [[nodiscard]] Map to_map() const;
    [[nodiscard]] static Result<ProtectionProfile> from_map(const Map& fields);
    [[nodiscard]] Result<std::int64_t> identity_hash() const;

    friend bool operator==(const ProtectionProfile& lhs, const ProtectionProfile& rhs)
    {
        return lhs.pp_name == rhs.pp_name && lhs.pp_link == rhs.pp_link;
    }
};

/**
 * @brief Maintenance update of a certified product
 */
struct MaintenanceReport
{
    static constexpr std::string_view kTypeTag = "MaintenanceReport";

    std::optional<std::chrono::year_month_day> maintenance_date;
    std::optional<std::string> maintenance_title;
    std::optional<std::string> maintenance_report_link;
    std::optional<std::string> maintenance_st_link;

    [[nodiscard]] static MaintenanceReport make(std::optional<std::chrono::year_month_day> date,
                                                std::optional<std::string> title,
                                                std::optional<std::string> report_link,
                                                std::optional<std::string> st_link);

    /// maintenance_date is written as "YYYY-MM-DD"
    [[nodiscard]] Map to_map() const;
    [[nodiscard]] static Result<MaintenanceReport> from_map(const Map& fields);
    [[nodiscard]] Result<std::int64_t> identity_hash() const;

    friend bool operator==(const MaintenanceReport&, const MaintenanceReport&) = default;
};

/**
 * @brief Algorithm certificate referenced by a FIPS module
 *
 * Has no identity hash, so it cannot be placed in a set and is stored
 * without "_hash".
 */
struct FIPSAlgorithm
{
    static constexpr std::string_view kTypeTag = "FIPSAlgorithm";

    std::string cert_id;
    std::optional<std::string> vendor;
    std::optional<std::string> implementation;
    std::optional<std::string> algorithm_type;
    std::optional<std::string> date;

    [[nodiscard]] static FIPSAlgorithm make(std::string cert_id,
                                            std::optional<std::string> vendor,
                                            std::optional<std::string> implementation,
                                            std::optional<std::string> algorithm_type,
                                            std::optional<std::string> date);

    [[nodiscard]] Map to_map() const;
    [[nodiscard]] static Result<FIPSAlgorithm> from_map(const Map& fields);

    friend bool operator==(const FIPSAlgorithm&, const FIPSAlgorithm&) = default;
};

/**
 * Build the registry holding every built-in domain type.
 *
 * Called once at startup; the result is meant to be held const.
 * @return Registry, or the registration error (errc::kTagConflict)
 */
[[nodiscard]] Result<TypeRegistry> build_builtin_registry();

}  // namespace objfmt::cert
