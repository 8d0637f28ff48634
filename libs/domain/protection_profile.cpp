/**
 * @file protection_profile.cpp
 * @brief ProtectionProfile domain type
 */

#include "objfmt/domain.hpp"

#include "fields.hpp"
#include "objfmt/canonical_json.hpp"

#include <utility>
#include <vector>

namespace objfmt::cert {

ProtectionProfile ProtectionProfile::make(std::optional<std::string> name,
                                          std::optional<std::string> link,
                                          std::optional<std::set<std::string>> ids)
{
    if (ids && ids->empty()) {
        ids.reset();
    }
    return ProtectionProfile{.pp_name = detail::sanitize_string(std::move(name)),
                             .pp_link = detail::sanitize_link(std::move(link)),
                             .pp_ids = std::move(ids)};
}

Map ProtectionProfile::to_map() const
{
    Value ids;
    if (pp_ids) {
        std::vector<Value> elements(pp_ids->begin(), pp_ids->end());
        // Strings are always hashable
        ids = Value(Set::from_elements(SetKind::kFrozenSet, std::move(elements)).value());
    }
    return Map{
        {"pp_name", detail::optional_value(pp_name)},
        {"pp_link", detail::optional_value(pp_link)},
        { "pp_ids",                   std::move(ids)}
    };
}

Result<ProtectionProfile> ProtectionProfile::from_map(const Map& fields)
{
    const detail::FieldReader reader(fields, kTypeTag);
    if (auto known = reader.expect_only({"pp_name", "pp_link", "pp_ids"}); !known) {
        return std::unexpected(known.error());
    }
    auto name = reader.optional_string("pp_name");
    if (!name) {
        return std::unexpected(name.error());
    }
    auto link = reader.optional_string("pp_link");
    if (!link) {
        return std::unexpected(link.error());
    }
    auto ids = reader.optional_string_collection("pp_ids");
    if (!ids) {
        return std::unexpected(ids.error());
    }

    std::optional<std::set<std::string>> id_set;
    if (*ids) {
        id_set.emplace((*ids)->begin(), (*ids)->end());
    }
    return make(std::move(*name), std::move(*link), std::move(id_set));
}

Result<std::int64_t> ProtectionProfile::identity_hash() const
{
    return canonical::identity_hash_canonical({
        {  "_type", std::string(kTypeTag)},
        {"pp_name", detail::optional_json(pp_name)},
        {"pp_link", detail::optional_json(pp_link)}
    });
}

}  // namespace objfmt::cert
