/**
 * @file maintenance_report.cpp
 * @brief MaintenanceReport domain type
 */

#include "objfmt/domain.hpp"

#include "fields.hpp"
#include "objfmt/canonical_json.hpp"

#include <utility>

namespace objfmt::cert {

namespace {

[[nodiscard]] std::optional<std::string>
date_text(const std::optional<std::chrono::year_month_day>& date)
{
    if (!date) {
        return std::nullopt;
    }
    return detail::format_date(*date);
}

}  // namespace

MaintenanceReport MaintenanceReport::make(std::optional<std::chrono::year_month_day> date,
                                          std::optional<std::string> title,
                                          std::optional<std::string> report_link,
                                          std::optional<std::string> st_link)
{
    return MaintenanceReport{.maintenance_date = date,
                             .maintenance_title = detail::sanitize_string(std::move(title)),
                             .maintenance_report_link = detail::sanitize_link(std::move(report_link)),
                             .maintenance_st_link = detail::sanitize_link(std::move(st_link))};
}

Map MaintenanceReport::to_map() const
{
    return Map{
        {       "maintenance_date", detail::optional_value(date_text(maintenance_date))},
        {      "maintenance_title",            detail::optional_value(maintenance_title)},
        {"maintenance_report_link",      detail::optional_value(maintenance_report_link)},
        {    "maintenance_st_link",          detail::optional_value(maintenance_st_link)}
    };
}

Result<MaintenanceReport> MaintenanceReport::from_map(const Map& fields)
{
    const detail::FieldReader reader(fields, kTypeTag);
    if (auto known = reader.expect_only({"maintenance_date",
                                         "maintenance_title",
                                         "maintenance_report_link",
                                         "maintenance_st_link"});
        !known) {
        return std::unexpected(known.error());
    }
    auto date = reader.optional_date("maintenance_date");
    if (!date) {
        return std::unexpected(date.error());
    }
    auto title = reader.optional_string("maintenance_title");
    if (!title) {
        return std::unexpected(title.error());
    }
    auto report_link = reader.optional_string("maintenance_report_link");
    if (!report_link) {
        return std::unexpected(report_link.error());
    }
    auto st_link = reader.optional_string("maintenance_st_link");
    if (!st_link) {
        return std::unexpected(st_link.error());
    }
    return make(*date, std::move(*title), std::move(*report_link), std::move(*st_link));
}

Result<std::int64_t> MaintenanceReport::identity_hash() const
{
    return canonical::identity_hash_canonical({
        {                  "_type",                      std::string(kTypeTag)},
        {       "maintenance_date", detail::optional_json(date_text(maintenance_date))},
        {      "maintenance_title",            detail::optional_json(maintenance_title)},
        {"maintenance_report_link",      detail::optional_json(maintenance_report_link)},
        {    "maintenance_st_link",          detail::optional_json(maintenance_st_link)}
    });
}

}  // namespace objfmt::cert
