/**
 * @file fips_algorithm.cpp
 * @brief FIPSAlgorithm domain type
 */

#include "objfmt/domain.hpp"

#include "fields.hpp"

#include <utility>

namespace objfmt::cert {

FIPSAlgorithm FIPSAlgorithm::make(std::string cert_id,
                                  std::optional<std::string> vendor,
                                  std::optional<std::string> implementation,
                                  std::optional<std::string> algorithm_type,
                                  std::optional<std::string> date)
{
    return FIPSAlgorithm{.cert_id = detail::sanitize_string(std::move(cert_id)).value_or(""),
                         .vendor = detail::sanitize_string(std::move(vendor)),
                         .implementation = detail::sanitize_string(std::move(implementation)),
                         .algorithm_type = detail::sanitize_string(std::move(algorithm_type)),
                         .date = detail::sanitize_string(std::move(date))};
}

Map FIPSAlgorithm::to_map() const
{
    return Map{
        {       "cert_id",                               cert_id},
        {        "vendor",         detail::optional_value(vendor)},
        {"implementation", detail::optional_value(implementation)},
        {"algorithm_type", detail::optional_value(algorithm_type)},
        {          "date",           detail::optional_value(date)}
    };
}

Result<FIPSAlgorithm> FIPSAlgorithm::from_map(const Map& fields)
{
    const detail::FieldReader reader(fields, kTypeTag);
    if (auto known =
            reader.expect_only({"cert_id", "vendor", "implementation", "algorithm_type", "date"});
        !known) {
        return std::unexpected(known.error());
    }
    auto cert_id = reader.string("cert_id");
    if (!cert_id) {
        return std::unexpected(cert_id.error());
    }
    auto vendor = reader.optional_string("vendor");
    if (!vendor) {
        return std::unexpected(vendor.error());
    }
    auto implementation = reader.optional_string("implementation");
    if (!implementation) {
        return std::unexpected(implementation.error());
    }
    auto algorithm_type = reader.optional_string("algorithm_type");
    if (!algorithm_type) {
        return std::unexpected(algorithm_type.error());
    }
    auto date = reader.optional_string("date");
    if (!date) {
        return std::unexpected(date.error());
    }
    return make(std::move(*cert_id),
                std::move(*vendor),
                std::move(*implementation),
                std::move(*algorithm_type),
                std::move(*date));
}

}  // namespace objfmt::cert
