/**
 * @file schema_validate.cpp
 * @brief JSON Schema validation using valijson
 */

#include "objfmt/schema_validate.hpp"

#include <cstddef>
#include <format>
#include <fstream>
#include <string_view>

#include <valijson/adapters/nlohmann_json_adapter.hpp>
#include <valijson/schema.hpp>
#include <valijson/schema_parser.hpp>
#include <valijson/validator.hpp>

namespace objfmt::common {

namespace {

constexpr std::string_view kDefsKey = "$defs";
constexpr std::string_view kDefinitionsKey = "definitions";
constexpr std::string_view kDefsRefPrefix = "#/$defs/";

/// Nested anyOf branches report one error each; keep the report readable
constexpr std::size_t kMaxReportedErrors = 8;

/**
 * @brief Point "#/$defs/x" references at "#/definitions/x"
 */
void rewrite_defs_refs(nlohmann::json& node)
{
    if (node.is_array()) {
        for (auto& element : node) {
            rewrite_defs_refs(element);
        }
        return;
    }
    if (!node.is_object()) {
        return;
    }
    for (auto& [key, child] : node.items()) {
        if (key == "$ref" && child.is_string()) {
            const auto& ref = child.get_ref<const std::string&>();
            if (ref.starts_with(kDefsRefPrefix)) {
                child = std::format("#/{}/{}", kDefinitionsKey, ref.substr(kDefsRefPrefix.size()));
            }
            continue;
        }
        rewrite_defs_refs(child);
    }
}

/**
 * @brief Load a schema file, moving a root "$defs" block to the draft-07
 *        "definitions" location valijson resolves
 */
[[nodiscard]] objfmt::Result<nlohmann::json> load_schema(const std::string& schema_path)
{
    std::ifstream in(schema_path);
    if (!in) {
        return make_error(errc::kSchemaFileOpenFailed, "Failed to open schema file: " + schema_path);
    }

    nlohmann::json schema;
    try {
        in >> schema;
    } catch (const nlohmann::json::exception& ex) {
        return make_error(errc::kSchemaParseFailed,
                          std::format("Failed to parse schema {}: {}", schema_path, ex.what()));
    }

    if (schema.is_object() && schema.contains(kDefsKey) && !schema.contains(kDefinitionsKey)) {
        schema[std::string(kDefinitionsKey)] = std::move(schema[std::string(kDefsKey)]);
        schema.erase(std::string(kDefsKey));
    }
    rewrite_defs_refs(schema);
    return schema;
}

[[nodiscard]] std::string describe_errors(valijson::ValidationResults& results)
{
    const std::size_t total = results.numErrors();
    std::string report;
    valijson::ValidationResults::Error error;
    for (std::size_t reported = 0; reported < kMaxReportedErrors && results.popError(error);
         ++reported) {
        std::string location;
        for (const auto& part : error.context) {
            location += part;
        }
        if (!report.empty()) {
            report += '\n';
        }
        report += std::format("{}: {}", location.empty() ? "<root>" : location, error.description);
    }
    if (total > kMaxReportedErrors) {
        report += std::format("\n({} more)", total - kMaxReportedErrors);
    }
    return report.empty() ? std::string("Document does not match the schema") : report;
}

}  // namespace

objfmt::VoidResult validate_json(const nlohmann::json& j, const std::string& schema_path)
{
    auto schema_json = load_schema(schema_path);
    if (!schema_json) {
        return std::unexpected(schema_json.error());
    }

    valijson::Schema schema;
    try {
        valijson::SchemaParser parser;
        valijson::adapters::NlohmannJsonAdapter schema_adapter(*schema_json);
        parser.populateSchema(schema_adapter, schema);
    } catch (const std::exception& ex) {
        return make_error(errc::kSchemaBuildFailed,
                          std::format("Failed to build schema {}: {}", schema_path, ex.what()));
    }

    valijson::Validator validator;
    valijson::ValidationResults results;
    valijson::adapters::NlohmannJsonAdapter document(j);
    if (!validator.validate(schema, document, &results)) {
        return make_error(errc::kSchemaValidationFailed, describe_errors(results));
    }
    return {};
}

}  // namespace objfmt::common
