/**
 * @file facade.cpp
 * @brief load/store and the full Storage <-> Object chains
 */

#include "objfmt/formats.hpp"

#include <utility>

namespace objfmt {

Result<Value> load(const nlohmann::json& document)
{
    auto working = StorageFormat(document).to_working_format();
    if (!working) {
        return std::unexpected(working.error());
    }
    return working->get();
}

Result<nlohmann::json> store(const Value& document)
{
    auto stored = WorkingFormat(document).to_storage_format();
    if (!stored) {
        return std::unexpected(stored.error());
    }
    return stored->get();
}

Result<Value> materialize(const nlohmann::json& document, const TypeRegistry& registry)
{
    auto working = StorageFormat(document).to_working_format();
    if (!working) {
        return std::unexpected(working.error());
    }
    auto raw = working->to_raw_format();
    if (!raw) {
        return std::unexpected(raw.error());
    }
    auto objects = raw->to_obj_format(registry);
    if (!objects) {
        return std::unexpected(objects.error());
    }
    return objects->get();
}

Result<nlohmann::json> dematerialize(const Value& document, const TypeRegistry& registry)
{
    auto raw = ObjFormat(document).to_raw_format(registry);
    if (!raw) {
        return std::unexpected(raw.error());
    }
    auto working = raw->to_working_format();
    if (!working) {
        return std::unexpected(working.error());
    }
    auto stored = working->to_storage_format();
    if (!stored) {
        return std::unexpected(stored.error());
    }
    return stored->get();
}

}  // namespace objfmt
