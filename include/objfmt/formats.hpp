#pragma once

/**
 * @file formats.hpp
 * @brief The four document stages and the conversions between them
 *
 *   Storage  <-->  Working  <-->  Raw  <-->  Object
 *
 * - Storage: nlohmann::json as written to the document database. No sets, no
 *   '.' in keys, sets and paths as tagged mappings {"_type", "_value"}.
 * - Working: Value with sets and dotted keys; paths and domain objects stay
 *   tagged mappings.
 * - Raw: Working plus native path values; set elements are hashable, mappings
 *   carrying "_hash" are hash-bearing.
 * - Object: Raw plus domain instances resolved through a TypeRegistry.
 *
 * No conversion mutates its input; each builds a new tree. Errors name the
 * JSON path of the offending node.
 */

#include "objfmt/common.hpp"
#include "objfmt/registry.hpp"
#include "objfmt/value.hpp"

#include <nlohmann/json.hpp>

namespace objfmt {

class WorkingFormat;
class RawFormat;
class ObjFormat;

class StorageFormat
{
public:
    explicit StorageFormat(nlohmann::json document);

    [[nodiscard]] const nlohmann::json& get() const noexcept { return m_document; }

    /**
     * @brief Add sets back and restore dots in keys
     *
     * Set elements must be hashable once converted. A tagged mapping, Path
     * included, is hashable only when it carries an integer "_hash"; Raw to
     * Working attaches one to every path, so stored paths inside sets carry it.
     * @return Working document; errc::kMalformedTag for a set mapping without
     *         an array "_value" or a non-integer "_hash", errc::kUnhashable for
     *         an unhashable set element, errc::kIntegerOverflow for unsigned
     *         integers beyond int64
     */
    [[nodiscard]] Result<WorkingFormat> to_working_format() const;

    /**
     * @brief Plain JSON rendering for export
     *
     * Sets become arrays, paths become strings, dots are restored and "_hash"
     * fields are dropped. The result is not meant to be read back.
     */
    [[nodiscard]] Result<nlohmann::json> to_json_mapping() const;

private:
    nlohmann::json m_document;
};

class WorkingFormat
{
public:
    explicit WorkingFormat(Value document);

    [[nodiscard]] const Value& get() const noexcept { return m_document; }

    /**
     * @brief Remove sets and dots in keys
     *
     * Symbol keys are written as "__<label>__" and are not turned back into
     * symbols by to_working_format().
     * @return Storage document; errc::kReservedCharacter for a key already
     *         containing the dot substitute, errc::kStageViolation for path
     *         values or domain objects, errc::kInvalidNumber for NaN/infinity
     */
    [[nodiscard]] Result<StorageFormat> to_storage_format() const;

    /**
     * @brief Materialize tagged "Path" mappings as path values
     */
    [[nodiscard]] Result<RawFormat> to_raw_format() const;

private:
    Value m_document;
};

class RawFormat
{
public:
    explicit RawFormat(Value document);

    [[nodiscard]] const Value& get() const noexcept { return m_document; }

    /**
     * @brief Turn path values back into hash-bearing tagged mappings
     *
     * Paths become {"_type": "Path", "_value": text, "_hash": identity hash};
     * mappings carrying "_hash" are marked hash-bearing.
     */
    [[nodiscard]] Result<WorkingFormat> to_working_format() const;

    /**
     * @brief Resolve tagged mappings of registered types into domain instances
     *
     * Resolution is bottom-up. Mappings with unknown tags are kept as plain
     * mappings.
     * @return Object document; the descriptor's decode error if a registered
     *         type rejects its fields
     */
    [[nodiscard]] Result<ObjFormat> to_obj_format(const TypeRegistry& registry) const;

private:
    Value m_document;
};

class ObjFormat
{
public:
    explicit ObjFormat(Value document);

    [[nodiscard]] const Value& get() const noexcept { return m_document; }

    /**
     * @brief Encode domain instances as tagged mappings
     *
     * "_hash" is attached when the instance has an identity hash and omitted
     * when it reports errc::kUnhashable.
     * @return Raw document; errc::kUnknownType for an instance whose tag is
     *         not registered
     */
    [[nodiscard]] Result<RawFormat> to_raw_format(const TypeRegistry& registry) const;

private:
    Value m_document;
};

/**
 * Read a stored document for application use (Storage -> Working).
 */
[[nodiscard]] Result<Value> load(const nlohmann::json& document);

/**
 * Prepare an application document for persistence (Working -> Storage).
 */
[[nodiscard]] Result<nlohmann::json> store(const Value& document);

/**
 * Read a stored document with domain instances resolved
 * (Storage -> Working -> Raw -> Object).
 */
[[nodiscard]] Result<Value> materialize(const nlohmann::json& document,
                                        const TypeRegistry& registry);

/**
 * Prepare an Object-stage document for persistence
 * (Object -> Raw -> Working -> Storage).
 */
[[nodiscard]] Result<nlohmann::json> dematerialize(const Value& document,
                                                   const TypeRegistry& registry);

}  // namespace objfmt
