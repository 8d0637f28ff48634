/**
 * @file main.cpp
 * @brief objfmt CLI entry point
 *
 * Commands:
 *   check     - Validate a Storage document and verify its load/store round trip
 *   export    - Write the plain JSON rendering of a Storage document
 *   resolve   - Resolve domain objects and write the document back to Storage form
 *   types     - List registered domain type tags
 *   version   - Show version information
 */

#include "objfmt/canonical_json.hpp"
#include "objfmt/common.hpp"
#include "objfmt/domain.hpp"
#include "objfmt/formats.hpp"
#include "objfmt/require_cpp23.hpp"
#include "objfmt/schema_validate.hpp"
#include "objfmt/storage_check.hpp"
#include "objfmt/version.hpp"

#include <cstddef>
#include <exception>
#include <filesystem>
#include <fstream>
#include <optional>
#include <print>
#include <ranges>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

void print_version()
{
    std::println("objfmt {} ({})", objfmt::kVersion, objfmt::kBuildId);
    std::println("  storage encoding: {}", objfmt::kStorageEncodingVersion);
}

void print_help()
{
    std::print(R"(objfmt - Document format conversion for the certificate store

Usage: objfmt <command> [options]

Commands:
  check       Validate a Storage document and verify load/store round trip
  export      Write the plain JSON rendering of a Storage document
  resolve     Resolve domain objects and write the Storage document back
  types       List registered domain type tags
  version     Show version information

Global Options:
  --help, -h          Show this help message
  --version, -v       Show version information

Run 'objfmt <command> --help' for command-specific options.
)");
}

void print_check_help()
{
    std::print(R"(Usage: objfmt check [options]

Validate a Storage document against the storage schema, load it, store it
again and verify the result equals the input.

Options:
  --input FILE              Storage document (required)
  --schema-dir DIR          Path to schema directory (default: ./schemas)
  --help, -h                Show this help
)");
}

void print_export_help()
{
    std::print(R"(Usage: objfmt export [options]

Write the plain JSON rendering of a Storage document: sets become arrays,
paths become strings, dots are restored and _hash fields are dropped.

Options:
  --input FILE              Storage document (required)
  --output FILE, -o         Output file (default: stdout)
  --help, -h                Show this help
)");
}

void print_resolve_help()
{
    std::print(R"(Usage: objfmt resolve [options]

Resolve domain objects with the built-in registry, then encode them again
and write the Storage document.

Options:
  --input FILE              Storage document (required)
  --output FILE, -o         Output file (default: stdout)
  --help, -h                Show this help
)");
}

struct CommandOptions
{
    std::string input;
    std::optional<std::string> output;
    std::string schema_dir;
    bool show_help;
};

// CLI parsing signature is stable.
// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
[[nodiscard]] auto read_option_value(std::span<char*> args,
                                     std::size_t index,
                                     std::string_view option) -> objfmt::Result<std::string>
{
    const std::size_t value_index = index + 1;
    if (value_index >= args.size() || args[value_index] == nullptr) {
        return objfmt::make_error(objfmt::errc::kMissingArgument,
                                  std::string("Missing value for option: ") + std::string(option));
    }
    return std::string(args[value_index]);
}

[[nodiscard]] objfmt::Result<CommandOptions> parse_command_args(std::span<char*> args)
{
    CommandOptions options{.input = std::string{},
                           .output = std::nullopt,
                           .schema_dir = "schemas",
                           .show_help = false};
    bool skip_next = false;
    for (auto [i, arg_ptr] : std::views::enumerate(args)) {
        if (skip_next) {
            skip_next = false;
            continue;
        }
        if (arg_ptr == nullptr) {
            continue;
        }
        const auto idx = static_cast<std::size_t>(i);
        std::string_view arg(arg_ptr);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        if (arg == "--input" || arg == "--in") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            options.input = *value;
            skip_next = true;
            continue;
        }
        if (arg == "--output" || arg == "-o") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            options.output = *value;
            skip_next = true;
            continue;
        }
        if (arg == "--schema-dir") {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            options.schema_dir = *value;
            skip_next = true;
            continue;
        }
        return objfmt::make_error(objfmt::errc::kInvalidArgument,
                                  "Unknown option: " + std::string(arg));
    }
    return options;
}

[[nodiscard]] objfmt::Result<nlohmann::json> read_json_file(const std::filesystem::path& path)
{
    std::ifstream in(path);
    if (!in) {
        return objfmt::make_error(objfmt::errc::kFileOpenFailed,
                                  "Failed to open JSON file: " + path.string());
    }
    nlohmann::json payload;
    try {
        in >> payload;
    } catch (const nlohmann::json::exception& ex) {
        return objfmt::make_error(objfmt::errc::kJsonParseFailed,
                                  "Failed to parse JSON file: " + path.string() + ": " + ex.what());
    }
    return payload;
}

/**
 * @brief Write payload in canonical form to a file, or to stdout without one
 */
[[nodiscard]] objfmt::VoidResult write_canonical_json(const std::optional<std::string>& path,
                                                      const nlohmann::json& payload)
{
    auto canonical = objfmt::canonical::canonicalize(payload);
    if (!canonical) {
        return std::unexpected(canonical.error());
    }
    if (!path) {
        std::println("{}", *canonical);
        return {};
    }

    std::ofstream out(*path);
    if (!out) {
        return objfmt::make_error(objfmt::errc::kFileOpenFailed,
                                  "Failed to open output file: " + *path);
    }
    out << *canonical << "\n";
    if (!out) {
        return objfmt::make_error(objfmt::errc::kFileOpenFailed,
                                  "Failed to write output file: " + *path);
    }
    return {};
}

[[nodiscard]] std::size_t count_objects(const objfmt::Value& value)
{
    using Kind = objfmt::Value::Kind;
    std::size_t count = 0;
    switch (value.kind()) {
        case Kind::kObject:
            return 1;
        case Kind::kList:
            for (const auto& element : *value.as_list()) {
                count += count_objects(element);
            }
            break;
        case Kind::kMap:
            for (const auto& [_, child] : *value.as_map()) {
                count += count_objects(child);
            }
            break;
        case Kind::kSet:
            for (const auto& element : *value.as_set()) {
                count += count_objects(element);
            }
            break;
        default:
            break;
    }
    return count;
}

int run_check(const CommandOptions& options)
{
    auto document = read_json_file(options.input);
    if (!document) {
        std::println(stderr, "Error: {}", document.error().message);
        return kExitFailure;
    }

    const auto schema_path =
        (std::filesystem::path(options.schema_dir) / "storage_doc.v1.schema.json").string();
    if (auto valid = objfmt::common::validate_json(*document, schema_path); !valid) {
        std::println(stderr, "Error: schema validation failed: {}", valid.error().message);
        return kExitFailure;
    }
    if (auto checked = objfmt::check_storage_document(*document); !checked) {
        std::println(stderr, "Error: {}: {}", checked.error().code, checked.error().message);
        return kExitFailure;
    }

    auto loaded = objfmt::load(*document);
    if (!loaded) {
        std::println(stderr, "Error: load failed: {}", loaded.error().message);
        return kExitFailure;
    }
    auto stored = objfmt::store(*loaded);
    if (!stored) {
        std::println(stderr, "Error: store failed: {}", stored.error().message);
        return kExitFailure;
    }
    if (*stored != *document) {
        std::println(stderr, "Error: store(load(document)) differs from the input");
        return kExitFailure;
    }

    std::println("OK: {}", options.input);
    return kExitOk;
}

int run_export(const CommandOptions& options)
{
    auto document = read_json_file(options.input);
    if (!document) {
        std::println(stderr, "Error: {}", document.error().message);
        return kExitFailure;
    }
    auto exported = objfmt::StorageFormat(*document).to_json_mapping();
    if (!exported) {
        std::println(stderr, "Error: export failed: {}", exported.error().message);
        return kExitFailure;
    }
    if (auto written = write_canonical_json(options.output, *exported); !written) {
        std::println(stderr, "Error: {}", written.error().message);
        return kExitFailure;
    }
    return kExitOk;
}

int run_resolve(const CommandOptions& options, const objfmt::TypeRegistry& registry)
{
    auto document = read_json_file(options.input);
    if (!document) {
        std::println(stderr, "Error: {}", document.error().message);
        return kExitFailure;
    }
    auto objects = objfmt::materialize(*document, registry);
    if (!objects) {
        std::println(stderr, "Error: resolve failed: {}", objects.error().message);
        return kExitFailure;
    }
    // Progress goes to stderr when the document itself is written to stdout
    if (options.output) {
        std::println("Resolved {} domain object(s)", count_objects(*objects));
    } else {
        std::println(stderr, "Resolved {} domain object(s)", count_objects(*objects));
    }

    auto stored = objfmt::dematerialize(*objects, registry);
    if (!stored) {
        std::println(stderr, "Error: encode failed: {}", stored.error().message);
        return kExitFailure;
    }
    if (auto written = write_canonical_json(options.output, *stored); !written) {
        std::println(stderr, "Error: {}", written.error().message);
        return kExitFailure;
    }
    return kExitOk;
}

int run_types(const objfmt::TypeRegistry& registry)
{
    for (const auto& tag : registry.tags()) {
        std::println("{}", tag);
    }
    return kExitOk;
}

using HelpPrinter = void (*)();

/**
 * @brief Parse options shared by the file commands; non-empty when the caller should exit
 */
[[nodiscard]] std::optional<int> prepare_file_command(std::span<char*> args,
                                                      HelpPrinter print_command_help,
                                                      CommandOptions& options)
{
    auto parsed = parse_command_args(args);
    if (!parsed) {
        std::println(stderr, "Error: {}", parsed.error().message);
        print_command_help();
        return kExitUsage;
    }
    if (parsed->show_help) {
        print_command_help();
        return kExitOk;
    }
    if (parsed->input.empty()) {
        std::println(stderr, "Error: --input is required");
        print_command_help();
        return kExitUsage;
    }
    options = std::move(*parsed);
    return std::nullopt;
}

[[nodiscard]] int run_cli(int argc, char** argv)
{
    try {
        if (argc < 2) {
            print_help();
            return kExitUsage;
        }

        std::string_view cmd = argv[1];

        if (cmd == "--help" || cmd == "-h") {
            print_help();
            return kExitOk;
        }
        if (cmd == "--version" || cmd == "-v" || cmd == "version") {
            print_version();
            return kExitOk;
        }

        // Registered once, before any conversion runs
        auto registry = objfmt::cert::build_builtin_registry();
        if (!registry) {
            std::println(stderr, "Error: {}", registry.error().message);
            return kExitFailure;
        }
        const objfmt::TypeRegistry& types = *registry;

        auto args = std::span<char*>(argv + 2, static_cast<std::size_t>(argc - 2));
        CommandOptions options{};

        if (cmd == "types") {
            return run_types(types);
        }
        if (cmd == "check") {
            if (auto done = prepare_file_command(args, print_check_help, options)) {
                return *done;
            }
            return run_check(options);
        }
        if (cmd == "export") {
            if (auto done = prepare_file_command(args, print_export_help, options)) {
                return *done;
            }
            return run_export(options);
        }
        if (cmd == "resolve") {
            if (auto done = prepare_file_command(args, print_resolve_help, options)) {
                return *done;
            }
            return run_resolve(options, types);
        }

        std::println(stderr, "Unknown command: {}", cmd);
        print_help();
        return kExitUsage;
    } catch (const std::exception& ex) {
        try {
            std::println(stderr, "Error: {}", ex.what());
        } catch (...) {
            std::terminate();
        }
        return kExitFailure;
    }
}

}  // namespace

int main(int argc, char** argv)
{
    return run_cli(argc, argv);
}
