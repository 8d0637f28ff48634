/**
 * @file test_cli.cpp
 * @brief End-to-end tests running the objfmt command-line tool
 */

#include "objfmt/domain.hpp"
#include "objfmt/formats.hpp"
#include "objfmt/vocabulary.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <sys/wait.h>

namespace objfmt::test {

namespace {

namespace fs = std::filesystem;
using Json = nlohmann::json;

constexpr std::string_view kObjfmtBinary = OBJFMT_TEST_BIN;
constexpr std::string_view kSchemaDir = OBJFMT_SCHEMA_DIR;

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

class TempDir
{
public:
    explicit TempDir(const std::string& name)
        : m_path(fs::temp_directory_path() / name)
    {
        fs::remove_all(m_path);
        fs::create_directories(m_path);
    }

    ~TempDir()
    {
        std::error_code ec;
        fs::remove_all(m_path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;
    TempDir(TempDir&&) = delete;
    TempDir& operator=(TempDir&&) = delete;

    [[nodiscard]] const fs::path& path() const { return m_path; }

private:
    fs::path m_path;
};

[[nodiscard]] std::string quote_arg(std::string_view value)
{
    std::string escaped;
    escaped.reserve(value.size());
    for (char c : value) {
        if (c == '"') {
            escaped.push_back('\\');
        }
        escaped.push_back(c);
    }
    return std::format("\"{}\"", escaped);
}

/**
 * @brief Run objfmt with args, sending stdout to a file; returns the exit status
 */
[[nodiscard]] int run_objfmt(const std::vector<std::string>& args, const fs::path& stdout_file)
{
    std::string command = quote_arg(kObjfmtBinary);
    for (const auto& arg : args) {
        command += ' ';
        command += quote_arg(arg);
    }
    command += std::format(" > {} 2> /dev/null", quote_arg(stdout_file.string()));

    const int status = std::system(command.c_str());
    if (status == -1 || !WIFEXITED(status)) {
        return -1;
    }
    return WEXITSTATUS(status);
}

void write_json(const fs::path& path, const Json& document)
{
    std::ofstream out(path);
    out << document.dump(2);
}

[[nodiscard]] std::string read_text(const fs::path& path)
{
    std::ifstream in(path);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

[[nodiscard]] Json read_json(const fs::path& path)
{
    std::ifstream in(path);
    return Json::parse(in);
}

/// {"a.b": {1, 2}, "p": <path "/x/y">, "title": "x"} in Storage form
[[nodiscard]] Json make_storage_document()
{
    Json document = {
        {"title",                                     "x"},
        {    "p", {{"_type", "Path"}, {"_value", "/x/y"}}}
    };
    document["a" + std::string(vocab::kDotSubstitute) + "b"] = {
        { "_type",                 "set"},
        {"_value", Json::array({1, 2})}
    };
    return document;
}

[[nodiscard]] Json make_certificate_document()
{
    return Json{
        {"protection_profiles",
         {{"_type", "set"},
          {"_value",
           Json::array({{{"_type", "ProtectionProfile"},
                         {"pp_name", "  PP-0084 "},
                         {"pp_link", nullptr},
                         {"pp_ids", nullptr},
                         {"_hash", 1}}})}}},
        {"algorithm",
         {{"_type", "FIPSAlgorithm"},
          {"cert_id", "A1"},
          {"vendor", nullptr},
          {"implementation", nullptr},
          {"algorithm_type", "AES"},
          {"date", nullptr}}}
    };
}

}  // namespace

TEST(CliTest, CheckAcceptsRoundTrippingDocument)
{
    TempDir temp_dir("objfmt_cli_check_ok");
    const auto input = temp_dir.path() / "doc.json";
    const auto out = temp_dir.path() / "stdout.txt";
    write_json(input, make_storage_document());

    ASSERT_EQ(run_objfmt({"check", "--input", input.string(), "--schema-dir", std::string(kSchemaDir)},
                         out),
              kExitOk);
    EXPECT_NE(read_text(out).find("OK: " + input.string()), std::string::npos);
}

TEST(CliTest, CheckRejectsDottedKeys)
{
    TempDir temp_dir("objfmt_cli_check_dotted");
    const auto input = temp_dir.path() / "doc.json";
    const auto out = temp_dir.path() / "stdout.txt";
    write_json(input,
               Json{
                   {"a.b", 1}
    });

    EXPECT_EQ(run_objfmt({"check", "--input", input.string(), "--schema-dir", std::string(kSchemaDir)},
                         out),
              kExitFailure);
}

TEST(CliTest, ExportWritesCanonicalPlainJson)
{
    TempDir temp_dir("objfmt_cli_export");
    const auto input = temp_dir.path() / "doc.json";
    const auto output = temp_dir.path() / "export.json";
    const auto out = temp_dir.path() / "stdout.txt";
    write_json(input, make_storage_document());

    ASSERT_EQ(run_objfmt({"export", "--input", input.string(), "-o", output.string()}, out), kExitOk);
    EXPECT_EQ(read_text(output), "{\"a.b\":[1,2],\"p\":\"/x/y\",\"title\":\"x\"}\n");
}

TEST(CliTest, ResolveReportsObjectsAndWritesStorage)
{
    TempDir temp_dir("objfmt_cli_resolve");
    const auto input = temp_dir.path() / "certificate.json";
    const auto output = temp_dir.path() / "resolved.json";
    const auto out = temp_dir.path() / "stdout.txt";
    const Json document = make_certificate_document();
    write_json(input, document);

    ASSERT_EQ(run_objfmt({"resolve", "--input", input.string(), "--output", output.string()}, out),
              kExitOk);
    EXPECT_NE(read_text(out).find("Resolved 2 domain object(s)"), std::string::npos);

    auto registry = cert::build_builtin_registry();
    ASSERT_TRUE(registry) << registry.error().message;
    auto objects = materialize(document, *registry);
    ASSERT_TRUE(objects) << objects.error().message;
    auto expected = dematerialize(*objects, *registry);
    ASSERT_TRUE(expected) << expected.error().message;

    const Json resolved = read_json(output);
    EXPECT_EQ(resolved, *expected);
    // Fields are sanitized and the stale hash is replaced
    const Json& profile = resolved.at("protection_profiles").at("_value").at(0);
    EXPECT_EQ(profile.at("pp_name"), "PP-0084");
    EXPECT_NE(profile.at("_hash"), 1);
    EXPECT_FALSE(resolved.at("algorithm").contains("_hash"));
}

TEST(CliTest, TypesListsBuiltinTags)
{
    TempDir temp_dir("objfmt_cli_types");
    const auto out = temp_dir.path() / "stdout.txt";

    ASSERT_EQ(run_objfmt({"types"}, out), kExitOk);
    EXPECT_EQ(read_text(out), "FIPSAlgorithm\nMaintenanceReport\nProtectionProfile\n");
}

TEST(CliTest, UsageErrors)
{
    TempDir temp_dir("objfmt_cli_usage");
    const auto out = temp_dir.path() / "stdout.txt";

    EXPECT_EQ(run_objfmt({"check"}, out), kExitUsage);
    EXPECT_EQ(run_objfmt({"export", "--bogus"}, out), kExitUsage);
    EXPECT_EQ(run_objfmt({"frobnicate"}, out), kExitUsage);
    EXPECT_EQ(run_objfmt({"resolve", "--input", (temp_dir.path() / "missing.json").string()}, out),
              kExitFailure);
}

}  // namespace objfmt::test
