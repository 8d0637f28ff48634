/**
 * @file test_facade.cpp
 * @brief load/store and the full Storage <-> Object chains
 */

#include "objfmt/formats.hpp"

#include "objfmt/hash.hpp"
#include "objfmt/vocabulary.hpp"
#include "support/widgets.hpp"

#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

namespace objfmt::test {

namespace {

using Json = nlohmann::json;

[[nodiscard]] std::string escaped(std::string_view before, std::string_view after)
{
    return std::string(before) + std::string(vocab::kDotSubstitute) + std::string(after);
}

[[nodiscard]] Value set_of(SetKind kind, std::vector<Value> elements)
{
    auto set = Set::from_elements(kind, std::move(elements));
    EXPECT_TRUE(set) << set.error().message;
    return set ? Value(std::move(*set)) : Value();
}

}  // namespace

TEST(FacadeTest, DottedSetAndPathScenario)
{
    const TypeRegistry registry{};
    const Value document(Map{
        {"a.b", set_of(SetKind::kSet, {Value(1), Value(2)})},
        {  "p",                        PathValue("/x/y")}
    });

    auto stored = dematerialize(document, registry);
    ASSERT_TRUE(stored) << stored.error().message;

    auto path_hash = identity_hash(Value(PathValue("/x/y")));
    ASSERT_TRUE(path_hash);
    Json expected = {
        {escaped("a", "b"),                       {{"_type", "set"}, {"_value", {1, 2}}}},
        {              "p", {{"_type", "Path"}, {"_value", "/x/y"}, {"_hash", *path_hash}}}
    };
    EXPECT_EQ(*stored, expected);

    // The stored form without "_hash" reads back to the same document
    Json without_hash = expected;
    without_hash["p"].erase("_hash");
    auto restored = materialize(without_hash, registry);
    ASSERT_TRUE(restored) << restored.error().message;
    EXPECT_EQ(*restored, document);
}

TEST(FacadeTest, StoreOfLoadReproducesStorageDocument)
{
    Json document = {
        {escaped("x", "y"),                              {{escaped("a", "b"), 1}}},
        {           "tags",   {{"_type", "frozenset"}, {"_value", {"b", "a", "c"}}}},
        {          "paths",
         {{"_type", "set"},
         {"_value", Json::array({{{"_type", "Path"}, {"_value", "/a"}, {"_hash", 17}}})}}},
        {         "nested",    Json::array({1, 2.5, nullptr, false, Json::object()})}
    };
    auto loaded = load(document);
    ASSERT_TRUE(loaded) << loaded.error().message;
    auto stored = store(*loaded);
    ASSERT_TRUE(stored) << stored.error().message;
    EXPECT_EQ(*stored, document);
}

TEST(FacadeTest, LoadOfStoreReproducesWorkingDocument)
{
    const Value document(Map{
        {   "a.b.c",              set_of(SetKind::kSet, {Value("x"), Value("y")})},
        {"frozen.k",      set_of(SetKind::kFrozenSet, {Value(1), Value(2.5)})},
        {   "plain", List{Value(Map{{"k.v", Value()}}), Value(true)}}
    });
    auto stored = store(document);
    ASSERT_TRUE(stored) << stored.error().message;
    auto loaded = load(*stored);
    ASSERT_TRUE(loaded) << loaded.error().message;
    EXPECT_EQ(*loaded, document);
}

TEST(FacadeTest, SetOfPathAndObjectRoundTrips)
{
    const TypeRegistry registry = make_widget_registry();
    const Value document(Map{
        {"members",
         set_of(SetKind::kSet, {Value(PathValue("/a/b")), make_object(Token{.id = 7}), Value(3)})}
    });

    auto stored = dematerialize(document, registry);
    ASSERT_TRUE(stored) << stored.error().message;
    ASSERT_TRUE(stored->at("members").at("_value").is_array());
    EXPECT_EQ(stored->at("members").at("_value").size(), 3U);

    auto restored = materialize(*stored, registry);
    ASSERT_TRUE(restored) << restored.error().message;
    const Set* members = restored->as_map()->find("members")->as_set();
    ASSERT_NE(members, nullptr);
    EXPECT_EQ(members->size(), 3U);
    EXPECT_TRUE(members->contains(Value(PathValue("/a/b"))));
    EXPECT_TRUE(members->contains(make_object(Token{.id = 7})));
    EXPECT_EQ(*restored, document);
}

TEST(FacadeTest, UnknownTagsSurviveMaterialize)
{
    const TypeRegistry registry = make_widget_registry();
    Json document = {
        {"thing", {{"_type", "SomethingElse"}, {"v", 1}}}
    };
    auto restored = materialize(document, registry);
    ASSERT_TRUE(restored) << restored.error().message;
    auto stored = dematerialize(*restored, registry);
    ASSERT_TRUE(stored) << stored.error().message;
    EXPECT_EQ(*stored, document);
}

TEST(FacadeTest, LoadRejectsSetWithoutValue)
{
    auto loaded = load(Json{
        {"_type", "set"}
    });
    ASSERT_FALSE(loaded);
    EXPECT_EQ(loaded.error().code, errc::kMalformedTag);
}

TEST(FacadeTest, StoreRejectsReservedCharacterInKey)
{
    auto stored = store(Value(Map{
        {escaped("a", "b"), 1}
    }));
    ASSERT_FALSE(stored);
    EXPECT_EQ(stored.error().code, errc::kReservedCharacter);
}

TEST(FacadeTest, DottedAndEscapedKeysStayDistinct)
{
    // Dots are stored escaped; a key already holding U+FF0E is refused by store()
    auto stored = store(Value(Map{
        {"a.b", 1}
    }));
    ASSERT_TRUE(stored);
    EXPECT_TRUE(stored->contains(escaped("a", "b")));
    EXPECT_FALSE(stored->contains("a.b"));
}

}  // namespace objfmt::test
