/**
 * @file test_storage_working.cpp
 * @brief Storage <-> Working conversion
 */

#include "objfmt/formats.hpp"

#include "objfmt/vocabulary.hpp"
#include "support/widgets.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
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

[[nodiscard]] Result<Value> to_working(const Json& document)
{
    auto working = StorageFormat(document).to_working_format();
    if (!working) {
        return std::unexpected(working.error());
    }
    return working->get();
}

[[nodiscard]] Result<Json> to_storage(const Value& document)
{
    auto stored = WorkingFormat(document).to_storage_format();
    if (!stored) {
        return std::unexpected(stored.error());
    }
    return stored->get();
}

[[nodiscard]] Value set_of(SetKind kind, std::vector<Value> elements)
{
    auto set = Set::from_elements(kind, std::move(elements));
    EXPECT_TRUE(set) << set.error().message;
    return set ? Value(std::move(*set)) : Value();
}

}  // namespace

TEST(StorageToWorkingTest, PlainValuesPassThrough)
{
    Json document = {
        {"name",                               "cert"},
        {"size",                                   12},
        {"rate",                                  0.5},
        {"tags", Json::array({true, nullptr, "x", 3})}
    };
    auto working = to_working(document);
    ASSERT_TRUE(working) << working.error().message;

    Value expected(Map{
        {"name", "cert"},
        {"size", 12},
        {"rate", 0.5},
        {"tags", List{Value(true), Value(), Value("x"), Value(3)}}
    });
    EXPECT_EQ(*working, expected);
}

TEST(StorageToWorkingTest, RestoresDotsInKeys)
{
    Json document = {
        {escaped("a", "b"), {{escaped("c", "d"), 1}}}
    };
    auto working = to_working(document);
    ASSERT_TRUE(working) << working.error().message;

    const Map* root = working->as_map();
    ASSERT_NE(root, nullptr);
    const Value* inner = root->find("a.b");
    ASSERT_NE(inner, nullptr);
    ASSERT_NE(inner->as_map(), nullptr);
    EXPECT_NE(inner->as_map()->find("c.d"), nullptr);
}

TEST(StorageToWorkingTest, BuildsSets)
{
    Json document = {
        {   "mutable",    {{"_type", "set"}, {"_value", {1, 2, 2}}}},
        {    "frozen", {{"_type", "frozenset"}, {"_value", Json::array({"a"})}}},
        {"list_value",                               Json::array()}
    };
    auto working = to_working(document);
    ASSERT_TRUE(working) << working.error().message;

    const Map& root = *working->as_map();
    const Set* mutable_set = root.find("mutable")->as_set();
    ASSERT_NE(mutable_set, nullptr);
    EXPECT_FALSE(mutable_set->frozen());
    EXPECT_EQ(mutable_set->size(), 2U);

    const Set* frozen_set = root.find("frozen")->as_set();
    ASSERT_NE(frozen_set, nullptr);
    EXPECT_TRUE(frozen_set->frozen());
    EXPECT_TRUE(frozen_set->contains(Value("a")));
}

TEST(StorageToWorkingTest, SetWithoutValueIsMalformed)
{
    auto working = to_working(Json{
        {"_type", "set"}
    });
    ASSERT_FALSE(working);
    EXPECT_EQ(working.error().code, errc::kMalformedTag);
}

TEST(StorageToWorkingTest, SetValueMustBeArray)
{
    auto working = to_working(Json{
        {"outer", {{"_type", "frozenset"}, {"_value", "abc"}}}
    });
    ASSERT_FALSE(working);
    EXPECT_EQ(working.error().code, errc::kMalformedTag);
    EXPECT_TRUE(working.error().message.starts_with("$.outer")) << working.error().message;
}

TEST(StorageToWorkingTest, UnhashableSetElementIsRejected)
{
    auto working = to_working(Json{
        {"s", {{"_type", "set"}, {"_value", Json::array({Json::array({1})})}}}
    });
    ASSERT_FALSE(working);
    EXPECT_EQ(working.error().code, errc::kUnhashable);
    EXPECT_TRUE(working.error().message.starts_with("$.s")) << working.error().message;
}

TEST(StorageToWorkingTest, HashCarryingMappingsCanBeSetElements)
{
    Json document = {
        {"_type",                                                        "set"},
        {"_value",
         Json::array({{{"_type", "Path"}, {"_value", "/a"}, {"_hash", 11}},
                      {{"_type", "Token"}, {"id", 1}, {"_hash", 38}}})}
    };
    auto working = to_working(document);
    ASSERT_TRUE(working) << working.error().message;
    const Set* set = working->as_set();
    ASSERT_NE(set, nullptr);
    EXPECT_EQ(set->size(), 2U);
    for (const auto& element : *set) {
        ASSERT_NE(element.as_map(), nullptr);
        EXPECT_TRUE(element.as_map()->hash_bearing());
    }
}

TEST(StorageToWorkingTest, PathSetElementNeedsHash)
{
    auto working = to_working(Json{
        {"paths", {{"_type", "set"}, {"_value", Json::array({{{"_type", "Path"}, {"_value", "/a"}}})}}}
    });
    ASSERT_FALSE(working);
    EXPECT_EQ(working.error().code, errc::kUnhashable);
    EXPECT_TRUE(working.error().message.starts_with("$.paths")) << working.error().message;

    // The form written by store() after a Raw stage round trip loads
    Set paths(SetKind::kSet);
    ASSERT_TRUE(paths.insert(Value(PathValue("/a"))));
    auto raw_working = RawFormat(Value(paths)).to_working_format();
    ASSERT_TRUE(raw_working) << raw_working.error().message;
    auto stored = to_storage(raw_working->get());
    ASSERT_TRUE(stored) << stored.error().message;
    auto reloaded = to_working(*stored);
    ASSERT_TRUE(reloaded) << reloaded.error().message;
    EXPECT_EQ(reloaded->as_set()->size(), 1U);
}

TEST(StorageToWorkingTest, NonIntegerHashIsMalformed)
{
    auto working = to_working(Json{
        {"_type", "Token"},
        {"_hash",   "abc"}
    });
    ASSERT_FALSE(working);
    EXPECT_EQ(working.error().code, errc::kMalformedTag);
}

TEST(StorageToWorkingTest, IntegerBeyondInt64Overflows)
{
    auto working = to_working(Json{
        {"big", std::numeric_limits<std::uint64_t>::max()}
    });
    ASSERT_FALSE(working);
    EXPECT_EQ(working.error().code, errc::kIntegerOverflow);
}

TEST(StorageToWorkingTest, PathMappingsStayTagged)
{
    auto working = to_working(Json{
        {"p", {{"_type", "Path"}, {"_value", "/x/y"}}}
    });
    ASSERT_TRUE(working) << working.error().message;
    const Value* path = working->as_map()->find("p");
    ASSERT_NE(path, nullptr);
    EXPECT_EQ(path->kind(), Value::Kind::kMap);
}

TEST(WorkingToStorageTest, EncodesSetsAsTaggedMappings)
{
    Value document(Map{
        {"s",    set_of(SetKind::kSet, {Value(3), Value(1), Value(2)})},
        {"f", set_of(SetKind::kFrozenSet, {Value("x")})}
    });
    auto stored = to_storage(document);
    ASSERT_TRUE(stored) << stored.error().message;

    Json expected = {
        {"s",       {{"_type", "set"}, {"_value", {3, 1, 2}}}},
        {"f", {{"_type", "frozenset"}, {"_value", Json::array({"x"})}}}
    };
    EXPECT_EQ(*stored, expected);
}

TEST(WorkingToStorageTest, EscapesDotsInKeys)
{
    Value document(Map{
        {"a.b.c", Map{{"d.e", 1}}}
    });
    auto stored = to_storage(document);
    ASSERT_TRUE(stored) << stored.error().message;

    const std::string outer = escaped("a", "b") + std::string(vocab::kDotSubstitute) + "c";
    ASSERT_TRUE(stored->contains(outer)) << stored->dump();
    EXPECT_TRUE(stored->at(outer).contains(escaped("d", "e")));
}

TEST(WorkingToStorageTest, KeyWithDotSubstituteIsRejected)
{
    Value document(Map{
        {escaped("a", "b"), 1}
    });
    auto stored = to_storage(document);
    ASSERT_FALSE(stored);
    EXPECT_EQ(stored.error().code, errc::kReservedCharacter);
}

TEST(WorkingToStorageTest, SymbolKeysUseLabel)
{
    Map map;
    map.insert_or_assign(Key(Symbol{"insert"}), Value(1));
    auto stored = to_storage(Value(map));
    ASSERT_TRUE(stored) << stored.error().message;
    EXPECT_EQ(*stored, (Json{{"__insert__", 1}}));

    // Symbols are not restored on the way back
    auto working = to_working(*stored);
    ASSERT_TRUE(working);
    EXPECT_NE(working->as_map()->find("__insert__"), nullptr);
}

TEST(WorkingToStorageTest, SymbolKeyCollidingWithStringKeyIsRejected)
{
    Map map;
    map.insert_or_assign(Key(Symbol{"x"}), Value(1));
    map.insert_or_assign(Key("__x__"), Value(2));
    auto stored = to_storage(Value(Map{
        {"outer", map}
    }));
    ASSERT_FALSE(stored);
    EXPECT_EQ(stored.error().code, errc::kReservedCharacter);
    EXPECT_TRUE(stored.error().message.starts_with("$.outer")) << stored.error().message;

    // Dots are escaped before the comparison
    Map dotted;
    dotted.insert_or_assign(Key("__a.b__"), Value(1));
    dotted.insert_or_assign(Key(Symbol{"a.b"}), Value(2));
    auto dotted_stored = to_storage(Value(dotted));
    ASSERT_FALSE(dotted_stored);
    EXPECT_EQ(dotted_stored.error().code, errc::kReservedCharacter);
}

TEST(WorkingToStorageTest, NonFiniteNumbersAreRejected)
{
    auto stored = to_storage(Value(List{Value(std::nan(""))}));
    ASSERT_FALSE(stored);
    EXPECT_EQ(stored.error().code, errc::kInvalidNumber);
}

TEST(WorkingToStorageTest, PathsAndObjectsBelongToLaterStages)
{
    auto with_path = to_storage(Value(Map{{"p", PathValue("/x")}}));
    ASSERT_FALSE(with_path);
    EXPECT_EQ(with_path.error().code, errc::kStageViolation);

    auto with_object = to_storage(Value(List{make_object(Widget{.n = 1})}));
    ASSERT_FALSE(with_object);
    EXPECT_EQ(with_object.error().code, errc::kStageViolation);
}

TEST(WorkingToStorageTest, InputIsNotModified)
{
    const Value document(Map{
        {"a.b", set_of(SetKind::kSet, {Value(1)})}
    });
    const Value copy = document;
    auto stored = to_storage(document);
    ASSERT_TRUE(stored);
    EXPECT_EQ(document, copy);
    EXPECT_NE(document.as_map()->find("a.b"), nullptr);
}

}  // namespace objfmt::test
