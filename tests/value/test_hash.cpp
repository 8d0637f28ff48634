/**
 * @file test_hash.cpp
 * @brief Identity hashing of document values
 */

#include "objfmt/hash.hpp"

#include "objfmt/common.hpp"
#include "support/widgets.hpp"

#include <gtest/gtest.h>

namespace objfmt::test {

TEST(IdentityHashTest, StableAcrossCalls)
{
    auto first = identity_hash(Value("abc"));
    auto second = identity_hash(Value("abc"));
    ASSERT_TRUE(first);
    ASSERT_TRUE(second);
    EXPECT_EQ(*first, *second);
    EXPECT_EQ(*first, common::sha256_int64("s:abc"));
}

TEST(IdentityHashTest, EqualNumbersHashEqually)
{
    auto as_int = identity_hash(Value(42));
    auto as_float = identity_hash(Value(42.0));
    ASSERT_TRUE(as_int);
    ASSERT_TRUE(as_float);
    EXPECT_EQ(*as_int, *as_float);

    auto fraction = identity_hash(Value(42.5));
    ASSERT_TRUE(fraction);
    EXPECT_NE(*as_int, *fraction);
}

TEST(IdentityHashTest, KindsDoNotCollide)
{
    auto text = identity_hash(Value("/x"));
    auto path = identity_hash(Value(PathValue("/x")));
    ASSERT_TRUE(text);
    ASSERT_TRUE(path);
    EXPECT_NE(*text, *path);
}

TEST(IdentityHashTest, FrozenSetIgnoresOrder)
{
    auto forward = Set::from_elements(SetKind::kFrozenSet, {Value(1), Value("a"), Value(2)});
    auto backward = Set::from_elements(SetKind::kFrozenSet, {Value(2), Value("a"), Value(1)});
    ASSERT_TRUE(forward);
    ASSERT_TRUE(backward);

    auto forward_hash = identity_hash(Value(*forward));
    auto backward_hash = identity_hash(Value(*backward));
    ASSERT_TRUE(forward_hash);
    ASSERT_TRUE(backward_hash);
    EXPECT_EQ(*forward_hash, *backward_hash);
}

TEST(IdentityHashTest, UnhashableKinds)
{
    for (const Value& value : {Value(List{}), Value(Map{}), Value(Set{})}) {
        auto hash = identity_hash(value);
        ASSERT_FALSE(hash);
        EXPECT_EQ(hash.error().code, errc::kUnhashable);
        EXPECT_FALSE(is_hashable(value));
    }
}

TEST(IdentityHashTest, HashBearingMapUsesStoredHash)
{
    Map map{
        {"_type", "Widget"},
        {    "n",        3},
        {"_hash",      100}
    };
    map.set_hash_bearing(true);
    auto hash = identity_hash(Value(map));
    ASSERT_TRUE(hash);
    EXPECT_EQ(*hash, 100);
}

TEST(IdentityHashTest, HashBearingMapNeedsIntegerHash)
{
    Map map{
        {"_hash", "not a number"}
    };
    map.set_hash_bearing(true);
    auto hash = identity_hash(Value(map));
    ASSERT_FALSE(hash);
    EXPECT_EQ(hash.error().code, errc::kMalformedTag);
}

TEST(IdentityHashTest, DomainObjects)
{
    auto token = identity_hash(make_object(Token{.id = 3}));
    ASSERT_TRUE(token);
    EXPECT_EQ(*token, 3 * 31 + 7);

    auto widget = identity_hash(make_object(Widget{.n = 3}));
    ASSERT_FALSE(widget);
    EXPECT_EQ(widget.error().code, errc::kUnhashable);

    auto gadget = identity_hash(make_object(Gadget{.payload = Value(1)}));
    ASSERT_FALSE(gadget);
    EXPECT_EQ(gadget.error().code, errc::kUnhashable);
}

TEST(IdentityHashTest, NormalizedPathsHashEqually)
{
    auto plain = identity_hash(Value(PathValue("/x/y")));
    auto messy = identity_hash(Value(PathValue("//x/./y/")));
    ASSERT_TRUE(plain);
    ASSERT_TRUE(messy);
    EXPECT_EQ(*plain, *messy);
}

}  // namespace objfmt::test
