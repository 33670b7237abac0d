#include <gtest/gtest.h>
#include <unordered_set>
#include <vector>
#include "Morph/Container/Bitmap.hpp"

class BitmapTest : public ::testing::Test
{
protected:
    void SetUp() override {}
    void TearDown() override {}
};

// Test basic bit operations
TEST_F(BitmapTest, BasicBitOperations)
{
    Morph::Bitmap<128> bitmap;

    EXPECT_TRUE(bitmap.None());
    EXPECT_FALSE(bitmap.Any());
    EXPECT_EQ(bitmap.Count(), 0u);

    bitmap.Set(0);
    bitmap.Set(63);
    bitmap.Set(64);
    bitmap.Set(127);

    EXPECT_TRUE(bitmap.Test(0));
    EXPECT_TRUE(bitmap.Test(63));
    EXPECT_TRUE(bitmap.Test(64));
    EXPECT_TRUE(bitmap.Test(127));
    EXPECT_FALSE(bitmap.Test(1));
    EXPECT_FALSE(bitmap.Test(50));
    EXPECT_EQ(bitmap.Count(), 4u);

    bitmap.Reset(0);
    bitmap.Reset(127);

    EXPECT_FALSE(bitmap.Test(0));
    EXPECT_FALSE(bitmap.Test(127));
    EXPECT_TRUE(bitmap.Test(63));
    EXPECT_EQ(bitmap.Count(), 2u);
}

// Out of range indices are ignored
TEST_F(BitmapTest, BoundaryConditions)
{
    Morph::Bitmap<64> bitmap;

    bitmap.Set(63);
    EXPECT_TRUE(bitmap.Test(63));

    bitmap.Set(64);
    bitmap.Set(1000);
    EXPECT_FALSE(bitmap.Test(64));
    EXPECT_FALSE(bitmap.Test(1000));
    EXPECT_EQ(bitmap.Count(), 1u);

    bitmap.Reset(1000);
    EXPECT_EQ(bitmap.Count(), 1u);
}

TEST_F(BitmapTest, HasAllAndHasAny)
{
    Morph::Bitmap<128> bitmap;
    bitmap.Set(0);
    bitmap.Set(5);
    bitmap.Set(64);

    Morph::Bitmap<128> subset;
    subset.Set(0);
    subset.Set(64);
    EXPECT_TRUE(bitmap.HasAll(subset));
    EXPECT_TRUE(bitmap.HasAny(subset));

    Morph::Bitmap<128> partial;
    partial.Set(5);
    partial.Set(15);
    EXPECT_FALSE(bitmap.HasAll(partial));
    EXPECT_TRUE(bitmap.HasAny(partial));

    Morph::Bitmap<128> disjoint;
    disjoint.Set(100);
    EXPECT_FALSE(bitmap.HasAny(disjoint));

    // Empty mask always matches HasAll, never HasAny
    Morph::Bitmap<128> empty;
    EXPECT_TRUE(bitmap.HasAll(empty));
    EXPECT_FALSE(bitmap.HasAny(empty));
}

TEST_F(BitmapTest, SetAlgebra)
{
    Morph::Bitmap<128> a;
    a.Set(1);
    a.Set(2);
    a.Set(100);

    Morph::Bitmap<128> b;
    b.Set(2);
    b.Set(3);

    auto both = a & b;
    EXPECT_EQ(both.Count(), 1u);
    EXPECT_TRUE(both.Test(2));

    auto either = a | b;
    EXPECT_EQ(either.Count(), 4u);
    EXPECT_TRUE(either.Test(3));
    EXPECT_TRUE(either.Test(100));

    auto onlyA = a.Without(b);
    EXPECT_EQ(onlyA.Count(), 2u);
    EXPECT_TRUE(onlyA.Test(1));
    EXPECT_TRUE(onlyA.Test(100));
    EXPECT_FALSE(onlyA.Test(2));

    // Operands are untouched
    EXPECT_EQ(a.Count(), 3u);
    EXPECT_EQ(b.Count(), 2u);
}

TEST_F(BitmapTest, EqualityOperator)
{
    Morph::Bitmap<192> bitmap1;
    Morph::Bitmap<192> bitmap2;
    EXPECT_EQ(bitmap1, bitmap2);

    bitmap1.Set(0);
    bitmap1.Set(191);
    bitmap2.Set(0);
    bitmap2.Set(191);
    EXPECT_EQ(bitmap1, bitmap2);

    bitmap2.Set(50);
    EXPECT_NE(bitmap1, bitmap2);

    bitmap2.Reset(50);
    EXPECT_EQ(bitmap1, bitmap2);
}

TEST_F(BitmapTest, ForEachSetBitVisitsInOrder)
{
    Morph::Bitmap<192> bitmap;
    const std::vector<std::size_t> expected = {0, 7, 63, 64, 130, 191};
    for (auto index : expected)
    {
        bitmap.Set(index);
    }

    std::vector<std::size_t> visited;
    bitmap.ForEachSetBit([&](std::size_t index) { visited.push_back(index); });
    EXPECT_EQ(visited, expected);

    Morph::Bitmap<192> empty;
    int calls = 0;
    empty.ForEachSetBit([&](std::size_t) { ++calls; });
    EXPECT_EQ(calls, 0);
}

TEST_F(BitmapTest, HashFunction)
{
    Morph::Bitmap<128> bitmap1;
    Morph::Bitmap<128> bitmap2;
    Morph::BitmapHash<128> hasher;

    EXPECT_EQ(hasher(bitmap1), hasher(bitmap2));

    bitmap1.Set(10);
    bitmap2.Set(10);
    EXPECT_EQ(hasher(bitmap1), hasher(bitmap2));

    std::unordered_set<Morph::Bitmap<128>, Morph::BitmapHash<128>> set;
    set.insert(bitmap1);
    set.insert(bitmap2);
    EXPECT_EQ(set.size(), 1u);

    bitmap2.Set(70);
    set.insert(bitmap2);
    EXPECT_EQ(set.size(), 2u);
}

TEST_F(BitmapTest, ConstexprOperations)
{
    constexpr auto bitmap = []
    {
        Morph::Bitmap<64> result;
        result.Set(3);
        result.Set(9);
        return result;
    }();

    static_assert(bitmap.Test(3));
    static_assert(bitmap.Count() == 2);
    EXPECT_TRUE(bitmap.Test(9));
}
