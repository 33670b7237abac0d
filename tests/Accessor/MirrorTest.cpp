#include <gtest/gtest.h>
#include <cstdint>
#include <iterator>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "../TestComponents.hpp"
#include "Morph/Accessor/ComponentAccessor.hpp"

using namespace Morph::Test;

namespace
{
    template<typename T>
    concept CanMirror = requires(Morph::ComponentAccessor<T>& accessor, Morph::Entity::IDType id, Morph::Entity entity)
    {
        accessor.Mirror(id, id);
        accessor.Mirror(entity, entity);
    };

    // Mirroring a type without AssignFrom must not compile
    static_assert(CanMirror<Health>);
    static_assert(CanMirror<Tint>);
    static_assert(!CanMirror<Position>);
    static_assert(!CanMirror<Frozen>);

    static_assert(Morph::ComponentAccessor<Tint>::MERGEABLE);
    static_assert(!Morph::ComponentAccessor<Position>::MERGEABLE);

    class CapturingLogger final : public Morph::ILogger
    {
    public:
        struct Entry
        {
            Morph::LogLevel level;
            std::string tag;
            std::string message;
        };

        void Write(Morph::LogLevel level, std::string_view tag, std::string_view message) override
        {
            entries.push_back({level, std::string(tag), std::string(message)});
        }

        std::vector<Entry> entries;
    };
}

class MirrorTest : public ::testing::Test
{
protected:
    std::unique_ptr<Morph::World> world;
    Morph::Entity target;
    Morph::Entity source;

    void SetUp() override
    {
        world = std::make_unique<Morph::World>();
        target = world->CreateEntity();
        source = world->CreateEntity();
    }

    void TearDown() override
    {
        Morph::Log::SetLogger(nullptr);
        world.reset();
    }

    std::uint64_t Transmutations() const
    {
        return world->GetStats().transmutations;
    }
};

TEST_F(MirrorTest, CreatesTargetAndCopiesState)
{
    auto& tint = Morph::AccessorFor<Tint>(*world);

    auto created = tint.Create(source);
    ASSERT_TRUE(created.IsOk());
    *created.Value() = Tint{0.25f, 0.5f, 0.75f, 0.5f};

    const auto before = Transmutations();
    auto mirrored = tint.Mirror(target, source);
    ASSERT_TRUE(mirrored.IsOk());
    ASSERT_NE(mirrored.Value(), nullptr);

    EXPECT_EQ(Transmutations(), before + 1);
    EXPECT_EQ(mirrored.Value(), tint.GetSafe(target));
    EXPECT_NE(mirrored.Value(), tint.GetSafe(source));
    EXPECT_FLOAT_EQ(mirrored.Value()->r, 0.25f);
    EXPECT_FLOAT_EQ(mirrored.Value()->g, 0.5f);
    EXPECT_FLOAT_EQ(mirrored.Value()->b, 0.75f);
    EXPECT_FLOAT_EQ(mirrored.Value()->a, 0.5f);
}

TEST_F(MirrorTest, ExistingTargetIsOverwrittenInPlace)
{
    auto& health = Morph::AccessorFor<Health>(*world);

    auto targetHealth = health.Create(target);
    auto sourceHealth = health.Create(source);
    ASSERT_TRUE(targetHealth.IsOk());
    ASSERT_TRUE(sourceHealth.IsOk());
    sourceHealth.Value()->current = 30;
    sourceHealth.Value()->max = 80;

    const auto before = Transmutations();
    auto mirrored = health.Mirror(target, source);
    ASSERT_TRUE(mirrored.IsOk());

    EXPECT_EQ(Transmutations(), before);
    EXPECT_EQ(mirrored.Value(), targetHealth.Value());
    EXPECT_EQ(targetHealth.Value()->current, 30);
    EXPECT_EQ(targetHealth.Value()->max, 80);
}

TEST_F(MirrorTest, AbsentSourceRemovesTarget)
{
    auto& health = Morph::AccessorFor<Health>(*world);
    ASSERT_TRUE(health.Create(target).IsOk());

    const auto before = Transmutations();
    auto mirrored = health.Mirror(target, source);
    ASSERT_TRUE(mirrored.IsOk());

    EXPECT_EQ(mirrored.Value(), nullptr);
    EXPECT_FALSE(health.Has(target));
    EXPECT_FALSE(health.Has(source));
    EXPECT_EQ(Transmutations(), before + 1);
}

TEST_F(MirrorTest, AbsentOnBothSidesDoesNothing)
{
    auto& health = Morph::AccessorFor<Health>(*world);
    const auto before = Transmutations();

    auto mirrored = health.Mirror(target, source);
    ASSERT_TRUE(mirrored.IsOk());

    EXPECT_EQ(mirrored.Value(), nullptr);
    EXPECT_FALSE(health.Has(target));
    EXPECT_EQ(Transmutations(), before);
}

// A source outside the id range owns nothing
TEST_F(MirrorTest, OutOfRangeSourceCountsAsAbsent)
{
    auto& health = Morph::AccessorFor<Health>(*world);
    ASSERT_TRUE(health.Create(target).IsOk());

    auto mirrored = health.Mirror(target.GetID(), world->GetCapacity() + 1);
    ASSERT_TRUE(mirrored.IsOk());
    EXPECT_EQ(mirrored.Value(), nullptr);
    EXPECT_FALSE(health.Has(target));
}

TEST_F(MirrorTest, OutOfRangeTargetFails)
{
    auto& health = Morph::AccessorFor<Health>(*world);
    ASSERT_TRUE(health.Create(source).IsOk());
    const auto before = Transmutations();

    auto mirrored = health.Mirror(world->GetCapacity(), source.GetID());
    ASSERT_TRUE(mirrored.IsErr());
    EXPECT_EQ(mirrored.Error().code, Morph::ErrorCode::OutOfBounds);
    EXPECT_EQ(Transmutations(), before);
}

// Later changes to the source are not propagated
TEST_F(MirrorTest, IsOneShot)
{
    auto& health = Morph::AccessorFor<Health>(*world);
    auto sourceHealth = health.Create(source);
    ASSERT_TRUE(sourceHealth.IsOk());
    sourceHealth.Value()->current = 10;

    auto mirrored = health.Mirror(target, source);
    ASSERT_TRUE(mirrored.IsOk());

    sourceHealth.Value()->current = 99;
    EXPECT_EQ(mirrored.Value()->current, 10);

    ASSERT_TRUE(health.Remove(source).IsOk());
    EXPECT_TRUE(health.Has(target));
}

TEST_F(MirrorTest, OntoItself)
{
    auto& health = Morph::AccessorFor<Health>(*world);

    auto absent = health.Mirror(source, source);
    ASSERT_TRUE(absent.IsOk());
    EXPECT_EQ(absent.Value(), nullptr);

    auto created = health.Create(source);
    ASSERT_TRUE(created.IsOk());
    created.Value()->current = 12;

    const auto before = Transmutations();
    auto mirrored = health.Mirror(source, source);
    ASSERT_TRUE(mirrored.IsOk());
    EXPECT_EQ(mirrored.Value(), created.Value());
    EXPECT_EQ(mirrored.Value()->current, 12);
    EXPECT_EQ(Transmutations(), before);
}

// What a mirror copies is up to AssignFrom
TEST_F(MirrorTest, MergeIsDefinedByComponent)
{
    auto& inventory = Morph::AccessorFor<Inventory>(*world);

    auto mine = inventory.Create(target);
    auto theirs = inventory.Create(source);
    ASSERT_TRUE(mine.IsOk());
    ASSERT_TRUE(theirs.IsOk());
    *mine.Value() = Inventory{3, 1};
    *theirs.Value() = Inventory{4, 2};

    ASSERT_TRUE(inventory.Mirror(target, source).IsOk());
    EXPECT_EQ(mine.Value()->coins, 7);
    EXPECT_EQ(mine.Value()->gems, 3);
}

TEST_F(MirrorTest, IdOverload)
{
    auto& tint = Morph::AccessorFor<Tint>(*world);
    auto created = tint.Create(source.GetID());
    ASSERT_TRUE(created.IsOk());
    created.Value()->g = 0.0f;

    auto mirrored = tint.Mirror(target.GetID(), source.GetID());
    ASSERT_TRUE(mirrored.IsOk());
    EXPECT_FLOAT_EQ(mirrored.Value()->g, 0.0f);
}

TEST_F(MirrorTest, ErasedMirrorOnMergeable)
{
    auto& health = Morph::AccessorFor<Health>(*world);
    Morph::IComponentAccessor* erased = world->GetAccessor(Morph::ComponentIDOf<Health>());
    ASSERT_NE(erased, nullptr);
    EXPECT_TRUE(erased->IsMergeable());

    auto sourceHealth = health.Create(source);
    ASSERT_TRUE(sourceHealth.IsOk());
    sourceHealth.Value()->current = 5;

    auto present = erased->MirrorPresence(target.GetID(), source.GetID());
    ASSERT_TRUE(present.IsOk());
    EXPECT_TRUE(present.Value());
    ASSERT_NE(health.GetSafe(target), nullptr);
    EXPECT_EQ(health.GetSafe(target)->current, 5);

    ASSERT_TRUE(health.Remove(source).IsOk());
    auto absent = erased->MirrorPresence(target.GetID(), source.GetID());
    ASSERT_TRUE(absent.IsOk());
    EXPECT_FALSE(absent.Value());
    EXPECT_FALSE(health.Has(target));
}

// Rejected for every input, before either entity is touched
TEST_F(MirrorTest, ErasedMirrorUnsupportedForPlainComponents)
{
    CapturingLogger logger;
    Morph::Log::SetLogger(&logger);

    auto& position = Morph::AccessorFor<Position>(*world);
    Morph::IComponentAccessor& erased = position;
    EXPECT_FALSE(erased.IsMergeable());

    auto sourcePosition = position.Create(source);
    ASSERT_TRUE(sourcePosition.IsOk());
    const auto before = Transmutations();

    const Morph::Entity::IDType outside = world->GetCapacity() + 3;
    const std::pair<Morph::Entity::IDType, Morph::Entity::IDType> inputs[] = {
        {target.GetID(), source.GetID()},
        {source.GetID(), target.GetID()},
        {target.GetID(), target.GetID()},
        {outside, source.GetID()},
        {target.GetID(), outside},
    };

    for (const auto& [to, from] : inputs)
    {
        auto result = erased.MirrorPresence(to, from);
        ASSERT_TRUE(result.IsErr());
        EXPECT_EQ(result.Error().code, Morph::ErrorCode::UnsupportedOperation);
    }

    EXPECT_FALSE(position.Has(target));
    EXPECT_TRUE(position.Has(source));
    EXPECT_EQ(Transmutations(), before);

    ASSERT_EQ(logger.entries.size(), std::size(inputs));
    EXPECT_EQ(logger.entries.front().level, Morph::LogLevel::Error);
    EXPECT_EQ(logger.entries.front().tag, "Accessor");
}
