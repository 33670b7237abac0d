#include <Morph/Morph.hpp>
#include <benchmark/benchmark.h>
#include <cstdint>
#include <vector>

struct Position
{
    std::uint64_t x;
    std::uint64_t y;
};

struct Tint
{
    float r = 1.0f;
    float g = 1.0f;
    float b = 1.0f;

    Tint& AssignFrom(const Tint& other)
    {
        r = other.r;
        g = other.g;
        b = other.b;
        return *this;
    }
};

static std::vector<Morph::Entity> CreateEntities(Morph::World& world, std::size_t count)
{
    std::vector<Morph::Entity> entities;
    entities.reserve(count);
    for (std::size_t i = 0; i < count; ++i)
    {
        entities.push_back(world.CreateEntity());
    }
    return entities;
}

static void BM_CreateEntities(benchmark::State& state)
{
    const size_t count = state.range(0);

    for (auto _ : state)
    {
        Morph::World world;
        for (size_t i = 0; i < count; ++i)
        {
            benchmark::DoNotOptimize(world.CreateEntity());
        }
    }

    state.SetItemsProcessed(state.iterations() * count);
}

// Add then remove on every entity: two transmutations each
static void BM_CreateRemoveToggle(benchmark::State& state)
{
    const size_t count = state.range(0);
    Morph::World world;
    auto entities = CreateEntities(world, count);
    auto& position = Morph::AccessorFor<Position>(world);

    for (auto _ : state)
    {
        for (auto entity : entities)
        {
            benchmark::DoNotOptimize(position.Create(entity));
        }
        for (auto entity : entities)
        {
            benchmark::DoNotOptimize(position.Remove(entity));
        }
    }

    state.SetItemsProcessed(state.iterations() * count * 2);
}

// Create on entities that already own the component: no transmutation
static void BM_CreateExisting(benchmark::State& state)
{
    const size_t count = state.range(0);
    Morph::World world;
    auto entities = CreateEntities(world, count);
    auto& position = Morph::AccessorFor<Position>(world);
    for (auto entity : entities)
    {
        benchmark::DoNotOptimize(position.Create(entity));
    }

    for (auto _ : state)
    {
        for (auto entity : entities)
        {
            benchmark::DoNotOptimize(position.Create(entity));
        }
    }

    state.SetItemsProcessed(state.iterations() * count);
}

// Half the entities own the component
static void BM_GetSafe(benchmark::State& state)
{
    const size_t count = state.range(0);
    Morph::World world;
    auto entities = CreateEntities(world, count);
    auto& position = Morph::AccessorFor<Position>(world);
    for (size_t i = 0; i < count; i += 2)
    {
        benchmark::DoNotOptimize(position.Create(entities[i]));
    }

    for (auto _ : state)
    {
        std::uint64_t sum = 0;
        for (auto entity : entities)
        {
            if (Position* p = position.GetSafe(entity))
            {
                sum += p->x;
            }
        }
        benchmark::DoNotOptimize(sum);
    }

    state.SetItemsProcessed(state.iterations() * count);
}

static void BM_Mirror(benchmark::State& state)
{
    const size_t count = state.range(0);
    Morph::World world;
    auto entities = CreateEntities(world, count * 2);
    auto& tint = Morph::AccessorFor<Tint>(world);
    for (size_t i = 0; i < count; ++i)
    {
        benchmark::DoNotOptimize(tint.Create(entities[i]));
    }

    for (auto _ : state)
    {
        for (size_t i = 0; i < count; ++i)
        {
            benchmark::DoNotOptimize(tint.Mirror(entities[count + i], entities[i]));
        }
        state.PauseTiming();
        for (size_t i = 0; i < count; ++i)
        {
            benchmark::DoNotOptimize(tint.Remove(entities[count + i]));
        }
        state.ResumeTiming();
    }

    state.SetItemsProcessed(state.iterations() * count);
}

BENCHMARK(BM_CreateEntities)->Arg(10000)->Arg(100000);
BENCHMARK(BM_CreateRemoveToggle)->Arg(10000)->Arg(100000);
BENCHMARK(BM_CreateExisting)->Arg(10000)->Arg(100000);
BENCHMARK(BM_GetSafe)->Arg(10000)->Arg(100000);
BENCHMARK(BM_Mirror)->Arg(10000)->Arg(100000);

BENCHMARK_MAIN();
