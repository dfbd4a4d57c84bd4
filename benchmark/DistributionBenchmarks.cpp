/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include <benchmark/benchmark.h>

#include "statdist/numerics/ExtendedPrecision.hpp"
#include "statdist/stats/NormalDistribution.hpp"
#include "statdist/stats/PoissonDistribution.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <memory>
#include <new>
#include <random>
#include <vector>

//-------------------------------------------------------------------------

using namespace statdist;
using namespace statdist::stats;

//-------------------------------------------------------------------------

static std::vector<double> makeUniforms(size_t count, double lo, double hi)
{
    std::mt19937 rng{12345};
    std::uniform_real_distribution<double> dist{lo, hi};
    std::vector<double> values(count);
    for (auto& value : values) {
        value = dist(rng);
    }
    return values;
}

static const std::vector<double> kArguments = makeUniforms(1024, 0.0, 40.0);
static const std::vector<double> kProbabilities = makeUniforms(1024, 0.0, 1.0);

//-------------------------------------------------------------------------

static void BM_Sqrt2xx(benchmark::State& state)
{
    size_t i = 0;
    for (auto _ : state) {
        benchmark::DoNotOptimize(
            numerics::ExtendedPrecision::sqrt2xx(kArguments[i++ % kArguments.size()]));
    }
}
BENCHMARK(BM_Sqrt2xx);

static void BM_Sqrt2xxNaive(benchmark::State& state)
{
    size_t i = 0;
    for (auto _ : state) {
        const double x = kArguments[i++ % kArguments.size()];
        benchmark::DoNotOptimize(std::sqrt(2.0 * x * x));
    }
}
BENCHMARK(BM_Sqrt2xxNaive);

static void BM_Expmhxx(benchmark::State& state)
{
    size_t i = 0;
    for (auto _ : state) {
        benchmark::DoNotOptimize(
            numerics::ExtendedPrecision::expmhxx(kArguments[i++ % kArguments.size()]));
    }
}
BENCHMARK(BM_Expmhxx);

//-------------------------------------------------------------------------

struct NormalFixture : benchmark::Fixture
{
    NormalDistribution dist{0.0, 1.0};
};

BENCHMARK_DEFINE_F(NormalFixture, CumulativeProbability)(benchmark::State& state)
{
    size_t i = 0;
    for (auto _ : state) {
        const double x = kArguments[i++ % kArguments.size()] - 20.0;
        benchmark::DoNotOptimize(dist.cumulativeProbability(x));
    }
}
BENCHMARK_REGISTER_F(NormalFixture, CumulativeProbability);

BENCHMARK_DEFINE_F(NormalFixture, InverseCumulativeProbability)(benchmark::State& state)
{
    size_t i = 0;
    for (auto _ : state) {
        benchmark::DoNotOptimize(
            dist.inverseCumulativeProbability(kProbabilities[i++ % kProbabilities.size()]));
    }
}
BENCHMARK_REGISTER_F(NormalFixture, InverseCumulativeProbability);

//-------------------------------------------------------------------------

struct PoissonFixture : benchmark::Fixture
{
    void SetUp(benchmark::State& state) override
    {
        dist = std::make_unique<PoissonDistribution>(static_cast<double>(state.range(0)));
    }

    void TearDown(benchmark::State&) override { dist.reset(); }

    std::unique_ptr<PoissonDistribution> dist;
};

BENCHMARK_DEFINE_F(PoissonFixture, CumulativeProbability)(benchmark::State& state)
{
    const auto mean = static_cast<int32_t>(state.range(0));
    int32_t x = 0;
    for (auto _ : state) {
        benchmark::DoNotOptimize(dist->cumulativeProbability(x));
        x = (x + 1) % (2 * mean + 1);
    }
}
BENCHMARK_REGISTER_F(PoissonFixture, CumulativeProbability)->Arg(4)->Arg(1000);

// Exercises the bracketing search of the default discrete inverse.
BENCHMARK_DEFINE_F(PoissonFixture, InverseCumulativeProbability)(benchmark::State& state)
{
    size_t i = 0;
    for (auto _ : state) {
        benchmark::DoNotOptimize(
            dist->inverseCumulativeProbability(kProbabilities[i++ % kProbabilities.size()]));
    }
}
BENCHMARK_REGISTER_F(PoissonFixture, InverseCumulativeProbability)->Arg(4)->Arg(1000)->Arg(1000000);

BENCHMARK_DEFINE_F(PoissonFixture, Sample)(benchmark::State& state)
{
    std::mt19937 rng{42};
    auto sampler = dist->createSampler(rng);
    for (auto _ : state) {
        benchmark::DoNotOptimize(sampler->sample());
    }
}
BENCHMARK_REGISTER_F(PoissonFixture, Sample)->Arg(4)->Arg(1000)->Arg(2000000000);

//-------------------------------------------------------------------------

struct MemoryManager : benchmark::MemoryManager
{
    benchmark::MemoryManager::Result stats;

    void Start() override
    {
        stats.num_allocs = 0;
        stats.max_bytes_used = 0;
        stats.total_allocated_bytes = 0;
        stats.net_heap_growth = 0;
    }

    void Stop(benchmark::MemoryManager::Result& result) override { result = stats; }
};

static MemoryManager s_mngr;

void* operator new(size_t size)
{
    void* ptr = malloc(size);
    if (ptr == nullptr) {
        throw std::bad_alloc();
    }
    auto& [num_allocs, max_bytes_used, total_allocated_bytes, net_heap_growth] = s_mngr.stats;
    num_allocs++;
    total_allocated_bytes += size;
    net_heap_growth += size;
    max_bytes_used = std::max(max_bytes_used, net_heap_growth);
    return ptr;
}

void operator delete(void* ptr) noexcept
{
    free(ptr);
}

void operator delete(void* ptr, size_t size) noexcept
{
    s_mngr.stats.net_heap_growth -= static_cast<int64_t>(size);
    free(ptr);
}

// Allocation per sampler.
static void BM_CreateNormalSampler(benchmark::State& state)
{
    const NormalDistribution dist{0.0, 1.0};
    std::mt19937 rng{42};
    for (auto _ : state) {
        auto sampler = dist.createSampler(rng);
        benchmark::DoNotOptimize(sampler.get());
    }
}
BENCHMARK(BM_CreateNormalSampler);

//-------------------------------------------------------------------------

int main(int argc, char* argv[])
{
    benchmark::RegisterMemoryManager(&s_mngr);
    benchmark::Initialize(&argc, argv);
    benchmark::RunSpecifiedBenchmarks();
    benchmark::RegisterMemoryManager(nullptr);
}

//-------------------------------------------------------------------------
