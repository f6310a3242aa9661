#include <benchmark/benchmark.h>

#include <bit>
#include <cstdint>
#include <random>
#include <vector>

#include "scanbits/scanbits.hpp"

using namespace scanbits;

namespace {

constexpr uint32_t kBits = 1u << 20;

// Fill roughly `per_million` of every million positions
void fill(Bitmap& bm, std::vector<uint64_t>& flat, int64_t per_million) {
  std::mt19937 rng(42);
  std::uniform_int_distribution<uint32_t> pos_dist(0, kBits - 1);
  const int64_t count = static_cast<int64_t>(kBits) * per_million / 1000000;
  for (int64_t i = 0; i < count; ++i) {
    const uint32_t pos = pos_dist(rng);
    bm.set(pos);
    flat[pos >> 6] |= uint64_t{1} << (pos & 63);
  }
}

}  // namespace

// Benchmark set + clear of one bit
static void BM_Bitmap_SetClear(benchmark::State& state) {
  auto owned = make_bitmap(kBits);
  Bitmap& bm = owned.bitmap;
  uint32_t pos = 0;

  for (auto _ : state) {
    bm.set(pos);
    bm.clear(pos);
    pos = (pos + 4099) & (kBits - 1);
  }
}
BENCHMARK(BM_Bitmap_SetClear);

static void BM_Bitmap_Get(benchmark::State& state) {
  auto owned = make_bitmap(kBits);
  Bitmap& bm = owned.bitmap;
  bm.set(12345);
  uint32_t pos = 0;

  for (auto _ : state) {
    benchmark::DoNotOptimize(bm.get(pos));
    pos = (pos + 4099) & (kBits - 1);
  }
}
BENCHMARK(BM_Bitmap_Get);

// Scan one full pass; density given in set bits per million
static void BM_Bitmap_ScanPass(benchmark::State& state) {
  auto owned = make_bitmap(kBits);
  Bitmap& bm = owned.bitmap;
  std::vector<uint64_t> flat(kBits / 64);
  fill(bm, flat, state.range(0));

  int64_t slabs = 0;
  for (auto _ : state) {
    auto first = bm.scan();
    if (!first) continue;
    ++slabs;
    for (auto next = bm.scan(); next && next->pos > first->pos; next = bm.scan()) {
      benchmark::DoNotOptimize(next->slab);
      ++slabs;
    }
  }
  state.SetItemsProcessed(slabs);
}
BENCHMARK(BM_Bitmap_ScanPass)->Arg(10)->Arg(100)->Arg(1000)->Arg(10000)->Arg(100000);

// Same density with a flat word array walked linearly
static void BM_Flat_ScanPass(benchmark::State& state) {
  auto owned = make_bitmap(kBits);
  std::vector<uint64_t> flat(kBits / 64);
  fill(owned.bitmap, flat, state.range(0));

  int64_t slabs = 0;
  for (auto _ : state) {
    for (uint64_t word : flat) {
      if (word != 0) {
        benchmark::DoNotOptimize(word);
        ++slabs;
      }
    }
  }
  state.SetItemsProcessed(slabs);
}
BENCHMARK(BM_Flat_ScanPass)->Arg(10)->Arg(100)->Arg(1000)->Arg(10000)->Arg(100000);

// Polling loop: take a slab, consume its bits, re-arm them
static void BM_Bitmap_PollLoop(benchmark::State& state) {
  auto owned = make_bitmap(kBits);
  Bitmap& bm = owned.bitmap;
  std::vector<uint64_t> flat(kBits / 64);
  fill(bm, flat, state.range(0));

  int64_t bits = 0;
  for (auto _ : state) {
    auto result = bm.scan();
    if (!result) continue;
    for (uint64_t slab = result->slab; slab != 0; slab &= slab - 1) {
      const uint32_t pos = result->pos + static_cast<uint32_t>(std::countr_zero(slab));
      bm.prefetch0(pos);
      ++bits;
    }
    bm.set_slab(result->pos, result->slab);
  }
  state.SetItemsProcessed(bits);
}
BENCHMARK(BM_Bitmap_PollLoop)->Arg(100)->Arg(10000);

static void BM_Bitmap_Reset(benchmark::State& state) {
  auto owned = make_bitmap(static_cast<uint32_t>(state.range(0)));
  Bitmap& bm = owned.bitmap;

  for (auto _ : state) {
    bm.reset();
    benchmark::ClobberMemory();
  }
  state.SetBytesProcessed(state.iterations() * Bitmap::memory_footprint(bm.size()));
}
BENCHMARK(BM_Bitmap_Reset)->Range(1 << 10, 1 << 20);

BENCHMARK_MAIN();
