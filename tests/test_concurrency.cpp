#include <gtest/gtest.h>

#include <atomic>
#include <bit>
#include <cstdint>
#include <mutex>
#include <random>
#include <thread>
#include <vector>

#include "scanbits/scanbits.hpp"

using namespace scanbits;

namespace {

constexpr uint32_t kBits = 1u << 16;
constexpr uint32_t kStickyEnd = kBits / 2;   // [0, kStickyEnd): set once, in order
constexpr uint64_t kEvenBits = 0x5555555555555555ULL;

// Odd positions are never written, so a reader seeing one set has read a
// word the writer never stored.
bool is_odd(uint32_t pos) { return (pos & 1) != 0; }

}  // namespace

// One writer, many readers. The writer only ever stores even bits:
//  - the lower half is filled in order, and each step is published through
//    `published` so readers know which bits must already be visible;
//  - the upper half churns through set/clear/set_slab/scan.
TEST(ConcurrencyTest, ReadersSeeOnlyWrittenValues) {
  constexpr int kNumReaders = 4;

  auto owned = make_bitmap(kBits);
  Bitmap& bm = owned.bitmap;
  const BitmapReader reader = bm.reader();

  std::atomic<uint32_t> published{0};
  std::atomic<bool> done{false};
  std::atomic<uint64_t> violations{0};
  std::atomic<uint64_t> reads{0};

  auto reader_loop = [&](int id) {
    std::mt19937 rng(static_cast<uint32_t>(id) * 7919u);
    std::uniform_int_distribution<uint32_t> pos_dist(0, kBits - 1);
    uint64_t local_reads = 0;

    while (!done.load(std::memory_order_acquire)) {
      const uint32_t visible = published.load(std::memory_order_acquire);
      const uint32_t pos = pos_dist(rng);
      reader.prefetch0(pos);
      const bool bit = reader.get(pos);
      ++local_reads;

      if (is_odd(pos)) {
        if (bit) violations.fetch_add(1);
      } else if (pos < kStickyEnd && pos < visible && !bit) {
        violations.fetch_add(1);
      }
    }
    reads.fetch_add(local_reads);
  };

  std::vector<std::thread> readers;
  for (int i = 0; i < kNumReaders; ++i) {
    readers.emplace_back(reader_loop, i);
  }

  std::mt19937 rng(2024);
  std::uniform_int_distribution<uint32_t> churn_dist(kStickyEnd / 2, kBits / 2 - 1);
  std::uniform_int_distribution<int> op_dist(0, 3);
  uint64_t bad_scans = 0;

  for (uint32_t pos = 0; pos < kStickyEnd; pos += 2) {
    bm.set(pos);
    published.store(pos + 1, std::memory_order_release);

    // Churn in the upper half, even positions only
    const uint32_t churn = churn_dist(rng) * 2;
    switch (op_dist(rng)) {
      case 0:
        bm.set(churn);
        break;
      case 1:
        bm.clear(churn);
        break;
      case 2:
        bm.set_slab(churn, (uint64_t{rng()} << 32 | rng()) & kEvenBits);
        break;
      default:
        if (auto result = bm.scan()) {
          if ((result->slab & ~kEvenBits) != 0) ++bad_scans;
        }
        break;
    }
  }

  done.store(true, std::memory_order_release);
  for (auto& t : readers) {
    t.join();
  }

  EXPECT_EQ(violations.load(), 0u);
  EXPECT_EQ(bad_scans, 0u);
  EXPECT_GT(reads.load(), 0u);

  // Everything in the lower half is now set
  for (uint32_t pos = 0; pos < kStickyEnd; ++pos) {
    ASSERT_EQ(bm.get(pos), !is_odd(pos)) << pos;
  }
}

// Readers spinning on a single slab while the writer flips it between two
// whole-word patterns must only ever see one of the two.
TEST(ConcurrencyTest, SlabStoresAreNotTorn) {
  constexpr int kNumReaders = 3;
  constexpr int kIterations = 200000;
  constexpr uint64_t kPatternA = 0xAAAAAAAAAAAAAAAAULL;
  constexpr uint64_t kPatternB = 0x0000FFFF0000FFFFULL;

  auto owned = make_bitmap(512);
  Bitmap& bm = owned.bitmap;
  const BitmapReader reader = bm.reader();
  bm.set_slab(64, kPatternA);

  std::atomic<bool> done{false};
  std::atomic<uint64_t> torn{0};

  auto reader_loop = [&]() {
    while (!done.load(std::memory_order_acquire)) {
      const uint64_t slab = reader.get_slab(100);
      if (slab != kPatternA && slab != kPatternB) torn.fetch_add(1);
      // Other slabs are never written
      if (reader.get_slab(0) != 0 || reader.get(200)) torn.fetch_add(1);
    }
  };

  std::vector<std::thread> readers;
  for (int i = 0; i < kNumReaders; ++i) {
    readers.emplace_back(reader_loop);
  }

  for (int i = 0; i < kIterations; ++i) {
    bm.set_slab(64, (i & 1) ? kPatternA : kPatternB);
  }

  done.store(true, std::memory_order_release);
  for (auto& t : readers) {
    t.join();
  }

  EXPECT_EQ(torn.load(), 0u);
  EXPECT_EQ(bm.get_slab(64), kPatternA);
  EXPECT_TRUE(bm.block_active(0));
}

// Several logical writers are fine once they serialize through a lock
TEST(ConcurrencyTest, ExternallySerializedWriters) {
  constexpr int kNumWriters = 4;
  constexpr uint32_t kPerWriter = 2000;

  auto owned = make_bitmap(kNumWriters * kPerWriter);
  Bitmap& bm = owned.bitmap;
  std::mutex lock;

  std::vector<std::thread> writers;
  for (int w = 0; w < kNumWriters; ++w) {
    writers.emplace_back([&, w]() {
      for (uint32_t i = 0; i < kPerWriter; ++i) {
        std::lock_guard<std::mutex> guard(lock);
        bm.set(static_cast<uint32_t>(w) * kPerWriter + i);
      }
    });
  }
  for (auto& t : writers) {
    t.join();
  }

  uint32_t total = 0;
  for (uint32_t i = 0; i < (kNumWriters * kPerWriter + 63) / 64; ++i) {
    auto result = bm.scan();
    ASSERT_TRUE(result.has_value());
    total += static_cast<uint32_t>(std::popcount(result->slab));
  }
  EXPECT_EQ(total, kNumWriters * kPerWriter);
}
