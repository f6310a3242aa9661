#include <gtest/gtest.h>

#include <cstdint>

#include "scanbits/bitmap.hpp"
#include "scanbits/internal/layout.hpp"

using namespace scanbits;

using NarrowLayout = internal::Layout<64>;
using WideLayout = internal::Layout<128>;

TEST(LayoutTest, BlockGeometry) {
  EXPECT_EQ(NarrowLayout::kSlabsPerBlock, 8u);
  EXPECT_EQ(NarrowLayout::kBlockBits, 512u);
  EXPECT_EQ(WideLayout::kSlabsPerBlock, 16u);
  EXPECT_EQ(WideLayout::kBlockBits, 1024u);
}

TEST(LayoutTest, SmallestBitmap) {
  constexpr auto layout = NarrowLayout::compute(1);
  EXPECT_EQ(layout.blocks, 1u);
  EXPECT_EQ(layout.array1_slabs, 1u);
  EXPECT_EQ(layout.array1_bytes, 64u);  // one slab padded to a cache line
  EXPECT_EQ(layout.array2_slabs, 8u);
  EXPECT_EQ(layout.footprint, 128u);
  EXPECT_EQ(layout.last_slab_mask, 1u);
}

TEST(LayoutTest, BlockBoundaries) {
  EXPECT_EQ(Bitmap::memory_footprint(512), 128u);
  EXPECT_EQ(Bitmap::memory_footprint(513), 192u);

  // 64 blocks still fit one array1 slab
  EXPECT_EQ(Bitmap::memory_footprint(512 * 64), 64u + 64u * 64u);
  // 65 blocks need a second array1 slab, still inside the padded line
  EXPECT_EQ(Bitmap::memory_footprint(512 * 64 + 1), 64u + 65u * 64u);
}

TEST(LayoutTest, WideCacheLine) {
  EXPECT_EQ(WideBitmap::memory_footprint(1), 256u);
  EXPECT_EQ(WideBitmap::memory_footprint(1024), 256u);
  EXPECT_EQ(WideBitmap::memory_footprint(1025), 384u);
}

TEST(LayoutTest, ZeroBitsHasNoFootprint) {
  EXPECT_EQ(Bitmap::memory_footprint(0), 0u);
  EXPECT_EQ(WideBitmap::memory_footprint(0), 0u);

  constexpr auto layout = NarrowLayout::compute(0);
  EXPECT_EQ(layout.blocks, 0u);
  EXPECT_EQ(layout.array2_slabs, 0u);
}

TEST(LayoutTest, LargestBitmap) {
  constexpr uint32_t kMaxBits = UINT32_MAX;
  constexpr auto layout = NarrowLayout::compute(kMaxBits);
  EXPECT_EQ(layout.blocks, 8388608u);
  EXPECT_EQ(layout.array1_slabs, 131072u);
  EXPECT_EQ(layout.footprint, 1048576u + 536870912u);
  EXPECT_EQ(layout.last_slab(), kMaxBits >> 6);
  EXPECT_EQ(layout.last_slab_mask, ~uint64_t{0} >> 1);
}

TEST(LayoutTest, FootprintIsMonotonic) {
  uint32_t previous = 0;
  for (uint32_t bits = 1; bits < 200000; bits += 37) {
    const uint32_t footprint = Bitmap::memory_footprint(bits);
    EXPECT_GE(footprint, previous) << "bits=" << bits;
    previous = footprint;
  }

  previous = 0;
  for (uint32_t bits = 1; bits < 200000; bits += 41) {
    const uint32_t footprint = WideBitmap::memory_footprint(bits);
    EXPECT_GE(footprint, previous) << "bits=" << bits;
    previous = footprint;
  }
}

TEST(LayoutTest, FootprintCoversArrays) {
  for (uint32_t bits : {1u, 63u, 64u, 65u, 511u, 4096u, 100000u, 1u << 20}) {
    const auto layout = NarrowLayout::compute(bits);
    EXPECT_GE(uint64_t{layout.array2_slabs} * 64, bits);
    EXPECT_GE(uint64_t{layout.array1_slabs} * 64, layout.blocks);
    EXPECT_EQ(layout.footprint, layout.array1_bytes + layout.array2_slabs * 8);
    EXPECT_EQ(layout.array1_bytes % 64, 0u);
  }
}

TEST(LayoutTest, TailMask) {
  EXPECT_EQ(NarrowLayout::compute(70).last_slab_mask, 0x3Fu);
  EXPECT_EQ(NarrowLayout::compute(128).last_slab_mask, ~uint64_t{0});
  EXPECT_EQ(NarrowLayout::compute(70).last_slab(), 1u);
}

TEST(LayoutTest, FootprintIsConstexpr) {
  static_assert(Bitmap::memory_footprint(1) == 128);
  static_assert(WideBitmap::memory_footprint(1) == 256);
  SUCCEED();
}
