#pragma once

#include <cstddef>
#include <cstdint>

#include "scanbits/internal/alignment.hpp"

namespace scanbits::internal {

// Memory layout of a two-level bitmap over one contiguous block:
//
//   [ array1: one bit per array2 block, padded to a cache line ][ array2 ]
//
// array2 holds the bits themselves in 64-bit slabs. Slabs are grouped into
// blocks of exactly one cache line, so a block is 512 bits on 64-byte lines
// and 1024 bits on 128-byte lines.
template <size_t CacheLineSize>
struct Layout {
  static_assert(CacheLineSize == kCacheLineSize || CacheLineSize == kWideCacheLineSize,
                "CacheLineSize must be 64 or 128 bytes");

  static constexpr uint32_t kSlabBits = 64;
  static constexpr uint32_t kSlabBitsLog2 = 6;
  static constexpr uint32_t kSlabBytes = sizeof(uint64_t);
  static constexpr uint32_t kSlabsPerBlock = static_cast<uint32_t>(CacheLineSize) / kSlabBytes;
  static constexpr uint32_t kBlockBits = kSlabsPerBlock * kSlabBits;
  static constexpr uint32_t kBlockBytes = static_cast<uint32_t>(CacheLineSize);

  uint32_t bits{0};
  uint32_t blocks{0};         // array2 cache lines == array1 bits in use
  uint32_t array1_slabs{0};
  uint32_t array1_bytes{0};   // padded to a cache line, also the array2 offset
  uint32_t array2_slabs{0};
  uint32_t footprint{0};
  uint64_t last_slab_mask{0}; // valid bits of the final array2 slab

  // All-zero layout for bits == 0, which no bitmap accepts
  [[nodiscard]] static constexpr Layout compute(uint32_t bits) noexcept {
    Layout layout;
    if (bits == 0) return layout;

    // 64-bit intermediates: bits + kBlockBits - 1 overflows uint32_t near the top
    const uint64_t blocks = div_ceil<uint64_t>(bits, kBlockBits);
    const uint64_t array1_slabs = div_ceil<uint64_t>(blocks, kSlabBits);
    const uint64_t array1_bytes = align_up<uint64_t>(array1_slabs * kSlabBytes, CacheLineSize);

    layout.bits = bits;
    layout.blocks = static_cast<uint32_t>(blocks);
    layout.array1_slabs = static_cast<uint32_t>(array1_slabs);
    layout.array1_bytes = static_cast<uint32_t>(array1_bytes);
    layout.array2_slabs = static_cast<uint32_t>(blocks * kSlabsPerBlock);
    layout.footprint = static_cast<uint32_t>(array1_bytes + blocks * kBlockBytes);

    const uint32_t tail_bits = bits % kSlabBits;
    layout.last_slab_mask = tail_bits == 0 ? ~uint64_t{0} : (uint64_t{1} << tail_bits) - 1;
    return layout;
  }

  // Index of the last array2 slab that holds any valid bit
  [[nodiscard]] constexpr uint32_t last_slab() const noexcept {
    return (bits - 1) >> kSlabBitsLog2;
  }

  [[nodiscard]] static constexpr uint32_t slab_index(uint32_t pos) noexcept {
    return pos >> kSlabBitsLog2;
  }

  [[nodiscard]] static constexpr uint64_t bit_mask(uint32_t pos) noexcept {
    return uint64_t{1} << (pos & (kSlabBits - 1));
  }

  [[nodiscard]] static constexpr uint32_t block_of_slab(uint32_t index2) noexcept {
    return index2 / kSlabsPerBlock;
  }
};

}  // namespace scanbits::internal
