#pragma once

#include <fmt/format.h>

#include <bit>
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include "scanbits/internal/alignment.hpp"
#include "scanbits/internal/atomic_slab.hpp"
#include "scanbits/internal/layout.hpp"
#include "scanbits/internal/prefetch.hpp"

namespace scanbits {

using Position = uint32_t;
using Slab = uint64_t;

// One non-empty array2 slab returned by scan(): pos is the position of the
// slab's bit 0 (a multiple of 64), slab is its raw value.
struct ScanResult {
  Position pos;
  Slab slab;
};

namespace internal {

[[noreturn, gnu::cold, gnu::noinline]]
inline void throw_out_of_range(const char* op, Position pos, uint32_t bits) {
  throw std::out_of_range(
      fmt::format("scanbits: {}({}) out of range for bitmap of {} bits", op, pos, bits));
}

[[noreturn, gnu::cold, gnu::noinline]]
inline void throw_invalid_argument(const std::string& what) {
  throw std::invalid_argument(fmt::format("scanbits: {}", what));
}

}  // namespace internal

template <size_t CacheLineSize>
class BasicBitmap;

// Read-only view of a bitmap, safe to copy into any number of threads.
// Only get(), get_slab() and prefetch0() are available, both lock-free and safe against
// the concurrent writer. A reader must not outlive the writer handle (or the
// memory block) it was taken from.
class BitmapReader {
 public:
  constexpr BitmapReader() noexcept = default;

  [[nodiscard]] bool get(Position pos) const {
    if (pos >= bits_) [[unlikely]] {
      internal::throw_out_of_range("get", pos, bits_);
    }
    assert(array2_ != nullptr);
    const uint64_t slab = internal::load_slab(array2_ + (pos >> 6));
    return (slab & (uint64_t{1} << (pos & 63))) != 0;
  }

  // Whole slab holding pos, read with one atomic load
  [[nodiscard]] Slab get_slab(Position pos) const {
    if (pos >= bits_) [[unlikely]] {
      internal::throw_out_of_range("get_slab", pos, bits_);
    }
    assert(array2_ != nullptr);
    return internal::load_slab(array2_ + (pos >> 6));
  }

  // Advisory; positions outside the bitmap are ignored
  void prefetch0(Position pos) const noexcept {
    if (pos < bits_) [[likely]] {
      internal::prefetch0(array2_ + (pos >> 6));
    }
  }

  [[nodiscard]] uint32_t size() const noexcept { return bits_; }
  [[nodiscard]] bool valid() const noexcept { return array2_ != nullptr; }

 private:
  template <size_t>
  friend class BasicBitmap;

  BitmapReader(uint64_t* array2, uint32_t bits) noexcept : array2_(array2), bits_(bits) {}

  uint64_t* array2_{nullptr};
  uint32_t bits_{0};
};

// Two-level scan bitmap placed over caller-owned memory.
//
// array2 stores the bits in 64-bit slabs grouped into cache-line blocks;
// array1 keeps one bit per block, set exactly when the block has a set bit.
// scan() walks array1 to skip empty blocks, so its cost follows the number
// of occupied blocks rather than the bitmap size.
//
// This object is the writer handle. It is move-only: whoever holds it is the
// one thread allowed to call set(), clear(), set_slab(), reset() and scan().
// Concurrent readers use reader(). Each slab update is a single atomic store,
// so readers observe a slab either before or after a change, never torn.
//
// The memory block is borrowed. It must stay valid while the handle and its
// readers are in use, and is left untouched when the handle is destroyed.
template <size_t CacheLineSize = internal::kCacheLineSize>
class BasicBitmap {
 public:
  using Layout = internal::Layout<CacheLineSize>;

  static constexpr size_t kCacheLineSize = CacheLineSize;
  static constexpr uint32_t kSlabBits = Layout::kSlabBits;
  static constexpr uint32_t kSlabsPerBlock = Layout::kSlabsPerBlock;
  static constexpr uint32_t kBlockBits = Layout::kBlockBits;

  // Bytes needed to back a bitmap of `bits` positions; 0 for bits == 0,
  // which init() rejects.
  [[nodiscard]] static constexpr uint32_t memory_footprint(uint32_t bits) noexcept {
    return Layout::compute(bits).footprint;
  }

  // Lay out and zero a bitmap over `mem`. Throws std::invalid_argument when
  // bits is zero, mem is null or not 8-byte aligned, or mem_size is below
  // memory_footprint(bits). Cache-line alignment of mem is recommended.
  [[nodiscard]] static BasicBitmap init(uint32_t bits, void* mem, uint32_t mem_size) {
    if (bits == 0) {
      internal::throw_invalid_argument("bitmap needs at least one bit");
    }
    if (mem == nullptr) {
      internal::throw_invalid_argument("bitmap memory is null");
    }
    if (!internal::is_aligned(mem, internal::kSlabAlignment)) {
      internal::throw_invalid_argument(fmt::format("bitmap memory {} is not {}-byte aligned",
                                                   fmt::ptr(mem), internal::kSlabAlignment));
    }
    const Layout layout = Layout::compute(bits);
    if (mem_size < layout.footprint) {
      internal::throw_invalid_argument(fmt::format(
          "{} bytes supplied, a bitmap of {} bits needs {}", mem_size, bits, layout.footprint));
    }
    return BasicBitmap(layout, static_cast<std::byte*>(mem));
  }

  ~BasicBitmap() = default;

  BasicBitmap(BasicBitmap&& other) noexcept
      : layout_(other.layout_),
        array1_(std::exchange(other.array1_, nullptr)),
        array2_(std::exchange(other.array2_, nullptr)),
        cursor_block_(other.cursor_block_),
        cursor_slab_(other.cursor_slab_),
        reading_(other.reading_) {}

  BasicBitmap& operator=(BasicBitmap&& other) noexcept {
    if (this != &other) {
      layout_ = other.layout_;
      array1_ = std::exchange(other.array1_, nullptr);
      array2_ = std::exchange(other.array2_, nullptr);
      cursor_block_ = other.cursor_block_;
      cursor_slab_ = other.cursor_slab_;
      reading_ = other.reading_;
    }
    return *this;
  }

  // A second writer handle would break the single-writer rule
  BasicBitmap(const BasicBitmap&) = delete;
  BasicBitmap& operator=(const BasicBitmap&) = delete;

  // Clear every bit and rewind the scan cursor
  void reset() noexcept {
    assert(valid());
    for (uint32_t i = 0; i < layout_.array2_slabs; ++i) {
      internal::store_slab(array2_ + i, 0);
    }
    for (uint32_t i = 0; i < layout_.array1_slabs; ++i) {
      internal::store_slab(array1_ + i, 0);
    }
    rewind();
  }

  void prefetch0(Position pos) const noexcept { reader().prefetch0(pos); }

  [[nodiscard]] bool get(Position pos) const { return reader().get(pos); }
  [[nodiscard]] Slab get_slab(Position pos) const { return reader().get_slab(pos); }

  void set(Position pos) {
    check_position("set", pos);
    const uint32_t index2 = Layout::slab_index(pos);
    uint64_t* slab2 = array2_ + index2;
    internal::store_slab(slab2, internal::load_slab_relaxed(slab2) | Layout::bit_mask(pos));
    mark_block(Layout::block_of_slab(index2));
  }

  void clear(Position pos) {
    check_position("clear", pos);
    const uint32_t index2 = Layout::slab_index(pos);
    uint64_t* slab2 = array2_ + index2;
    const uint64_t value = internal::load_slab_relaxed(slab2) & ~Layout::bit_mask(pos);
    internal::store_slab(slab2, value);
    if (value != 0) return;

    const uint32_t block = Layout::block_of_slab(index2);
    if (block_empty(block)) {
      unmark_block(block);
    }
  }

  // Replace the whole slab holding pos. Bits past the end of the bitmap are
  // dropped from the new value.
  void set_slab(Position pos, Slab slab) {
    check_position("set_slab", pos);
    const uint32_t index2 = Layout::slab_index(pos);
    if (index2 == layout_.last_slab()) {
      slab &= layout_.last_slab_mask;
    }
    internal::store_slab(array2_ + index2, slab);

    const uint32_t block = Layout::block_of_slab(index2);
    if (slab != 0) {
      mark_block(block);
    } else if (block_empty(block)) {
      unmark_block(block);
    }
  }

  // Next non-empty slab after the cursor, wrapping to position 0 past the
  // end. Empty only when no bit at all is set. A full pass over an unchanged
  // bitmap returns each non-empty slab exactly once.
  [[nodiscard]] std::optional<ScanResult> scan() noexcept {
    assert(valid());
    if (auto result = scan_read()) {
      return result;
    }
    if (!scan_search()) {
      return std::nullopt;
    }
    scan_read_init();
    return scan_read();
  }

  // Summary bit of an array2 block, for callers that want block occupancy
  [[nodiscard]] bool block_active(uint32_t block) const noexcept {
    if (block >= layout_.blocks) return false;
    const uint64_t value1 = internal::load_slab(array1_ + (block >> 6));
    return (value1 & (uint64_t{1} << (block & 63))) != 0;
  }

  [[nodiscard]] BitmapReader reader() const noexcept { return {array2_, layout_.bits}; }

  [[nodiscard]] uint32_t size() const noexcept { return layout_.bits; }
  [[nodiscard]] uint32_t block_count() const noexcept { return layout_.blocks; }
  [[nodiscard]] const Layout& layout() const noexcept { return layout_; }
  [[nodiscard]] bool valid() const noexcept { return array2_ != nullptr; }

 private:
  BasicBitmap(const Layout& layout, std::byte* mem) noexcept
      : layout_(layout),
        array1_(reinterpret_cast<uint64_t*>(mem)),
        array2_(reinterpret_cast<uint64_t*>(mem + layout.array1_bytes)) {
    reset();
  }

  void check_position(const char* op, Position pos) const {
    assert(valid());
    if (pos >= layout_.bits) [[unlikely]] {
      internal::throw_out_of_range(op, pos, layout_.bits);
    }
  }

  [[nodiscard]] bool block_empty(uint32_t block) const noexcept {
    uint64_t* slab2 = array2_ + block * kSlabsPerBlock;
    for (uint32_t i = 0; i < kSlabsPerBlock; ++i) {
      if (internal::load_slab_relaxed(slab2 + i) != 0) return false;
    }
    return true;
  }

  void mark_block(uint32_t block) noexcept {
    uint64_t* slab1 = array1_ + (block >> 6);
    internal::store_slab(slab1, internal::load_slab_relaxed(slab1) | (uint64_t{1} << (block & 63)));
  }

  void unmark_block(uint32_t block) noexcept {
    uint64_t* slab1 = array1_ + (block >> 6);
    internal::store_slab(slab1,
                         internal::load_slab_relaxed(slab1) & ~(uint64_t{1} << (block & 63)));
  }

  // Park on the last block so the first search starts at block 0
  void rewind() noexcept {
    cursor_block_ = layout_.blocks - 1;
    cursor_slab_ = 0;
    reading_ = false;
  }

  // Continue through the remaining slabs of the block being read
  [[nodiscard]] std::optional<ScanResult> scan_read() noexcept {
    if (!reading_) return std::nullopt;

    const uint32_t end = (cursor_block_ + 1) * kSlabsPerBlock;
    while (cursor_slab_ < end) {
      const uint32_t index2 = cursor_slab_++;
      const uint64_t value = internal::load_slab_relaxed(array2_ + index2);
      if (value != 0) {
        reading_ = cursor_slab_ < end;
        return ScanResult{index2 << Layout::kSlabBitsLog2, value};
      }
    }
    reading_ = false;
    return std::nullopt;
  }

  // Find the next active block after the current one through array1. The
  // search covers every block once, ending with the current block itself.
  [[nodiscard]] bool scan_search() noexcept {
    const uint32_t start = cursor_block_ + 1 == layout_.blocks ? 0 : cursor_block_ + 1;

    uint32_t index1 = start >> 6;
    uint64_t value1 = internal::load_slab_relaxed(array1_ + index1) & (~uint64_t{0} << (start & 63));
    if (value1 != 0) {
      cursor_block_ = (index1 << 6) + static_cast<uint32_t>(std::countr_zero(value1));
      return true;
    }

    for (uint32_t i = 0; i < layout_.array1_slabs; ++i) {
      index1 = index1 + 1 == layout_.array1_slabs ? 0 : index1 + 1;
      value1 = internal::load_slab_relaxed(array1_ + index1);
      if (value1 != 0) {
        cursor_block_ = (index1 << 6) + static_cast<uint32_t>(std::countr_zero(value1));
        return true;
      }
    }
    return false;
  }

  void scan_read_init() noexcept {
    cursor_slab_ = cursor_block_ * kSlabsPerBlock;
    reading_ = true;
    if (cursor_block_ + 1 < layout_.blocks) {
      internal::prefetch1(array2_ + cursor_slab_ + kSlabsPerBlock);
    }
  }

  Layout layout_{};
  uint64_t* array1_{nullptr};
  uint64_t* array2_{nullptr};

  // Scan cursor, owned by the writer
  uint32_t cursor_block_{0};
  uint32_t cursor_slab_{0};
  bool reading_{false};
};

using Bitmap = BasicBitmap<internal::kCacheLineSize>;
using WideBitmap = BasicBitmap<internal::kWideCacheLineSize>;

}  // namespace scanbits
