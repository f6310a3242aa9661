#pragma once

#include <atomic>
#include <cstdint>

namespace scanbits::internal {

static_assert(std::atomic_ref<uint64_t>::is_always_lock_free,
              "slab access must be a single lock-free 64-bit load or store");

// Every access to array1/array2 words goes through these, so that a reader
// racing the writer sees either the old or the new word, never a mix.
// The writer is the only thread that stores, so no read-modify-write is needed.

[[nodiscard]] inline uint64_t load_slab(uint64_t* slab) noexcept {
  return std::atomic_ref<uint64_t>(*slab).load(std::memory_order_acquire);
}

// Writer re-reading its own stores
[[nodiscard]] inline uint64_t load_slab_relaxed(uint64_t* slab) noexcept {
  return std::atomic_ref<uint64_t>(*slab).load(std::memory_order_relaxed);
}

inline void store_slab(uint64_t* slab, uint64_t value) noexcept {
  std::atomic_ref<uint64_t>(*slab).store(value, std::memory_order_release);
}

}  // namespace scanbits::internal
