#pragma once

#include <cstddef>
#include <cstdint>

namespace scanbits::internal {

// Round value up to a power-of-two alignment
template <typename T>
[[nodiscard]] constexpr T align_up(T value, T alignment) noexcept {
  return (value + alignment - 1) & ~(alignment - 1);
}

// Ceiling division for unsigned counts
template <typename T>
[[nodiscard]] constexpr T div_ceil(T value, T divisor) noexcept {
  return (value + divisor - 1) / divisor;
}

// Check if a pointer is aligned to the specified alignment
template <typename T>
[[nodiscard]] inline bool is_aligned(T* ptr, size_t alignment) noexcept {
  return (reinterpret_cast<uintptr_t>(ptr) & (alignment - 1)) == 0;
}

inline constexpr size_t kCacheLineSize = 64;  // x86-64 and most arm64 cores
inline constexpr size_t kWideCacheLineSize = 128;
inline constexpr size_t kSlabAlignment = sizeof(uint64_t);

}  // namespace scanbits::internal
