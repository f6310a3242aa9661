#pragma once

namespace scanbits::internal {

// Prefetch into all cache levels (L1 and up)
inline void prefetch0(const void* ptr) noexcept {
#if defined(__GNUC__) || defined(__clang__)
  __builtin_prefetch(ptr, 0, 3);
#elif defined(_MSC_VER)
  _mm_prefetch(static_cast<const char*>(ptr), _MM_HINT_T0);
#else
  (void)ptr;
#endif
}

// Prefetch into L2 and up; used to pull the next array2 line while scanning
inline void prefetch1(const void* ptr) noexcept {
#if defined(__GNUC__) || defined(__clang__)
  __builtin_prefetch(ptr, 0, 2);
#elif defined(_MSC_VER)
  _mm_prefetch(static_cast<const char*>(ptr), _MM_HINT_T1);
#else
  (void)ptr;
#endif
}

}  // namespace scanbits::internal
