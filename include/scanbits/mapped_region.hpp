#pragma once

#include <sys/mman.h>
#include <unistd.h>

#include <cstddef>
#include <cstdint>
#include <new>
#include <utility>

#include "scanbits/internal/alignment.hpp"

namespace scanbits {

struct PageTraits {
  static constexpr size_t kHugePageSize = 2 * 1024 * 1024;  // 2MB
  static constexpr size_t kRegularPageSize = 4096;          // 4KB
};

// Zeroed, page-aligned anonymous mapping used as bitmap backing memory.
// Owns the mapping and unmaps it on destruction; a bitmap placed over it
// borrows the memory, so the region has to outlive the bitmap.
class MappedRegion {
 public:
  MappedRegion() noexcept = default;

  // Throws std::bad_alloc when the mapping cannot be created
  explicit MappedRegion(size_t bytes) {
    if (bytes == 0) return;

#ifdef SCANBITS_USE_HUGEPAGES
    size_ = internal::align_up(bytes, PageTraits::kHugePageSize);
    data_ = mmap(nullptr, size_, PROT_READ | PROT_WRITE,
                 MAP_PRIVATE | MAP_ANONYMOUS | MAP_HUGETLB | MAP_POPULATE, -1, 0);
    if (data_ != MAP_FAILED) {
      huge_pages_ = true;
      return;
    }
#endif

    size_ = internal::align_up(bytes, PageTraits::kRegularPageSize);
    data_ = mmap(nullptr, size_, PROT_READ | PROT_WRITE, MAP_PRIVATE | MAP_ANONYMOUS | MAP_POPULATE,
                 -1, 0);
    if (data_ == MAP_FAILED) {
      data_ = nullptr;
      size_ = 0;
      throw std::bad_alloc();
    }
  }

  // Region large enough for a bitmap of `bits` positions
  template <typename BitmapT>
  [[nodiscard]] static MappedRegion for_bitmap(uint32_t bits) {
    return MappedRegion(BitmapT::memory_footprint(bits));
  }

  ~MappedRegion() { release(); }

  MappedRegion(MappedRegion&& other) noexcept
      : data_(std::exchange(other.data_, nullptr)),
        size_(std::exchange(other.size_, 0)),
        huge_pages_(std::exchange(other.huge_pages_, false)) {}

  MappedRegion& operator=(MappedRegion&& other) noexcept {
    if (this != &other) {
      release();
      data_ = std::exchange(other.data_, nullptr);
      size_ = std::exchange(other.size_, 0);
      huge_pages_ = std::exchange(other.huge_pages_, false);
    }
    return *this;
  }

  MappedRegion(const MappedRegion&) = delete;
  MappedRegion& operator=(const MappedRegion&) = delete;

  // Pin the region in RAM so that scans never fault
  bool lock() noexcept {
    if (data_ == nullptr) return false;
    return mlock(data_, size_) == 0;
  }

  [[nodiscard]] void* data() const noexcept { return data_; }
  [[nodiscard]] size_t size() const noexcept { return size_; }
  [[nodiscard]] bool huge_pages() const noexcept { return huge_pages_; }
  [[nodiscard]] bool valid() const noexcept { return data_ != nullptr; }

 private:
  void release() noexcept {
    if (data_ != nullptr) {
      munmap(data_, size_);
      data_ = nullptr;
      size_ = 0;
    }
  }

  void* data_{nullptr};
  size_t size_{0};
  bool huge_pages_{false};
};

}  // namespace scanbits
