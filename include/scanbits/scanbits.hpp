#pragma once

#include <cstdint>
#include <utility>

#include "scanbits/bitmap.hpp"
#include "scanbits/mapped_region.hpp"

namespace scanbits {

// Bitmap of `bits` positions together with the region backing it. Members
// are declared so that the bitmap goes away before its memory.
template <typename BitmapT = Bitmap>
struct OwnedBitmap {
  MappedRegion region;
  BitmapT bitmap;
};

template <typename BitmapT = Bitmap>
[[nodiscard]] inline OwnedBitmap<BitmapT> make_bitmap(uint32_t bits) {
  MappedRegion region = MappedRegion::for_bitmap<BitmapT>(bits);
  void* mem = region.data();
  const auto mem_size = static_cast<uint32_t>(region.size());
  BitmapT bitmap = BitmapT::init(bits, mem, mem_size);
  return {std::move(region), std::move(bitmap)};
}

}  // namespace scanbits
