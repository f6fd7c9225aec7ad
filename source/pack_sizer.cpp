#include "packwerk/pack_sizer.hpp"
#include "packwerk/error.hpp"

#include <algorithm>
#include <limits>

namespace packwerk {

uint64_t isqrt(uint64_t n) {
  if (n < 2) return n;
  // Ньютон; стартуем сверху, чтобы последовательность монотонно убывала.
  uint64_t x = n;
  uint64_t y = (x >> 1) + (x & 1);
  while (y < x) {
    x = y;
    y = (x + n / x) / 2;
  }
  return x;
}

PackSizer::PackSizer(uint32_t default_size, uint32_t grow_factor, uint32_t size_limit,
                     uint64_t current_size,
                     uint32_t min_tolerate_percent, uint32_t max_tolerate_percent)
  : default_size_(default_size), grow_factor_(grow_factor), size_limit_(size_limit),
    current_size_(current_size),
    min_tolerate_percent_(min_tolerate_percent), max_tolerate_percent_(max_tolerate_percent) {}

PackSizer PackSizer::from_config(const RepoConfig& c, BlobType type, uint64_t current_size) {
  const auto ps = c.packsize(type);
  const auto [min_pct, max_pct] = c.packsize_ok_percents();
  return PackSizer(ps.default_size, ps.grow_factor, ps.size_limit, current_size, min_pct, max_pct);
}

PackSizer PackSizer::fixed(uint32_t size) {
  return PackSizer(size, 0, size, 0, 0, 100);
}

uint32_t PackSizer::pack_size() const {
  const uint64_t grown = isqrt(current_size_) * grow_factor_ + default_size_;
  const uint64_t cap = std::min<uint64_t>(size_limit_, MAX_PACK_SIZE);
  return static_cast<uint32_t>(std::min(grown, cap));
}

bool PackSizer::is_too_small(uint32_t size) const {
  return static_cast<uint64_t>(size) * 100 <
         static_cast<uint64_t>(pack_size()) * min_tolerate_percent_;
}

bool PackSizer::is_too_large(uint32_t size) const {
  return static_cast<uint64_t>(size) * 100 >
         static_cast<uint64_t>(pack_size()) * max_tolerate_percent_;
}

void PackSizer::add_size(uint32_t added) {
  if (current_size_ > std::numeric_limits<uint64_t>::max() - added) {
    throw Error(ErrorKind::Conversion, "pack sizer: repository size overflows u64");
  }
  current_size_ += added;
}

} // namespace packwerk
