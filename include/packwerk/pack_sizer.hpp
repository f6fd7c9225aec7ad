#pragma once
#include <cstdint>

#include "packwerk/blob.hpp"
#include "packwerk/config.hpp"

namespace packwerk {

// Жёсткий потолок размера пака, независимо от настроек.
static constexpr uint32_t MAX_PACK_SIZE = 4076 * MiB;

// Целевой размер пака растёт как sqrt от уже записанного объёма:
//   target = min(isqrt(current) * grow_factor + default_size, size_limit, MAX_PACK_SIZE)
class PackSizer {
public:
  PackSizer(uint32_t default_size, uint32_t grow_factor, uint32_t size_limit,
            uint64_t current_size = 0,
            uint32_t min_tolerate_percent = 0, uint32_t max_tolerate_percent = 100);

  static PackSizer from_config(const RepoConfig& c, BlobType type, uint64_t current_size);
  // Всегда size; too_large = size > fixed.
  static PackSizer fixed(uint32_t size);

  uint32_t pack_size() const;

  bool is_too_small(uint32_t size) const;
  bool is_too_large(uint32_t size) const;
  bool size_ok(uint32_t size) const { return !is_too_small(size) && !is_too_large(size); }

  void add_size(uint32_t added);
  uint64_t current_size() const noexcept { return current_size_; }

private:
  uint32_t default_size_;
  uint32_t grow_factor_;
  uint32_t size_limit_;
  uint64_t current_size_;
  uint32_t min_tolerate_percent_;
  uint32_t max_tolerate_percent_;
};

uint64_t isqrt(uint64_t n);

} // namespace packwerk
