#pragma once
#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace packwerk {

using Bytes = std::vector<uint8_t>;

// 32-байтовый SHA-256. BlobId = хеш открытого текста блоба,
// PackId = хеш полного содержимого пак-файла (он же ключ в хранилище).
struct Id {
  std::array<uint8_t, 32> raw{};

  bool operator==(const Id&) const = default;
  auto operator<=>(const Id&) const = default;

  bool is_null() const;
  std::string to_hex() const;
  static std::optional<Id> from_hex(std::string_view hex);
};

using BlobId = Id;
using PackId = Id;

Id hash_bytes(const uint8_t* data, size_t len);
inline Id hash_bytes(const Bytes& b) { return hash_bytes(b.data(), b.size()); }
inline Id hash_bytes(std::string_view s) {
  return hash_bytes(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

// XXH64 over the raw digest, for unordered containers.
struct IdHash {
  size_t operator()(const Id& id) const noexcept;
};

} // namespace packwerk

template <>
struct std::hash<packwerk::Id> {
  size_t operator()(const packwerk::Id& id) const noexcept { return packwerk::IdHash{}(id); }
};
