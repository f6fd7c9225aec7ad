#include "packwerk/id.hpp"
#include "packwerk/error.hpp"

#include <openssl/evp.h>
#include <xxhash.h>

#include <algorithm>

namespace packwerk {

static int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

bool Id::is_null() const {
  return std::all_of(raw.begin(), raw.end(), [](uint8_t b){ return b == 0; });
}

std::string Id::to_hex() const {
  static const char digits[] = "0123456789abcdef";
  std::string out;
  out.reserve(raw.size() * 2);
  for (uint8_t b : raw) {
    out.push_back(digits[b >> 4]);
    out.push_back(digits[b & 0x0f]);
  }
  return out;
}

std::optional<Id> Id::from_hex(std::string_view hex) {
  Id id;
  if (hex.size() != id.raw.size() * 2) return std::nullopt;
  for (size_t i = 0; i < id.raw.size(); ++i) {
    int hi = hex_value(hex[2*i]);
    int lo = hex_value(hex[2*i + 1]);
    if (hi < 0 || lo < 0) return std::nullopt;
    id.raw[i] = static_cast<uint8_t>((hi << 4) | lo);
  }
  return id;
}

Id hash_bytes(const uint8_t* data, size_t len) {
  Id id;
  unsigned int out_len = 0;
  if (1 != EVP_Digest(data, len, id.raw.data(), &out_len, EVP_sha256(), nullptr) ||
      out_len != id.raw.size()) {
    throw Error(ErrorKind::Crypto, "SHA-256 digest failed");
  }
  return id;
}

size_t IdHash::operator()(const Id& id) const noexcept {
  return static_cast<size_t>(XXH64(id.raw.data(), id.raw.size(), 0));
}

} // namespace packwerk
