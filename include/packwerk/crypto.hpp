#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "packwerk/id.hpp"

namespace packwerk {

// Ключ репозитория: 32 байта AES-256-GCM в mlock'нутой анонимной странице.
// Шифротекст: nonce(12) || data || tag(16).
class Key {
public:
  static constexpr size_t KEY_LEN   = 32;
  static constexpr size_t NONCE_LEN = 12;
  static constexpr size_t TAG_LEN   = 16;
  static constexpr size_t OVERHEAD  = NONCE_LEN + TAG_LEN;

  explicit Key(const uint8_t* raw, size_t len);
  ~Key();
  Key(const Key&) = delete;
  Key& operator=(const Key&) = delete;
  Key(Key&&) = delete;
  Key& operator=(Key&&) = delete;

  static std::shared_ptr<Key> random();
  // PBKDF2-HMAC-SHA256
  static std::shared_ptr<Key> derive(const std::string& password, const Bytes& salt,
                                     uint32_t iterations);

  Bytes encrypt(const uint8_t* in, size_t len) const;
  Bytes encrypt(const Bytes& in) const { return encrypt(in.data(), in.size()); }

  Bytes decrypt(const uint8_t* in, size_t len) const;
  Bytes decrypt(const Bytes& in) const { return decrypt(in.data(), in.size()); }

private:
  Key();

  uint8_t* key_{nullptr};
  size_t   alloc_len_{0};
};

Bytes random_bytes(size_t n);

} // namespace packwerk
