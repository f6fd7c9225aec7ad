#pragma once
#include <cstdint>
#include <memory>
#include <optional>

#include "packwerk/blob.hpp"
#include "packwerk/crypto.hpp"

namespace packwerk {

struct EnvelopeOptions {
  int  compression_level = 0;   // 0 = без сжатия
  bool verify = false;          // самопроверка: расшифровать/распаковать и сравнить
};

// Сжатие (опционально) + шифрование. Признак сжатия не хранится в шифротексте:
// длина до сжатия уходит в запись заголовка пака.
class CryptoEnvelope {
public:
  CryptoEnvelope(std::shared_ptr<const Key> key, EnvelopeOptions opts);

  const Key& key() const noexcept { return *key_; }
  std::shared_ptr<const Key> key_ptr() const { return key_; }
  const EnvelopeOptions& options() const noexcept { return opts_; }

  Bytes encrypt(const Bytes& plain) const;
  Bytes decrypt(const Bytes& cipher) const;

  ProcessedBlob process(const Bytes& plain) const;
  // Обратный проход по результату process(); несовпадение с plain = Verification.
  void verify(const Bytes& plain, const ProcessedBlob& processed) const;

  Bytes decrypt_and_maybe_decompress(const Bytes& cipher,
                                     std::optional<uint32_t> uncompressed_length) const;

private:
  std::shared_ptr<const Key> key_;
  EnvelopeOptions opts_;
};

} // namespace packwerk
