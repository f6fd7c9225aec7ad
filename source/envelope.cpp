#include "packwerk/envelope.hpp"
#include "packwerk/compress.hpp"
#include "packwerk/error.hpp"

#include <spdlog/spdlog.h>

namespace packwerk {

CryptoEnvelope::CryptoEnvelope(std::shared_ptr<const Key> key, EnvelopeOptions opts)
  : key_(std::move(key)), opts_(opts) {
  if (!key_) throw Error(ErrorKind::Internal, "envelope requires a key");
}

Bytes CryptoEnvelope::encrypt(const Bytes& plain) const {
  return key_->encrypt(plain);
}

Bytes CryptoEnvelope::decrypt(const Bytes& cipher) const {
  return key_->decrypt(cipher);
}

ProcessedBlob CryptoEnvelope::process(const Bytes& plain) const {
  ProcessedBlob out;
  out.data_len = narrow<uint32_t>(plain.size(), "blob length");

  if (opts_.compression_level != 0) {
    Bytes packed = compress(plain, opts_.compression_level);
    out.data = key_->encrypt(packed);
    out.uncompressed_length = out.data_len;
  } else {
    out.data = key_->encrypt(plain);
  }

  if (opts_.verify) verify(plain, out);
  return out;
}

void CryptoEnvelope::verify(const Bytes& plain, const ProcessedBlob& processed) const {
  Bytes back;
  try {
    back = decrypt_and_maybe_decompress(processed.data, processed.uncompressed_length);
  } catch (const Error& e) {
    spdlog::error("self-verify: round trip failed: {}", e.what());
    throw Error(ErrorKind::Verification, std::string("self-verify round trip failed: ") + e.what());
  }
  if (back != plain) {
    spdlog::error("self-verify: data mismatch ({} bytes)", plain.size());
    throw Error(ErrorKind::Verification, "self-verify: round trip does not reproduce input");
  }
}

Bytes CryptoEnvelope::decrypt_and_maybe_decompress(const Bytes& cipher,
                                                   std::optional<uint32_t> uncompressed_length) const {
  Bytes plain = key_->decrypt(cipher);
  if (!uncompressed_length) return plain;
  return decompress(plain, *uncompressed_length);
}

} // namespace packwerk
