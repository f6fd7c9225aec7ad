#include "packwerk/pack_reader.hpp"
#include "packwerk/error.hpp"

#include <spdlog/spdlog.h>

namespace packwerk {

PackHeader read_pack_header(Backend& backend, const Key& key, const PackId& pack_id,
                            uint32_t pack_size) {
  if (pack_size < HEADER_LENGTH_TRAILER) {
    throw Error(ErrorKind::Format, "pack " + pack_id.to_hex() + " too small for a trailer");
  }
  const Bytes trailer = backend.read_partial(FileType::Pack, pack_id,
                                             pack_size - HEADER_LENGTH_TRAILER,
                                             HEADER_LENGTH_TRAILER);
  const uint32_t header_len = get_u32le(trailer.data());
  if (static_cast<uint64_t>(header_len) + HEADER_LENGTH_TRAILER > pack_size) {
    throw Error(ErrorKind::Format,
                "pack " + pack_id.to_hex() + ": header length " + std::to_string(header_len) +
                " exceeds pack size " + std::to_string(pack_size));
  }
  const uint32_t header_start = pack_size - HEADER_LENGTH_TRAILER - header_len;
  const Bytes enc = backend.read_partial(FileType::Pack, pack_id, header_start, header_len);

  PackHeader h = PackHeader::from_binary(key.decrypt(enc));
  if (h.content_size() != header_start) {
    throw Error(ErrorKind::Format,
                "pack " + pack_id.to_hex() + ": header describes " +
                std::to_string(h.content_size()) + " bytes, pack holds " +
                std::to_string(header_start));
  }
  return h;
}

Bytes read_blob_raw(Backend& backend, const PackId& pack_id, const IndexBlob& entry) {
  return backend.read_partial(FileType::Pack, pack_id, entry.offset, entry.length);
}

Bytes read_blob(Backend& backend, const CryptoEnvelope& envelope, const PackId& pack_id,
                const IndexBlob& entry) {
  const Bytes raw = read_blob_raw(backend, pack_id, entry);
  Bytes plain = envelope.decrypt_and_maybe_decompress(raw, entry.uncompressed_length);
  if (hash_bytes(plain) != entry.id) {
    spdlog::error("blob {} in pack {}: hash mismatch", entry.id.to_hex(), pack_id.to_hex());
    throw Error(ErrorKind::Verification, "blob " + entry.id.to_hex() + " does not match its id");
  }
  return plain;
}

} // namespace packwerk
