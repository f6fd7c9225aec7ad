// source/pack_format.cpp
#include "packwerk/pack_format.hpp"
#include "packwerk/error.hpp"

#include <cstring>

namespace packwerk {

const char* blob_type_name(BlobType t) {
  return t == BlobType::Tree ? "tree" : "data";
}

uint8_t entry_tag(BlobType type, bool compressed) {
  if (type == BlobType::Tree) return compressed ? TAG_TREE_COMPRESSED : TAG_TREE;
  return compressed ? TAG_DATA_COMPRESSED : TAG_DATA;
}

size_t header_entry_len(const IndexBlob& b) {
  return b.uncompressed_length ? HEADER_ENTRY_LEN_COMPRESSED : HEADER_ENTRY_LEN;
}

void put_u32le(Bytes& out, uint32_t v) {
  out.push_back(static_cast<uint8_t>(v));
  out.push_back(static_cast<uint8_t>(v >> 8));
  out.push_back(static_cast<uint8_t>(v >> 16));
  out.push_back(static_cast<uint8_t>(v >> 24));
}

uint32_t get_u32le(const uint8_t* p) {
  return static_cast<uint32_t>(p[0]) |
         (static_cast<uint32_t>(p[1]) << 8) |
         (static_cast<uint32_t>(p[2]) << 16) |
         (static_cast<uint32_t>(p[3]) << 24);
}

void put_entry(Bytes& out, const IndexBlob& b) {
  out.push_back(entry_tag(b.type, b.uncompressed_length.has_value()));
  put_u32le(out, b.offset);
  put_u32le(out, b.length);
  if (b.uncompressed_length) put_u32le(out, *b.uncompressed_length);
  out.insert(out.end(), b.id.raw.begin(), b.id.raw.end());
}

IndexBlob get_entry(const uint8_t*& p, const uint8_t* end) {
  if (end - p < (ptrdiff_t)HEADER_ENTRY_LEN) {
    throw Error(ErrorKind::Format, "truncated header entry");
  }
  IndexBlob b;
  const uint8_t tag = *p++;
  bool compressed = false;
  switch (tag) {
    case TAG_DATA:            b.type = BlobType::Data; break;
    case TAG_TREE:            b.type = BlobType::Tree; break;
    case TAG_DATA_COMPRESSED: b.type = BlobType::Data; compressed = true; break;
    case TAG_TREE_COMPRESSED: b.type = BlobType::Tree; compressed = true; break;
    default:
      throw Error(ErrorKind::Format, "unknown header entry tag " + std::to_string(tag));
  }
  if (compressed && end - p < (ptrdiff_t)(HEADER_ENTRY_LEN_COMPRESSED - 1)) {
    throw Error(ErrorKind::Format, "truncated compressed header entry");
  }
  b.offset = get_u32le(p); p += 4;
  b.length = get_u32le(p); p += 4;
  if (compressed) { b.uncompressed_length = get_u32le(p); p += 4; }
  std::memcpy(b.id.raw.data(), p, b.id.raw.size());
  p += b.id.raw.size();
  return b;
}

size_t PackHeader::binary_size(const std::vector<IndexBlob>& blobs) {
  size_t n = 0;
  for (const auto& b : blobs) n += header_entry_len(b);
  return n;
}

Bytes PackHeader::to_binary() const {
  Bytes out;
  out.reserve(binary_size(blobs));
  for (const auto& b : blobs) put_entry(out, b);
  return out;
}

PackHeader PackHeader::from_binary(const Bytes& data) {
  PackHeader h;
  const uint8_t* p   = data.data();
  const uint8_t* end = data.data() + data.size();
  uint64_t expect_offset = 0;
  while (p < end) {
    IndexBlob b = get_entry(p, end);
    if (b.offset != expect_offset) {
      throw Error(ErrorKind::Format,
                  "header entry #" + std::to_string(h.blobs.size()) + " at offset " +
                  std::to_string(b.offset) + ", expected " + std::to_string(expect_offset));
    }
    expect_offset += b.length;
    h.blobs.push_back(b);
  }
  return h;
}

uint32_t PackHeader::content_size() const {
  if (blobs.empty()) return 0;
  const auto& last = blobs.back();
  return narrow<uint32_t>(static_cast<uint64_t>(last.offset) + last.length, "pack content size");
}

PackHeader parse_pack(const Bytes& pack, const Key& key) {
  if (pack.size() < HEADER_LENGTH_TRAILER) {
    throw Error(ErrorKind::Format, "pack shorter than header length trailer");
  }
  const uint32_t header_len = get_u32le(pack.data() + pack.size() - HEADER_LENGTH_TRAILER);
  if (static_cast<uint64_t>(header_len) + HEADER_LENGTH_TRAILER > pack.size()) {
    throw Error(ErrorKind::Format,
                "header length " + std::to_string(header_len) + " exceeds pack size " +
                std::to_string(pack.size()));
  }

  const size_t header_start = pack.size() - HEADER_LENGTH_TRAILER - header_len;
  Bytes header = key.decrypt(pack.data() + header_start, header_len);
  PackHeader h = PackHeader::from_binary(header);

  if (h.content_size() != header_start) {
    throw Error(ErrorKind::Format,
                "header describes " + std::to_string(h.content_size()) +
                " bytes, pack holds " + std::to_string(header_start));
  }
  return h;
}

} // namespace packwerk
