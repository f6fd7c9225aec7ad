#include "packwerk/index_file.hpp"
#include "packwerk/error.hpp"
#include "packwerk/pack_format.hpp"

#include <algorithm>
#include <cstring>

namespace packwerk {

static constexpr char     kIndexMagic[4] = {'P', 'W', 'I', 'X'};
static constexpr uint32_t kIndexVersion  = 1;

static void put_u64le(Bytes& out, uint64_t v) {
  put_u32le(out, static_cast<uint32_t>(v));
  put_u32le(out, static_cast<uint32_t>(v >> 32));
}

static uint64_t get_u64le(const uint8_t* p) {
  return static_cast<uint64_t>(get_u32le(p)) | (static_cast<uint64_t>(get_u32le(p + 4)) << 32);
}

static void need(const uint8_t* p, const uint8_t* end, size_t n, const char* what) {
  if (end - p < (ptrdiff_t)n) throw Error(ErrorKind::Format, std::string("index file truncated at ") + what);
}

void IndexPack::add(const BlobId& blob_id, BlobType type, uint32_t offset, uint32_t length,
                    std::optional<uint32_t> uncompressed_length) {
  blobs.push_back(IndexBlob{blob_id, type, offset, length, uncompressed_length});
}

uint32_t IndexPack::pack_size() const {
  uint64_t size = HEADER_LENGTH_TRAILER + Key::OVERHEAD + PackHeader::binary_size(blobs);
  if (!blobs.empty()) size += static_cast<uint64_t>(blobs.back().offset) + blobs.back().length;
  return narrow<uint32_t>(size, "pack size");
}

void IndexFile::add(IndexPack pack, bool is_removal) {
  if (is_removal) packs_to_delete.push_back(std::move(pack));
  else            packs.push_back(std::move(pack));
}

Bytes IndexFile::to_binary() const {
  Bytes out;
  out.insert(out.end(), kIndexMagic, kIndexMagic + 4);
  put_u32le(out, kIndexVersion);
  put_u32le(out, narrow<uint32_t>(packs.size() + packs_to_delete.size(), "index pack count"));

  auto put_pack = [&](const IndexPack& p, uint8_t kind) {
    out.push_back(kind);
    out.insert(out.end(), p.id.raw.begin(), p.id.raw.end());
    if (p.time) {
      out.push_back(1);
      const auto secs = std::chrono::duration_cast<std::chrono::seconds>(
                            p.time->time_since_epoch()).count();
      put_u64le(out, static_cast<uint64_t>(secs));
    } else {
      out.push_back(0);
      put_u64le(out, 0);
    }
    put_u32le(out, narrow<uint32_t>(p.blobs.size(), "index blob count"));
    for (const auto& b : p.blobs) put_entry(out, b);
  };

  for (const auto& p : packs)           put_pack(p, 0);
  for (const auto& p : packs_to_delete) put_pack(p, 1);
  return out;
}

IndexFile IndexFile::from_binary(const Bytes& data) {
  const uint8_t* p   = data.data();
  const uint8_t* end = data.data() + data.size();

  need(p, end, 12, "header");
  if (std::memcmp(p, kIndexMagic, 4) != 0) throw Error(ErrorKind::Format, "bad index file magic");
  p += 4;
  const uint32_t version = get_u32le(p); p += 4;
  if (version != kIndexVersion) {
    throw Error(ErrorKind::Format, "unsupported index file version " + std::to_string(version));
  }
  const uint32_t count = get_u32le(p); p += 4;

  IndexFile f;
  for (uint32_t i = 0; i < count; ++i) {
    need(p, end, 1 + 32 + 1 + 8 + 4, "pack record");
    const uint8_t kind = *p++;
    if (kind > 1) throw Error(ErrorKind::Format, "bad index record kind " + std::to_string(kind));

    IndexPack pack;
    std::memcpy(pack.id.raw.data(), p, pack.id.raw.size());
    p += pack.id.raw.size();
    const uint8_t has_time = *p++;
    const uint64_t secs = get_u64le(p); p += 8;
    if (has_time) {
      pack.time = std::chrono::system_clock::time_point(std::chrono::seconds(static_cast<int64_t>(secs)));
    }
    const uint32_t blobs = get_u32le(p); p += 4;
    pack.blobs.reserve(std::min<size_t>(blobs, static_cast<size_t>(end - p) / HEADER_ENTRY_LEN));
    for (uint32_t j = 0; j < blobs; ++j) pack.blobs.push_back(get_entry(p, end));

    f.add(std::move(pack), kind == 1);
  }
  if (p != end) throw Error(ErrorKind::Format, "trailing bytes after index records");
  return f;
}

} // namespace packwerk
