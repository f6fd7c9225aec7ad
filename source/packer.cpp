#include "packwerk/packer.hpp"
#include "packwerk/error.hpp"
#include "packwerk/pack_format.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace packwerk {

uint32_t padding_size(uint64_t unpadded_total) {
  return PACK_ALIGN - static_cast<uint32_t>(unpadded_total % PACK_ALIGN);
}

Packer::Packer(std::shared_ptr<const Key> key, PackSizer sizer, PackerOptions opts)
  : key_(std::move(key)), sizer_(sizer), opts_(std::move(opts)) {
  if (!key_) throw Error(ErrorKind::Internal, "packer requires a key");
  if (!opts_.clock) opts_.clock = default_clock();
  created_ = opts_.clock();
}

void Packer::append(const Bytes& data, const BlobId& id, std::optional<uint32_t> uncompressed_length) {
  const uint32_t len = narrow<uint32_t>(data.size(), "blob ciphertext length");
  const uint32_t offset = size_;
  size_ = narrow<uint32_t>(static_cast<uint64_t>(size_) + len, "pack content size");
  file_.insert(file_.end(), data.begin(), data.end());
  index_.add(id, opts_.type, offset, len, uncompressed_length);
}

void Packer::add(const Bytes& data, const BlobId& id, uint32_t data_len,
                 std::optional<uint32_t> uncompressed_length) {
  if (finalized_) throw Error(ErrorKind::Internal, "packer already finalized");
  if (has(id)) {
    spdlog::debug("packer[{}]: blob {} already in pending pack", blob_type_name(opts_.type), id.to_hex());
    return;
  }
  append(data, id, uncompressed_length);
  count_++;
  pending_.insert(id);

  stats_.blobs++;
  stats_.data += data_len;
  stats_.data_packed += data.size();
}

bool Packer::needs_save(std::optional<uint32_t> size_limit) const {
  if (index_.empty()) return false;
  const uint32_t limit = std::min(size_limit.value_or(sizer_.pack_size()), MAX_PACK_SIZE);
  return count_ >= PACKER_MAX_COUNT ||
         size_ >= limit ||
         opts_.clock() - created_ >= PACKER_MAX_AGE;
}

std::optional<SavedPack> Packer::save_if_needed(std::optional<uint32_t> size_limit) {
  if (!needs_save(size_limit)) return std::nullopt;
  return save();
}

// Псевдоблоб со случайными байтами и нулевым id; в статистику не попадает.
void Packer::add_padding() {
  const uint64_t base = static_cast<uint64_t>(size_) +
                        PackHeader::binary_size(index_.blobs) + HEADER_ENTRY_LEN +
                        Key::OVERHEAD + HEADER_LENGTH_TRAILER;
  const uint32_t pad = padding_size(base);
  append(random_bytes(pad), BlobId{}, std::nullopt);
}

std::optional<SavedPack> Packer::save() {
  count_ = 0;
  created_ = opts_.clock();
  if (index_.empty()) return std::nullopt;

  if (opts_.padding) add_padding();

  const Bytes header = key_->encrypt(PackHeader{index_.blobs}.to_binary());
  file_.insert(file_.end(), header.begin(), header.end());
  put_u32le(file_, narrow<uint32_t>(header.size(), "pack header length"));

  SavedPack out{std::move(file_), std::move(index_)};
  file_ = Bytes{};
  index_ = IndexPack{};
  size_ = 0;
  pending_.clear();

  const uint32_t total = narrow<uint32_t>(out.bytes.size(), "pack size");
  sizer_.add_size(total);
  spdlog::debug("packer[{}]: pack ready, {} blobs, {} bytes", blob_type_name(opts_.type),
                out.desc.blobs.size(), total);
  return out;
}

std::pair<std::optional<SavedPack>, PackerStats> Packer::finalize() {
  if (finalized_) throw Error(ErrorKind::Internal, "packer finalized twice");
  auto last = save();
  finalized_ = true;
  return {std::move(last), stats_};
}

} // namespace packwerk
