#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <unordered_set>
#include <utility>

#include "packwerk/blob.hpp"
#include "packwerk/clock.hpp"
#include "packwerk/crypto.hpp"
#include "packwerk/index_file.hpp"
#include "packwerk/pack_sizer.hpp"

namespace packwerk {

static constexpr uint32_t PACKER_MAX_COUNT = 10000;
static constexpr std::chrono::seconds PACKER_MAX_AGE{300};

struct PackerStats {
  uint64_t blobs = 0;
  uint64_t data = 0;          // открытый текст
  uint64_t data_packed = 0;   // шифротекст

  PackerStats& operator+=(const PackerStats& o) {
    blobs += o.blobs;
    data += o.data;
    data_packed += o.data_packed;
    return *this;
  }
  bool operator==(const PackerStats&) const = default;
};

// Готовый пак: байты файла + дескриптор (id ещё не назначен).
struct SavedPack {
  Bytes     bytes;
  IndexPack desc;
};

// Сколько байт паддинга нужно, чтобы unpadded_total (уже с записью о паддинге,
// шифро-оверхедом заголовка и трейлером) стал кратен PACK_ALIGN. Всегда 1..=PACK_ALIGN.
uint32_t padding_size(uint64_t unpadded_total);

struct PackerOptions {
  BlobType    type = BlobType::Data;
  bool        padding = true;
  SteadyClock clock = default_clock();
};

// Накопитель одного пака. Не потокобезопасен: снаружи под мьютексом.
class Packer {
public:
  Packer(std::shared_ptr<const Key> key, PackSizer sizer, PackerOptions opts = {});

  void add(const Bytes& data, const BlobId& id, uint32_t data_len,
           std::optional<uint32_t> uncompressed_length);

  bool needs_save(std::optional<uint32_t> size_limit = std::nullopt) const;
  std::optional<SavedPack> save_if_needed(std::optional<uint32_t> size_limit = std::nullopt);
  std::optional<SavedPack> save();

  // Последний save + итоговая статистика. Только один раз.
  std::pair<std::optional<SavedPack>, PackerStats> finalize();

  bool has(const BlobId& id) const { return pending_.count(id) != 0; }

  BlobType blob_type() const noexcept { return opts_.type; }
  uint32_t size() const noexcept { return size_; }
  uint32_t count() const noexcept { return count_; }
  const PackerStats& stats() const noexcept { return stats_; }
  const PackSizer& sizer() const noexcept { return sizer_; }

private:
  void append(const Bytes& data, const BlobId& id, std::optional<uint32_t> uncompressed_length);
  void add_padding();

  std::shared_ptr<const Key> key_;
  PackSizer     sizer_;
  PackerOptions opts_;

  Bytes     file_;
  uint32_t  size_ = 0;
  uint32_t  count_ = 0;
  std::chrono::steady_clock::time_point created_;
  IndexPack index_;
  std::unordered_set<BlobId, IdHash> pending_;
  PackerStats stats_;
  bool finalized_ = false;
};

} // namespace packwerk
