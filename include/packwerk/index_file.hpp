#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <vector>

#include "packwerk/blob.hpp"

namespace packwerk {

// Одна запись о блобе внутри пака.
struct IndexBlob {
  BlobId                  id;
  BlobType                type = BlobType::Data;
  uint32_t                offset = 0;
  uint32_t                length = 0;
  std::optional<uint32_t> uncompressed_length;

  bool operator==(const IndexBlob&) const = default;
};

// Дескриптор пака. id назначается только при записи (хеш полного содержимого),
// time ставит WriteActor после успешной записи.
struct IndexPack {
  PackId                                               id;
  std::vector<IndexBlob>                               blobs;
  std::optional<std::chrono::system_clock::time_point> time;

  void add(const BlobId& id, BlobType type, uint32_t offset, uint32_t length,
           std::optional<uint32_t> uncompressed_length);

  // Полный размер пак-файла, вычисленный по записям.
  uint32_t pack_size() const;
  bool empty() const { return blobs.empty(); }
};

// Файл индекса: пачка дескрипторов + паки, помеченные к удалению.
struct IndexFile {
  std::vector<IndexPack> packs;
  std::vector<IndexPack> packs_to_delete;

  void add(IndexPack pack, bool is_removal);
  bool empty() const { return packs.empty() && packs_to_delete.empty(); }

  // PWIX v1: magic, version, count, затем записи; всё little-endian.
  Bytes to_binary() const;
  static IndexFile from_binary(const Bytes& data);
};

} // namespace packwerk
