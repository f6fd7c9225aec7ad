#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "packwerk/backend.hpp"
#include "packwerk/clock.hpp"
#include "packwerk/crypto.hpp"
#include "packwerk/index_file.hpp"

namespace packwerk {

// То, что конвейеру нужно от индекса: атомарная заявка на blob id
// и приём дескриптора записанного пака.
class IndexGate {
public:
  virtual ~IndexGate() = default;

  // true ровно для первого вызова с данным id среди всех, кто делит этот gate.
  virtual bool reserve(const BlobId& id) = 0;
  virtual void accept(IndexPack pack, bool is_removal) = 0;
};

struct BlobLocation {
  PackId    pack;
  IndexBlob blob;
};

static constexpr size_t INDEX_MAX_COUNT = 50000;
static constexpr std::chrono::seconds INDEX_MAX_AGE{300};

// Индекс в памяти + пакетная выгрузка IndexFile в хранилище (index/<sha256>).
class Indexer : public IndexGate {
public:
  Indexer(std::shared_ptr<Backend> backend, std::shared_ptr<const Key> key,
          SteadyClock clock = default_clock());

  bool reserve(const BlobId& id) override;
  void accept(IndexPack pack, bool is_removal) override;

  bool has(const BlobId& id) const;
  std::optional<BlobLocation> lookup(const BlobId& id) const;

  // Снимок живых паков (без помеченных к удалению).
  std::vector<IndexPack> packs() const;
  // Суммарный размер живых паков данного типа; для PackSizer.
  uint64_t total_pack_size(BlobType type) const;

  // Прочитать все index-файлы из хранилища. Возвращает число файлов.
  size_t load_existing();

  // Сохранить накопленное (если есть). Возвращает id index-файла.
  std::optional<Id> finalize();

  uint64_t files_saved() const;

private:
  void apply(const IndexPack& pack, bool is_removal);   // под mu_
  bool needs_save() const;                              // под mu_
  std::optional<IndexFile> take_file();                 // под mu_
  Id write_file(const IndexFile& file);                 // без mu_

  std::shared_ptr<Backend>   backend_;
  std::shared_ptr<const Key> key_;
  SteadyClock                clock_;

  mutable std::mutex mu_;
  std::unordered_set<BlobId, IdHash>               indexed_;
  std::unordered_map<BlobId, BlobLocation, IdHash> locations_;
  std::map<PackId, IndexPack>                      packs_;

  IndexFile                             file_;
  size_t                                count_ = 0;
  std::chrono::steady_clock::time_point created_;
  uint64_t                              files_saved_ = 0;
};

} // namespace packwerk
