#include "packwerk/indexer.hpp"
#include "packwerk/error.hpp"

#include <spdlog/spdlog.h>

namespace packwerk {

Indexer::Indexer(std::shared_ptr<Backend> backend, std::shared_ptr<const Key> key, SteadyClock clock)
  : backend_(std::move(backend)), key_(std::move(key)), clock_(std::move(clock)) {
  if (!backend_ || !key_) throw Error(ErrorKind::Internal, "indexer requires backend and key");
  created_ = clock_();
}

bool Indexer::reserve(const BlobId& id) {
  std::lock_guard lk(mu_);
  return indexed_.insert(id).second;
}

void Indexer::apply(const IndexPack& pack, bool is_removal) {
  if (is_removal) {
    for (const auto& b : pack.blobs) {
      auto it = locations_.find(b.id);
      if (it != locations_.end() && it->second.pack == pack.id) locations_.erase(it);
    }
    packs_.erase(pack.id);
    return;
  }
  for (const auto& b : pack.blobs) {
    if (b.id.is_null()) continue;   // паддинг
    indexed_.insert(b.id);
    locations_[b.id] = BlobLocation{pack.id, b};
  }
  packs_[pack.id] = pack;
}

bool Indexer::needs_save() const {
  const auto age = clock_() - created_;
  return count_ >= INDEX_MAX_COUNT || age >= INDEX_MAX_AGE;
}

std::optional<IndexFile> Indexer::take_file() {
  if (file_.empty()) return std::nullopt;
  IndexFile out = std::move(file_);
  file_ = IndexFile{};
  count_ = 0;
  created_ = clock_();
  return out;
}

Id Indexer::write_file(const IndexFile& file) {
  const Bytes enc = key_->encrypt(file.to_binary());
  const Id id = hash_bytes(enc);
  backend_->write(FileType::Index, id, enc);
  spdlog::info("index saved: {} ({} packs, {} removed)", id.to_hex(), file.packs.size(),
               file.packs_to_delete.size());
  std::lock_guard lk(mu_);
  files_saved_++;
  return id;
}

void Indexer::accept(IndexPack pack, bool is_removal) {
  std::optional<IndexFile> ready;
  {
    std::lock_guard lk(mu_);
    apply(pack, is_removal);
    count_ += pack.blobs.size();
    file_.add(std::move(pack), is_removal);
    if (needs_save()) ready = take_file();
  }
  if (ready) write_file(*ready);
}

bool Indexer::has(const BlobId& id) const {
  std::lock_guard lk(mu_);
  return indexed_.count(id) != 0;
}

std::optional<BlobLocation> Indexer::lookup(const BlobId& id) const {
  std::lock_guard lk(mu_);
  auto it = locations_.find(id);
  if (it == locations_.end()) return std::nullopt;
  return it->second;
}

std::vector<IndexPack> Indexer::packs() const {
  std::lock_guard lk(mu_);
  std::vector<IndexPack> out;
  out.reserve(packs_.size());
  for (const auto& [id, p] : packs_) out.push_back(p);
  return out;
}

uint64_t Indexer::total_pack_size(BlobType type) const {
  std::lock_guard lk(mu_);
  uint64_t total = 0;
  for (const auto& [id, p] : packs_) {
    if (!p.blobs.empty() && p.blobs.front().type == type) total += p.pack_size();
  }
  return total;
}

size_t Indexer::load_existing() {
  const auto ids = backend_->list(FileType::Index);
  // Сначала все добавления, потом удаления: порядок файлов в хранилище не задан.
  std::vector<IndexPack> removals;
  for (const auto& id : ids) {
    const Bytes enc = backend_->read_full(FileType::Index, id);
    if (hash_bytes(enc) != id) {
      throw Error(ErrorKind::Verification, "index file " + id.to_hex() + " does not match its id");
    }
    IndexFile f = IndexFile::from_binary(key_->decrypt(enc));
    std::lock_guard lk(mu_);
    for (const auto& p : f.packs) apply(p, false);
    for (auto& p : f.packs_to_delete) removals.push_back(std::move(p));
  }
  {
    std::lock_guard lk(mu_);
    for (const auto& p : removals) apply(p, true);
  }
  spdlog::info("loaded {} index files, {} packs", ids.size(), packs().size());
  return ids.size();
}

std::optional<Id> Indexer::finalize() {
  std::optional<IndexFile> ready;
  {
    std::lock_guard lk(mu_);
    ready = take_file();
  }
  if (!ready) return std::nullopt;
  return write_file(*ready);
}

uint64_t Indexer::files_saved() const {
  std::lock_guard lk(mu_);
  return files_saved_;
}

} // namespace packwerk
