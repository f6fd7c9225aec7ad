#include "packwerk/repository_packer.hpp"
#include "packwerk/error.hpp"

#include <spdlog/spdlog.h>

#include <tuple>

namespace packwerk {

RepositoryPacker::RepositoryPacker(std::shared_ptr<Backend> backend, std::shared_ptr<IndexGate> gate,
                                   CryptoEnvelope envelope, PackSizer sizer, PackerOptions opts)
  : gate_(gate),
    envelope_(std::move(envelope)),
    blob_type_(opts.type),
    packer_(envelope_.key_ptr(), sizer, std::move(opts)),
    actor_(std::move(backend), std::move(gate)) {
  crypt_thread_ = std::thread([this] { run_crypt(); });
  pack_thread_  = std::thread([this] { run_pack(); });
}

RepositoryPacker::~RepositoryPacker() {
  if (state_ == State::Active) {
    spdlog::warn("repository packer [{}] dropped without finalize, pending blobs lost",
                 blob_type_name(blob_type_));
    in_.abort();
    processed_.abort();
  }
  if (crypt_thread_.joinable()) crypt_thread_.join();
  if (pack_thread_.joinable()) pack_thread_.join();
}

void RepositoryPacker::fail(std::exception_ptr e) {
  {
    std::lock_guard lk(err_mu_);
    if (!error_) {
      error_ = e;
      spdlog::error("repository packer [{}]: {}", blob_type_name(blob_type_), describe(e));
    }
  }
  failed_ = true;
  in_.abort();
  processed_.abort();
}

void RepositoryPacker::check_active() const {
  if (failed_) {
    std::lock_guard lk(err_mu_);
    throw Error(ErrorKind::Internal, "repository packer failed: " + describe(error_));
  }
  if (state_ != State::Active) {
    throw Error(ErrorKind::Internal, "repository packer is finalized");
  }
}

void RepositoryPacker::add(Bytes data, const BlobId& id) {
  add_with_size_limit(std::move(data), id, std::nullopt);
}

void RepositoryPacker::add_with_size_limit(Bytes data, const BlobId& id,
                                           std::optional<uint32_t> size_limit) {
  check_active();
  if (!in_.push(Job{std::move(data), id, size_limit})) {
    check_active();
    throw Error(ErrorKind::Internal, "repository packer queue closed");
  }
}

void RepositoryPacker::add_raw(const Bytes& data, const BlobId& id, uint32_t data_len,
                               std::optional<uint32_t> uncompressed_length,
                               std::optional<uint32_t> size_limit) {
  check_active();
  if (!gate_->reserve(id)) return;
  try {
    add_to_packer(data, id, data_len, uncompressed_length, size_limit);
  } catch (...) {
    fail(std::current_exception());
    throw;
  }
}

void RepositoryPacker::add_to_packer(const Bytes& data, const BlobId& id, uint32_t data_len,
                                     std::optional<uint32_t> uncompressed_length,
                                     std::optional<uint32_t> size_limit) {
  std::unique_lock lk(packer_mu_);
  packer_.add(data, id, data_len, uncompressed_length);
  auto saved = packer_.save_if_needed(size_limit);
  if (!saved) return;

  // Сначала берём handoff_mu_, потом отпускаем упаковщик: паки уходят в actor_ в порядке сборки,
  // а запись в хранилище идёт без блокировки упаковщика.
  std::unique_lock hand(handoff_mu_);
  lk.unlock();
  actor_.send(std::move(*saved));
}

void RepositoryPacker::run_crypt() {
  try {
    while (auto job = in_.pop()) {
      if (!gate_->reserve(job->id)) {
        spdlog::debug("blob {} already present, skipped", job->id.to_hex());
        continue;
      }
      ProcessedBlob pb = envelope_.process(job->data);
      if (!processed_.push(Processed{std::move(pb), job->id, job->size_limit})) break;
    }
  } catch (...) {
    fail(std::current_exception());
  }
  processed_.close();
}

void RepositoryPacker::run_pack() {
  try {
    while (auto p = processed_.pop()) {
      add_to_packer(p->blob.data, p->id, p->blob.data_len, p->blob.uncompressed_length,
                    p->size_limit);
    }
  } catch (...) {
    fail(std::current_exception());
  }
}

PackerStats RepositoryPacker::finalize() {
  State expected = State::Active;
  if (!state_.compare_exchange_strong(expected, State::Draining)) {
    throw Error(ErrorKind::Internal, "repository packer finalized twice");
  }

  in_.close();
  if (crypt_thread_.joinable()) crypt_thread_.join();
  if (pack_thread_.joinable()) pack_thread_.join();

  PackerStats stats;
  if (!failed_) {
    try {
      std::optional<SavedPack> last;
      {
        std::lock_guard lk(packer_mu_);
        std::tie(last, stats) = packer_.finalize();
      }
      if (last) {
        std::lock_guard hand(handoff_mu_);
        actor_.send(std::move(*last));
      }
    } catch (...) {
      fail(std::current_exception());
    }
  }

  std::exception_ptr actor_error;
  try {
    actor_.finalize();
  } catch (...) {
    actor_error = std::current_exception();
  }
  state_ = State::Finalized;

  {
    std::lock_guard lk(err_mu_);
    if (error_) std::rethrow_exception(error_);
  }
  if (actor_error) std::rethrow_exception(actor_error);

  spdlog::info("repository packer [{}] finalized: {} blobs, {} bytes -> {} bytes packed",
               blob_type_name(blob_type_), stats.blobs, stats.data, stats.data_packed);
  return stats;
}

} // namespace packwerk
