#pragma once
#include <atomic>
#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

#include "packwerk/backend.hpp"
#include "packwerk/bounded_queue.hpp"
#include "packwerk/envelope.hpp"
#include "packwerk/indexer.hpp"
#include "packwerk/packer.hpp"
#include "packwerk/write_actor.hpp"

namespace packwerk {

// Конвейер записи блобов одного типа:
//   add() --(рандеву)--> [reserve + сжатие/шифрование] --(1)--> [Packer] --(1)--> WriteActor
// Дедупликация только через gate.reserve(): блоб, id которого уже заявлен, молча пропускается.
class RepositoryPacker {
public:
  RepositoryPacker(std::shared_ptr<Backend> backend, std::shared_ptr<IndexGate> gate,
                   CryptoEnvelope envelope, PackSizer sizer, PackerOptions opts = {});
  ~RepositoryPacker();

  RepositoryPacker(const RepositoryPacker&) = delete;
  RepositoryPacker& operator=(const RepositoryPacker&) = delete;

  // Блокируется, пока рабочий поток не заберёт блоб.
  void add(Bytes data, const BlobId& id);
  void add_with_size_limit(Bytes data, const BlobId& id, std::optional<uint32_t> size_limit);

  // Уже зашифрованный блоб, мимо конверта. Выполняется в потоке вызывающего.
  void add_raw(const Bytes& data, const BlobId& id, uint32_t data_len,
               std::optional<uint32_t> uncompressed_length,
               std::optional<uint32_t> size_limit = std::nullopt);

  // Дописать всё, дождаться записи, вернуть статистику или первую ошибку.
  PackerStats finalize();

  BlobType blob_type() const noexcept { return blob_type_; }
  const CryptoEnvelope& envelope() const noexcept { return envelope_; }

private:
  enum class State : uint8_t { Active, Draining, Finalized };

  struct Job {
    Bytes                   data;
    BlobId                  id;
    std::optional<uint32_t> size_limit;
  };
  struct Processed {
    ProcessedBlob           blob;
    BlobId                  id;
    std::optional<uint32_t> size_limit;
  };

  void run_crypt();
  void run_pack();
  void add_to_packer(const Bytes& data, const BlobId& id, uint32_t data_len,
                     std::optional<uint32_t> uncompressed_length,
                     std::optional<uint32_t> size_limit);
  void check_active() const;
  void fail(std::exception_ptr e);

  std::shared_ptr<IndexGate> gate_;
  CryptoEnvelope             envelope_;
  BlobType                   blob_type_;

  std::mutex packer_mu_;
  Packer     packer_;
  std::mutex handoff_mu_;     // сохраняет порядок паков при передаче в actor_
  WriteActor actor_;

  BoundedQueue<Job>       in_{0};
  BoundedQueue<Processed> processed_{1};
  std::thread             crypt_thread_;
  std::thread             pack_thread_;

  std::atomic<State> state_{State::Active};
  mutable std::mutex err_mu_;
  std::exception_ptr error_;
  std::atomic<bool>  failed_{false};
};

} // namespace packwerk
