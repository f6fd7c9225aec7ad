#pragma once
#include <atomic>
#include <exception>
#include <memory>
#include <mutex>
#include <thread>

#include "packwerk/backend.hpp"
#include "packwerk/bounded_queue.hpp"
#include "packwerk/indexer.hpp"
#include "packwerk/packer.hpp"

namespace packwerk {

// Один поток записи готовых паков: sha256 -> backend.write -> время -> gate.accept.
// Очередь на один пак: упаковщик ждёт, пока запись не освободит место.
class WriteActor {
public:
  WriteActor(std::shared_ptr<Backend> backend, std::shared_ptr<IndexGate> gate);
  ~WriteActor();

  WriteActor(const WriteActor&) = delete;
  WriteActor& operator=(const WriteActor&) = delete;

  // После первой ошибки пробрасывает её же.
  void send(SavedPack pack);

  // Закрыть очередь, дождаться записи остатка, пробросить первую ошибку.
  void finalize();

  uint64_t packs_written() const noexcept { return written_; }

private:
  void run();
  void write_one(SavedPack pack);
  void record(std::exception_ptr e);

  std::shared_ptr<Backend>   backend_;
  std::shared_ptr<IndexGate> gate_;
  BoundedQueue<SavedPack>    queue_{1};
  std::thread                worker_;

  std::mutex            err_mu_;
  std::exception_ptr    error_;
  std::atomic<bool>     failed_{false};
  std::atomic<uint64_t> written_{0};
  bool                  finalized_ = false;
};

} // namespace packwerk
