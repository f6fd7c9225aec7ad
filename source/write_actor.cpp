#include "packwerk/write_actor.hpp"
#include "packwerk/error.hpp"

#include <spdlog/spdlog.h>

#include <chrono>

namespace packwerk {

WriteActor::WriteActor(std::shared_ptr<Backend> backend, std::shared_ptr<IndexGate> gate)
  : backend_(std::move(backend)), gate_(std::move(gate)) {
  if (!backend_ || !gate_) throw Error(ErrorKind::Internal, "write actor requires backend and index");
  worker_ = std::thread([this] { run(); });
}

WriteActor::~WriteActor() {
  if (worker_.joinable()) {
    queue_.close();
    worker_.join();
  }
}

void WriteActor::record(std::exception_ptr e) {
  std::lock_guard lk(err_mu_);
  if (!error_) {
    error_ = e;
    spdlog::error("write actor: {}", describe(e));
  }
  failed_ = true;
}

void WriteActor::send(SavedPack pack) {
  if (failed_) {
    std::lock_guard lk(err_mu_);
    std::rethrow_exception(error_);
  }
  if (!queue_.push(std::move(pack))) {
    throw Error(ErrorKind::Internal, "write actor is closed");
  }
}

void WriteActor::write_one(SavedPack pack) {
  const PackId id = hash_bytes(pack.bytes);
  backend_->write(FileType::Pack, id, pack.bytes);
  pack.desc.id = id;
  pack.desc.time = std::chrono::system_clock::now();
  spdlog::info("pack {} written: {} blobs, {} bytes", id.to_hex(), pack.desc.blobs.size(),
               pack.bytes.size());
  written_++;
  gate_->accept(std::move(pack.desc), false);
}

void WriteActor::run() {
  while (auto pack = queue_.pop()) {
    // Уже стоящие в очереди паки пишем и после ошибки; отката нет.
    try {
      write_one(std::move(*pack));
    } catch (...) {
      record(std::current_exception());
    }
  }
}

void WriteActor::finalize() {
  if (finalized_) throw Error(ErrorKind::Internal, "write actor finalized twice");
  finalized_ = true;
  queue_.close();
  if (worker_.joinable()) worker_.join();
  std::lock_guard lk(err_mu_);
  if (error_) std::rethrow_exception(error_);
}

} // namespace packwerk
