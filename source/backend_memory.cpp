#include "packwerk/backend.hpp"
#include "packwerk/error.hpp"

#include <spdlog/spdlog.h>

namespace packwerk {

const char* file_type_dir(FileType t) {
  return t == FileType::Pack ? "data" : "index";
}

void MemoryBackend::write(FileType type, const Id& id, const Bytes& data) {
  FailHook hook;
  {
    std::lock_guard lk(mu_);
    hook = fail_write_;
  }
  if (hook && hook(type, id)) {
    spdlog::error("memory backend: injected write failure for {}/{}", file_type_dir(type), id.to_hex());
    throw Error(ErrorKind::Backend, "write failed: " + id.to_hex());
  }
  std::lock_guard lk(mu_);
  files_[{type, id}] = data;
  writes_++;
}

Bytes MemoryBackend::read_full(FileType type, const Id& id) {
  std::lock_guard lk(mu_);
  auto it = files_.find({type, id});
  if (it == files_.end()) {
    throw Error(ErrorKind::Backend, std::string("no such file: ") + file_type_dir(type) + "/" + id.to_hex());
  }
  return it->second;
}

Bytes MemoryBackend::read_partial(FileType type, const Id& id, uint32_t offset, uint32_t length) {
  std::lock_guard lk(mu_);
  auto it = files_.find({type, id});
  if (it == files_.end()) {
    throw Error(ErrorKind::Backend, std::string("no such file: ") + file_type_dir(type) + "/" + id.to_hex());
  }
  const Bytes& f = it->second;
  if (static_cast<uint64_t>(offset) + length > f.size()) {
    throw Error(ErrorKind::Backend,
                "partial read out of range: " + std::to_string(offset) + "+" +
                std::to_string(length) + " > " + std::to_string(f.size()));
  }
  return Bytes(f.begin() + offset, f.begin() + offset + length);
}

std::vector<Id> MemoryBackend::list(FileType type) {
  std::lock_guard lk(mu_);
  std::vector<Id> out;
  for (auto& [k, v] : files_) {
    if (k.first == type) out.push_back(k.second);
  }
  return out;
}

void MemoryBackend::remove(FileType type, const Id& id) {
  std::lock_guard lk(mu_);
  if (files_.erase({type, id}) == 0) {
    throw Error(ErrorKind::Backend, std::string("remove: no such file ") + id.to_hex());
  }
}

void MemoryBackend::set_fail_write(FailHook hook) {
  std::lock_guard lk(mu_);
  fail_write_ = std::move(hook);
}

size_t MemoryBackend::count(FileType type) const {
  std::lock_guard lk(mu_);
  size_t n = 0;
  for (auto& [k, v] : files_) if (k.first == type) ++n;
  return n;
}

} // namespace packwerk
