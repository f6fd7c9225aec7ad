#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "packwerk/id.hpp"

namespace packwerk {

enum class FileType : uint8_t { Pack, Index };

const char* file_type_dir(FileType t);

// Байтовое хранилище. Ретраев здесь нет: любая ошибка -> Error(Backend).
class Backend {
public:
  virtual ~Backend() = default;

  virtual void  write(FileType type, const Id& id, const Bytes& data) = 0;
  virtual Bytes read_full(FileType type, const Id& id) = 0;
  virtual Bytes read_partial(FileType type, const Id& id, uint32_t offset, uint32_t length) = 0;
  virtual std::vector<Id> list(FileType type) = 0;
  virtual void  remove(FileType type, const Id& id) = 0;
};

// In-memory backend, used by the tests and by `bench`.
class MemoryBackend : public Backend {
public:
  using FailHook = std::function<bool(FileType, const Id&)>;

  void  write(FileType type, const Id& id, const Bytes& data) override;
  Bytes read_full(FileType type, const Id& id) override;
  Bytes read_partial(FileType type, const Id& id, uint32_t offset, uint32_t length) override;
  std::vector<Id> list(FileType type) override;
  void  remove(FileType type, const Id& id) override;

  // Хук для тестов: вернуть true -> write() падает с Error(Backend).
  void set_fail_write(FailHook hook);

  uint64_t writes() const noexcept { return writes_; }
  size_t   count(FileType type) const;

private:
  mutable std::mutex mu_;
  std::map<std::pair<FileType, Id>, Bytes> files_;
  FailHook fail_write_;
  std::atomic<uint64_t> writes_{0};
};

// Каталог на локальном диске:
//   <root>/data/ab/abcdef...   паки
//   <root>/index/abcdef...     индекс-файлы
// Запись: tmp-файл -> fsync -> rename -> fsync каталога.
class LocalBackend : public Backend {
public:
  explicit LocalBackend(std::string root);

  bool init_layout();
  const std::string& root() const noexcept { return root_; }

  void  write(FileType type, const Id& id, const Bytes& data) override;
  Bytes read_full(FileType type, const Id& id) override;
  Bytes read_partial(FileType type, const Id& id, uint32_t offset, uint32_t length) override;
  std::vector<Id> list(FileType type) override;
  void  remove(FileType type, const Id& id) override;

  std::string path_for(FileType type, const Id& id) const;

private:
  std::string root_;
};

} // namespace packwerk
