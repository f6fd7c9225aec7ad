#pragma once
#include <cstdint>
#include <memory>

#include "packwerk/backend.hpp"
#include "packwerk/index_file.hpp"
#include "packwerk/repository_packer.hpp"

namespace packwerk {

// Перекладка существующих блобов в новые паки.
// Лимит размера фиксируется при создании из PackSizer.
class Repacker {
public:
  Repacker(std::shared_ptr<Backend> backend, std::shared_ptr<IndexGate> gate,
           CryptoEnvelope envelope, PackSizer sizer, PackerOptions opts = {});

  // Сырые байты без расшифровки; длина открытого текста в статистике = 0.
  void add_fast(const PackId& pack_id, const IndexBlob& blob);
  // Расшифровать/распаковать и прогнать заново через конверт.
  void add(const PackId& pack_id, const IndexBlob& blob);

  PackerStats finalize();

  uint32_t size_limit() const noexcept { return size_limit_; }

private:
  std::shared_ptr<Backend> backend_;
  uint32_t                 size_limit_;
  RepositoryPacker         packer_;
};

} // namespace packwerk
