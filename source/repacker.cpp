#include "packwerk/repacker.hpp"
#include "packwerk/pack_reader.hpp"

#include <spdlog/spdlog.h>

namespace packwerk {

Repacker::Repacker(std::shared_ptr<Backend> backend, std::shared_ptr<IndexGate> gate,
                   CryptoEnvelope envelope, PackSizer sizer, PackerOptions opts)
  : backend_(backend),
    size_limit_(sizer.pack_size()),
    packer_(std::move(backend), std::move(gate), std::move(envelope), sizer, std::move(opts)) {}

void Repacker::add_fast(const PackId& pack_id, const IndexBlob& blob) {
  const Bytes raw = read_blob_raw(*backend_, pack_id, blob);
  spdlog::debug("repack (fast) blob {} from pack {}", blob.id.to_hex(), pack_id.to_hex());
  packer_.add_raw(raw, blob.id, 0, blob.uncompressed_length, size_limit_);
}

void Repacker::add(const PackId& pack_id, const IndexBlob& blob) {
  Bytes plain = read_blob(*backend_, packer_.envelope(), pack_id, blob);
  spdlog::debug("repack blob {} from pack {}", blob.id.to_hex(), pack_id.to_hex());
  packer_.add_with_size_limit(std::move(plain), blob.id, size_limit_);
}

PackerStats Repacker::finalize() {
  return packer_.finalize();
}

} // namespace packwerk
