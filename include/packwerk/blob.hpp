#pragma once
#include <cstdint>
#include <optional>

#include "packwerk/id.hpp"

namespace packwerk {

// Пак всегда содержит блобы ровно одного типа.
enum class BlobType : uint8_t { Tree, Data };

const char* blob_type_name(BlobType t);

// Результат конверта: шифротекст + длина открытого текста.
// uncompressed_length присутствует тогда и только тогда, когда было сжатие.
struct ProcessedBlob {
  Bytes                   data;
  uint32_t                data_len = 0;
  std::optional<uint32_t> uncompressed_length;
};

} // namespace packwerk
