#pragma once
#include <cstdint>

#include "packwerk/backend.hpp"
#include "packwerk/envelope.hpp"
#include "packwerk/pack_format.hpp"

namespace packwerk {

// Заголовок через два частичных чтения: трейлер, затем сам заголовок.
// pack_size известен из индекса.
PackHeader read_pack_header(Backend& backend, const Key& key, const PackId& pack_id,
                            uint32_t pack_size);

// Сырые байты блоба (шифротекст) из пака.
Bytes read_blob_raw(Backend& backend, const PackId& pack_id, const IndexBlob& entry);

// Шифротекст -> открытый текст; проверяет, что хеш совпадает с entry.id.
Bytes read_blob(Backend& backend, const CryptoEnvelope& envelope, const PackId& pack_id,
                const IndexBlob& entry);

} // namespace packwerk
