#pragma once
#include <cstddef>
#include <cstdint>

#include "packwerk/id.hpp"

namespace packwerk {

// zlib. level: 1..9, -1 = Z_DEFAULT_COMPRESSION.
Bytes compress(const uint8_t* in, size_t len, int level);
inline Bytes compress(const Bytes& in, int level) { return compress(in.data(), in.size(), level); }

// expected_len задаётся из заголовка пака; несовпадение длины -> Verification.
Bytes decompress(const Bytes& in, uint32_t expected_len);

} // namespace packwerk
