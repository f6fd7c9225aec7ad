#include "packwerk/compress.hpp"
#include "packwerk/error.hpp"

#include <zlib.h>

namespace packwerk {

Bytes compress(const uint8_t* in, size_t len, int level) {
  const uLong src_len = narrow<uLong>(len, "compress input");
  uLongf dst_len = compressBound(src_len);
  Bytes out(dst_len);
  int rc = compress2(out.data(), &dst_len, in, src_len, level);
  if (rc != Z_OK) {
    throw Error(ErrorKind::Internal, "zlib compress2 failed, rc=" + std::to_string(rc));
  }
  out.resize(dst_len);
  return out;
}

Bytes decompress(const Bytes& in, uint32_t expected_len) {
  // на один байт больше ожидаемого: так ловим «распаковалось длиннее»
  Bytes out(static_cast<size_t>(expected_len) + 1);
  uLongf dst_len = static_cast<uLongf>(out.size());
  int rc = uncompress(out.data(), &dst_len, in.data(), narrow<uLong>(in.size(), "compressed input"));
  if (rc == Z_BUF_ERROR && dst_len == out.size()) {
    throw Error(ErrorKind::Verification,
                "decompressed data exceeds expected length " + std::to_string(expected_len));
  }
  if (rc != Z_OK) {
    throw Error(ErrorKind::Verification, "zlib uncompress failed, rc=" + std::to_string(rc));
  }
  if (dst_len != expected_len) {
    throw Error(ErrorKind::Verification,
                "decompressed length " + std::to_string(dst_len) +
                " != expected " + std::to_string(expected_len));
  }
  out.resize(dst_len);
  return out;
}

} // namespace packwerk
