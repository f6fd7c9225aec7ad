// include/packwerk/pack_format.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

#include "packwerk/crypto.hpp"
#include "packwerk/index_file.hpp"

namespace packwerk {

// Layout of a pack file:
//   [blob_1 ciphertext] ... [blob_n ciphertext] [padding?]
//   [encrypted header]
//   [header length: u32 little-endian, unencrypted]
//
// Header entry (plaintext, little-endian), in storage order:
//   tag u8 | offset u32 | length u32 | uncompressed u32 (tags 2,3 only) | id[32]
static constexpr uint8_t  TAG_DATA            = 0;
static constexpr uint8_t  TAG_TREE            = 1;
static constexpr uint8_t  TAG_DATA_COMPRESSED = 2;
static constexpr uint8_t  TAG_TREE_COMPRESSED = 3;

static constexpr size_t   HEADER_ENTRY_LEN            = 1 + 4 + 4 + 32;
static constexpr size_t   HEADER_ENTRY_LEN_COMPRESSED = HEADER_ENTRY_LEN + 4;
static constexpr size_t   HEADER_LENGTH_TRAILER       = 4;
static constexpr uint32_t PACK_ALIGN                  = 64 * 1024;

uint8_t entry_tag(BlobType type, bool compressed);
size_t  header_entry_len(const IndexBlob& b);

void      put_u32le(Bytes& out, uint32_t v);
uint32_t  get_u32le(const uint8_t* p);

void      put_entry(Bytes& out, const IndexBlob& b);
// Сдвигает p; на обрезанном входе или неизвестном теге бросает Format.
IndexBlob get_entry(const uint8_t*& p, const uint8_t* end);

struct PackHeader {
  std::vector<IndexBlob> blobs;

  static size_t binary_size(const std::vector<IndexBlob>& blobs);

  Bytes to_binary() const;
  // Проверяет, что смещения начинаются с 0 и идут без дыр и перекрытий.
  static PackHeader from_binary(const Bytes& data);

  // Суммарная длина блобов (конец последнего).
  uint32_t content_size() const;
};

// Разбор полного пак-файла: трейлер -> расшифровка заголовка -> проверка,
// что заголовок покрывает ровно все байты перед ним.
PackHeader parse_pack(const Bytes& pack, const Key& key);

} // namespace packwerk
