#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include "packwerk/error.hpp"
#include "packwerk/index_file.hpp"
#include "packwerk/pack_format.hpp"

#include <cstdint>
#include <limits>

using namespace packwerk;

static BlobId id_of(uint8_t seed) {
  BlobId id;
  for (size_t i = 0; i < id.raw.size(); ++i) id.raw[i] = static_cast<uint8_t>(seed + i);
  return id;
}

static PackHeader sample_header() {
  PackHeader h;
  h.blobs.push_back(IndexBlob{id_of(1), BlobType::Data, 0, 100, std::nullopt});
  h.blobs.push_back(IndexBlob{id_of(2), BlobType::Data, 100, 60, 500u});
  h.blobs.push_back(IndexBlob{id_of(3), BlobType::Data, 160, 28, std::nullopt});
  return h;
}

TEST_CASE("PackHeader: entry sizes depend on compression") {
  const PackHeader h = sample_header();
  const Bytes bin = h.to_binary();
  REQUIRE(bin.size() == 2 * HEADER_ENTRY_LEN + HEADER_ENTRY_LEN_COMPRESSED);
  REQUIRE(PackHeader::binary_size(h.blobs) == bin.size());

  // первая запись: tag, offset, length, id
  REQUIRE(bin[0] == TAG_DATA);
  REQUIRE(get_u32le(bin.data() + 1) == 0);
  REQUIRE(get_u32le(bin.data() + 5) == 100);
  // вторая: сжатая, есть поле исходной длины
  REQUIRE(bin[HEADER_ENTRY_LEN] == TAG_DATA_COMPRESSED);
  REQUIRE(get_u32le(bin.data() + HEADER_ENTRY_LEN + 9) == 500);
}

TEST_CASE("PackHeader: binary round trip preserves entries") {
  const PackHeader h = sample_header();
  const PackHeader back = PackHeader::from_binary(h.to_binary());
  REQUIRE(back.blobs == h.blobs);
  REQUIRE(back.content_size() == 188);
}

TEST_CASE("PackHeader: tree tags") {
  REQUIRE(entry_tag(BlobType::Tree, false) == TAG_TREE);
  REQUIRE(entry_tag(BlobType::Tree, true) == TAG_TREE_COMPRESSED);
  REQUIRE(entry_tag(BlobType::Data, false) == TAG_DATA);
  REQUIRE(entry_tag(BlobType::Data, true) == TAG_DATA_COMPRESSED);
}

TEST_CASE("PackHeader: gaps and overlaps are rejected") {
  PackHeader h = sample_header();
  h.blobs[1].offset = 101;
  try {
    (void)PackHeader::from_binary(h.to_binary());
    FAIL("expected Format error");
  } catch (const Error& e) {
    REQUIRE(e.kind() == ErrorKind::Format);
  }

  PackHeader first_not_zero;
  first_not_zero.blobs.push_back(IndexBlob{id_of(9), BlobType::Tree, 4, 40, std::nullopt});
  REQUIRE_THROWS_AS(PackHeader::from_binary(first_not_zero.to_binary()), Error);
}

TEST_CASE("PackHeader: unknown tag and truncation are rejected") {
  Bytes bin = sample_header().to_binary();

  Bytes bad_tag = bin;
  bad_tag[0] = 7;
  REQUIRE_THROWS_AS(PackHeader::from_binary(bad_tag), Error);

  Bytes cut(bin.begin(), bin.end() - 5);
  try {
    (void)PackHeader::from_binary(cut);
    FAIL("expected Format error");
  } catch (const Error& e) {
    REQUIRE(e.kind() == ErrorKind::Format);
  }
}

TEST_CASE("parse_pack: header must cover exactly the bytes before it") {
  auto key = Key::random();
  PackHeader h;
  h.blobs.push_back(IndexBlob{id_of(1), BlobType::Data, 0, 10, std::nullopt});

  auto build = [&](size_t content_len) {
    Bytes pack(content_len, 0xAB);
    const Bytes enc = key->encrypt(h.to_binary());
    pack.insert(pack.end(), enc.begin(), enc.end());
    put_u32le(pack, static_cast<uint32_t>(enc.size()));
    return pack;
  };

  REQUIRE(parse_pack(build(10), *key).blobs == h.blobs);
  REQUIRE_THROWS_AS(parse_pack(build(11), *key), Error);

  Bytes bogus_trailer = build(10);
  put_u32le(bogus_trailer, 0xFFFFFFFFu);
  REQUIRE_THROWS_AS(parse_pack(bogus_trailer, *key), Error);
}

TEST_CASE("IndexPack: pack size from entries") {
  IndexPack p;
  REQUIRE(p.empty());
  p.add(id_of(1), BlobType::Data, 0, 100, std::nullopt);
  p.add(id_of(2), BlobType::Data, 100, 50, 70u);
  REQUIRE(p.pack_size() == 150 + HEADER_ENTRY_LEN + HEADER_ENTRY_LEN_COMPRESSED +
                           Key::OVERHEAD + HEADER_LENGTH_TRAILER);
}

TEST_CASE("IndexFile: binary round trip with removals and timestamps") {
  IndexFile f;
  IndexPack a;
  a.id = id_of(10);
  a.add(id_of(1), BlobType::Data, 0, 100, std::nullopt);
  a.time = std::chrono::system_clock::time_point(std::chrono::seconds(1700000000));
  IndexPack b;
  b.id = id_of(20);
  b.add(id_of(2), BlobType::Tree, 0, 33, 90u);
  f.add(a, false);
  f.add(b, true);

  const IndexFile back = IndexFile::from_binary(f.to_binary());
  REQUIRE(back.packs.size() == 1);
  REQUIRE(back.packs_to_delete.size() == 1);
  REQUIRE(back.packs[0].id == a.id);
  REQUIRE(back.packs[0].blobs == a.blobs);
  REQUIRE(back.packs[0].time == a.time);
  REQUIRE(back.packs_to_delete[0].blobs == b.blobs);
  REQUIRE_FALSE(back.packs_to_delete[0].time.has_value());
}

TEST_CASE("IndexFile: corrupt input is a format error") {
  IndexFile f;
  IndexPack a;
  a.add(id_of(1), BlobType::Data, 0, 100, std::nullopt);
  f.add(a, false);
  Bytes bin = f.to_binary();

  Bytes bad_magic = bin;
  bad_magic[0] = 'X';
  REQUIRE_THROWS_AS(IndexFile::from_binary(bad_magic), Error);

  Bytes truncated(bin.begin(), bin.end() - 1);
  REQUIRE_THROWS_AS(IndexFile::from_binary(truncated), Error);

  Bytes trailing = bin;
  trailing.push_back(0);
  REQUIRE_THROWS_AS(IndexFile::from_binary(trailing), Error);
}

TEST_CASE("narrow: values that do not fit u32 are conversion errors") {
  REQUIRE(narrow<uint32_t>(uint64_t{4096}, "x") == 4096u);
  try {
    (void)narrow<uint32_t>(uint64_t{1} << 32, "pack size");
    FAIL("expected Conversion error");
  } catch (const Error& e) {
    REQUIRE(e.kind() == ErrorKind::Conversion);
  }
  REQUIRE_THROWS_AS(narrow<uint32_t>(-1, "negative"), Error);
}

TEST_CASE("Id: hex round trip and SHA-256 of empty input") {
  const Id empty = hash_bytes(Bytes{});
  REQUIRE(empty.to_hex() == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  REQUIRE(Id::from_hex(empty.to_hex()) == empty);
  REQUIRE_FALSE(Id::from_hex("zz").has_value());
  REQUIRE(Id{}.is_null());
  REQUIRE_FALSE(empty.is_null());
}
