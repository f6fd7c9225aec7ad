#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include "packwerk/error.hpp"
#include "packwerk/indexer.hpp"

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace packwerk;
using namespace std::chrono_literals;

static BlobId id_n(uint32_t n) {
  BlobId id;
  id.raw[0] = static_cast<uint8_t>(n);
  id.raw[1] = static_cast<uint8_t>(n >> 8);
  id.raw[2] = static_cast<uint8_t>(n >> 16);
  id.raw[31] = 0x5A;
  return id;
}

static IndexPack pack_of(uint32_t pack_no, uint32_t first, uint32_t count,
                         BlobType type = BlobType::Data) {
  IndexPack p;
  p.id = id_n(1'000'000 + pack_no);
  uint32_t off = 0;
  for (uint32_t i = 0; i < count; ++i) {
    p.add(id_n(first + i), type, off, 64, std::nullopt);
    off += 64;
  }
  return p;
}

TEST_CASE("Indexer: reserve succeeds exactly once per id") {
  auto be = std::make_shared<MemoryBackend>();
  Indexer idx(be, Key::random());
  REQUIRE(idx.reserve(id_n(1)));
  REQUIRE_FALSE(idx.reserve(id_n(1)));
  REQUIRE(idx.reserve(id_n(2)));
  REQUIRE(idx.has(id_n(1)));
  REQUIRE_FALSE(idx.has(id_n(3)));
  // заявлен, но ещё не записан
  REQUIRE_FALSE(idx.lookup(id_n(1)).has_value());
}

TEST_CASE("Indexer: concurrent reserve has a single winner per id") {
  auto be = std::make_shared<MemoryBackend>();
  Indexer idx(be, Key::random());
  std::atomic<int> wins{0};
  std::vector<std::thread> ts;
  for (int t = 0; t < 8; ++t) {
    ts.emplace_back([&] {
      for (uint32_t i = 0; i < 1000; ++i) {
        if (idx.reserve(id_n(i))) wins++;
      }
    });
  }
  for (auto& t : ts) t.join();
  REQUIRE(wins.load() == 1000);
}

TEST_CASE("Indexer: accepted packs are looked up and saved at finalize") {
  auto be = std::make_shared<MemoryBackend>();
  auto key = Key::random();
  Indexer idx(be, key);

  idx.accept(pack_of(1, 0, 3), false);
  auto loc = idx.lookup(id_n(1));
  REQUIRE(loc.has_value());
  REQUIRE(loc->pack == id_n(1'000'001));
  REQUIRE(loc->blob.offset == 64);
  REQUIRE(be->count(FileType::Index) == 0);

  auto saved = idx.finalize();
  REQUIRE(saved.has_value());
  REQUIRE(be->count(FileType::Index) == 1);
  REQUIRE(idx.files_saved() == 1);
  REQUIRE_FALSE(idx.finalize().has_value());

  // новый экземпляр видит то же самое после загрузки
  Indexer again(be, key);
  REQUIRE(again.load_existing() == 1);
  REQUIRE(again.has(id_n(2)));
  REQUIRE_FALSE(again.reserve(id_n(2)));
  REQUIRE(again.lookup(id_n(2))->blob.offset == 128);
  REQUIRE(again.packs().size() == 1);
}

TEST_CASE("Indexer: index file is written once 50000 blobs accumulate") {
  auto be = std::make_shared<MemoryBackend>();
  Indexer idx(be, Key::random());

  idx.accept(pack_of(1, 0, 30000), false);
  REQUIRE(be->count(FileType::Index) == 0);
  idx.accept(pack_of(2, 30000, 20000), false);
  REQUIRE(be->count(FileType::Index) == 1);
  REQUIRE_FALSE(idx.finalize().has_value());
}

TEST_CASE("Indexer: index file is written after 300 seconds") {
  auto be = std::make_shared<MemoryBackend>();
  auto now = std::make_shared<std::chrono::steady_clock::time_point>();
  Indexer idx(be, Key::random(), [now] { return *now; });

  idx.accept(pack_of(1, 0, 1), false);
  REQUIRE(be->count(FileType::Index) == 0);
  *now += 300s;
  idx.accept(pack_of(2, 1, 1), false);
  REQUIRE(be->count(FileType::Index) == 1);
}

TEST_CASE("Indexer: padding entries are not indexed, sizes are tracked per type") {
  auto be = std::make_shared<MemoryBackend>();
  Indexer idx(be, Key::random());

  IndexPack p = pack_of(1, 0, 2, BlobType::Tree);
  p.add(BlobId{}, BlobType::Tree, 128, 1000, std::nullopt);
  idx.accept(p, false);

  REQUIRE_FALSE(idx.has(BlobId{}));
  REQUIRE(idx.total_pack_size(BlobType::Tree) == p.pack_size());
  REQUIRE(idx.total_pack_size(BlobType::Data) == 0);
}

TEST_CASE("Indexer: removals drop packs and their locations") {
  auto be = std::make_shared<MemoryBackend>();
  auto key = Key::random();
  Indexer idx(be, key);

  const IndexPack old_pack = pack_of(1, 0, 2);
  idx.accept(old_pack, false);
  IndexPack moved = pack_of(2, 1, 1);   // блоб 1 переехал
  idx.accept(moved, false);
  idx.accept(old_pack, true);

  REQUIRE_FALSE(idx.lookup(id_n(0)).has_value());
  REQUIRE(idx.lookup(id_n(1))->pack == moved.id);
  REQUIRE(idx.packs().size() == 1);
  idx.finalize();

  Indexer loaded(be, key);
  loaded.load_existing();
  REQUIRE(loaded.packs().size() == 1);
  REQUIRE(loaded.lookup(id_n(1))->pack == moved.id);
}

TEST_CASE("Indexer: tampered index file is rejected on load") {
  auto be = std::make_shared<MemoryBackend>();
  auto key = Key::random();
  {
    Indexer idx(be, key);
    idx.accept(pack_of(1, 0, 1), false);
    idx.finalize();
  }
  const Id file_id = be->list(FileType::Index).at(0);
  Bytes data = be->read_full(FileType::Index, file_id);
  data[data.size() / 2] ^= 0xFF;
  be->write(FileType::Index, file_id, data);

  Indexer idx(be, key);
  REQUIRE_THROWS_AS(idx.load_existing(), Error);
}
