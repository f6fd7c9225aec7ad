#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include "packwerk/envelope.hpp"
#include "packwerk/error.hpp"
#include "packwerk/pack_format.hpp"
#include "packwerk/packer.hpp"

#include <chrono>
#include <memory>

using namespace packwerk;
using namespace std::chrono_literals;

// Ручные часы для проверки возраста пака.
struct FakeClock {
  std::shared_ptr<std::chrono::steady_clock::time_point> now =
      std::make_shared<std::chrono::steady_clock::time_point>();

  SteadyClock fn() const {
    auto p = now;
    return [p] { return *p; };
  }
  void advance(std::chrono::seconds s) { *now += s; }
};

static Bytes fill(size_t n, uint8_t v) { return Bytes(n, v); }

TEST_CASE("Packer: empty packer never saves") {
  auto key = Key::random();
  Packer p(key, PackSizer::fixed(1000), {.padding = false});
  REQUIRE_FALSE(p.needs_save());
  REQUIRE_FALSE(p.save().has_value());

  auto [last, stats] = p.finalize();
  REQUIRE_FALSE(last.has_value());
  REQUIRE(stats == PackerStats{});
}

TEST_CASE("Packer: saved pack layout matches its descriptor") {
  auto key = Key::random();
  CryptoEnvelope env(key, {});
  Packer p(key, PackSizer::fixed(1 << 20), {.padding = false});

  std::vector<Bytes> plains = {fill(100, 1), fill(1, 2), fill(5000, 3)};
  uint64_t packed = 0;
  for (const auto& plain : plains) {
    auto pb = env.process(plain);
    packed += pb.data.size();
    p.add(pb.data, hash_bytes(plain), pb.data_len, pb.uncompressed_length);
  }
  REQUIRE(p.count() == 3);
  REQUIRE(p.has(hash_bytes(plains[1])));

  auto saved = p.save();
  REQUIRE(saved.has_value());
  const auto& desc = saved->desc;
  REQUIRE(desc.blobs.size() == 3);
  REQUIRE(desc.blobs[0].offset == 0);
  REQUIRE(desc.blobs[1].offset == desc.blobs[0].length);
  REQUIRE(desc.blobs[2].offset == desc.blobs[1].offset + desc.blobs[1].length);
  REQUIRE(saved->bytes.size() == desc.pack_size());

  const PackHeader h = parse_pack(saved->bytes, *key);
  REQUIRE(h.blobs == desc.blobs);

  // каждый блоб расшифровывается обратно по записи заголовка
  for (size_t i = 0; i < plains.size(); ++i) {
    const auto& e = h.blobs[i];
    Bytes cipher(saved->bytes.begin() + e.offset, saved->bytes.begin() + e.offset + e.length);
    REQUIRE(env.decrypt(cipher) == plains[i]);
    REQUIRE(e.id == hash_bytes(plains[i]));
    REQUIRE(e.type == BlobType::Data);
  }

  REQUIRE(p.stats().blobs == 3);
  REQUIRE(p.stats().data == 5101);
  REQUIRE(p.stats().data_packed == packed);
  REQUIRE_FALSE(p.has(hash_bytes(plains[1])));
  REQUIRE(p.size() == 0);
  REQUIRE(p.sizer().current_size() == saved->bytes.size());
}

TEST_CASE("Packer: an id already in the pending pack is not added again") {
  auto key = Key::random();
  Packer p(key, PackSizer::fixed(1 << 20), {.padding = false});
  const BlobId id = hash_bytes(fill(1, 7));

  p.add(fill(60, 7), id, 32, std::nullopt);
  p.add(fill(60, 7), id, 32, std::nullopt);
  REQUIRE(p.count() == 1);
  REQUIRE(p.size() == 60);
  REQUIRE(p.stats().blobs == 1);

  auto saved = p.save();
  REQUIRE(saved->desc.blobs.size() == 1);

  // после save тот же id снова попадает в новый пак
  p.add(fill(60, 7), id, 32, std::nullopt);
  REQUIRE(p.count() == 1);
  REQUIRE(p.stats().blobs == 2);
}

TEST_CASE("Packer: size trigger uses the sizer target or an explicit limit") {
  auto key = Key::random();
  Packer p(key, PackSizer::fixed(1000), {.padding = false});

  p.add(fill(900, 1), hash_bytes(fill(1, 1)), 872, std::nullopt);
  REQUIRE_FALSE(p.needs_save());
  REQUIRE(p.needs_save(500));

  p.add(fill(100, 2), hash_bytes(fill(1, 2)), 72, std::nullopt);
  REQUIRE(p.needs_save());
  REQUIRE_FALSE(p.needs_save(2000));

  auto saved = p.save_if_needed();
  REQUIRE(saved.has_value());
  REQUIRE_FALSE(p.save_if_needed().has_value());
}

TEST_CASE("Packer: count trigger at 10000 blobs") {
  auto key = Key::random();
  Packer p(key, PackSizer::fixed(MAX_PACK_SIZE), {.padding = false});

  for (uint32_t i = 0; i < PACKER_MAX_COUNT - 1; ++i) {
    BlobId id;
    id.raw[0] = static_cast<uint8_t>(i);
    id.raw[1] = static_cast<uint8_t>(i >> 8);
    p.add(fill(1, 0), id, 1, std::nullopt);
  }
  REQUIRE_FALSE(p.needs_save());

  BlobId last;
  last.raw[31] = 1;
  p.add(fill(1, 0), last, 1, std::nullopt);
  REQUIRE(p.needs_save());

  auto saved = p.save();
  REQUIRE(saved->desc.blobs.size() == PACKER_MAX_COUNT);
  REQUIRE(p.count() == 0);
}

TEST_CASE("Packer: age trigger at 300 seconds") {
  auto key = Key::random();
  FakeClock clock;
  Packer p(key, PackSizer::fixed(1 << 20), {.padding = false, .clock = clock.fn()});

  p.add(fill(50, 1), hash_bytes(fill(1, 1)), 22, std::nullopt);
  clock.advance(299s);
  REQUIRE_FALSE(p.needs_save());
  clock.advance(1s);
  REQUIRE(p.needs_save());

  REQUIRE(p.save_if_needed().has_value());

  // возраст отсчитывается заново от save()
  p.add(fill(50, 2), hash_bytes(fill(1, 2)), 22, std::nullopt);
  REQUIRE_FALSE(p.needs_save());
  clock.advance(300s);
  REQUIRE(p.needs_save());
}

TEST_CASE("Packer: age alone never saves an empty buffer") {
  auto key = Key::random();
  FakeClock clock;
  Packer p(key, PackSizer::fixed(1 << 20), {.padding = false, .clock = clock.fn()});
  clock.advance(3600s);
  REQUIRE_FALSE(p.needs_save());
  REQUIRE_FALSE(p.save_if_needed().has_value());
}

TEST_CASE("padding_size: always 1..=64KiB") {
  REQUIRE(padding_size(1) == PACK_ALIGN - 1);
  REQUIRE(padding_size(PACK_ALIGN - 1) == 1);
  REQUIRE(padding_size(PACK_ALIGN) == PACK_ALIGN);
  REQUIRE(padding_size(3 * PACK_ALIGN + 17) == PACK_ALIGN - 17);
}

TEST_CASE("Packer: padding aligns the pack and stays out of stats") {
  auto key = Key::random();
  CryptoEnvelope env(key, {});
  Packer p(key, PackSizer::fixed(1 << 24), {.type = BlobType::Tree, .padding = true});

  uint64_t packed = 0;
  for (uint8_t i = 0; i < 5; ++i) {
    const Bytes plain = fill(1000 + i * 333, i);
    auto pb = env.process(plain);
    packed += pb.data.size();
    p.add(pb.data, hash_bytes(plain), pb.data_len, std::nullopt);
  }

  auto saved = p.save();
  REQUIRE(saved.has_value());
  REQUIRE(saved->bytes.size() % PACK_ALIGN == 0);
  REQUIRE(saved->desc.blobs.size() == 6);

  const auto& pad = saved->desc.blobs.back();
  REQUIRE(pad.id.is_null());
  REQUIRE(pad.type == BlobType::Tree);
  REQUIRE(pad.length >= 1);
  REQUIRE(pad.length <= PACK_ALIGN);

  REQUIRE(parse_pack(saved->bytes, *key).blobs == saved->desc.blobs);
  REQUIRE(saved->bytes.size() == saved->desc.pack_size());

  REQUIRE(p.stats().blobs == 5);
  REQUIRE(p.stats().data_packed == packed);
}

TEST_CASE("Packer: finalize is one-shot") {
  auto key = Key::random();
  Packer p(key, PackSizer::fixed(1 << 20), {.padding = false});
  p.add(fill(40, 1), hash_bytes(fill(1, 1)), 12, std::nullopt);

  auto [last, stats] = p.finalize();
  REQUIRE(last.has_value());
  REQUIRE(stats.blobs == 1);

  REQUIRE_THROWS_AS(p.finalize(), Error);
  try {
    p.add(fill(40, 2), hash_bytes(fill(1, 2)), 12, std::nullopt);
    FAIL("expected Internal error");
  } catch (const Error& e) {
    REQUIRE(e.kind() == ErrorKind::Internal);
  }
}
