#ifdef __has_include
#  if __has_include(<catch2/catch_all.hpp>)
#    include <catch2/catch_all.hpp>
#  else
#    include <catch2/catch.hpp>
#  endif
#endif

#include "packwerk/error.hpp"
#include "packwerk/write_actor.hpp"
#include "recording_gate.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <thread>

using namespace packwerk;

static SavedPack make_pack(const std::shared_ptr<Key>& key, uint8_t seed) {
  Packer p(key, PackSizer::fixed(1 << 20), {.padding = false});
  const Bytes plain(100 + seed, seed);
  p.add(key->encrypt(plain), hash_bytes(plain), static_cast<uint32_t>(plain.size()), std::nullopt);
  return *p.save();
}

TEST_CASE("WriteActor: pack stored under the hash of its bytes, then indexed") {
  auto key = Key::random();
  auto be = std::make_shared<MemoryBackend>();
  auto gate = std::make_shared<RecordingGate>();
  WriteActor actor(be, gate);

  SavedPack pack = make_pack(key, 1);
  const Bytes bytes = pack.bytes;
  const IndexPack desc = pack.desc;
  const auto before = std::chrono::system_clock::now();

  actor.send(std::move(pack));
  actor.finalize();

  const PackId id = hash_bytes(bytes);
  REQUIRE(be->read_full(FileType::Pack, id) == bytes);
  REQUIRE(actor.packs_written() == 1);

  const auto accepted = gate->accepted();
  REQUIRE(accepted.size() == 1);
  REQUIRE_FALSE(accepted[0].is_removal);
  REQUIRE(accepted[0].pack.id == id);
  REQUIRE(accepted[0].pack.blobs == desc.blobs);
  REQUIRE(accepted[0].pack.time.has_value());
  REQUIRE(*accepted[0].pack.time >= before);
}

TEST_CASE("WriteActor: packs are written in the order sent") {
  auto key = Key::random();
  auto be = std::make_shared<MemoryBackend>();
  auto gate = std::make_shared<RecordingGate>();
  WriteActor actor(be, gate);

  std::vector<PackId> expected;
  for (uint8_t i = 0; i < 10; ++i) {
    SavedPack p = make_pack(key, i);
    expected.push_back(hash_bytes(p.bytes));
    actor.send(std::move(p));
  }
  actor.finalize();

  const auto accepted = gate->accepted();
  REQUIRE(accepted.size() == expected.size());
  for (size_t i = 0; i < expected.size(); ++i) REQUIRE(accepted[i].pack.id == expected[i]);
}

TEST_CASE("WriteActor: first failure is reported, queued packs still written") {
  auto key = Key::random();
  auto be = std::make_shared<MemoryBackend>();
  auto gate = std::make_shared<RecordingGate>();

  std::promise<void> release;
  auto released = release.get_future().share();
  std::atomic<int> calls{0};
  be->set_fail_write([&, released](FileType, const Id&) {
    if (calls++ == 0) {
      released.wait();
      return true;
    }
    return false;
  });

  WriteActor actor(be, gate);
  actor.send(make_pack(key, 1));     // запись этого пака упадёт
  actor.send(make_pack(key, 2));     // уже в очереди к моменту ошибки
  release.set_value();

  try {
    actor.finalize();
    FAIL("expected Backend error");
  } catch (const Error& e) {
    REQUIRE(e.kind() == ErrorKind::Backend);
  }
  REQUIRE(be->count(FileType::Pack) == 1);
  REQUIRE(gate->accepted().size() == 1);
}

TEST_CASE("WriteActor: sends after a failure are rejected") {
  auto key = Key::random();
  auto be = std::make_shared<MemoryBackend>();
  be->set_fail_write([](FileType, const Id&) { return true; });
  auto gate = std::make_shared<RecordingGate>();
  WriteActor actor(be, gate);

  actor.send(make_pack(key, 1));
  // ждём, пока ошибка зафиксируется
  bool rejected = false;
  for (int i = 0; i < 200 && !rejected; ++i) {
    try {
      actor.send(make_pack(key, static_cast<uint8_t>(i + 2)));
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    } catch (const Error& e) {
      REQUIRE(e.kind() == ErrorKind::Backend);
      rejected = true;
    }
  }
  REQUIRE(rejected);
  REQUIRE_THROWS_AS(actor.finalize(), Error);
  REQUIRE(gate->accepted().empty());
}

TEST_CASE("WriteActor: finalize twice is an internal error") {
  auto be = std::make_shared<MemoryBackend>();
  WriteActor actor(be, std::make_shared<RecordingGate>());
  actor.finalize();
  try {
    actor.finalize();
    FAIL("expected Internal error");
  } catch (const Error& e) {
    REQUIRE(e.kind() == ErrorKind::Internal);
  }
  REQUIRE_THROWS_AS(actor.send(SavedPack{}), Error);
}
