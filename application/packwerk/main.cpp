#include "packwerk/backend.hpp"
#include "packwerk/config.hpp"
#include "packwerk/error.hpp"
#include "packwerk/indexer.hpp"
#include "packwerk/pack_reader.hpp"
#include "packwerk/repacker.hpp"
#include "packwerk/repository_packer.hpp"

#include <spdlog/spdlog.h>
#include <fmt/core.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace packwerk;

// ----------------------------
// Аргументы
// ----------------------------
struct Args {
  std::string mode;                  // init | put | check | repack | bench
  std::string path = "./packwerk-repo";
  std::string password;
  std::string log_level = "info";
  std::string source;                // put DIR

  uint64_t chunk = 1 * MiB;          // put: размер куска
  bool     fast = false;             // repack --fast
  bool     read_data = false;        // check --read-data

  // init
  int  compression = 0;
  bool padding = true;
  bool verify = false;

  // bench
  uint64_t blobs = 10000;
  uint64_t blob_size = 64 * 1024;
  unsigned threads = 4;

  bool help = false;
};

static void print_usage(const char* prog) {
  fmt::print(
R"(Usage:
  {0} [options] init|put DIR|check|repack|bench

Common:
  --path DIR              : repository directory (default: ./packwerk-repo)
  --password PW           : repository password (or env PACKWERK_PASSWORD)
  --log-level LEVEL       : trace|debug|info|warn|error|off (default: info)

init:
  --compression N         : zlib level, 0 = off (default: 0)
  --padding on|off        : pad packs to 64 KiB (default: on)
  --verify on|off         : self-verify every blob (default: off)

put DIR:
  --chunk BYTES           : fixed chunk size, K/M suffixes (default: 1M)

check:
  --read-data             : decrypt and hash every blob

repack:
  --fast                  : relocate raw ciphertext without decrypting

bench (in-memory repository):
  --blobs N               : number of blobs (default: 10000)
  --blob-size BYTES       : blob size (default: 64K)
  --threads N             : producer threads (default: 4)

Examples:
  {0} --path /tmp/repo --password secret init
  {0} --path /tmp/repo --password secret put /etc
  {0} --path /tmp/repo --password secret check --read-data
)",
    prog);
}

static bool parse_bool(std::string_view s, bool& out) {
  if (s == "on" || s == "true" || s == "1") { out = true; return true; }
  if (s == "off"|| s == "false"|| s == "0") { out = false; return true; }
  return false;
}

static uint64_t parse_bytes(std::string_view s) {
  if (s.empty()) return 0;
  char unit = s.back();
  uint64_t mul = 1;
  std::string_view num = s;
  if (unit=='K'||unit=='k'||unit=='M'||unit=='m'||unit=='G'||unit=='g') {
    num.remove_suffix(1);
    if (unit=='K'||unit=='k') mul = 1024ull;
    if (unit=='M'||unit=='m') mul = 1024ull*1024ull;
    if (unit=='G'||unit=='g') mul = 1024ull*1024ull*1024ull;
  }
  return std::strtoull(std::string(num).c_str(), nullptr, 10) * mul;
}

static Args parse_args(int argc, char** argv) {
  Args a;
  for (int i=1;i<argc;++i) {
    std::string_view t = argv[i];
    if (t=="-h" || t=="--help") { a.help=true; break; }

    auto need_value = [&](int i)->bool { return (i+1)<argc; };

    if (t=="init" || t=="check" || t=="repack" || t=="bench") { a.mode = std::string(t); continue; }
    if (t=="put" && need_value(i)) { a.mode = "put"; a.source = argv[++i]; continue; }
    if (t=="--path" && need_value(i)) { a.path = argv[++i]; continue; }
    if (t=="--password" && need_value(i)) { a.password = argv[++i]; continue; }
    if (t=="--log-level" && need_value(i)) { a.log_level = argv[++i]; continue; }
    if (t=="--chunk" && need_value(i)) { a.chunk = parse_bytes(argv[++i]); continue; }
    if (t=="--fast") { a.fast = true; continue; }
    if (t=="--read-data") { a.read_data = true; continue; }
    if (t=="--compression" && need_value(i)) { a.compression = std::atoi(argv[++i]); continue; }
    if (t=="--padding" && need_value(i)) { if(!parse_bool(argv[++i], a.padding)) a.help=true; continue; }
    if (t=="--verify" && need_value(i)) { if(!parse_bool(argv[++i], a.verify)) a.help=true; continue; }
    if (t=="--blobs" && need_value(i)) { a.blobs = std::strtoull(argv[++i],nullptr,10); continue; }
    if (t=="--blob-size" && need_value(i)) { a.blob_size = parse_bytes(argv[++i]); continue; }
    if (t=="--threads" && need_value(i)) { a.threads = std::strtoul(argv[++i],nullptr,10); continue; }

    spdlog::warn("Unknown arg: {}", t);
    a.help = true;
  }
  if (a.password.empty()) {
    if (const char* env = std::getenv("PACKWERK_PASSWORD")) a.password = env;
  }
  return a;
}

static std::string hex_encode(const Bytes& b) {
  static const char digits[] = "0123456789abcdef";
  std::string out;
  for (uint8_t c : b) { out.push_back(digits[c >> 4]); out.push_back(digits[c & 0x0f]); }
  return out;
}

static Bytes hex_decode(const std::string& s) {
  Bytes out;
  for (size_t i = 0; i + 1 < s.size(); i += 2) {
    out.push_back(static_cast<uint8_t>(std::stoul(s.substr(i, 2), nullptr, 16)));
  }
  return out;
}

// ----------------------------
// Открытый репозиторий
// ----------------------------
struct Repo {
  RepoConfig                    config;
  std::shared_ptr<LocalBackend> backend;
  std::shared_ptr<Key>          key;
};

static std::string config_path(const std::string& root) {
  return (fs::path(root) / "config").string();
}

static std::optional<Repo> open_repo(const Args& a) {
  auto cfg = load_config(config_path(a.path));
  if (!cfg) return std::nullopt;
  if (a.password.empty()) {
    spdlog::error("no password given (--password or PACKWERK_PASSWORD)");
    return std::nullopt;
  }
  Repo r;
  r.config  = *cfg;
  r.backend = std::make_shared<LocalBackend>(a.path);
  r.key     = Key::derive(a.password, hex_decode(cfg->kdf_salt), cfg->kdf_iterations);
  return r;
}

static int cmd_init(const Args& a) {
  if (a.password.empty()) {
    spdlog::error("no password given (--password or PACKWERK_PASSWORD)");
    return 1;
  }
  if (fs::exists(config_path(a.path))) {
    spdlog::error("repository already initialized at {}", a.path);
    return 1;
  }
  LocalBackend be(a.path);
  if (!be.init_layout()) return 1;

  RepoConfig cfg;
  cfg.compression = a.compression;
  cfg.padding     = a.padding;
  cfg.verify      = a.verify;
  cfg.kdf_salt    = hex_encode(random_bytes(16));
  if (!save_config(config_path(a.path), cfg)) return 1;

  spdlog::info("repository initialized at {}", a.path);
  return 0;
}

static int cmd_put(const Args& a) {
  auto repo = open_repo(a);
  if (!repo) return 1;
  if (a.chunk == 0) {
    spdlog::error("--chunk must be positive");
    return 2;
  }

  auto indexer = std::make_shared<Indexer>(repo->backend, repo->key);
  indexer->load_existing();

  const CryptoEnvelope env(repo->key, repo->config.envelope_options());
  auto make_packer = [&](BlobType type) {
    return std::make_unique<RepositoryPacker>(
        repo->backend, indexer, env,
        PackSizer::from_config(repo->config, type, indexer->total_pack_size(type)),
        PackerOptions{.type = type, .padding = repo->config.padding});
  };
  auto data_packer = make_packer(BlobType::Data);
  auto tree_packer = make_packer(BlobType::Tree);

  uint64_t files = 0, bytes = 0;
  for (const auto& e : fs::recursive_directory_iterator(a.source, fs::directory_options::skip_permission_denied)) {
    if (!e.is_regular_file()) continue;
    std::ifstream in(e.path(), std::ios::binary);
    if (!in) {
      spdlog::warn("cannot read {}, skipped", e.path().string());
      continue;
    }
    // Дерево файла: путь + id кусков, по одному в строке.
    std::string tree = e.path().string() + "\n";
    Bytes buf(a.chunk);
    while (in) {
      in.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(buf.size()));
      const auto got = static_cast<size_t>(in.gcount());
      if (got == 0) break;
      Bytes chunk(buf.begin(), buf.begin() + got);
      const BlobId id = hash_bytes(chunk);
      tree += id.to_hex() + "\n";
      bytes += got;
      data_packer->add(std::move(chunk), id);
    }
    tree_packer->add(Bytes(tree.begin(), tree.end()), hash_bytes(tree));
    ++files;
  }

  const PackerStats data = data_packer->finalize();
  const PackerStats trees = tree_packer->finalize();
  indexer->finalize();

  fmt::print("files: {}  bytes read: {}\n", files, bytes);
  fmt::print("data:  {} new blobs, {} bytes -> {} bytes packed\n", data.blobs, data.data, data.data_packed);
  fmt::print("tree:  {} new blobs, {} bytes -> {} bytes packed\n", trees.blobs, trees.data, trees.data_packed);
  return 0;
}

static int cmd_check(const Args& a) {
  auto repo = open_repo(a);
  if (!repo) return 1;

  Indexer indexer(repo->backend, repo->key);
  indexer.load_existing();
  const CryptoEnvelope env(repo->key, repo->config.envelope_options());

  uint64_t packs = 0, blobs = 0, errors = 0;
  for (const auto& pack : indexer.packs()) {
    ++packs;
    try {
      const PackHeader h = read_pack_header(*repo->backend, *repo->key, pack.id, pack.pack_size());
      if (h.blobs != pack.blobs) {
        spdlog::error("pack {}: header does not match index", pack.id.to_hex());
        ++errors;
        continue;
      }
      if (!a.read_data) continue;
      for (const auto& b : h.blobs) {
        if (b.id.is_null()) continue;
        (void)read_blob(*repo->backend, env, pack.id, b);
        ++blobs;
      }
    } catch (const Error& e) {
      spdlog::error("pack {}: {}", pack.id.to_hex(), e.what());
      ++errors;
    }
  }
  fmt::print("checked {} packs, {} blobs, {} errors\n", packs, blobs, errors);
  return errors == 0 ? 0 : 1;
}

static int cmd_repack(const Args& a) {
  auto repo = open_repo(a);
  if (!repo) return 1;

  Indexer old_index(repo->backend, repo->key);
  old_index.load_existing();
  const auto old_packs = old_index.packs();

  // Новый индекс: reserve() на нём пропускает каждый блоб ровно один раз.
  auto new_index = std::make_shared<Indexer>(repo->backend, repo->key);
  const CryptoEnvelope env(repo->key, repo->config.envelope_options());
  auto make_repacker = [&](BlobType type) {
    return std::make_unique<Repacker>(
        repo->backend, new_index, env,
        PackSizer::from_config(repo->config, type, 0),
        PackerOptions{.type = type, .padding = repo->config.padding});
  };
  auto data = make_repacker(BlobType::Data);
  auto tree = make_repacker(BlobType::Tree);

  for (const auto& pack : old_packs) {
    for (const auto& b : pack.blobs) {
      if (b.id.is_null()) continue;
      Repacker& r = b.type == BlobType::Tree ? *tree : *data;
      if (a.fast) r.add_fast(pack.id, b);
      else        r.add(pack.id, b);
    }
  }
  const PackerStats ds = data->finalize();
  const PackerStats ts = tree->finalize();

  for (const auto& pack : old_packs) new_index->accept(pack, true);
  new_index->finalize();
  for (const auto& pack : old_packs) repo->backend->remove(FileType::Pack, pack.id);

  fmt::print("repacked {} packs: data {} blobs ({} bytes), tree {} blobs ({} bytes)\n",
             old_packs.size(), ds.blobs, ds.data_packed, ts.blobs, ts.data_packed);
  return 0;
}

static int cmd_bench(const Args& a) {
  auto backend = std::make_shared<MemoryBackend>();
  auto key     = Key::random();
  auto indexer = std::make_shared<Indexer>(backend, key);
  RepositoryPacker packer(backend, indexer,
                          CryptoEnvelope(key, EnvelopeOptions{.compression_level = a.compression,
                                                              .verify = a.verify}),
                          PackSizer::from_config(RepoConfig{}, BlobType::Data, 0),
                          PackerOptions{.type = BlobType::Data, .padding = a.padding});

  const unsigned th = std::max(1u, a.threads);
  std::vector<std::thread> workers;
  auto t0 = std::chrono::steady_clock::now();
  for (unsigned t = 0; t < th; ++t) {
    workers.emplace_back([&, t] {
      std::mt19937_64 rng(0xBADC0FFEEULL + t);
      for (uint64_t i = t; i < a.blobs; i += th) {
        Bytes blob(a.blob_size);
        for (auto& c : blob) c = static_cast<uint8_t>(rng());
        const BlobId id = hash_bytes(blob);
        packer.add(std::move(blob), id);
      }
    });
  }
  for (auto& w : workers) w.join();
  const PackerStats st = packer.finalize();
  indexer->finalize();
  auto t1 = std::chrono::steady_clock::now();
  const double sec = std::chrono::duration<double>(t1 - t0).count();

  fmt::print("=== packwerk bench (threads={}, blobs={}, blob_size={}) ===\n", th, a.blobs, a.blob_size);
  fmt::print("packed {} blobs, {} bytes -> {} bytes in {:.3f} s: {:.1f} MiB/s, {} packs\n",
             st.blobs, st.data, st.data_packed, sec, st.data / sec / MiB,
             backend->count(FileType::Pack));
  return 0;
}

// ----------------------------
// main
// ----------------------------
int main(int argc, char** argv) {
  auto a = parse_args(argc, argv);
  if (a.help || a.mode.empty()) { print_usage(argv[0]); return a.help ? 0 : 2; }

  spdlog::set_level(spdlog::level::from_str(a.log_level));

  try {
    if (a.mode == "init")   return cmd_init(a);
    if (a.mode == "put")    return cmd_put(a);
    if (a.mode == "check")  return cmd_check(a);
    if (a.mode == "repack") return cmd_repack(a);
    if (a.mode == "bench")  return cmd_bench(a);
  } catch (const Error& e) {
    spdlog::error("{} failed: {}", a.mode, e.what());
    return 1;
  } catch (const std::exception& e) {
    spdlog::error("{} failed: {}", a.mode, e.what());
    return 1;
  }

  spdlog::error("Unknown mode: {}", a.mode);
  print_usage(argv[0]);
  return 2;
}
