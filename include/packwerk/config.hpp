#pragma once
#include <cstdint>
#include <istream>
#include <limits>
#include <optional>
#include <ostream>
#include <string>
#include <utility>

#include "packwerk/blob.hpp"
#include "packwerk/envelope.hpp"

namespace packwerk {

static constexpr uint32_t MiB = 1024 * 1024;

static constexpr uint32_t DEFAULT_TREE_SIZE      = 4 * MiB;
static constexpr uint32_t DEFAULT_DATA_SIZE      = 32 * MiB;
static constexpr uint32_t DEFAULT_GROW_FACTOR    = 32;
static constexpr uint32_t DEFAULT_SIZE_LIMIT     = std::numeric_limits<uint32_t>::max();
static constexpr uint32_t DEFAULT_MIN_PERCENTAGE = 30;
static constexpr uint32_t DEFAULT_KDF_ITERATIONS = 200000;

// Параметры репозитория. Хранится текстом `key = value` в <root>/config.
struct RepoConfig {
  uint32_t version = 1;

  // Паки
  uint32_t treepack_size       = DEFAULT_TREE_SIZE;
  uint32_t treepack_growfactor = DEFAULT_GROW_FACTOR;
  uint32_t treepack_size_limit = DEFAULT_SIZE_LIMIT;
  uint32_t datapack_size       = DEFAULT_DATA_SIZE;
  uint32_t datapack_growfactor = DEFAULT_GROW_FACTOR;
  uint32_t datapack_size_limit = DEFAULT_SIZE_LIMIT;

  uint32_t min_packsize_tolerate_percent = DEFAULT_MIN_PERCENTAGE;
  uint32_t max_packsize_tolerate_percent = 0;   // 0 = не проверять

  bool padding = true;

  // Конверт
  int  compression = 0;                         // уровень zlib, 0 = выкл.
  bool verify      = false;

  // Ключ
  std::string kdf_salt;                         // hex
  uint32_t    kdf_iterations = DEFAULT_KDF_ITERATIONS;

  struct PackSize {
    uint32_t default_size;
    uint32_t grow_factor;
    uint32_t size_limit;
  };
  PackSize packsize(BlobType type) const;

  // (min, max); max = u32::max если проверка выключена.
  std::pair<uint32_t, uint32_t> packsize_ok_percents() const;

  EnvelopeOptions envelope_options() const {
    return EnvelopeOptions{.compression_level = compression, .verify = verify};
  }
};

// Разбор: `#`/`;` комментарии, пробелы по краям игнорируются,
// неизвестные ключи -> warn. Некорректное значение -> nullopt + error в лог.
std::optional<RepoConfig> parse_config(std::istream& in);
void write_config(std::ostream& out, const RepoConfig& c);

std::optional<RepoConfig> load_config(const std::string& path);
bool save_config(const std::string& path, const RepoConfig& c);

} // namespace packwerk
