#include "packwerk/config.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdio>
#include <fstream>
#include <functional>
#include <map>

namespace packwerk {

static std::string trim(std::string s) {
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n')) s.pop_back();
  size_t i = 0;
  while (i < s.size() && (s[i] == ' ' || s[i] == '\t')) ++i;
  return s.substr(i);
}

static bool parse_u32(const std::string& v, uint32_t& out) {
  auto r = std::from_chars(v.data(), v.data() + v.size(), out);
  return r.ec == std::errc() && r.ptr == v.data() + v.size();
}

static bool parse_int(const std::string& v, int& out) {
  auto r = std::from_chars(v.data(), v.data() + v.size(), out);
  return r.ec == std::errc() && r.ptr == v.data() + v.size();
}

static bool parse_bool(std::string v, bool& out) {
  for (auto& ch : v) ch = (char)std::tolower((unsigned char)ch);
  if (v == "true" || v == "yes" || v == "on" || v == "1")  { out = true;  return true; }
  if (v == "false" || v == "no" || v == "off" || v == "0") { out = false; return true; }
  return false;
}

RepoConfig::PackSize RepoConfig::packsize(BlobType type) const {
  if (type == BlobType::Tree) return {treepack_size, treepack_growfactor, treepack_size_limit};
  return {datapack_size, datapack_growfactor, datapack_size_limit};
}

std::pair<uint32_t, uint32_t> RepoConfig::packsize_ok_percents() const {
  const uint32_t max = max_packsize_tolerate_percent == 0
                           ? std::numeric_limits<uint32_t>::max()
                           : max_packsize_tolerate_percent;
  return {min_packsize_tolerate_percent, max};
}

std::optional<RepoConfig> parse_config(std::istream& in) {
  RepoConfig c;

  using Setter = std::function<bool(const std::string&)>;
  auto u32 = [](uint32_t& f) -> Setter { return [&f](const std::string& v) { return parse_u32(v, f); }; };
  const std::map<std::string, Setter> setters = {
    {"version",                       u32(c.version)},
    {"treepack_size",                 u32(c.treepack_size)},
    {"treepack_growfactor",           u32(c.treepack_growfactor)},
    {"treepack_size_limit",           u32(c.treepack_size_limit)},
    {"datapack_size",                 u32(c.datapack_size)},
    {"datapack_growfactor",           u32(c.datapack_growfactor)},
    {"datapack_size_limit",           u32(c.datapack_size_limit)},
    {"min_packsize_tolerate_percent", u32(c.min_packsize_tolerate_percent)},
    {"max_packsize_tolerate_percent", u32(c.max_packsize_tolerate_percent)},
    {"kdf_iterations",                u32(c.kdf_iterations)},
    {"padding",     [&c](const std::string& v) { return parse_bool(v, c.padding); }},
    {"verify",      [&c](const std::string& v) { return parse_bool(v, c.verify); }},
    {"compression", [&c](const std::string& v) {
       return parse_int(v, c.compression) && c.compression >= -1 && c.compression <= 9;
     }},
    {"kdf_salt",    [&c](const std::string& v) {
       if (v.size() % 2 != 0) return false;
       if (!std::all_of(v.begin(), v.end(), [](char ch) { return std::isxdigit((unsigned char)ch); })) return false;
       c.kdf_salt = v;
       return true;
     }},
  };

  std::string line;
  size_t lineno = 0;
  while (std::getline(in, line)) {
    ++lineno;
    auto s = trim(line);
    if (s.empty() || s[0] == '#' || s[0] == ';') continue;
    auto pos = s.find('=');
    if (pos == std::string::npos) {
      spdlog::warn("config:{}: no '=' in line, skipped", lineno);
      continue;
    }
    auto k = trim(s.substr(0, pos));
    auto v = trim(s.substr(pos + 1));
    auto it = setters.find(k);
    if (it == setters.end()) {
      spdlog::warn("config:{}: unknown key '{}'", lineno, k);
      continue;
    }
    if (!it->second(v)) {
      spdlog::error("config:{}: bad value for {}: '{}'", lineno, k, v);
      return std::nullopt;
    }
  }

  if (c.version != 1) {
    spdlog::error("config: unsupported repository version {}", c.version);
    return std::nullopt;
  }
  return c;
}

void write_config(std::ostream& out, const RepoConfig& c) {
  out << "# packwerk repository config\n";
  out << "version = " << c.version << "\n";
  out << "treepack_size = " << c.treepack_size << "\n";
  out << "treepack_growfactor = " << c.treepack_growfactor << "\n";
  out << "treepack_size_limit = " << c.treepack_size_limit << "\n";
  out << "datapack_size = " << c.datapack_size << "\n";
  out << "datapack_growfactor = " << c.datapack_growfactor << "\n";
  out << "datapack_size_limit = " << c.datapack_size_limit << "\n";
  out << "min_packsize_tolerate_percent = " << c.min_packsize_tolerate_percent << "\n";
  out << "max_packsize_tolerate_percent = " << c.max_packsize_tolerate_percent << "\n";
  out << "padding = " << (c.padding ? "true" : "false") << "\n";
  out << "compression = " << c.compression << "\n";
  out << "verify = " << (c.verify ? "true" : "false") << "\n";
  out << "kdf_salt = " << c.kdf_salt << "\n";
  out << "kdf_iterations = " << c.kdf_iterations << "\n";
}

std::optional<RepoConfig> load_config(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    spdlog::error("config not found: {}", path);
    return std::nullopt;
  }
  return parse_config(in);
}

bool save_config(const std::string& path, const RepoConfig& c) {
  const auto tmp = path + ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) {
      spdlog::error("cannot open {} for writing", tmp);
      return false;
    }
    write_config(out, c);
    out.flush();
    if (!out) {
      spdlog::error("write failed: {}", tmp);
      return false;
    }
  }
  if (std::rename(tmp.c_str(), path.c_str()) != 0) {
    spdlog::error("rename {} -> {} failed", tmp, path);
    return false;
  }
  return true;
}

} // namespace packwerk
