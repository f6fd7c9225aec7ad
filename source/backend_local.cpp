#include "packwerk/backend.hpp"
#include "packwerk/error.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <dirent.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace packwerk {

static bool ensure_dir(const std::string& p) {
  struct stat st {};
  if (::stat(p.c_str(), &st) == 0) {
    return S_ISDIR(st.st_mode);
  }
  return ::mkdir(p.c_str(), 0700) == 0 || errno == EEXIST;
}

static std::string join_path(std::string a, const std::string& b) {
  if (!a.empty() && a.back() != '/') a.push_back('/');
  a += b;
  return a;
}

static void fsync_dir_path(const std::string& dir) {
  int dfd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY);
  if (dfd >= 0) { (void)::fsync(dfd); ::close(dfd); }
}

static std::string errno_text() {
  return std::string(std::strerror(errno)) + " (errno=" + std::to_string(errno) + ")";
}

[[noreturn]] static void fail(const std::string& what, const std::string& path) {
  const std::string msg = what + " " + path + ": " + errno_text();
  spdlog::error("local backend: {}", msg);
  throw Error(ErrorKind::Backend, msg);
}

// RAII над файловым дескриптором
struct Fd {
  int fd = -1;
  explicit Fd(int f) : fd(f) {}
  ~Fd() { if (fd >= 0) ::close(fd); }
  Fd(const Fd&) = delete;
  Fd& operator=(const Fd&) = delete;
};

LocalBackend::LocalBackend(std::string root) : root_(std::move(root)) {}

bool LocalBackend::init_layout() {
  if (!ensure_dir(root_)) {
    spdlog::error("cannot create repository dir {}", root_);
    return false;
  }
  const auto data = join_path(root_, file_type_dir(FileType::Pack));
  const auto index = join_path(root_, file_type_dir(FileType::Index));
  if (!ensure_dir(data) || !ensure_dir(index)) {
    spdlog::error("cannot create data/index dirs under {}", root_);
    return false;
  }
  for (int i = 0; i < 256; ++i) {
    char sub[3];
    std::snprintf(sub, sizeof(sub), "%02x", i);
    if (!ensure_dir(join_path(data, sub))) {
      spdlog::error("cannot create {}/{}", data, sub);
      return false;
    }
  }
  fsync_dir_path(root_);
  return true;
}

std::string LocalBackend::path_for(FileType type, const Id& id) const {
  const std::string hex = id.to_hex();
  auto dir = join_path(root_, file_type_dir(type));
  if (type == FileType::Pack) dir = join_path(dir, hex.substr(0, 2));
  return join_path(dir, hex);
}

void LocalBackend::write(FileType type, const Id& id, const Bytes& data) {
  const auto path = path_for(type, id);
  const auto dir  = path.substr(0, path.find_last_of('/'));
  if (!ensure_dir(dir)) fail("mkdir", dir);

  const auto tmp = path + ".tmp";
  {
    Fd f(::open(tmp.c_str(), O_CREAT | O_TRUNC | O_WRONLY, 0600));
    if (f.fd < 0) fail("open", tmp);

    size_t off = 0;
    while (off < data.size()) {
      ssize_t w = ::write(f.fd, data.data() + off, data.size() - off);
      if (w < 0) {
        if (errno == EINTR) continue;
        const int saved = errno;
        ::unlink(tmp.c_str());
        errno = saved;
        fail("write", tmp);
      }
      off += static_cast<size_t>(w);
    }
    if (::fsync(f.fd) != 0) {
      const int saved = errno;
      ::unlink(tmp.c_str());
      errno = saved;
      fail("fsync", tmp);
    }
  }

  if (::rename(tmp.c_str(), path.c_str()) != 0) {
    const int saved = errno;
    ::unlink(tmp.c_str());
    errno = saved;
    fail("rename", path);
  }
  fsync_dir_path(dir);
  spdlog::debug("local backend: wrote {} ({} bytes)", path, data.size());
}

Bytes LocalBackend::read_full(FileType type, const Id& id) {
  const auto path = path_for(type, id);
  Fd f(::open(path.c_str(), O_RDONLY));
  if (f.fd < 0) fail("open", path);

  struct stat st {};
  if (::fstat(f.fd, &st) != 0) fail("fstat", path);

  Bytes out(static_cast<size_t>(st.st_size));
  size_t off = 0;
  while (off < out.size()) {
    ssize_t r = ::pread(f.fd, out.data() + off, out.size() - off, static_cast<off_t>(off));
    if (r < 0) {
      if (errno == EINTR) continue;
      fail("read", path);
    }
    if (r == 0) break;
    off += static_cast<size_t>(r);
  }
  if (off != out.size()) {
    throw Error(ErrorKind::Backend, "short read on " + path);
  }
  return out;
}

Bytes LocalBackend::read_partial(FileType type, const Id& id, uint32_t offset, uint32_t length) {
  const auto path = path_for(type, id);
  Fd f(::open(path.c_str(), O_RDONLY));
  if (f.fd < 0) fail("open", path);

  Bytes out(length);
  size_t got = 0;
  while (got < length) {
    ssize_t r = ::pread(f.fd, out.data() + got, length - got,
                        static_cast<off_t>(offset) + static_cast<off_t>(got));
    if (r < 0) {
      if (errno == EINTR) continue;
      fail("pread", path);
    }
    if (r == 0) break;
    got += static_cast<size_t>(r);
  }
  if (got != length) {
    throw Error(ErrorKind::Backend,
                "partial read out of range: " + path + " @" + std::to_string(offset) +
                "+" + std::to_string(length));
  }
  return out;
}

static void collect_ids(const std::string& dir, std::vector<Id>& out) {
  DIR* d = ::opendir(dir.c_str());
  if (!d) return;
  while (auto* e = ::readdir(d)) {
    std::string n = e->d_name;
    if (n.size() != 64) continue;
    if (auto id = Id::from_hex(n)) out.push_back(*id);
  }
  ::closedir(d);
}

std::vector<Id> LocalBackend::list(FileType type) {
  std::vector<Id> out;
  const auto dir = join_path(root_, file_type_dir(type));
  if (type == FileType::Index) {
    collect_ids(dir, out);
  } else {
    for (int i = 0; i < 256; ++i) {
      char sub[3];
      std::snprintf(sub, sizeof(sub), "%02x", i);
      collect_ids(join_path(dir, sub), out);
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

void LocalBackend::remove(FileType type, const Id& id) {
  const auto path = path_for(type, id);
  if (::unlink(path.c_str()) != 0) fail("unlink", path);
  fsync_dir_path(path.substr(0, path.find_last_of('/')));
}

} // namespace packwerk
