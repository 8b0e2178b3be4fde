#include "util/Procfs.hpp"

#include <sys/stat.h>
#include <sys/types.h>
#include <dirent.h>
#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>

namespace lineage::util {

static std::string proc_root() {
  const char* env = std::getenv("LINEAGE_PROC_ROOT");
  if (env && *env) return std::string(env);
  return std::string();
}

auto map_proc_path(const std::string& abs) -> std::string {
  if (abs.rfind("/proc", 0) != 0) return abs; // not under /proc
  auto root = proc_root();
  if (root.empty()) return abs;
  std::filesystem::path p(root);
  p /= std::filesystem::path(abs.substr(1)); // drop leading '/'
  return p.string();
}

auto read_file(const std::string& abs) -> ReadResult {
  ReadResult r;
  auto path = map_proc_path(abs);
  int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) { r.err = errno; return r; }
  std::string out;
  char buf[4096];
  for (;;) {
    ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n > 0) { out.append(buf, static_cast<size_t>(n)); continue; }
    if (n == 0) break;
    if (errno == EINTR) continue;
    // Process exited between open and read shows up as ESRCH here
    r.err = errno;
    ::close(fd);
    return r;
  }
  ::close(fd);
  r.data = std::move(out);
  return r;
}

auto read_link(const std::string& abs) -> ReadResult {
  ReadResult r;
  auto path = map_proc_path(abs);
  std::string buf(256, '\0');
  for (;;) {
    ssize_t n = ::readlink(path.c_str(), buf.data(), buf.size());
    if (n < 0) { r.err = errno; return r; }
    if (static_cast<size_t>(n) < buf.size()) {
      buf.resize(static_cast<size_t>(n));
      r.data = std::move(buf);
      return r;
    }
    // Possibly truncated, retry with a larger buffer
    buf.assign(buf.size() * 2, '\0');
  }
}

auto list_dir(const std::string& abs, int* err) -> std::optional<std::vector<std::string>> {
  auto path = map_proc_path(abs);
  DIR* d = ::opendir(path.c_str());
  if (!d) {
    if (err) *err = errno;
    return std::nullopt;
  }
  std::vector<std::string> out;
  int rd_err = 0;
  for (;;) {
    errno = 0;
    auto* ent = ::readdir(d);
    if (!ent) { rd_err = errno; break; }
    const char* name = ent->d_name;
    if (std::strcmp(name, ".") == 0 || std::strcmp(name, "..") == 0) continue;
    out.emplace_back(name);
  }
  ::closedir(d);
  if (rd_err != 0) {
    if (err) *err = rd_err;
    return std::nullopt;
  }
  return out;
}

bool path_exists(const std::string& abs) {
  struct stat st{};
  return ::stat(map_proc_path(abs).c_str(), &st) == 0;
}

} // namespace lineage::util
