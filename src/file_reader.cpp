#include "file_reader.hpp"
#include "posix_fd.hpp"
#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

static FileStat to_file_stat(const struct stat& st) {
  FileStat fs;
  fs.size = static_cast<uint64_t>(st.st_size);
#if defined(__APPLE__)
  fs.mtime_sec = static_cast<int64_t>(st.st_mtimespec.tv_sec);
  fs.mtime_nsec = static_cast<int64_t>(st.st_mtimespec.tv_nsec);
#else
  fs.mtime_sec = static_cast<int64_t>(st.st_mtim.tv_sec);
  fs.mtime_nsec = static_cast<int64_t>(st.st_mtim.tv_nsec);
#endif
  fs.mode = static_cast<uint32_t>(st.st_mode);
  fs.dev = static_cast<uint64_t>(st.st_dev);
  fs.ino = static_cast<uint64_t>(st.st_ino);
  return fs;
}

namespace {
struct MappedRegion {
  void* addr;
  size_t len;
  ~MappedRegion() { ::munmap(addr, len); }
};
}

static std::string errno_text(const std::string& what, const std::filesystem::path& path, int err) {
  return what + path.string() + " (" + std::strerror(err) + ")";
}

ReadStatus mmap_read_file(const std::filesystem::path& path,
                          std::string& out_bytes,
                          FileStat& out_stat,
                          std::string& msg) {
  UniqueFd ufd(::open(path.string().c_str(), O_RDONLY | O_CLOEXEC));
  if (!ufd.valid()) {
    int err = errno;
    if (err == ENOENT) { msg = std::string("new file: ") + path.string(); return ReadStatus::NotFound; }
    msg = errno_text("can not open file: ", path, err);
    return ReadStatus::Error;
  }
  struct stat st{};
  if (::fstat(ufd.get(), &st) != 0) { msg = errno_text("can not read file stat: ", path, errno); return ReadStatus::Error; }
  if (S_ISDIR(st.st_mode)) { msg = std::string("is a directory: ") + path.string(); return ReadStatus::Error; }
  size_t n = static_cast<size_t>(st.st_size);
  if (n == 0) {
    out_bytes.clear();
    out_stat = to_file_stat(st);
    msg = std::string("opened file: ") + path.string();
    return ReadStatus::Ok;
  }
  void* mem = ::mmap(nullptr, n, PROT_READ, MAP_PRIVATE, ufd.get(), 0);
  if (mem == MAP_FAILED) { msg = errno_text("can not mmap file: ", path, errno); return ReadStatus::Error; }
  MappedRegion region{mem, n};
  (void)::madvise(mem, n, MADV_SEQUENTIAL);
  out_bytes.assign(static_cast<const char*>(mem), n);
  out_stat = to_file_stat(st);
  msg = std::string("opened file: ") + path.string();
  return ReadStatus::Ok;
}

bool mmap_read_lines(const std::filesystem::path& path,
                     std::vector<std::string>& out_lines,
                     std::string& msg) {
  out_lines.clear();
  std::string data;
  FileStat st;
  if (mmap_read_file(path, data, st, msg) != ReadStatus::Ok) return false;
  size_t n = data.size();
  size_t start = 0;
  for (size_t i = 0; i < n; ++i) {
    if (data[i] == '\n') {
      size_t end = i;
      if (end > start && data[end - 1] == '\r') end--;
      out_lines.emplace_back(data, start, end - start);
      start = i + 1;
    }
  }
  if (start < n) {
    size_t end = n;
    if (end > start && data[end - 1] == '\r') end--;
    out_lines.emplace_back(data, start, end - start);
  }
  return true;
}
