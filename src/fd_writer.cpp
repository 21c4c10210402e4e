#include "fd_writer.hpp"
#include <cerrno>
#include <cstring>
#include <unistd.h>

FdWriter::FdWriter(int fd, size_t chunk) : fd_(fd), buf_(chunk == 0 ? 1 : chunk) {}

bool FdWriter::write_span(const char* p, size_t len) {
  size_t remain = len;
  while (remain > 0) {
    ssize_t w = ::write(fd_, p, remain);
    if (w < 0) {
      if (errno == EINTR) continue;
      err_ = errno;
      return false;
    }
    p += w;
    remain -= static_cast<size_t>(w);
    written_ += static_cast<size_t>(w);
  }
  return true;
}

bool FdWriter::flush() {
  if (err_ != 0) return false;
  if (used_ == 0) return true;
  size_t n = used_;
  used_ = 0;
  return write_span(buf_.data(), n);
}

bool FdWriter::write(const char* p, size_t len) {
  if (err_ != 0) return false;
  if (len == 0) return true;
  if (len > buf_.size() - used_) {
    if (!flush()) return false;
    if (len >= buf_.size()) return write_span(p, len);
  }
  std::memcpy(buf_.data() + used_, p, len);
  used_ += len;
  return true;
}

bool FdWriter::put(char c) {
  if (err_ != 0) return false;
  if (used_ == buf_.size() && !flush()) return false;
  buf_[used_++] = c;
  return true;
}
