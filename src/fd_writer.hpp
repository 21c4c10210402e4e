#pragma once
/*
 * FdWriter
 *
 * Purpose: chunked buffered writer over a raw file descriptor.
 * Usage: write()/put() fill the chunk, flush() drains it; spans larger than
 *        the chunk go straight to the fd. After the first failure every call
 *        returns false and error() keeps that errno.
 */
#include <cstddef>
#include <string_view>
#include <vector>
#include "config.hpp"

class FdWriter {
public:
  explicit FdWriter(int fd, size_t chunk = SE_WRITE_CHUNK_SIZE);

  bool write(const char* p, size_t len);
  bool write(std::string_view s) { return write(s.data(), s.size()); }
  bool put(char c);
  bool flush();

  int error() const { return err_; }
  size_t written() const { return written_; }

private:
  bool write_span(const char* p, size_t len);

  int fd_;
  std::vector<char> buf_;
  size_t used_ = 0;
  size_t written_ = 0;
  int err_ = 0;
};
