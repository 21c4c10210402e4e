#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (Selection/EditError/ExitStatus/FileStat).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 */
#include <cstddef>
#include <cstdint>
#include <string_view>

/* [start, end) byte range over a snapshot's content */
struct Selection {
  size_t start = 0;
  size_t end = 0;

  size_t start_index() const { return start; }
  size_t end_index() const { return end; }
  bool empty() const { return start == end; }
  bool operator==(const Selection&) const = default;
};

enum class EditError { None, NoFile, Io, CopyFailed, OutOfBounds };

std::string_view edit_error_name(EditError e);

struct ExitStatus {
  enum class Kind { Exited, Signaled, Unknown } kind = Kind::Unknown;
  int code = 0; /* exit code, or signal number when Signaled */

  bool success() const { return kind == Kind::Exited && code == 0; }
};

/* metadata captured when a file is loaded */
struct FileStat {
  uint64_t size = 0;
  int64_t mtime_sec = 0;
  int64_t mtime_nsec = 0;
  uint32_t mode = 0;
  uint64_t dev = 0;
  uint64_t ino = 0;

  bool operator==(const FileStat&) const = default;
};
