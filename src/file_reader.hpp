#pragma once
/*
 * FileReader
 *
 * Purpose: read a file through a transient read-only mmap.
 * Usage: mmap_read_file(path, bytes, st, msg) copies the whole file and
 *        unmaps before returning; a missing file is NotFound, not Error.
 *        mmap_read_lines(path, lines, msg) splits into lines; normalize CRLF.
 */
#include <vector>
#include <string>
#include <filesystem>
#include "types.hpp"

enum class ReadStatus { Ok, NotFound, Error };

ReadStatus mmap_read_file(const std::filesystem::path& path,
                          std::string& out_bytes,
                          FileStat& out_stat,
                          std::string& msg);

bool mmap_read_lines(const std::filesystem::path& path,
                     std::vector<std::string>& out_lines,
                     std::string& msg);
