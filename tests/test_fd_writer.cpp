#include "fd_writer.hpp"
#include "posix_fd.hpp"
#include <cassert>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

static std::string read_text(const fs::path& p) {
  std::ifstream f(p, std::ios::binary);
  std::stringstream ss;
  ss << f.rdbuf();
  return ss.str();
}

int main() {
  fs::path p = fs::temp_directory_path() / ("snapedit_writer_" + std::to_string(::getpid()));
  {
    UniqueFd ufd(::open(p.string().c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644));
    assert(ufd.valid());
    FdWriter w(ufd.get(), 8);
    assert(w.write("abc"));
    assert(w.put('-'));
    assert(w.written() == 0);
    assert(w.write("0123456789abcdef"));
    assert(w.put('!'));
    assert(w.write(""));
    assert(w.flush());
    assert(w.written() == 21);
    assert(w.error() == 0);
    assert(ufd.close_checked() == 0);
  }
  assert(read_text(p) == "abc-0123456789abcdef!");
  fs::remove(p);

  {
    int fds[2];
    assert(::pipe(fds) == 0);
    UniqueFd rd(fds[0]);
    UniqueFd wr(fds[1]);
    FdWriter w(wr.get(), 4);
    for (char c : std::string("hello pipe")) assert(w.put(c));
    assert(w.flush());
    wr.reset();
    char buf[32];
    ssize_t n = ::read(rd.get(), buf, sizeof(buf));
    assert(n == 10);
    assert(std::string(buf, static_cast<size_t>(n)) == "hello pipe");
  }

  {
    /* failures stick */
    FdWriter w(-1, 4);
    assert(w.write("ab"));
    assert(!w.write("cdefgh"));
    assert(w.error() == EBADF);
    assert(!w.put('x'));
    assert(!w.flush());
  }
  return 0;
}
