#include "editor.hpp"
#include "fd_writer.hpp"
#include "file_reader.hpp"
#include "posix_fd.hpp"
#include "config.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>
#include <vector>

Editor::Editor() : history_(History().append(Text())) {}

Editor Editor::from_string(std::string_view str) {
  Editor res;
  res.history_ = History().append(Text::from_string(str));
  return res;
}

EditError Editor::from_file(const std::filesystem::path& path, Editor& out, std::string& msg) {
  std::string bytes;
  FileStat st;
  ReadStatus rs = mmap_read_file(path, bytes, st, msg);
  if (rs == ReadStatus::Error) return EditError::Io;

  Editor res;
  res.history_ = History().append(Text::from_bytes(std::move(bytes)));
  res.file_ = FileBinding{path, std::nullopt};
  if (rs == ReadStatus::Ok) res.file_->stat = st;
  out = std::move(res);
  return EditError::None;
}

Editor Editor::add_undo(const Text& t) const {
  if (t.equal(current())) return *this;

  Editor res = *this;
  res.history_ = history_.append(t);
  res.history_pos_ = res.history_.len() - 1;
  res.undo_src_.reset();
  return res;
}

Editor Editor::undo() const {
  const Text& curr = current();
  size_t pos = history_pos_;
  if (undo_src_ && history_pos_ + 1 == history_.len()) pos = *undo_src_;
  while (pos != 0) {
    pos--;
    if (!Content::equal(curr.content(), history_.at(pos).content())) break;
  }

  Editor res = *this;
  res.history_ = history_.append(history_.at(pos));
  res.history_pos_ = res.history_.len() - 1;
  res.undo_src_ = pos;
  return res;
}

bool Editor::dirty() const {
  return !Content::equal(on_disk().content(), current().content());
}

Editor Editor::mark_copied() const {
  Editor res = *this;
  res.copy_pos_ = res.history_pos_;
  return res;
}

Editor Editor::bind_file(const std::filesystem::path& path) const {
  Editor res = *this;
  res.file_ = FileBinding{path, std::nullopt};
  return res;
}

static std::string io_failure(const std::string& what, const std::filesystem::path& path, int err) {
  return what + path.string() + " (" + std::strerror(err) + ")";
}

EditError Editor::save(Editor& out, std::string& msg) const {
  if (!dirty()) { out = *this; msg = "no changes to save"; return EditError::None; }
  if (!file_) { msg = "don't have path, bind a file before saving"; return EditError::NoFile; }

  const std::filesystem::path& path = file_->path;
  UniqueFd ufd(::open(path.string().c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644));
  if (!ufd.valid()) { msg = io_failure("write file failed: ", path, errno); return EditError::Io; }

  FdWriter w(ufd.get());
  if (!w.write(current().content().view()) || !w.flush()) {
    msg = io_failure("write file failed: ", path, w.error());
    return EditError::Io;
  }
#if defined(__APPLE__)
  if (::fsync(ufd.get()) != 0) { msg = io_failure("write file failed: ", path, errno); return EditError::Io; }
#else
  if (::fdatasync(ufd.get()) != 0) { msg = io_failure("write file failed: ", path, errno); return EditError::Io; }
#endif
  if (int err = ufd.close_checked()) { msg = io_failure("write file failed: ", path, err); return EditError::Io; }

  Editor res = *this;
  res.on_disk_pos_ = res.history_pos_;
  out = std::move(res);
  msg = std::string("saved file: ") + path.string();
  return EditError::None;
}

EditError Editor::copy_clipboard(const IClipboard& clip, std::string& msg) const {
  Process proc;
  if (!clip.spawn_copy(proc, msg)) return EditError::Io;

  const Text& text = current();
  int err = 0;
  {
    SigpipeGuard guard;
    FdWriter w(proc.stdin_fd());
    bool first = true;
    for (const Selection& c : text.cursors()) {
      if (!first && !w.put('\n')) break;
      first = false;
      size_t end = c.end_index();
      text.content().for_each(c.start_index(), [&](size_t i, char ch) {
        if (i >= end) return false;
        return w.put(ch);
      });
      if (w.error() != 0) break;
    }
    if (w.error() == 0) w.flush();
    err = w.error();
    if (err == 0) err = proc.close_stdin();
  }
  if (err != 0) {
    proc.kill();
    msg = std::string("clipboard copy failed: ") + std::strerror(err);
    return EditError::Io;
  }

  ExitStatus st;
  if (!proc.wait(st, msg)) return EditError::Io;
  /* best effort: a failing copy utility is reported, not surfaced as an error */
  size_t n = text.cursors().size();
  msg = "copied " + std::to_string(n) + (n == 1 ? " selection" : " selections");
  if (!st.success()) msg += " (clipboard " + describe_exit(st) + ")";
  return EditError::None;
}

EditError Editor::paste_clipboard(const IClipboard& clip, Editor& out, std::string& msg) const {
  Process proc;
  if (!clip.spawn_paste(proc, msg)) return EditError::Io;

  const size_t limit = clip.paste_limit();
  std::string data;
  std::vector<char> chunk(SE_WRITE_CHUNK_SIZE);
  while (true) {
    ssize_t r = ::read(proc.stdout_fd(), chunk.data(), chunk.size());
    if (r < 0) {
      if (errno == EINTR) continue;
      int err = errno;
      proc.kill();
      msg = std::string("clipboard paste failed: ") + std::strerror(err);
      return EditError::Io;
    }
    if (r == 0) break;
    if (static_cast<size_t>(r) > limit - data.size()) {
      proc.kill();
      msg = "clipboard paste exceeds " + std::to_string(limit) + " bytes";
      return EditError::OutOfBounds;
    }
    data.append(chunk.data(), static_cast<size_t>(r));
  }

  ExitStatus st;
  if (!proc.wait(st, msg)) return EditError::Io;
  if (!st.success()) {
    msg = "clipboard paste failed: " + describe_exit(st);
    return EditError::CopyFailed;
  }

  out = add_undo(current().paste(data));
  msg = "pasted " + std::to_string(data.size()) + " bytes";
  return EditError::None;
}
