#pragma once
/*
 * Editor
 *
 * Purpose: editing state of one document: snapshot history, the current /
 *          on-disk / copied baselines, and the optional backing file.
 * Values: every operation is const and yields a new Editor; History entries
 *         are shared between the values, never rewritten.
 * Errors: fallible operations return EditError and fill msg; the out Editor
 *         is assigned only on success.
 */
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include "history.hpp"
#include "clipboard.hpp"
#include "types.hpp"

struct FileBinding {
  std::filesystem::path path;
  std::optional<FileStat> stat; /* nullopt: the path did not exist at load */
};

class Editor {
public:
  Editor();

  static Editor from_string(std::string_view str);
  static EditError from_file(const std::filesystem::path& path, Editor& out, std::string& msg);

  const Text& current() const { return history_.at(history_pos_); }
  const Text& on_disk() const { return history_.at(on_disk_pos_); }
  const Text& copied() const { return history_.at(copy_pos_); }

  const History& history() const { return history_; }
  size_t history_len() const { return history_.len(); }
  size_t history_pos() const { return history_pos_; }
  size_t on_disk_pos() const { return on_disk_pos_; }
  size_t copy_pos() const { return copy_pos_; }
  const std::optional<FileBinding>& file() const { return file_; }

  /*
   * Records t as the newest state. A t equal to current() (content and
   * cursors) is dropped. Edits never branch: t always lands at the end of
   * the history, even if history_pos is not the last index.
   */
  Editor add_undo(const Text& t) const;

  /*
   * Linearized undo: walks back to the nearest entry whose content differs
   * from current() and appends a copy of it. Repeated undo continues from
   * the entry the previous undo recovered, so it keeps stepping back.
   */
  Editor undo() const;

  bool dirty() const;
  Editor mark_copied() const;
  Editor bind_file(const std::filesystem::path& path) const;

  EditError save(Editor& out, std::string& msg) const;
  EditError copy_clipboard(const IClipboard& clip, std::string& msg) const;
  EditError paste_clipboard(const IClipboard& clip, Editor& out, std::string& msg) const;

private:
  History history_;
  size_t history_pos_ = 0;
  size_t on_disk_pos_ = 0;
  size_t copy_pos_ = 0;
  /* index the newest entry was recovered from, while it came from undo() */
  std::optional<size_t> undo_src_;
  std::optional<FileBinding> file_;
};
