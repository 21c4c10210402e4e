#include "editor.hpp"
#include <cassert>
#include <string>
#include <vector>

static std::string cur(const Editor& e) { return std::string(e.current().content().view()); }

static void test_fresh_editor() {
  Editor e = Editor::from_string("abc");
  assert(e.history_len() == 1);
  assert(e.history_pos() == 0);
  assert(e.on_disk_pos() == 0);
  assert(e.copy_pos() == 0);
  assert(!e.file());
  assert(!e.dirty());
  assert(cur(e) == "abc");

  Editor d;
  assert(d.history_len() == 1);
  assert(cur(d).empty());
}

static void test_noop_edit_suppressed() {
  Editor e = Editor::from_string("abc");
  Editor same = e.add_undo(Text::from_string("abc"));
  assert(same.history_len() == 1);
  assert(same.history_pos() == 0);

  /* a cursor move is recorded but does not dirty the document */
  Editor moved = e.add_undo(e.current().with_cursors({Selection{1, 2}}));
  assert(moved.history_len() == 2);
  assert(moved.history_pos() == 1);
  assert(!moved.dirty());

  Editor edited = e.add_undo(Text::from_string("abcd"));
  assert(edited.dirty());
}

static void test_undo_steps_back() {
  Editor e = Editor::from_string("C0");
  e = e.add_undo(Text::from_string("C1"));
  e = e.add_undo(Text::from_string("C2"));
  assert(e.history_len() == 3);

  Editor u1 = e.undo();
  assert(cur(u1) == "C1");
  assert(u1.history_len() == 4);
  assert(u1.history_pos() == 3);

  Editor u2 = u1.undo();
  assert(cur(u2) == "C0");
  assert(u2.history_len() == 5);

  Editor u3 = u2.undo();
  assert(cur(u3) == "C0");
  assert(u3.history_len() == 6);
  assert(u3.history_pos() == 5);

  Editor u4 = u3.undo();
  assert(cur(u4) == "C0");
  assert(u4.history_len() == 7);
}

static void test_undo_at_start() {
  Editor e = Editor::from_string("only");
  Editor u = e.undo();
  assert(cur(u) == "only");
  assert(u.history_len() == 2);
  assert(u.history_pos() == 1);
  assert(!u.dirty());
}

static void test_undo_skips_cursor_only_entries() {
  Editor e = Editor::from_string("hello");
  e = e.add_undo(e.current().with_cursors({Selection{5, 5}}));
  e = e.add_undo(Text::from_string("hello!"));
  e = e.add_undo(e.current().with_cursors({Selection{6, 6}}));
  Editor u = e.undo();
  assert(cur(u) == "hello");
  /* cursor state comes from the recovered entry */
  assert(u.current().cursors()[0] == (Selection{5, 5}));
}

static void test_edit_after_undo() {
  Editor e = Editor::from_string("a");
  e = e.add_undo(Text::from_string("ab"));
  e = e.add_undo(Text::from_string("abc"));
  e = e.undo();
  assert(cur(e) == "ab");
  e = e.add_undo(Text::from_string("abX"));
  assert(e.history_pos() == e.history_len() - 1);
  Editor u = e.undo();
  assert(cur(u) == "ab");
  Editor u2 = u.undo();
  assert(cur(u2) == "abc");
}

static void test_history_append_only() {
  Editor e = Editor::from_string("x");
  std::vector<std::string> seen;
  std::vector<Editor> values{e};
  e = e.add_undo(Text::from_string("y")); values.push_back(e);
  e = e.undo(); values.push_back(e);
  e = e.add_undo(Text::from_string("z")); values.push_back(e);
  e = e.undo(); values.push_back(e);
  e = e.mark_copied(); values.push_back(e);

  size_t prev_len = 0;
  for (const Editor& v : values) {
    assert(v.history_len() >= prev_len);
    prev_len = v.history_len();
  }
  for (size_t i = 0; i < e.history_len(); ++i) seen.emplace_back(e.history().at(i).content().view());
  assert((seen == std::vector<std::string>{"x", "y", "x", "z", "x"}));
  /* earlier values still see their own prefix */
  for (const Editor& v : values) {
    for (size_t i = 0; i < v.history_len(); ++i) assert(v.history().at(i).content().view() == seen[i]);
  }
}

static void test_values_do_not_interfere() {
  Editor base = Editor::from_string("base");
  Editor left = base.add_undo(Text::from_string("left"));
  Editor right = base.add_undo(Text::from_string("right"));
  assert(cur(base) == "base");
  assert(cur(left) == "left");
  assert(cur(right) == "right");
  assert(left.history_len() == 2);
  assert(right.history_len() == 2);
  Editor left2 = left.add_undo(Text::from_string("left2"));
  assert(cur(left2) == "left2");
  assert(right.history().at(1).content().view() == "right");
}

static void test_mark_copied() {
  Editor e = Editor::from_string("one");
  e = e.add_undo(Text::from_string("two"));
  assert(e.copied().content().view() == "one");
  Editor c = e.mark_copied();
  assert(c.copy_pos() == c.history_pos());
  assert(c.copied().content().view() == "two");
  assert(c.history_len() == e.history_len());
  assert(e.copy_pos() == 0);
}

static void test_dirty_follows_content() {
  Editor e = Editor::from_string("v1");
  e = e.add_undo(Text::from_string("v2"));
  assert(e.dirty());
  e = e.undo();
  assert(!e.dirty());
  assert(e.on_disk().content().view() == "v1");
}

int main() {
  test_fresh_editor();
  test_noop_edit_suppressed();
  test_undo_steps_back();
  test_undo_at_start();
  test_undo_skips_cursor_only_entries();
  test_edit_after_undo();
  test_history_append_only();
  test_values_do_not_interfere();
  test_mark_copied();
  test_dirty_follows_content();
  return 0;
}
