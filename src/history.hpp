#pragma once
/*
 * History
 *
 * Purpose: append-only, insertion-ordered list of Text snapshots.
 * Sharing: a History is a handle {arena, len}; copies share the arena and
 *          append() at the arena tail extends it in place. A handle that is
 *          no longer the tail (another copy already appended) forks a new
 *          arena from its own prefix, so handles never see foreign entries.
 * Note: entries live in a deque, references returned by at() stay valid.
 */
#include <deque>
#include <memory>
#include "text.hpp"

class History {
public:
  History();

  History append(const Text& t) const;
  const Text& at(size_t i) const;
  size_t len() const { return len_; }
  bool empty() const { return len_ == 0; }

private:
  History(std::shared_ptr<std::deque<Text>> arena, size_t len);

  std::shared_ptr<std::deque<Text>> arena_;
  size_t len_ = 0;
};
