#include "history.hpp"
#include <stdexcept>

History::History() : arena_(std::make_shared<std::deque<Text>>()) {}

History::History(std::shared_ptr<std::deque<Text>> arena, size_t len)
  : arena_(std::move(arena)), len_(len) {}

History History::append(const Text& t) const {
  if (arena_->size() == len_) {
    arena_->push_back(t);
    return History(arena_, len_ + 1);
  }
  auto fork = std::make_shared<std::deque<Text>>(arena_->begin(), arena_->begin() + static_cast<std::ptrdiff_t>(len_));
  fork->push_back(t);
  return History(std::move(fork), len_ + 1);
}

const Text& History::at(size_t i) const {
  if (i >= len_) throw std::out_of_range("history index out of range");
  return (*arena_)[i];
}
