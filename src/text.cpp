#include "text.hpp"
#include <algorithm>

Content::Content() : data_(std::make_shared<const std::string>()) {}

Content::Content(std::string bytes) : data_(std::make_shared<const std::string>(std::move(bytes))) {}

std::string Content::slice(size_t start, size_t end) const {
  size_t n = data_->size();
  start = std::min(start, n);
  end = std::min(std::max(end, start), n);
  return data_->substr(start, end - start);
}

void Content::for_each(size_t start, const Visitor& fn) const {
  const std::string& s = *data_;
  for (size_t i = start; i < s.size(); ++i) {
    if (!fn(i, s[i])) return;
  }
}

bool Content::equal(const Content& a, const Content& b) {
  if (a.data_ == b.data_) return true;
  return *a.data_ == *b.data_;
}

Text::Text() : cursors_{Selection{}} {}

Text::Text(Content content, std::vector<Selection> cursors)
  : content_(std::move(content)), cursors_(std::move(cursors)) {}

Text Text::from_string(std::string_view bytes) {
  return Text(Content(std::string(bytes)), {Selection{}});
}

Text Text::from_bytes(std::string bytes) {
  return Text(Content(std::move(bytes)), {Selection{}});
}

std::vector<Selection> Text::normalize(std::vector<Selection> cs, size_t size) {
  if (cs.empty()) return {Selection{}};
  for (auto& c : cs) {
    c.start = std::min(c.start, size);
    c.end = std::min(c.end, size);
    if (c.start > c.end) std::swap(c.start, c.end);
  }
  std::stable_sort(cs.begin(), cs.end(), [](const Selection& a, const Selection& b) {
    return a.start < b.start;
  });
  std::vector<Selection> out;
  out.reserve(cs.size());
  for (const auto& c : cs) {
    /* overlapping ranges merge; touching empty cursors at one offset collapse */
    if (!out.empty() && (c.start < out.back().end || c.start == out.back().start)) {
      out.back().end = std::max(out.back().end, c.end);
      continue;
    }
    out.push_back(c);
  }
  return out;
}

Text Text::with_cursors(std::vector<Selection> cursors) const {
  return Text(content_, normalize(std::move(cursors), content_.size()));
}

static std::vector<std::string_view> split_pieces(std::string_view bytes) {
  std::vector<std::string_view> pieces;
  size_t st = 0;
  while (true) {
    size_t pos = bytes.find('\n', st);
    if (pos == std::string_view::npos) { pieces.push_back(bytes.substr(st)); break; }
    pieces.push_back(bytes.substr(st, pos - st));
    st = pos + 1;
  }
  return pieces;
}

Text Text::paste(std::string_view bytes) const {
  std::vector<std::string_view> pieces;
  if (cursors_.size() > 1) {
    pieces = split_pieces(bytes);
    if (pieces.size() != cursors_.size()) pieces.clear();
  }

  std::string_view src = content_.view();
  std::string out;
  out.reserve(src.size() + bytes.size() * cursors_.size());
  std::vector<Selection> next;
  next.reserve(cursors_.size());
  size_t last = 0;
  for (size_t i = 0; i < cursors_.size(); ++i) {
    const Selection& c = cursors_[i];
    std::string_view ins = pieces.empty() ? bytes : pieces[i];
    out.append(src.substr(last, c.start - last));
    out.append(ins);
    next.push_back(Selection{out.size(), out.size()});
    last = c.end;
  }
  out.append(src.substr(last));
  return Text(Content(std::move(out)), std::move(next));
}

bool Text::equal(const Text& other) const {
  return cursors_ == other.cursors_ && Content::equal(content_, other.content_);
}
