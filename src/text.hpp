#pragma once
/*
 * Text
 *
 * Purpose: immutable document snapshot (content bytes + ordered cursor set).
 * Sharing: Content holds its bytes behind shared_ptr<const>, so copies of a
 *          Text alias the same storage and are never mutated after creation.
 * Note: stands in for a rope/piece table; Editor only relies on this API.
 */
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>
#include "types.hpp"

class Content {
public:
  Content();
  explicit Content(std::string bytes);

  size_t size() const { return data_->size(); }
  bool empty() const { return data_->empty(); }
  char at(size_t i) const { return (*data_)[i]; }
  std::string_view view() const { return *data_; }
  std::string slice(size_t start, size_t end) const;

  /*visitor gets (index, byte); return false to stop the walk*/
  using Visitor = std::function<bool(size_t, char)>;
  void for_each(size_t start, const Visitor& fn) const;

  static bool equal(const Content& a, const Content& b);

private:
  std::shared_ptr<const std::string> data_;
};

class Text {
public:
  Text();

  static Text from_string(std::string_view bytes);
  /*takes ownership of bytes, no copy*/
  static Text from_bytes(std::string bytes);

  const Content& content() const { return content_; }
  const std::vector<Selection>& cursors() const { return cursors_; }

  Text with_cursors(std::vector<Selection> cursors) const;
  Text paste(std::string_view bytes) const;

  bool equal(const Text& other) const;

private:
  Text(Content content, std::vector<Selection> cursors);
  static std::vector<Selection> normalize(std::vector<Selection> cursors, size_t size);

  Content content_;
  std::vector<Selection> cursors_;
};
