#pragma once
/*
 * Register
 *
 * Purpose: single-slot clipboard for yank/delete-line.
 * Each write overwrites the previous content; empty until the first write.
 */
#include <optional>
#include <string>

class Register {
public:
  void set(std::string text) { text_ = std::move(text); }
  bool empty() const { return !text_.has_value(); }
  const std::optional<std::string>& content() const { return text_; }
private:
  std::optional<std::string> text_;
};
