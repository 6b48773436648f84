#pragma once
/*
 * TextBuffer
 *
 * Purpose: single-line composer buffer with a byte cursor in [0, size].
 * Constraint: one byte per column; only printable ASCII (0x20..0x7e) is accepted,
 *             everything else is rejected as a no-op.
 * Note: up/down are inert until the composer grows multi-line support.
 */
#include <string>
#include <string_view>
#include "yank_register.hpp"

class TextBuffer {
public:
  static bool is_supported(char c);

  bool insert_char(char c);
  int insert_text(std::string_view s);
  bool backspace();

  void move_left();
  void move_right();
  void move_up();
  void move_down();
  void move_line_start();
  void move_line_end();

  void yank_line(Register& reg) const;
  void delete_line(Register& reg);
  std::string take_and_clear();

  const std::string& text() const { return text_; }
  int cursor() const { return cursor_; }
  int size() const { return static_cast<int>(text_.size()); }
  bool empty() const { return text_.empty(); }

private:
  std::string text_;
  int cursor_ = 0;
};
