#include "text_buffer.hpp"

bool TextBuffer::is_supported(char c) {
  unsigned char u = static_cast<unsigned char>(c);
  return u >= 0x20 && u <= 0x7e;
}

bool TextBuffer::insert_char(char c) {
  if (!is_supported(c)) return false;
  text_.insert(text_.begin() + cursor_, c);
  cursor_++;
  return true;
}

int TextBuffer::insert_text(std::string_view s) {
  int n = 0;
  for (char c : s) if (insert_char(c)) n++;
  return n;
}

bool TextBuffer::backspace() {
  if (cursor_ <= 0) return false;
  text_.erase(text_.begin() + cursor_ - 1);
  cursor_--;
  return true;
}

void TextBuffer::move_left() { if (cursor_ > 0) cursor_--; }
void TextBuffer::move_right() { if (cursor_ < size()) cursor_++; }
void TextBuffer::move_up() {}
void TextBuffer::move_down() {}
void TextBuffer::move_line_start() { cursor_ = 0; }
void TextBuffer::move_line_end() { cursor_ = size(); }

void TextBuffer::yank_line(Register& reg) const { reg.set(text_); }

void TextBuffer::delete_line(Register& reg) {
  reg.set(text_);
  text_.clear();
  cursor_ = 0;
}

std::string TextBuffer::take_and_clear() {
  std::string out;
  out.swap(text_);
  cursor_ = 0;
  return out;
}
