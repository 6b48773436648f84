#include "text_buffer.hpp"
#include <cassert>
#include <random>
#include <string>

static void test_insert_and_cursor() {
  TextBuffer b;
  assert(b.empty() && b.cursor() == 0);
  assert(b.insert_char('h'));
  assert(b.insert_char('i'));
  assert(b.text() == "hi" && b.cursor() == 2);
  b.move_left();
  assert(b.insert_char('!'));
  assert(b.text() == "h!i" && b.cursor() == 2);
}

static void test_rejects_unsupported() {
  TextBuffer b;
  b.insert_char('a');
  assert(!b.insert_char('\t'));
  assert(!b.insert_char('\n'));
  assert(!b.insert_char(static_cast<char>(0x7f)));
  assert(!b.insert_char(static_cast<char>(0xc3)));
  assert(b.text() == "a" && b.cursor() == 1);
  assert(b.insert_text("b\xc3\xa9" "c") == 2);
  assert(b.text() == "abc");
}

static void test_clamped_moves() {
  TextBuffer b;
  b.move_left();
  b.move_right();
  assert(b.cursor() == 0);
  b.insert_text("abc");
  b.move_right();
  assert(b.cursor() == 3);
  b.move_line_start();
  assert(b.cursor() == 0);
  b.move_left();
  assert(b.cursor() == 0);
  b.move_up();
  b.move_down();
  assert(b.cursor() == 0 && b.text() == "abc");
  b.move_line_end();
  assert(b.cursor() == 3);
}

static void test_backspace() {
  TextBuffer b;
  assert(!b.backspace());
  b.insert_text("abc");
  b.move_left();
  assert(b.backspace());
  assert(b.text() == "ac" && b.cursor() == 1);
  b.move_line_start();
  assert(!b.backspace());
  assert(b.text() == "ac");
}

static void test_register_ops() {
  TextBuffer b;
  Register reg;
  assert(reg.empty());
  b.insert_text("hello");
  b.yank_line(reg);
  assert(reg.content() && *reg.content() == "hello");
  assert(b.text() == "hello" && b.cursor() == 5);
  b.move_left();
  b.insert_char('X');
  b.delete_line(reg);
  assert(*reg.content() == "hellXo");
  assert(b.empty() && b.cursor() == 0);
  b.yank_line(reg);
  assert(reg.content() && reg.content()->empty());
}

static void test_take_and_clear() {
  TextBuffer b;
  b.insert_text("bye");
  b.move_left();
  assert(b.take_and_clear() == "bye");
  assert(b.empty() && b.cursor() == 0);
}

// navigation never leaves [0, len] and never edits
static void test_random_navigation() {
  std::mt19937 rng(12345);
  TextBuffer b;
  b.insert_text("some chat line");
  const std::string before = b.text();
  for (int i = 0; i < 5000; ++i) {
    switch (rng() % 6) {
      case 0: b.move_left(); break;
      case 1: b.move_right(); break;
      case 2: b.move_up(); break;
      case 3: b.move_down(); break;
      case 4: b.move_line_start(); break;
      default: b.move_line_end(); break;
    }
    assert(b.cursor() >= 0 && b.cursor() <= b.size());
    assert(b.text() == before);
  }
}

int main() {
  test_insert_and_cursor();
  test_rejects_unsupported();
  test_clamped_moves();
  test_backspace();
  test_register_ops();
  test_take_and_clear();
  test_random_navigation();
  return 0;
}
