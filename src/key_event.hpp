#pragma once
/*
 * KeyEvent
 *
 * Purpose: abstract key event consumed by the modal editor.
 * decode_key maps ncurses key codes; the editor never sees physical codes.
 */

struct KeyEvent {
  enum class Kind { Char, Escape, Enter, Backspace, Left, Right, Up, Down, Home, End, Interrupt, None };
  Kind kind = Kind::None;
  char ch = 0;

  static KeyEvent character(char c) { return {Kind::Char, c}; }
  static KeyEvent of(Kind k) { return {k, 0}; }
};

KeyEvent decode_key(int ch);
