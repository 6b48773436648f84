#pragma once
/*
 * ITerminal
 *
 * Purpose: abstract terminal backend (size, clear, draw, cursor, refresh).
 * Goal: decouple from concrete impls (ncurses/headless), enable testing.
 */
#include <string>
#include "types.hpp"

struct TermSize { int rows; int cols; };

// color pairs shared by all backends; Sender* pairs follow the 8 basic colors
enum ColorPair { PairDefault = 1, PairStatus = 2, PairSelf = 3, PairSenderFirst = 4, PairSenderCount = 6 };

class ITerminal {
public:
  virtual ~ITerminal() = default;
  virtual TermSize getSize() const = 0;
  virtual void clear() = 0;
  virtual void draw_text(int row, int col, const std::string& text) = 0;
  virtual void draw_colored(int row, int col, const std::string& text, int color_pair_id) = 0;
  virtual void move_cursor(int row, int col) = 0;
  virtual void set_cursor_shape(Mode mode) = 0;
  virtual void refresh() = 0;
  virtual void clear_to_eol(int row, int col) = 0;
};
