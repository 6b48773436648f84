#pragma once
/*
 * NcursesTerminal
 *
 * Purpose: ITerminal on ncurses; owns curses init/teardown (RAII) and the chat color pairs.
 * Input: getch() returns ERR after input_timeout_ms so inbound chat is drawn without a keystroke.
 */
#include "iterminal.hpp"
#include <ncurses.h>

class NcursesTerminal : public ITerminal {
public:
  explicit NcursesTerminal(int input_timeout_ms);
  ~NcursesTerminal() override;
  NcursesTerminal(const NcursesTerminal&) = delete;
  NcursesTerminal& operator=(const NcursesTerminal&) = delete;

  TermSize getSize() const override;
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_colored(int row, int col, const std::string& text, int color_pair_id) override;
  void move_cursor(int row, int col) override;
  void set_cursor_shape(Mode mode) override;
  void refresh() override;
  void clear_to_eol(int row, int col) override;
private:
  void init_colors();

  Mode shape_ = Mode::Insert; // forces the first set_cursor_shape to emit
};
