#include "ncurses_terminal.hpp"
#include <clocale>
#include <cstdio>

NcursesTerminal::NcursesTerminal(int input_timeout_ms) {
  std::setlocale(LC_ALL, "");
  initscr();
  raw();
  noecho();
  keypad(stdscr, TRUE);
  ESCDELAY = 25;
  timeout(input_timeout_ms);
  init_colors();
  set_cursor_shape(Mode::Normal);
}

NcursesTerminal::~NcursesTerminal() {
  // back to the terminal's default cursor before handing the screen back
  std::fputs("\x1b[0 q", stdout);
  std::fflush(stdout);
  endwin();
}

void NcursesTerminal::init_colors() {
  if (has_colors()) {
    start_color();
    short bg = use_default_colors() == OK ? -1 : COLOR_BLACK;
    init_pair(PairDefault, -1, bg);
    init_pair(PairStatus, COLOR_BLACK, COLOR_CYAN);
    init_pair(PairSelf, COLOR_YELLOW, bg);
    const short sender_colors[PairSenderCount] = {COLOR_RED, COLOR_GREEN, COLOR_BLUE, COLOR_MAGENTA, COLOR_CYAN, COLOR_WHITE};
    for (int i = 0; i < PairSenderCount; ++i) init_pair(static_cast<short>(PairSenderFirst + i), sender_colors[i], bg);
  }
}

TermSize NcursesTerminal::getSize() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { erase(); }

void NcursesTerminal::draw_text(int row, int col, const std::string& text) {
  if (has_colors()) attron(COLOR_PAIR(PairDefault));
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  if (has_colors()) attroff(COLOR_PAIR(PairDefault));
}

void NcursesTerminal::draw_colored(int row, int col, const std::string& text, int color_pair_id) {
  if (has_colors()) attron(COLOR_PAIR(color_pair_id));
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  if (has_colors()) attroff(COLOR_PAIR(color_pair_id));
}

void NcursesTerminal::move_cursor(int row, int col) { move(row, col); }

void NcursesTerminal::set_cursor_shape(Mode mode) {
  if (mode == shape_) return;
  shape_ = mode;
  // DECSCUSR: steady block in Normal, steady bar in Insert
  std::fputs(mode == Mode::Insert ? "\x1b[6 q" : "\x1b[2 q", stdout);
  std::fflush(stdout);
}

void NcursesTerminal::refresh() { ::refresh(); }

void NcursesTerminal::clear_to_eol(int row, int col) {
  move(row, col);
  clrtoeol();
}
