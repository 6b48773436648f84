#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal for automated tests and render verification.
 * Keeps a character grid plus the last cursor position and color per cell.
 */
#include <algorithm>
#include <string>
#include <vector>
#include "iterminal.hpp"

class HeadlessTerminal : public ITerminal {
public:
  HeadlessTerminal(int rows, int cols) : rows_(rows), cols_(cols) { clear(); }

  TermSize getSize() const override { return {rows_, cols_}; }
  void clear() override {
    grid_.assign(rows_, std::string(cols_, ' '));
    colors_.assign(rows_, std::vector<int>(cols_, 0));
  }
  void draw_text(int row, int col, const std::string& text) override { put(row, col, text, PairDefault); }
  void draw_colored(int row, int col, const std::string& text, int color_pair_id) override { put(row, col, text, color_pair_id); }
  void move_cursor(int row, int col) override { cur_row_ = row; cur_col_ = col; }
  void set_cursor_shape(Mode mode) override { shape_ = mode; }
  void refresh() override { refreshes_++; }
  void clear_to_eol(int row, int col) override {
    if (row < 0 || row >= rows_) return;
    for (int c = std::max(0, col); c < cols_; ++c) { grid_[row][c] = ' '; colors_[row][c] = 0; }
  }

  // row text with trailing spaces removed
  std::string row(int r) const {
    std::string s = grid_[r];
    while (!s.empty() && s.back() == ' ') s.pop_back();
    return s;
  }
  int color_at(int r, int c) const { return colors_[r][c]; }
  int cursor_row() const { return cur_row_; }
  int cursor_col() const { return cur_col_; }
  Mode cursor_shape() const { return shape_; }
  int refreshes() const { return refreshes_; }

private:
  void put(int row, int col, const std::string& text, int color) {
    if (row < 0 || row >= rows_) return;
    for (size_t i = 0; i < text.size(); ++i) {
      int c = col + static_cast<int>(i);
      if (c < 0 || c >= cols_) continue;
      grid_[row][c] = text[i];
      colors_[row][c] = color;
    }
  }

  int rows_;
  int cols_;
  std::vector<std::string> grid_;
  std::vector<std::vector<int>> colors_;
  int cur_row_ = 0;
  int cur_col_ = 0;
  Mode shape_ = Mode::Normal;
  int refreshes_ = 0;
};
