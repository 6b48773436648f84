#include "renderer.hpp"
#include <algorithm>
#include <cstdlib>
#include <functional>

// nearest of red/green/blue/magenta/cyan/white for a "#RRGGBB" tag,
// otherwise a stable pick from the sender name
int sender_color_pair(const ChatMessage& m) {
  if (m.self) return PairSelf;
  if (m.color.size() == 7 && m.color[0] == '#') {
    char* end = nullptr;
    long rgb = std::strtol(m.color.c_str() + 1, &end, 16);
    if (end && *end == '\0') {
      int r = (rgb >> 16) & 0xff, g = (rgb >> 8) & 0xff, b = rgb & 0xff;
      bool R = r >= 128, G = g >= 128, B = b >= 128;
      int idx;
      if (R && G && B) idx = 5;
      else if (G && B) idx = 4;
      else if (R && B) idx = 3;
      else if (R && G) idx = 0;
      else if (B) idx = 2;
      else if (G) idx = 1;
      else if (R) idx = 0;
      else idx = 2;
      return PairSenderFirst + idx;
    }
  }
  size_t h = std::hash<std::string>{}(m.sender);
  return PairSenderFirst + static_cast<int>(h % PairSenderCount);
}

void Renderer::render(ITerminal& term, const ChatView& view) {
  TermSize sz = term.getSize();
  int rows = sz.rows, cols = sz.cols;
  term.clear();
  if (rows <= 0 || cols <= 0) { term.refresh(); return; }
  int composer_row = rows - 1;
  if (rows >= 2) {
    int status_row = rows - 2;
    if (view.messages) render_messages(term, *view.messages, status_row, cols);
    render_status(term, view, status_row, cols);
  }
  render_composer(term, view, composer_row, cols);
  term.set_cursor_shape(view.mode);
  term.move_cursor(composer_row, std::max(0, view.cursor - left_col_));
  term.refresh();
}

void Renderer::render_messages(ITerminal& term, const std::vector<ChatMessage>& msgs, int area_rows, int cols) {
  if (area_rows <= 0) return;
  struct Line { const ChatMessage* msg; std::string text; bool first; };
  std::vector<Line> lines;
  // walk newest → oldest until the area is full, wrapping long messages
  for (auto it = msgs.rbegin(); it != msgs.rend() && (int)lines.size() < area_rows; ++it) {
    std::string full = it->sender + ": " + it->body;
    std::vector<Line> wrapped;
    for (size_t st = 0; st < full.size(); st += cols) wrapped.push_back({&*it, full.substr(st, cols), st == 0});
    for (auto w = wrapped.rbegin(); w != wrapped.rend() && (int)lines.size() < area_rows; ++w) lines.push_back(*w);
  }
  int row = area_rows - static_cast<int>(lines.size());
  for (auto l = lines.rbegin(); l != lines.rend(); ++l, ++row) {
    if (l->first) {
      size_t name_len = std::min(l->text.size(), l->msg->sender.size());
      term.draw_colored(row, 0, l->text.substr(0, name_len), sender_color_pair(*l->msg));
      term.draw_text(row, static_cast<int>(name_len), l->text.substr(name_len));
    } else {
      term.draw_text(row, 0, l->text);
    }
    term.clear_to_eol(row, static_cast<int>(l->text.size()));
  }
}

void Renderer::render_status(ITerminal& term, const ChatView& view, int row, int cols) {
  std::string s = std::string(" -- ") + to_string(view.mode) + " -- ";
  if (!view.channel.empty()) s += " #" + view.channel;
  s += " [" + std::string(to_string(view.state)) + "]";
  if (!view.status.empty()) s += "  " + view.status;
  if ((int)s.size() < cols) s.append(cols - s.size(), ' ');
  else s.resize(cols);
  term.draw_colored(row, 0, s, PairStatus);
}

void Renderer::render_composer(ITerminal& term, const ChatView& view, int row, int cols) {
  int len = static_cast<int>(view.composer.size());
  int cur = std::clamp(view.cursor, 0, len);
  if (cur < left_col_) left_col_ = cur;
  else if (cur >= left_col_ + cols) left_col_ = cur - cols + 1;
  left_col_ = std::clamp(left_col_, 0, std::max(0, len));
  std::string vis = view.composer.substr(std::min(left_col_, len), cols);
  term.draw_text(row, 0, vis);
  term.clear_to_eol(row, static_cast<int>(vis.size()));
}
