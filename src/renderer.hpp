#pragma once
/*
 * Renderer
 *
 * Purpose: draw chat history, status line and composer; keep the composer cursor visible.
 * Dependency: draws via ITerminal to allow backend replacement.
 * Constraint: only state kept between frames is the composer's horizontal scroll.
 */
#include <string>
#include <vector>
#include "chat_message.hpp"
#include "iterminal.hpp"
#include "types.hpp"

struct ChatView {
  const std::vector<ChatMessage>* messages = nullptr;
  std::string composer;
  int cursor = 0;
  Mode mode = Mode::Normal;
  SessionState state = SessionState::Disconnected;
  std::string channel;
  std::string status;
};

int sender_color_pair(const ChatMessage& m);

class Renderer {
public:
  void render(ITerminal& term, const ChatView& view);
  int composer_left() const { return left_col_; }
private:
  void render_messages(ITerminal& term, const std::vector<ChatMessage>& msgs, int area_rows, int cols);
  void render_status(ITerminal& term, const ChatView& view, int row, int cols);
  void render_composer(ITerminal& term, const ChatView& view, int row, int cols);

  int left_col_ = 0;
};
