#pragma once
/*
 * App
 *
 * Purpose: terminal loop: render → poll key → dispatch to ChatClient.
 * Note: term_ is constructed after client_, so curses is torn down first.
 */
#include "chat_client.hpp"
#include "ncurses_terminal.hpp"
#include "renderer.hpp"
#include <cstdint>
#include <vector>

class App {
public:
  App(ClientOptions opts, int input_timeout_ms);
  int run();
private:
  void render();

  ChatClient client_;
  NcursesTerminal term_;
  Renderer renderer_;
  // last copied history; refreshed only when the history version moves
  std::vector<ChatMessage> msgs_;
  uint64_t msgs_version_ = 0;
};
