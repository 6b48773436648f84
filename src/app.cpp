#include "app.hpp"
#include <ncurses.h>
#include "key_event.hpp"
#include "log.hpp"

App::App(ClientOptions opts, int input_timeout_ms) : client_(std::move(opts)), term_(input_timeout_ms) {}

int App::run() {
  ChatError e = client_.start();
  if (e != ChatError::None) log_error("connect failed: {}", to_string(e));
  while (true) {
    render();
    int ch = getch();
    if (ch == ERR || ch == KEY_RESIZE) continue;
    EditOutcome out = client_.handle_key(decode_key(ch));
    if (out.action == EditOutcome::Action::Quit) break;
  }
  client_.stop();
  return client_.connection_state() == SessionState::AuthFailed ? 2 : 0;
}

void App::render() {
  client_.history_if_newer(msgs_version_, msgs_);
  ChatView view;
  view.messages = &msgs_;
  view.composer = client_.composer_text();
  view.cursor = client_.composer_cursor();
  view.mode = client_.mode();
  view.state = client_.connection_state();
  view.channel = client_.channel();
  view.status = client_.status();
  renderer_.render(term_, view);
}
