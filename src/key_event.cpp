#include "key_event.hpp"
#include <ncurses.h>

static constexpr int CTRL_c = 'C' - 64;
static constexpr int CTRL_q = 'Q' - 64;
static constexpr int ESC = 27;
static constexpr int DEL = 127;

KeyEvent decode_key(int ch) {
  switch (ch) {
    case ERR: return KeyEvent::of(KeyEvent::Kind::None);
    case ESC: return KeyEvent::of(KeyEvent::Kind::Escape);
    case '\n': case '\r': case KEY_ENTER: return KeyEvent::of(KeyEvent::Kind::Enter);
    case KEY_BACKSPACE: case DEL: case '\b': return KeyEvent::of(KeyEvent::Kind::Backspace);
    case KEY_LEFT: return KeyEvent::of(KeyEvent::Kind::Left);
    case KEY_RIGHT: return KeyEvent::of(KeyEvent::Kind::Right);
    case KEY_UP: return KeyEvent::of(KeyEvent::Kind::Up);
    case KEY_DOWN: return KeyEvent::of(KeyEvent::Kind::Down);
    case KEY_HOME: return KeyEvent::of(KeyEvent::Kind::Home);
    case KEY_END: return KeyEvent::of(KeyEvent::Kind::End);
    case CTRL_c: case CTRL_q: return KeyEvent::of(KeyEvent::Kind::Interrupt);
    default: break;
  }
  if (ch >= 0 && ch <= 0xff) return KeyEvent::character(static_cast<char>(ch));
  return KeyEvent::of(KeyEvent::Kind::None);
}
