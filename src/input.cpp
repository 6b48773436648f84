#include "input.hpp"

Input::Chord Input::consume(int ch) {
  switch (pending_) {
    case PendingPrefix::None:
      if (ch == 'y') { pending_ = PendingPrefix::Y; return Chord::Pending; }
      if (ch == 'd') { pending_ = PendingPrefix::D; return Chord::Pending; }
      return Chord::None;
    case PendingPrefix::Y:
      pending_ = PendingPrefix::None;
      return ch == 'y' ? Chord::Yy : Chord::Cancelled;
    case PendingPrefix::D:
      pending_ = PendingPrefix::None;
      return ch == 'd' ? Chord::Dd : Chord::Cancelled;
  }
  return Chord::None;
}
