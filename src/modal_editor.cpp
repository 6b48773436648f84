#include "modal_editor.hpp"
#include "config.hpp"

using Kind = KeyEvent::Kind;

EditOutcome ModalEditor::handle_key(const KeyEvent& ev) {
  if (ev.kind == Kind::Interrupt) {
    input_.reset();
    EditOutcome out; out.action = EditOutcome::Action::Quit; return out;
  }
  if (ev.kind == Kind::None) return {};
  if (mode_ == Mode::Insert) return handle_insert(ev);
  return handle_normal(ev);
}

EditOutcome ModalEditor::handle_normal(const KeyEvent& ev) {
  int ch = ev.kind == Kind::Char ? static_cast<unsigned char>(ev.ch) : -1;
  switch (input_.consume(ch)) {
    case Input::Chord::Pending: return {};
    case Input::Chord::Yy: buf_.yank_line(reg_); return {};
    case Input::Chord::Dd: buf_.delete_line(reg_); return {};
    case Input::Chord::Cancelled:
      // the cancelling key may itself start a new prefix
      if (input_.consume(ch) == Input::Chord::Pending) return {};
      return handle_normal_key(ev);
    case Input::Chord::None: break;
  }
  return handle_normal_key(ev);
}

EditOutcome ModalEditor::handle_normal_key(const KeyEvent& ev) {
  switch (ev.kind) {
    case Kind::Enter: return submit();
    case Kind::Left: buf_.move_left(); return {};
    case Kind::Right: buf_.move_right(); return {};
    case Kind::Up: buf_.move_up(); return {};
    case Kind::Down: buf_.move_down(); return {};
    case Kind::Home: buf_.move_line_start(); return {};
    case Kind::End: buf_.move_line_end(); return {};
    case Kind::Escape: return {};
    case Kind::Char: break;
    default: return reject();
  }
  switch (ev.ch) {
    case 'i': mode_ = Mode::Insert; return {};
    case 'h': buf_.move_left(); return {};
    case 'l': buf_.move_right(); return {};
    case 'j': buf_.move_down(); return {};
    case 'k': buf_.move_up(); return {};
    case '$': buf_.move_line_end(); return {};
    case '^': buf_.move_line_start(); return {};
    case 'P': return paste();
    default: return reject();
  }
}

EditOutcome ModalEditor::handle_insert(const KeyEvent& ev) {
  switch (ev.kind) {
    case Kind::Escape: mode_ = Mode::Normal; return {};
    case Kind::Enter: return submit();
    case Kind::Backspace: buf_.backspace(); return {};
    case Kind::Left: buf_.move_left(); return {};
    case Kind::Right: buf_.move_right(); return {};
    case Kind::Up: buf_.move_up(); return {};
    case Kind::Down: buf_.move_down(); return {};
    case Kind::Home: buf_.move_line_start(); return {};
    case Kind::End: buf_.move_line_end(); return {};
    case Kind::Char:
      if (buf_.size() < VICHAT_MAX_MESSAGE_BYTES && buf_.insert_char(ev.ch)) return {};
      return reject();
    default: return reject();
  }
}

EditOutcome ModalEditor::submit() {
  EditOutcome out;
  if (buf_.empty()) return out;
  out.action = EditOutcome::Action::Submit;
  out.message = buf_.take_and_clear();
  return out;
}

EditOutcome ModalEditor::paste() {
  const auto& content = reg_.content();
  int room = VICHAT_MAX_MESSAGE_BYTES - buf_.size();
  if (!content || room <= 0) return reject();
  // the pasted tail that does not fit is dropped
  buf_.insert_text(std::string_view(*content).substr(0, room));
  return {};
}

EditOutcome ModalEditor::reject() {
  rejected_++;
  EditOutcome out;
  out.status = ChatError::InputRejected;
  return out;
}
