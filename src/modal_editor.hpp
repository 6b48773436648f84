#pragma once
/*
 * ModalEditor
 *
 * Purpose: Normal/Insert state machine over the composer buffer and register.
 * Output: every key yields an EditOutcome; Submit carries the outbound text.
 * Hidden state: Mode and the yy/dd pending prefix, nothing else.
 * Limit: the composer holds at most VICHAT_MAX_MESSAGE_BYTES; keys past it are rejected.
 */
#include <cstddef>
#include <string>
#include "chat_error.hpp"
#include "input.hpp"
#include "key_event.hpp"
#include "text_buffer.hpp"
#include "types.hpp"
#include "yank_register.hpp"

struct EditOutcome {
  enum class Action { None, Submit, Quit };
  Action action = Action::None;
  std::string message;
  ChatError status = ChatError::None;
};

class ModalEditor {
public:
  EditOutcome handle_key(const KeyEvent& ev);

  Mode mode() const { return mode_; }
  PendingPrefix pending_prefix() const { return input_.pending(); }
  const TextBuffer& buffer() const { return buf_; }
  const Register& reg() const { return reg_; }
  size_t rejected_count() const { return rejected_; }

private:
  EditOutcome handle_normal(const KeyEvent& ev);
  EditOutcome handle_normal_key(const KeyEvent& ev);
  EditOutcome handle_insert(const KeyEvent& ev);
  EditOutcome submit();
  EditOutcome paste();
  EditOutcome reject();

  TextBuffer buf_;
  Register reg_;
  Input input_;
  Mode mode_ = Mode::Normal;
  size_t rejected_ = 0;
};
