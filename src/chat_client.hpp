#pragma once
/*
 * ChatClient
 *
 * Purpose: wires key events into the modal editor, submits to IrcSession and
 *          feeds inbound messages into ChatHistory.
 * Threading: handle_key and the render accessors run on the input thread; the
 *            session runs on an internal network thread (io_context).
 */
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include "chat_history.hpp"
#include "irc_session.hpp"
#include "modal_editor.hpp"

struct ClientOptions {
  SessionOptions session;
  size_t history_cap = VICHAT_HISTORY_CAP;
  std::string token;
  std::string channel;
};

class ChatClient {
public:
  // when factory is empty, plain TCP (AsioTransport) is used
  explicit ChatClient(ClientOptions opts, TransportFactory factory = {});
  ~ChatClient();
  ChatClient(const ChatClient&) = delete;
  ChatClient& operator=(const ChatClient&) = delete;

  ChatError start();
  void stop();

  EditOutcome handle_key(const KeyEvent& ev);

  std::vector<ChatMessage> history_snapshot() const { return history_.snapshot(); }
  uint64_t history_version() const { return history_.version(); }
  bool history_if_newer(uint64_t& seen, std::vector<ChatMessage>& out) const { return history_.snapshot_if_newer(seen, out); }
  const std::string& composer_text() const { return editor_.buffer().text(); }
  int composer_cursor() const { return editor_.buffer().cursor(); }
  Mode mode() const { return editor_.mode(); }
  const ModalEditor& editor() const { return editor_; }
  SessionState connection_state() const { return session_.state(); }
  std::string status() const;
  std::string channel() const;
  size_t held_count() const;

private:
  void submit(const std::string& text);
  void on_session_event(const SessionEvent& ev);
  void flush_held();
  void drop_held();
  void set_status(std::string s);

  ClientOptions opts_;
  boost::asio::io_context io_;
  std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_;
  std::thread net_thread_;
  ChatHistory history_;
  IrcSession session_;
  ModalEditor editor_;

  mutable std::mutex mu_;
  std::deque<std::string> held_;
  std::string status_;
};
