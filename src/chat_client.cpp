#include "chat_client.hpp"
#include "asio_transport.hpp"
#include "log.hpp"

ChatClient::ChatClient(ClientOptions opts, TransportFactory factory)
  : opts_(std::move(opts)),
    history_(opts_.history_cap),
    session_(io_, factory ? std::move(factory) : AsioTransport::factory(), opts_.session) {
  session_.set_message_handler([this](ChatMessage m){ history_.append(std::move(m)); });
  session_.set_event_handler([this](const SessionEvent& ev){ on_session_event(ev); });
}

ChatClient::~ChatClient() { stop(); }

ChatError ChatClient::start() {
  if (!net_thread_.joinable()) {
    work_.emplace(boost::asio::make_work_guard(io_));
    io_.restart();
    net_thread_ = std::thread([this]{ io_.run(); });
  }
  ChatError e = session_.connect(opts_.token, opts_.channel);
  if (e != ChatError::None) set_status(to_string(e));
  return e;
}

void ChatClient::stop() {
  if (!net_thread_.joinable()) return;
  session_.close();
  work_.reset();
  net_thread_.join();
}

EditOutcome ChatClient::handle_key(const KeyEvent& ev) {
  EditOutcome out = editor_.handle_key(ev);
  if (out.action == EditOutcome::Action::Submit) submit(out.message);
  return out;
}

void ChatClient::submit(const std::string& text) {
  std::lock_guard<std::mutex> lk(mu_);
  ChatError e;
  if (session_.state() == SessionState::AuthFailed) e = ChatError::AuthRejected;
  // keep order: nothing may overtake messages still waiting for the join
  else e = held_.empty() ? session_.send_message(text) : ChatError::NotJoined;
  switch (e) {
    case ChatError::None:
      break;
    case ChatError::RateLimited:
      status_ = "rate limited, message queued";
      break;
    case ChatError::NotJoined:
      held_.push_back(text);
      status_ = "not joined yet, " + std::to_string(held_.size()) + " message(s) held";
      log_info("holding message until joined");
      break;
    default:
      status_ = std::string("message not sent: ") + to_string(e);
      log_warn("submit failed: {}", to_string(e));
      break;
  }
}

void ChatClient::flush_held() {
  std::lock_guard<std::mutex> lk(mu_);
  while (!held_.empty()) {
    ChatError e = session_.send_message(held_.front());
    if (e == ChatError::NotJoined) return;
    if (e != ChatError::None && e != ChatError::RateLimited)
      log_warn("held message dropped: {}", to_string(e));
    held_.pop_front();
  }
}

// no Joined event follows an auth rejection
void ChatClient::drop_held() {
  std::lock_guard<std::mutex> lk(mu_);
  for (const auto& text : held_) log_warn("failed to send: {}", text);
  held_.clear();
}

void ChatClient::on_session_event(const SessionEvent& ev) {
  using K = SessionEvent::Kind;
  switch (ev.kind) {
    case K::StateChanged:
      if (ev.state == SessionState::Joined) {
        set_status("joined #" + session_.channel());
        flush_held();
      }
      break;
    case K::ReconnectScheduled:
      set_status("reconnecting (attempt " + std::to_string(ev.attempt) + ") in " +
                 std::to_string(ev.delay.count()) + " ms");
      break;
    case K::ReconnectRequested:
      set_status("server requested reconnect");
      break;
    case K::Notice:
      set_status(ev.text);
      break;
    case K::SendFailed:
      set_status("failed to send: " + ev.text);
      break;
    case K::AuthRejected:
      drop_held();
      set_status("authentication rejected: " + ev.text);
      break;
    case K::TransportError:
      set_status(std::string(to_string(ChatError::TransportFailure)) + ": " + ev.text);
      break;
  }
}

void ChatClient::set_status(std::string s) {
  std::lock_guard<std::mutex> lk(mu_);
  status_ = std::move(s);
}

std::string ChatClient::status() const {
  std::lock_guard<std::mutex> lk(mu_);
  return status_;
}

std::string ChatClient::channel() const {
  const std::string& c = session_.channel();
  if (!c.empty()) return c;
  return opts_.channel;
}

size_t ChatClient::held_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return held_.size();
}
