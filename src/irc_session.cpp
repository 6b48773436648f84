#include "irc_session.hpp"
#include <algorithm>
#include <cctype>
#include <boost/asio/post.hpp>
#include "log.hpp"

namespace asio = boost::asio;
using boost::system::error_code;

static std::string to_lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

IrcSession::IrcSession(asio::io_context& io, TransportFactory factory, SessionOptions opts)
  : io_(io),
    factory_(std::move(factory)),
    opts_(std::move(opts)),
    backoff_(opts_.backoff_min, opts_.backoff_max),
    reconnect_timer_(io),
    send_timer_(io),
    handshake_timer_(io),
    liveness_timer_(io) {}

ChatError IrcSession::validate_message(const std::string& text) {
  if (text.empty() || text.size() > VICHAT_MAX_MESSAGE_BYTES) return ChatError::InvalidMessage;
  if (text.find_first_of("\r\n") != std::string::npos) return ChatError::InvalidMessage;
  return ChatError::None;
}

ChatError IrcSession::connect(const std::string& token, const std::string& channel) {
  if (token.empty() || channel.empty()) return ChatError::InvalidMessage;
  SessionState s = state();
  if (s == SessionState::Joined) return ChatError::AlreadyConnected;
  if (s == SessionState::AuthFailed) return ChatError::AuthRejected;
  bool expected = false;
  if (credentials_set_.compare_exchange_strong(expected, true)) {
    token_ = token;
    channel_ = to_lower(channel[0] == '#' ? channel.substr(1) : channel);
  }
  asio::post(io_, [this]{
    closed_ = false;
    do_connect();
  });
  return ChatError::None;
}

ChatError IrcSession::send_message(const std::string& text) {
  ChatError e = validate_message(text);
  if (e != ChatError::None) return e;
  if (state() != SessionState::Joined) return ChatError::NotJoined;
  int64_t now = clock::now().time_since_epoch().count();
  int64_t last = last_send_ns_.load();
  auto interval = std::chrono::duration_cast<clock::duration>(opts_.min_send_interval).count();
  bool delayed = pending_.fetch_add(1) > 0 || (last != 0 && now - last < interval);
  asio::post(io_, [this, text]{ enqueue(text); });
  return delayed ? ChatError::RateLimited : ChatError::None;
}

void IrcSession::close() {
  asio::post(io_, [this]{
    closed_ = true;
    reconnect_pending_ = false;
    reconnect_timer_.cancel();
    teardown();
    if (state() != SessionState::AuthFailed) set_state(SessionState::Disconnected);
    log_info("session closed");
  });
}

void IrcSession::do_connect() {
  if (closed_ || state() != SessionState::Disconnected) return;
  reconnect_pending_ = false;
  reconnect_timer_.cancel();
  uint64_t id = ++conn_id_;
  transport_ = factory_(io_);
  set_state(SessionState::Connecting);
  arm_handshake_timer();
  log_info("connecting to {}:{} for #{}", opts_.host, opts_.port, channel_);
  transport_->async_connect(opts_.host, opts_.port, [this, id](const error_code& ec){ on_connected(id, ec); });
}

void IrcSession::on_connected(uint64_t id, const error_code& ec) {
  if (id != conn_id_) return;
  if (ec) { on_transport_failure("connect: " + ec.message()); return; }
  set_state(SessionState::Authenticating);
  last_activity_ = clock::now();
  write_raw(format_cap_req());
  write_raw(format_pass(token_));
  write_raw(format_nick(opts_.nick));
  start_read(id);
}

void IrcSession::start_read(uint64_t id) {
  transport_->async_read_line([this, id](const error_code& ec, std::string line){
    if (id != conn_id_) return;
    if (ec) { on_transport_failure("read: " + ec.message()); return; }
    handle_line(line);
    if (id == conn_id_ && transport_) start_read(id);
  });
}

void IrcSession::handle_line(const std::string& line) {
  last_activity_ = clock::now();
  probing_ = false;
  auto parsed = parse_irc_line(line);
  if (!parsed) { log_debug("ignored line: {}", line); return; }
  const IrcMessage& m = *parsed;
  switch (classify(m)) {
    case FrameKind::Keepalive:
      write_raw(format_pong(m.trailing().empty() ? std::string("tmi.twitch.tv") : m.trailing()));
      break;
    case FrameKind::Pong:
      break;
    case FrameKind::CapAck:
      log_debug("capabilities acknowledged: {}", m.trailing());
      break;
    case FrameKind::Welcome:
      on_welcome();
      break;
    case FrameKind::Join:
      if (state() == SessionState::Joining && to_lower(m.prefix.nick) == to_lower(opts_.nick)) on_joined();
      break;
    case FrameKind::RoomState:
      if (state() == SessionState::Joining) on_joined();
      break;
    case FrameKind::GlobalUserState:
    case FrameKind::UserState:
      if (!m.tag("display-name").empty()) self_name_ = m.tag("display-name");
      if (!m.tag("color").empty()) self_color_ = m.tag("color");
      break;
    case FrameKind::Notice:
      if (state() != SessionState::Joined && is_auth_failure_notice(m)) { on_auth_rejected(m.trailing()); break; }
      log_info("notice: {}", m.trailing());
      { SessionEvent ev; ev.kind = SessionEvent::Kind::Notice; ev.text = m.trailing(); emit(std::move(ev)); }
      break;
    case FrameKind::Reconnect:
      on_reconnect_request();
      break;
    case FrameKind::Chat:
      on_chat(m);
      break;
    case FrameKind::Other:
      log_debug("unhandled {}", m.command);
      break;
  }
}

void IrcSession::on_welcome() {
  if (state() != SessionState::Authenticating) return;
  set_state(SessionState::Joining);
  arm_handshake_timer();
  write_raw(format_join(channel_));
}

void IrcSession::on_joined() {
  handshake_timer_.cancel();
  backoff_.reset();
  set_state(SessionState::Joined);
  arm_liveness_timer();
  drain_outbound();
}

void IrcSession::on_chat(const IrcMessage& m) {
  if (to_lower(m.param(0)) != "#" + channel_) return;
  ChatMessage msg;
  msg.sender = sender_of(m);
  msg.body = chat_body(m.trailing());
  msg.seq = next_seq_++;
  msg.color = m.tag("color");
  if (on_message_) on_message_(std::move(msg));
}

void IrcSession::on_auth_rejected(const std::string& text) {
  log_error("authentication rejected: {}", text);
  teardown();
  while (!outbound_.empty()) {
    SessionEvent ev; ev.kind = SessionEvent::Kind::SendFailed; ev.text = outbound_.front().text;
    outbound_.pop_front();
    pending_--;
    emit(std::move(ev));
  }
  set_state(SessionState::AuthFailed);
  SessionEvent ev; ev.kind = SessionEvent::Kind::AuthRejected; ev.text = text;
  emit(std::move(ev));
}

void IrcSession::on_transport_failure(const std::string& reason) {
  if (closed_ || state() == SessionState::AuthFailed) return;
  log_warn("transport failure in state {}: {}", to_string(state()), reason);
  { SessionEvent ev; ev.kind = SessionEvent::Kind::TransportError; ev.text = reason; emit(std::move(ev)); }
  teardown();
  for (auto it = outbound_.begin(); it != outbound_.end();) {
    if (++it->retries <= opts_.max_send_retries) { ++it; continue; }
    log_warn("dropping message after {} reconnects: {}", opts_.max_send_retries, it->text);
    SessionEvent ev; ev.kind = SessionEvent::Kind::SendFailed; ev.text = it->text;
    it = outbound_.erase(it);
    pending_--;
    emit(std::move(ev));
  }
  set_state(SessionState::Disconnected);
  schedule_reconnect();
}

void IrcSession::on_reconnect_request() {
  log_info("server requested reconnect");
  { SessionEvent ev; ev.kind = SessionEvent::Kind::ReconnectRequested; emit(std::move(ev)); }
  teardown();
  set_state(SessionState::Disconnected);
  do_connect();
}

void IrcSession::teardown() {
  handshake_timer_.cancel();
  liveness_timer_.cancel();
  send_timer_.cancel();
  send_timer_armed_ = false;
  writing_ = false;
  probing_ = false;
  ++conn_id_;
  if (transport_) {
    transport_->close();
    transport_.reset();
  }
}

void IrcSession::schedule_reconnect() {
  auto delay = backoff_.next();
  reconnect_pending_ = true;
  log_info("reconnect attempt {} in {} ms", backoff_.attempts(), delay.count());
  SessionEvent ev;
  ev.kind = SessionEvent::Kind::ReconnectScheduled;
  ev.attempt = backoff_.attempts();
  ev.delay = delay;
  emit(std::move(ev));
  reconnect_timer_.expires_after(delay);
  reconnect_timer_.async_wait([this](const error_code& ec){
    if (ec || !reconnect_pending_) return;
    do_connect();
  });
}

void IrcSession::write_raw(std::string data) {
  if (!transport_) return;
  uint64_t id = conn_id_;
  transport_->async_write(std::move(data), [this, id](const error_code& ec){
    if (id != conn_id_ || !ec) return;
    on_transport_failure("write: " + ec.message());
  });
}

void IrcSession::enqueue(std::string text) {
  outbound_.push_back({std::move(text), 0});
  drain_outbound();
}

void IrcSession::drain_outbound() {
  if (state() != SessionState::Joined || writing_ || outbound_.empty() || !transport_) return;
  auto now = clock::now();
  if (has_sent_) {
    auto ready = last_send_tp_ + opts_.min_send_interval;
    if (now < ready) {
      if (!send_timer_armed_) {
        send_timer_armed_ = true;
        send_timer_.expires_at(ready);
        send_timer_.async_wait([this](const error_code& ec){
          if (ec) return;
          send_timer_armed_ = false;
          drain_outbound();
        });
      }
      return;
    }
  }
  writing_ = true;
  has_sent_ = true;
  last_send_tp_ = now;
  last_send_ns_.store(now.time_since_epoch().count());
  uint64_t id = conn_id_;
  transport_->async_write(format_privmsg(channel_, outbound_.front().text),
                          [this, id](const error_code& ec){ on_chat_written(id, ec); });
}

void IrcSession::on_chat_written(uint64_t id, const error_code& ec) {
  if (id != conn_id_) return;
  writing_ = false;
  if (ec) { on_transport_failure("write: " + ec.message()); return; }
  Outbound done = std::move(outbound_.front());
  outbound_.pop_front();
  pending_--;
  ChatMessage echo;
  echo.sender = self_name_.empty() ? opts_.nick : self_name_;
  echo.body = chat_body(done.text);
  echo.seq = next_seq_++;
  echo.color = self_color_;
  echo.self = true;
  if (on_message_) on_message_(std::move(echo));
  drain_outbound();
}

void IrcSession::arm_handshake_timer() {
  uint64_t id = conn_id_;
  handshake_timer_.expires_after(opts_.handshake_timeout);
  handshake_timer_.async_wait([this, id](const error_code& ec){
    if (ec || id != conn_id_) return;
    SessionState s = state();
    if (s == SessionState::Connecting || s == SessionState::Authenticating || s == SessionState::Joining)
      on_transport_failure(std::string("handshake timed out while ") + to_string(s));
  });
}

void IrcSession::arm_liveness_timer() {
  uint64_t id = conn_id_;
  liveness_timer_.expires_at(probing_ ? probe_deadline_ : last_activity_ + opts_.liveness_timeout);
  liveness_timer_.async_wait([this, id](const error_code& ec){
    if (ec || id != conn_id_) return;
    on_liveness_timer();
  });
}

void IrcSession::on_liveness_timer() {
  if (state() != SessionState::Joined) return;
  auto now = clock::now();
  if (probing_) {
    if (now >= probe_deadline_) { on_transport_failure("keepalive probe timed out"); return; }
  } else if (now - last_activity_ >= opts_.liveness_timeout) {
    probing_ = true;
    probe_deadline_ = now + opts_.probe_grace;
    log_debug("no traffic for {} ms, probing", opts_.liveness_timeout.count());
    write_raw(format_ping());
  }
  arm_liveness_timer();
}

void IrcSession::set_state(SessionState s) {
  if (state_.exchange(s) == s) return;
  log_info("session state: {}", to_string(s));
  SessionEvent ev;
  ev.kind = SessionEvent::Kind::StateChanged;
  ev.state = s;
  emit(std::move(ev));
}

void IrcSession::emit(SessionEvent ev) {
  if (on_event_) on_event_(ev);
}
