#pragma once
/*
 * IrcSession
 *
 * Purpose: one authenticated, joined connection to a Twitch chat channel.
 * States: Disconnected -> Connecting -> Authenticating -> Joining -> Joined,
 *         back to Disconnected on any transport failure (then reconnect with
 *         backoff), AuthFailed is terminal.
 * Threading: all internal state lives on the io_context thread. connect(),
 *            send_message() and close() may be called from any thread; they
 *            hand work over with asio::post. state() and pending_count() are atomic.
 * Lifetime: must outlive every handler queued on the io_context.
 */
#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include "backoff.hpp"
#include "chat_error.hpp"
#include "chat_message.hpp"
#include "config.hpp"
#include "irc_message.hpp"
#include "transport.hpp"
#include "types.hpp"

struct SessionOptions {
  std::string host = VICHAT_DEFAULT_HOST;
  std::string port = VICHAT_DEFAULT_PORT;
  std::string nick;
  std::chrono::milliseconds min_send_interval{VICHAT_SEND_INTERVAL_MS};
  std::chrono::milliseconds backoff_min{VICHAT_BACKOFF_MIN_MS};
  std::chrono::milliseconds backoff_max{VICHAT_BACKOFF_MAX_MS};
  std::chrono::milliseconds liveness_timeout{std::chrono::seconds(VICHAT_LIVENESS_TIMEOUT_S)};
  std::chrono::milliseconds probe_grace{std::chrono::seconds(VICHAT_PROBE_GRACE_S)};
  std::chrono::milliseconds handshake_timeout{std::chrono::seconds(VICHAT_HANDSHAKE_TIMEOUT_S)};
  int max_send_retries = VICHAT_MAX_SEND_RETRIES;
};

struct SessionEvent {
  enum class Kind { StateChanged, ReconnectScheduled, ReconnectRequested, Notice, SendFailed, AuthRejected, TransportError };
  Kind kind = Kind::StateChanged;
  SessionState state = SessionState::Disconnected;
  int attempt = 0;
  std::chrono::milliseconds delay{0};
  std::string text;
};

class IrcSession {
public:
  using MessageHandler = std::function<void(ChatMessage)>;
  using EventHandler = std::function<void(const SessionEvent&)>;

  IrcSession(boost::asio::io_context& io, TransportFactory factory, SessionOptions opts);
  IrcSession(const IrcSession&) = delete;
  IrcSession& operator=(const IrcSession&) = delete;

  // handlers run on the io thread; install before connect()
  void set_message_handler(MessageHandler h) { on_message_ = std::move(h); }
  void set_event_handler(EventHandler h) { on_event_ = std::move(h); }

  ChatError connect(const std::string& token, const std::string& channel);
  ChatError send_message(const std::string& text);
  void close();

  SessionState state() const { return state_.load(); }
  size_t pending_count() const { return pending_.load(); }
  const std::string& channel() const { return channel_; }

  static ChatError validate_message(const std::string& text);

private:
  using clock = std::chrono::steady_clock;
  struct Outbound {
    std::string text;
    int retries = 0;
  };

  void do_connect();
  void on_connected(uint64_t id, const boost::system::error_code& ec);
  void start_read(uint64_t id);
  void handle_line(const std::string& line);
  void on_welcome();
  void on_joined();
  void on_chat(const IrcMessage& m);
  void on_auth_rejected(const std::string& text);
  void on_transport_failure(const std::string& reason);
  void on_reconnect_request();
  void teardown();
  void schedule_reconnect();
  void write_raw(std::string data);
  void enqueue(std::string text);
  void drain_outbound();
  void on_chat_written(uint64_t id, const boost::system::error_code& ec);
  void arm_handshake_timer();
  void arm_liveness_timer();
  void on_liveness_timer();
  void set_state(SessionState s);
  void emit(SessionEvent ev);

  boost::asio::io_context& io_;
  TransportFactory factory_;
  SessionOptions opts_;
  MessageHandler on_message_;
  EventHandler on_event_;

  std::atomic<SessionState> state_{SessionState::Disconnected};
  std::atomic<size_t> pending_{0};
  std::atomic<int64_t> last_send_ns_{0};
  std::atomic<bool> credentials_set_{false};
  std::string token_;
  std::string channel_;

  // io thread only
  std::shared_ptr<ITransport> transport_;
  uint64_t conn_id_ = 0;
  bool closed_ = false;
  bool writing_ = false;
  bool probing_ = false;
  bool send_timer_armed_ = false;
  bool reconnect_pending_ = false;
  bool has_sent_ = false;
  clock::time_point last_send_tp_{};
  clock::time_point last_activity_{};
  clock::time_point probe_deadline_{};
  std::deque<Outbound> outbound_;
  Backoff backoff_;
  uint64_t next_seq_ = 0;
  std::string self_name_;
  std::string self_color_;

  boost::asio::steady_timer reconnect_timer_;
  boost::asio::steady_timer send_timer_;
  boost::asio::steady_timer handshake_timer_;
  boost::asio::steady_timer liveness_timer_;
};
