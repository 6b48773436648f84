#pragma once
/*
 * IrcMessage
 *
 * Purpose: parse/format Twitch IRC lines (IRCv3 tags, prefix, command, params).
 * Note: parse never throws; malformed lines yield nullopt.
 * Docs: https://dev.twitch.tv/docs/chat/irc/
 */
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

struct IrcPrefix {
  std::string nick;
  std::string user;
  std::string host;
};

struct IrcMessage {
  std::unordered_map<std::string, std::string> tags;
  IrcPrefix prefix;
  std::string command;
  std::vector<std::string> params; // trailing param, if any, is the last element

  std::string tag(const std::string& key) const;
  std::string param(size_t i) const { return i < params.size() ? params[i] : std::string(); }
  std::string trailing() const { return params.empty() ? std::string() : params.back(); }
};

enum class FrameKind {
  Chat, Keepalive, Pong, Notice, Reconnect, Welcome, CapAck,
  Join, RoomState, UserState, GlobalUserState, Other
};

std::optional<IrcMessage> parse_irc_line(std::string_view line);
std::string unescape_tag_value(std::string_view v);
FrameKind classify(const IrcMessage& msg);

// display-name tag, else prefix nick, else the channel
std::string sender_of(const IrcMessage& msg);
// strips CTCP ACTION framing: "\x01ACTION waves\x01" -> "* waves"
std::string chat_body(const std::string& text);
bool is_auth_failure_notice(const IrcMessage& msg);

std::string format_cap_req();
std::string format_pass(const std::string& token);
std::string format_nick(const std::string& nick);
std::string format_join(const std::string& channel);
std::string format_privmsg(const std::string& channel, const std::string& text);
std::string format_ping();
std::string format_pong(const std::string& param);
