#include "irc_message.hpp"
#include <algorithm>
#include <cctype>

std::string IrcMessage::tag(const std::string& key) const {
  auto it = tags.find(key);
  return it == tags.end() ? std::string() : it->second;
}

std::string unescape_tag_value(std::string_view v) {
  std::string out;
  out.reserve(v.size());
  for (size_t i = 0; i < v.size(); ++i) {
    char c = v[i];
    if (c != '\\') { out.push_back(c); continue; }
    if (i + 1 >= v.size()) break; // lone trailing backslash is dropped
    char n = v[++i];
    switch (n) {
      case ':': out.push_back(';'); break;
      case 's': out.push_back(' '); break;
      case '\\': out.push_back('\\'); break;
      case 'r': out.push_back('\r'); break;
      case 'n': out.push_back('\n'); break;
      default: out.push_back(n); break;
    }
  }
  return out;
}

static void parse_tags(std::string_view s, std::unordered_map<std::string, std::string>& out) {
  size_t st = 0;
  while (st <= s.size()) {
    size_t end = s.find(';', st);
    if (end == std::string_view::npos) end = s.size();
    std::string_view kv = s.substr(st, end - st);
    if (!kv.empty()) {
      size_t eq = kv.find('=');
      if (eq == std::string_view::npos) out[std::string(kv)] = std::string();
      else out[std::string(kv.substr(0, eq))] = unescape_tag_value(kv.substr(eq + 1));
    }
    st = end + 1;
  }
}

static IrcPrefix parse_prefix(std::string_view s) {
  IrcPrefix p;
  size_t bang = s.find('!');
  size_t at = s.find('@');
  if (bang == std::string_view::npos) {
    if (at == std::string_view::npos) { p.host = std::string(s); return p; }
    p.nick = std::string(s.substr(0, at));
    p.host = std::string(s.substr(at + 1));
    return p;
  }
  p.nick = std::string(s.substr(0, bang));
  if (at == std::string_view::npos || at < bang) { p.user = std::string(s.substr(bang + 1)); return p; }
  p.user = std::string(s.substr(bang + 1, at - bang - 1));
  p.host = std::string(s.substr(at + 1));
  return p;
}

std::optional<IrcMessage> parse_irc_line(std::string_view line) {
  while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.remove_suffix(1);
  IrcMessage m;
  size_t pos = 0;
  auto skip_spaces = [&]{ while (pos < line.size() && line[pos] == ' ') pos++; };
  auto next_token = [&]() -> std::string_view {
    size_t sp = line.find(' ', pos);
    if (sp == std::string_view::npos) sp = line.size();
    std::string_view t = line.substr(pos, sp - pos);
    pos = sp;
    return t;
  };
  if (pos < line.size() && line[pos] == '@') {
    pos++;
    parse_tags(next_token(), m.tags);
    skip_spaces();
  }
  if (pos < line.size() && line[pos] == ':') {
    pos++;
    std::string_view pre = next_token();
    if (pre.empty()) return std::nullopt;
    m.prefix = parse_prefix(pre);
    skip_spaces();
  }
  std::string_view cmd = next_token();
  if (cmd.empty()) return std::nullopt;
  m.command.assign(cmd.begin(), cmd.end());
  std::transform(m.command.begin(), m.command.end(), m.command.begin(),
                 [](unsigned char c){ return static_cast<char>(std::toupper(c)); });
  while (true) {
    skip_spaces();
    if (pos >= line.size()) break;
    if (line[pos] == ':') {
      m.params.emplace_back(line.substr(pos + 1));
      break;
    }
    m.params.emplace_back(next_token());
  }
  return m;
}

FrameKind classify(const IrcMessage& msg) {
  const std::string& c = msg.command;
  if (c == "PRIVMSG") return FrameKind::Chat;
  if (c == "PING") return FrameKind::Keepalive;
  if (c == "PONG") return FrameKind::Pong;
  if (c == "NOTICE") return FrameKind::Notice;
  if (c == "RECONNECT") return FrameKind::Reconnect;
  if (c == "001") return FrameKind::Welcome;
  if (c == "JOIN") return FrameKind::Join;
  if (c == "ROOMSTATE") return FrameKind::RoomState;
  if (c == "USERSTATE") return FrameKind::UserState;
  if (c == "GLOBALUSERSTATE") return FrameKind::GlobalUserState;
  if (c == "CAP" && msg.param(1) == "ACK") return FrameKind::CapAck;
  return FrameKind::Other;
}

std::string sender_of(const IrcMessage& msg) {
  std::string dn = msg.tag("display-name");
  if (!dn.empty()) return dn;
  if (!msg.prefix.nick.empty()) return msg.prefix.nick;
  std::string chan = msg.param(0);
  if (!chan.empty() && chan[0] == '#') chan.erase(chan.begin());
  return chan;
}

std::string chat_body(const std::string& text) {
  static const std::string kAction = "\x01" "ACTION ";
  if (text.size() >= kAction.size() && text.compare(0, kAction.size(), kAction) == 0) {
    std::string body = text.substr(kAction.size());
    if (!body.empty() && body.back() == '\x01') body.pop_back();
    return "* " + body;
  }
  return text;
}

bool is_auth_failure_notice(const IrcMessage& msg) {
  if (msg.command != "NOTICE") return false;
  const std::string t = msg.trailing();
  return t.find("Login authentication failed") != std::string::npos ||
         t.find("Improperly formatted auth") != std::string::npos;
}

std::string format_cap_req() {
  return "CAP REQ :twitch.tv/membership twitch.tv/tags twitch.tv/commands\r\n";
}

std::string format_pass(const std::string& token) {
  if (token.rfind("oauth:", 0) == 0) return "PASS " + token + "\r\n";
  return "PASS oauth:" + token + "\r\n";
}

std::string format_nick(const std::string& nick) { return "NICK " + nick + "\r\n"; }
std::string format_join(const std::string& channel) { return "JOIN #" + channel + "\r\n"; }

std::string format_privmsg(const std::string& channel, const std::string& text) {
  return "PRIVMSG #" + channel + " :" + text + "\r\n";
}

std::string format_ping() { return "PING :tmi.twitch.tv\r\n"; }
std::string format_pong(const std::string& param) { return "PONG :" + param + "\r\n"; }
