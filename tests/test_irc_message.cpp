#include "irc_message.hpp"
#include <cassert>
#include <string>

static const char* kPrivmsg =
  "@badge-info=;badges=broadcaster/1;client-nonce=28e05b1c83f1e916ca1710c44b014515;color=#0000FF;"
  "display-name=foofoo;emotes=62835:0-10;first-msg=0;flags=;id=f80a19d6-e35a-4273-82d0-cd87f614e767;"
  "mod=0;room-id=713936733;subscriber=0;tmi-sent-ts=1642696567751;turbo=0;user-id=713936733;user-type= "
  ":foofoo!foofoo@foofoo.tmi.twitch.tv PRIVMSG #bar :bleedPurple";

static const char* kUserState =
  "@badge-info=;badges=moderator/1;color=;display-name=bar;emote-sets=0,300374282;mod=1;"
  "subscriber=0;user-type=mod :tmi.twitch.tv USERSTATE #foo";

static void test_parse_privmsg() {
  auto m = parse_irc_line(kPrivmsg);
  assert(m);
  assert(m->command == "PRIVMSG");
  assert(classify(*m) == FrameKind::Chat);
  assert(m->tag("display-name") == "foofoo");
  assert(m->tag("color") == "#0000FF");
  assert(m->tag("user-type").empty());
  assert(m->tag("missing").empty());
  assert(m->prefix.nick == "foofoo" && m->prefix.user == "foofoo");
  assert(m->prefix.host == "foofoo.tmi.twitch.tv");
  assert(m->params.size() == 2);
  assert(m->param(0) == "#bar");
  assert(m->trailing() == "bleedPurple");
  assert(sender_of(*m) == "foofoo");
}

static void test_parse_userstate() {
  auto m = parse_irc_line(kUserState);
  assert(m);
  assert(classify(*m) == FrameKind::UserState);
  assert(m->tag("mod") == "1");
  assert(m->tag("emote-sets") == "0,300374282");
  assert(m->prefix.host == "tmi.twitch.tv" && m->prefix.nick.empty());
  assert(m->param(0) == "#foo");
}

static void test_trailing_keeps_spaces_and_colons() {
  auto m = parse_irc_line(":a!a@a.tmi.twitch.tv PRIVMSG #c :hello  there :) \r\n");
  assert(m);
  assert(m->trailing() == "hello  there :) ");
  assert(sender_of(*m) == "a");
}

static void test_classify_control_frames() {
  assert(classify(*parse_irc_line("PING :tmi.twitch.tv")) == FrameKind::Keepalive);
  assert(parse_irc_line("PING :tmi.twitch.tv")->trailing() == "tmi.twitch.tv");
  assert(classify(*parse_irc_line(":tmi.twitch.tv PONG tmi.twitch.tv :tmi.twitch.tv")) == FrameKind::Pong);
  assert(classify(*parse_irc_line(":tmi.twitch.tv RECONNECT")) == FrameKind::Reconnect);
  assert(classify(*parse_irc_line(":tmi.twitch.tv 001 viewer :Welcome, GLHF!")) == FrameKind::Welcome);
  assert(classify(*parse_irc_line(":tmi.twitch.tv CAP * ACK :twitch.tv/tags")) == FrameKind::CapAck);
  assert(classify(*parse_irc_line(":tmi.twitch.tv CAP * NAK :twitch.tv/tags")) == FrameKind::Other);
  assert(classify(*parse_irc_line(":viewer!viewer@viewer.tmi.twitch.tv JOIN #chan")) == FrameKind::Join);
  assert(classify(*parse_irc_line("@room-id=1;slow=0 :tmi.twitch.tv ROOMSTATE #chan")) == FrameKind::RoomState);
  assert(classify(*parse_irc_line(":tmi.twitch.tv GLOBALUSERSTATE")) == FrameKind::GlobalUserState);
  assert(classify(*parse_irc_line(":tmi.twitch.tv 353 viewer = #chan :viewer")) == FrameKind::Other);
  assert(classify(*parse_irc_line("privmsg #c :lower")) == FrameKind::Chat);
}

static void test_auth_failure_notice() {
  auto m = parse_irc_line(":tmi.twitch.tv NOTICE * :Login authentication failed");
  assert(m && classify(*m) == FrameKind::Notice);
  assert(is_auth_failure_notice(*m));
  assert(is_auth_failure_notice(*parse_irc_line(":tmi.twitch.tv NOTICE * :Improperly formatted auth")));
  auto other = parse_irc_line("@msg-id=slow_on :tmi.twitch.tv NOTICE #chan :This room is now in slow mode.");
  assert(!is_auth_failure_notice(*other));
}

static void test_malformed_lines() {
  assert(!parse_irc_line(""));
  assert(!parse_irc_line("\r\n"));
  assert(!parse_irc_line("@a=b"));
  assert(!parse_irc_line(": PRIVMSG #c :x"));
  assert(!parse_irc_line(":only.prefix"));
}

static void test_unescape() {
  assert(unescape_tag_value("a\\sb") == "a b");
  assert(unescape_tag_value("semi\\:colon") == "semi;colon");
  assert(unescape_tag_value("back\\\\slash") == "back\\slash");
  assert(unescape_tag_value("x\\ny\\r") == "x\ny\r");
  assert(unescape_tag_value("trail\\") == "trail");
  assert(unescape_tag_value("\\q") == "q");
  auto m = parse_irc_line("@system-msg=hello\\sworld :tmi.twitch.tv USERNOTICE #c");
  assert(m->tag("system-msg") == "hello world");
}

static void test_sender_fallbacks() {
  auto no_tags = parse_irc_line(":bob!bob@bob.tmi.twitch.tv PRIVMSG #c :hi");
  assert(sender_of(*no_tags) == "bob");
  auto no_prefix = parse_irc_line("PRIVMSG #chan :hi");
  assert(sender_of(*no_prefix) == "chan");
}

static void test_action_body() {
  assert(chat_body("\x01" "ACTION waves\x01") == "* waves");
  assert(chat_body("\x01" "ACTION waves") == "* waves");
  assert(chat_body("plain") == "plain");
}

static void test_formatters() {
  assert(format_pass("abc") == "PASS oauth:abc\r\n");
  assert(format_pass("oauth:abc") == "PASS oauth:abc\r\n");
  assert(format_nick("viewer") == "NICK viewer\r\n");
  assert(format_join("chan") == "JOIN #chan\r\n");
  assert(format_privmsg("chan", "hi there") == "PRIVMSG #chan :hi there\r\n");
  assert(format_ping() == "PING :tmi.twitch.tv\r\n");
  assert(format_pong("tmi.twitch.tv") == "PONG :tmi.twitch.tv\r\n");
  assert(format_cap_req().rfind("CAP REQ :", 0) == 0);

  // what we write parses back into the same frame
  auto m = parse_irc_line(format_privmsg("chan", "hi there"));
  assert(m && m->param(0) == "#chan" && m->trailing() == "hi there");
}

int main() {
  test_parse_privmsg();
  test_parse_userstate();
  test_trailing_keeps_spaces_and_colons();
  test_classify_control_frames();
  test_auth_failure_notice();
  test_malformed_lines();
  test_unescape();
  test_sender_fallbacks();
  test_action_body();
  test_formatters();
  return 0;
}
