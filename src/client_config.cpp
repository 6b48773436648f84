#include "client_config.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>

template <typename T>
static bool parse_number(const std::string& s, T& out, T min_value, std::string& err) {
  T v{};
  auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc() || p != s.data() + s.size()) { err = "not a number: " + s; return false; }
  if (v < min_value) { err = "value must be >= " + std::to_string(min_value) + ": " + s; return false; }
  out = v;
  return true;
}

static std::string trim(const std::string& s) {
  auto sp = [](unsigned char c){ return std::isspace(c) != 0; };
  size_t i = 0; while (i < s.size() && sp((unsigned char)s[i])) i++;
  size_t j = s.size(); while (j > i && sp((unsigned char)s[j-1])) j--;
  return s.substr(i, j - i);
}

OptionRegistry ClientConfig::registry() {
  OptionRegistry r;
  auto text = [](std::string& field) {
    return [&field](const std::string& v, std::string& err) {
      if (v.empty()) { err = "empty value"; return false; }
      field = v;
      return true;
    };
  };
  auto integer = [](int& field, int min_value) {
    return [&field, min_value](const std::string& v, std::string& err) { return parse_number(v, field, min_value, err); };
  };
  r.register_option("host", text(host));
  r.register_option("port", text(port));
  r.register_option("nick", text(nick));
  r.register_option("channel", text(channel));
  r.register_option("token", text(token));
  r.register_option("log_file", [this](const std::string& v, std::string&) { log_file = v; return true; });
  r.register_option("log_level", [this](const std::string& v, std::string& err) {
    if (parse_log_level(v, log_level)) return true;
    err = "log_level must be debug|info|warn|error";
    return false;
  });
  r.register_option("history_cap", [this](const std::string& v, std::string& err) {
    return parse_number<size_t>(v, history_cap, 1, err);
  });
  r.register_option("send_interval_ms", integer(send_interval_ms, 0));
  r.register_option("backoff_min_ms", integer(backoff_min_ms, 1));
  r.register_option("backoff_max_ms", integer(backoff_max_ms, 1));
  r.register_option("liveness_timeout_s", integer(liveness_timeout_s, 1));
  r.register_option("probe_grace_s", integer(probe_grace_s, 1));
  r.register_option("handshake_timeout_s", integer(handshake_timeout_s, 1));
  r.register_option("max_send_retries", integer(max_send_retries, 0));
  return r;
}

bool ClientConfig::finalize(std::string& msg) {
  if (token.empty()) {
    if (const char* env = std::getenv("TWITCH_TOKEN")) token = env;
  }
  if (token.rfind("oauth:", 0) == 0) token.erase(0, 6);
  if (!channel.empty() && channel[0] == '#') channel.erase(0, 1);
  for (auto& c : channel) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (nick.empty()) nick = channel;
  if (channel.empty()) { msg = "missing channel: use --channel <name>"; return false; }
  if (token.empty()) { msg = "missing token: use --token <oauth token> or set TWITCH_TOKEN"; return false; }
  if (backoff_max_ms < backoff_min_ms) { msg = "backoff_max_ms must be >= backoff_min_ms"; return false; }
  return true;
}

ClientOptions ClientConfig::client_options() const {
  ClientOptions o;
  o.session.host = host;
  o.session.port = port;
  o.session.nick = nick;
  o.session.min_send_interval = std::chrono::milliseconds(send_interval_ms);
  o.session.backoff_min = std::chrono::milliseconds(backoff_min_ms);
  o.session.backoff_max = std::chrono::milliseconds(backoff_max_ms);
  o.session.liveness_timeout = std::chrono::seconds(liveness_timeout_s);
  o.session.probe_grace = std::chrono::seconds(probe_grace_s);
  o.session.handshake_timeout = std::chrono::seconds(handshake_timeout_s);
  o.session.max_send_retries = max_send_retries;
  o.history_cap = history_cap;
  o.token = token;
  o.channel = channel;
  return o;
}

std::optional<std::filesystem::path> default_rc_path() {
  const char* home = std::getenv("HOME");
  if (!home) return std::nullopt;
  return std::filesystem::path(home) / VICHAT_RC_NAME;
}

bool load_config_file(const std::filesystem::path& path, ClientConfig& cfg, std::string& msg) {
  std::ifstream in(path);
  if (!in) { msg = "open config failed: " + path.string(); return false; }
  OptionRegistry reg = cfg.registry();
  std::string raw;
  int lineno = 0;
  while (std::getline(in, raw)) {
    lineno++;
    std::string s = trim(raw);
    if (s.empty()) continue;
    if (s[0] == '#' || s[0] == '"') continue;
    if (s.size() >= 2 && s[0] == '/' && s[1] == '/') continue;
    if (s[0] == ':') s = trim(s.substr(1));
    if (s.rfind("set ", 0) == 0) s = trim(s.substr(4));
    std::string name, value;
    size_t eq = s.find('=');
    size_t sp = s.find_first_of(" \t");
    size_t cut = std::min(eq, sp);
    if (cut == std::string::npos) { name = s; }
    else { name = trim(s.substr(0, cut)); value = trim(s.substr(cut + 1)); }
    if (!value.empty() && value[0] == '=') value = trim(value.substr(1));
    std::string err;
    if (!reg.apply(name, value, err)) {
      msg = path.string() + ":" + std::to_string(lineno) + ": " + err;
      return false;
    }
  }
  return true;
}

CliResult scan_args(int argc, char** argv) {
  CliResult r;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--help" || a == "-h") { r.show_help = true; continue; }
    if (a == "--config") {
      if (i + 1 >= argc) { r.ok = false; r.msg = "--config needs a path"; return r; }
      r.config_path = std::filesystem::path(argv[++i]);
    }
  }
  return r;
}

bool apply_args(int argc, char** argv, ClientConfig& cfg, std::string& msg) {
  OptionRegistry reg = cfg.registry();
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--help" || a == "-h") continue;
    if (a == "--config") { i++; continue; }
    if (a.rfind("--", 0) != 0) { msg = "unexpected argument: " + a; return false; }
    std::string name = a.substr(2);
    std::string value;
    size_t eq = name.find('=');
    if (eq != std::string::npos) { value = name.substr(eq + 1); name = name.substr(0, eq); }
    for (auto& c : name) if (c == '-') c = '_';
    if (!reg.has(name)) { msg = "unknown option: " + a; return false; }
    if (eq == std::string::npos) {
      if (i + 1 >= argc) { msg = a + " needs a value"; return false; }
      value = argv[++i];
    }
    std::string err;
    if (!reg.apply(name, value, err)) { msg = a + ": " + err; return false; }
  }
  return true;
}

std::string usage(const char* prog) {
  std::string s = std::string("usage: ") + prog + " --channel <name> [--token <oauth token>] [options]\n"
    "  token falls back to $TWITCH_TOKEN\n"
    "  --config <path>   rc file (default ~/" VICHAT_RC_NAME ")\n"
    "options (also valid in the rc file as `set <name> <value>`):\n";
  ClientConfig tmp;
  for (const auto& n : tmp.registry().names()) s += "  --" + n + " <value>\n";
  return s;
}
