#include "client_config.hpp"
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>
#include "log.hpp"

namespace fs = std::filesystem;

struct Argv {
  explicit Argv(std::vector<std::string> a) : args(std::move(a)) {
    for (auto& s : args) ptrs.push_back(s.data());
    ptrs.push_back(nullptr);
  }
  int argc() const { return static_cast<int>(args.size()); }
  char** argv() { return ptrs.data(); }
  std::vector<std::string> args;
  std::vector<char*> ptrs;
};

static fs::path write_temp(const std::string& name, const std::string& content) {
  fs::path p = fs::temp_directory_path() / name;
  std::ofstream out(p);
  out << content;
  return p;
}

static std::string read_all(const fs::path& p) {
  std::ifstream in(p);
  std::stringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

static void test_defaults() {
  ClientConfig cfg;
  assert(cfg.host == VICHAT_DEFAULT_HOST);
  assert(cfg.port == "6667");
  assert(cfg.history_cap == VICHAT_HISTORY_CAP);
  assert(cfg.send_interval_ms == VICHAT_SEND_INTERVAL_MS);
  assert(cfg.log_level == LogLevel::Info);
  assert(cfg.log_file.empty());
}

static void test_rc_file() {
  fs::path p = write_temp("vichat_test_rc",
    "# comment\n"
    "\" vim style comment\n"
    "// another\n"
    "\n"
    "set channel #SomeChan\n"
    ":set history_cap 50\n"
    "send_interval_ms=2000\n"
    "  backoff_max_ms = 60000  \n"
    "log_level debug\n");
  ClientConfig cfg;
  std::string msg;
  assert(load_config_file(p, cfg, msg));
  assert(cfg.channel == "#SomeChan");
  assert(cfg.history_cap == 50);
  assert(cfg.send_interval_ms == 2000);
  assert(cfg.backoff_max_ms == 60000);
  assert(cfg.log_level == LogLevel::Debug);
  fs::remove(p);
}

static void test_rc_errors_carry_line() {
  fs::path p = write_temp("vichat_test_rc_bad", "set channel x\nset colour blue\n");
  ClientConfig cfg;
  std::string msg;
  assert(!load_config_file(p, cfg, msg));
  assert(msg.find(":2: unknown option: colour") != std::string::npos);
  fs::remove(p);

  p = write_temp("vichat_test_rc_num", "history_cap 0\n");
  assert(!load_config_file(p, cfg, msg));
  assert(msg.find(":1:") != std::string::npos);
  p = write_temp("vichat_test_rc_num", "send_interval_ms fast\n");
  assert(!load_config_file(p, cfg, msg));
  assert(msg.find("not a number") != std::string::npos);
  fs::remove(p);

  assert(!load_config_file(fs::temp_directory_path() / "vichat_missing_rc", cfg, msg));
  assert(msg.find("open config failed") != std::string::npos);
}

static void test_args() {
  Argv a({"vichat", "--config", "/nowhere", "--channel", "foo", "--token=abc", "--send-interval-ms", "100",
          "--log-file", "/tmp/x.log"});
  CliResult cli = scan_args(a.argc(), a.argv());
  assert(cli.ok && !cli.show_help);
  assert(cli.config_path && *cli.config_path == fs::path("/nowhere"));

  ClientConfig cfg;
  std::string msg;
  assert(apply_args(a.argc(), a.argv(), cfg, msg));
  assert(cfg.channel == "foo");
  assert(cfg.token == "abc");
  assert(cfg.send_interval_ms == 100);
  assert(cfg.log_file == "/tmp/x.log");

  Argv help({"vichat", "-h"});
  assert(scan_args(help.argc(), help.argv()).show_help);
  Argv bad_config({"vichat", "--config"});
  assert(!scan_args(bad_config.argc(), bad_config.argv()).ok);

  Argv unknown({"vichat", "--colour", "blue"});
  assert(!apply_args(unknown.argc(), unknown.argv(), cfg, msg));
  assert(msg.find("unknown option") != std::string::npos);
  Argv positional({"vichat", "chan"});
  assert(!apply_args(positional.argc(), positional.argv(), cfg, msg));
  Argv missing({"vichat", "--nick"});
  assert(!apply_args(missing.argc(), missing.argv(), cfg, msg));
  assert(msg.find("needs a value") != std::string::npos);
  Argv negative({"vichat", "--max-send-retries=-1"});
  assert(!apply_args(negative.argc(), negative.argv(), cfg, msg));

  assert(usage("vichat").find("--history_cap") != std::string::npos);
}

static void test_finalize() {
  unsetenv("TWITCH_TOKEN");
  ClientConfig cfg;
  std::string msg;
  assert(!cfg.finalize(msg));
  assert(msg.find("channel") != std::string::npos);

  cfg.channel = "#SomeChan";
  assert(!cfg.finalize(msg));
  assert(msg.find("token") != std::string::npos);

  setenv("TWITCH_TOKEN", "oauth:fromenv", 1);
  assert(cfg.finalize(msg));
  assert(cfg.token == "fromenv");
  assert(cfg.channel == "somechan");
  assert(cfg.nick == "somechan");

  ClientConfig explicit_token;
  explicit_token.channel = "c";
  explicit_token.token = "mine";
  explicit_token.nick = "me";
  assert(explicit_token.finalize(msg));
  assert(explicit_token.token == "mine" && explicit_token.nick == "me");
  unsetenv("TWITCH_TOKEN");

  ClientConfig inverted;
  inverted.channel = "c";
  inverted.token = "t";
  inverted.backoff_min_ms = 500;
  inverted.backoff_max_ms = 100;
  assert(!inverted.finalize(msg));
  assert(msg.find("backoff") != std::string::npos);
}

static void test_client_options() {
  ClientConfig cfg;
  cfg.channel = "chan";
  cfg.token = "tok";
  cfg.send_interval_ms = 250;
  cfg.liveness_timeout_s = 7;
  cfg.history_cap = 3;
  std::string msg;
  assert(cfg.finalize(msg));
  ClientOptions o = cfg.client_options();
  assert(o.channel == "chan" && o.token == "tok");
  assert(o.session.nick == "chan");
  assert(o.session.min_send_interval == std::chrono::milliseconds(250));
  assert(o.session.liveness_timeout == std::chrono::seconds(7));
  assert(o.history_cap == 3);
}

static void test_log_file() {
  fs::path p = fs::temp_directory_path() / "vichat_test.log";
  fs::remove(p);
  std::string msg;
  log_info("before open is dropped");
  assert(log_open(p.string(), LogLevel::Info, msg));
  log_debug("hidden {}", 1);
  log_info("joined #{}", "chan");
  log_error("failed: {}", 42);
  log_close();
  std::string text = read_all(p);
  assert(text.find("before open") == std::string::npos);
  assert(text.find("hidden") == std::string::npos);
  assert(text.find("INFO  joined #chan") != std::string::npos);
  assert(text.find("ERROR failed: 42") != std::string::npos);
  fs::remove(p);

  LogLevel lvl = LogLevel::Info;
  assert(parse_log_level("warn", lvl) && lvl == LogLevel::Warn);
  assert(!parse_log_level("loud", lvl));
  assert(!log_open("/nonexistent-dir/x.log", LogLevel::Info, msg));
}

int main() {
  test_defaults();
  test_rc_file();
  test_rc_errors_carry_line();
  test_args();
  test_finalize();
  test_client_options();
  test_log_file();
  return 0;
}
