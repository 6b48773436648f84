#include "app.hpp"
#include "client_config.hpp"
#include "log.hpp"
#include <iostream>

int main(int argc, char** argv) {
  CliResult cli = scan_args(argc, argv);
  if (!cli.ok) { std::cerr << cli.msg << "\n" << usage(argv[0]); return 1; }
  if (cli.show_help) { std::cout << usage(argv[0]); return 0; }

  ClientConfig cfg;
  std::string msg;
  if (cli.config_path) {
    if (!load_config_file(*cli.config_path, cfg, msg)) { std::cerr << msg << "\n"; return 1; }
  } else if (auto rc = default_rc_path()) {
    std::error_code ec;
    if (std::filesystem::exists(*rc, ec) && !load_config_file(*rc, cfg, msg)) { std::cerr << msg << "\n"; return 1; }
  }
  if (!apply_args(argc, argv, cfg, msg)) { std::cerr << msg << "\n" << usage(argv[0]); return 1; }
  if (!cfg.finalize(msg)) { std::cerr << msg << "\n" << usage(argv[0]); return 1; }
  if (!log_open(cfg.log_file, cfg.log_level, msg)) { std::cerr << msg << "\n"; return 1; }

  log_info("vichat starting: #{} as {}", cfg.channel, cfg.nick);
  int rc;
  {
    App app(cfg.client_options(), 16);
    rc = app.run();
  }
  log_info("vichat exiting ({})", rc);
  log_close();
  return rc;
}
