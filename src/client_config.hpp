#pragma once
/*
 * ClientConfig
 *
 * Purpose: runtime settings layered defaults → rc file → command line → env.
 * Errors: bool + message, no exceptions.
 */
#include <filesystem>
#include <optional>
#include <string>
#include "chat_client.hpp"
#include "log.hpp"
#include "option_registry.hpp"

struct ClientConfig {
  std::string host = VICHAT_DEFAULT_HOST;
  std::string port = VICHAT_DEFAULT_PORT;
  std::string nick;
  std::string channel;
  std::string token;
  size_t history_cap = VICHAT_HISTORY_CAP;
  int send_interval_ms = VICHAT_SEND_INTERVAL_MS;
  int backoff_min_ms = VICHAT_BACKOFF_MIN_MS;
  int backoff_max_ms = VICHAT_BACKOFF_MAX_MS;
  int liveness_timeout_s = VICHAT_LIVENESS_TIMEOUT_S;
  int probe_grace_s = VICHAT_PROBE_GRACE_S;
  int handshake_timeout_s = VICHAT_HANDSHAKE_TIMEOUT_S;
  int max_send_retries = VICHAT_MAX_SEND_RETRIES;
  std::string log_file;
  LogLevel log_level = LogLevel::Info;

  OptionRegistry registry();
  // env fallback (TWITCH_TOKEN), normalization and required-field checks
  bool finalize(std::string& msg);
  ClientOptions client_options() const;
};

std::optional<std::filesystem::path> default_rc_path();
bool load_config_file(const std::filesystem::path& path, ClientConfig& cfg, std::string& msg);

struct CliResult {
  bool ok = true;
  bool show_help = false;
  std::optional<std::filesystem::path> config_path;
  std::string msg;
};

// Only picks up --config/--help; the remaining flags are applied by apply_args
// after the rc file has been loaded.
CliResult scan_args(int argc, char** argv);
bool apply_args(int argc, char** argv, ClientConfig& cfg, std::string& msg);
std::string usage(const char* prog);
