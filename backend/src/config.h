#pragma once
// ─── FrameRelay — Configuration ─────────────────────────────────────────
// Process configuration read from FRAMERELAY_* environment variables (an
// optional .env file is loaded first and never overrides the environment).

#include "crow/logging.h"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>

struct FrameRelayConfig {
  int port = 8080;
  std::string bind_address = "0.0.0.0";
  unsigned int threads = 0;  // 0 = hardware concurrency
  int upstream_timeout_seconds = 30;
  size_t max_body_bytes = 32u * 1024u * 1024u;
  int max_redirects = 10;
  bool verify_tls = true;
  bool block_private_targets = false;
  crow::LogLevel log_level = crow::LogLevel::Info;
};

using EnvLookup = std::function<std::optional<std::string>(const std::string &)>;

// Reads KEY=VALUE lines from `path` into the environment without
// overwriting variables that are already set. Missing file is not an error.
void load_dotenv(const std::string &path = ".env");

// Looks a variable up in the process environment.
std::optional<std::string> process_env(const std::string &name);

std::optional<crow::LogLevel> parse_log_level(const std::string &value);

// Builds the configuration; invalid values keep the default and log a
// warning.
FrameRelayConfig load_config(const EnvLookup &lookup = process_env);
