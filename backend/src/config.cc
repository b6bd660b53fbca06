// ─── FrameRelay — Configuration implementation ──────────────────────────

#include "config.h"
#include "utils.h"

#include <cstdlib>
#include <fstream>
#include <limits>

namespace {

std::optional<long long> parse_integer(const std::string &text) {
  std::string value = trim_copy(text);
  if (value.empty() || value.size() > 18 ||
      value.find_first_not_of("0123456789") != std::string::npos) {
    return std::nullopt;
  }
  return std::stoll(value);
}

std::optional<bool> parse_bool(const std::string &text) {
  std::string value = to_lower(trim_copy(text));
  if (value == "1" || value == "true" || value == "yes" || value == "on") return true;
  if (value == "0" || value == "false" || value == "no" || value == "off") return false;
  return std::nullopt;
}

template <typename T>
void read_integer(const EnvLookup &lookup, const std::string &name, long long min,
                  long long max, T &target) {
  auto raw = lookup(name);
  if (!raw || trim_copy(*raw).empty()) return;
  auto value = parse_integer(*raw);
  if (!value || *value < min || *value > max) {
    CROW_LOG_WARNING << "Invalid " << name << "=" << *raw << ", using default "
                     << target;
    return;
  }
  target = static_cast<T>(*value);
}

void read_bool(const EnvLookup &lookup, const std::string &name, bool &target) {
  auto raw = lookup(name);
  if (!raw || trim_copy(*raw).empty()) return;
  auto value = parse_bool(*raw);
  if (!value) {
    CROW_LOG_WARNING << "Invalid " << name << "=" << *raw << ", using default "
                     << (target ? "1" : "0");
    return;
  }
  target = *value;
}

}  // namespace

void load_dotenv(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) return;

  std::string line;
  while (std::getline(file, line)) {
    line = trim_copy(line);
    if (line.empty() || line[0] == '#') continue;
    if (starts_with(line, "export ")) line = trim_copy(line.substr(7));
    auto pos = line.find('=');
    if (pos == std::string::npos) continue;
    std::string key = trim_copy(line.substr(0, pos));
    std::string val = trim_copy(line.substr(pos + 1));
    if (val.size() >= 2 && (val.front() == '"' || val.front() == '\'') &&
        val.back() == val.front()) {
      val = val.substr(1, val.size() - 2);
    }
    if (key.empty()) continue;
    setenv(key.c_str(), val.c_str(), 0);  // Don't overwrite existing
  }
}

std::optional<std::string> process_env(const std::string &name) {
  const char *value = std::getenv(name.c_str());
  if (!value) return std::nullopt;
  return std::string(value);
}

std::optional<crow::LogLevel> parse_log_level(const std::string &value) {
  std::string level = to_lower(trim_copy(value));
  if (level == "debug") return crow::LogLevel::Debug;
  if (level == "info") return crow::LogLevel::Info;
  if (level == "warning" || level == "warn") return crow::LogLevel::Warning;
  if (level == "error") return crow::LogLevel::Error;
  if (level == "critical") return crow::LogLevel::Critical;
  return std::nullopt;
}

FrameRelayConfig load_config(const EnvLookup &lookup) {
  FrameRelayConfig config;

  read_integer(lookup, "FRAMERELAY_PORT", 1, 65535, config.port);
  if (auto bind = lookup("FRAMERELAY_BIND")) {
    if (!trim_copy(*bind).empty()) config.bind_address = trim_copy(*bind);
  }
  read_integer(lookup, "FRAMERELAY_THREADS", 1, 1024, config.threads);
  read_integer(lookup, "FRAMERELAY_UPSTREAM_TIMEOUT_SECONDS", 1, 3600,
               config.upstream_timeout_seconds);
  read_integer(lookup, "FRAMERELAY_MAX_BODY_BYTES", 1,
               std::numeric_limits<int>::max(), config.max_body_bytes);
  read_integer(lookup, "FRAMERELAY_MAX_REDIRECTS", 0, 100, config.max_redirects);
  read_bool(lookup, "FRAMERELAY_VERIFY_TLS", config.verify_tls);
  read_bool(lookup, "FRAMERELAY_BLOCK_PRIVATE_TARGETS", config.block_private_targets);

  if (auto raw = lookup("FRAMERELAY_LOG_LEVEL")) {
    if (!trim_copy(*raw).empty()) {
      auto level = parse_log_level(*raw);
      if (level) {
        config.log_level = *level;
      } else {
        CROW_LOG_WARNING << "Invalid FRAMERELAY_LOG_LEVEL=" << *raw
                         << ", using default info";
      }
    }
  }
  return config;
}
