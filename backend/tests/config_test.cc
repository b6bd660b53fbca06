// ─── FrameRelay — Configuration tests ───────────────────────────────────

#include "config.h"

#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <map>

namespace {

EnvLookup lookup_from(const std::map<std::string, std::string> &values) {
  return [values](const std::string &name) -> std::optional<std::string> {
    auto it = values.find(name);
    if (it == values.end()) return std::nullopt;
    return it->second;
  };
}

}  // namespace

TEST(ConfigTest, Defaults) {
  FrameRelayConfig config = load_config(lookup_from({}));
  EXPECT_EQ(config.port, 8080);
  EXPECT_EQ(config.bind_address, "0.0.0.0");
  EXPECT_EQ(config.threads, 0u);
  EXPECT_EQ(config.upstream_timeout_seconds, 30);
  EXPECT_EQ(config.max_body_bytes, 32u * 1024u * 1024u);
  EXPECT_EQ(config.max_redirects, 10);
  EXPECT_TRUE(config.verify_tls);
  EXPECT_FALSE(config.block_private_targets);
  EXPECT_EQ(config.log_level, crow::LogLevel::Info);
}

TEST(ConfigTest, ReadsOverrides) {
  FrameRelayConfig config = load_config(lookup_from({
      {"FRAMERELAY_PORT", "9090"},
      {"FRAMERELAY_BIND", " 127.0.0.1 "},
      {"FRAMERELAY_THREADS", "4"},
      {"FRAMERELAY_UPSTREAM_TIMEOUT_SECONDS", "5"},
      {"FRAMERELAY_MAX_BODY_BYTES", "1048576"},
      {"FRAMERELAY_MAX_REDIRECTS", "0"},
      {"FRAMERELAY_VERIFY_TLS", "off"},
      {"FRAMERELAY_BLOCK_PRIVATE_TARGETS", "Yes"},
      {"FRAMERELAY_LOG_LEVEL", "DEBUG"},
  }));
  EXPECT_EQ(config.port, 9090);
  EXPECT_EQ(config.bind_address, "127.0.0.1");
  EXPECT_EQ(config.threads, 4u);
  EXPECT_EQ(config.upstream_timeout_seconds, 5);
  EXPECT_EQ(config.max_body_bytes, 1048576u);
  EXPECT_EQ(config.max_redirects, 0);
  EXPECT_FALSE(config.verify_tls);
  EXPECT_TRUE(config.block_private_targets);
  EXPECT_EQ(config.log_level, crow::LogLevel::Debug);
}

TEST(ConfigTest, InvalidValuesKeepDefaults) {
  FrameRelayConfig config = load_config(lookup_from({
      {"FRAMERELAY_PORT", "70000"},
      {"FRAMERELAY_THREADS", "-2"},
      {"FRAMERELAY_UPSTREAM_TIMEOUT_SECONDS", "soon"},
      {"FRAMERELAY_MAX_REDIRECTS", "500"},
      {"FRAMERELAY_VERIFY_TLS", "maybe"},
      {"FRAMERELAY_LOG_LEVEL", "chatty"},
      {"FRAMERELAY_BIND", "   "},
  }));
  EXPECT_EQ(config.port, 8080);
  EXPECT_EQ(config.threads, 0u);
  EXPECT_EQ(config.upstream_timeout_seconds, 30);
  EXPECT_EQ(config.max_redirects, 10);
  EXPECT_TRUE(config.verify_tls);
  EXPECT_EQ(config.log_level, crow::LogLevel::Info);
  EXPECT_EQ(config.bind_address, "0.0.0.0");
}

TEST(ConfigTest, ParsesLogLevels) {
  EXPECT_EQ(parse_log_level("warn").value_or(crow::LogLevel::Debug),
            crow::LogLevel::Warning);
  EXPECT_EQ(parse_log_level(" Error ").value_or(crow::LogLevel::Debug),
            crow::LogLevel::Error);
  EXPECT_EQ(parse_log_level("critical").value_or(crow::LogLevel::Debug),
            crow::LogLevel::Critical);
  EXPECT_FALSE(parse_log_level("verbose").has_value());
}

TEST(ConfigTest, DotenvDoesNotOverrideEnvironment) {
  const std::string path = ::testing::TempDir() + "framerelay_test.env";
  {
    std::ofstream file(path);
    file << "# comment\n"
         << "FRAMERELAY_TEST_DOTENV_A=1\n"
         << "export FRAMERELAY_TEST_DOTENV_B=\"two words\"\n"
         << "FRAMERELAY_TEST_DOTENV_C=from-file\n"
         << "not a pair\n";
  }
  setenv("FRAMERELAY_TEST_DOTENV_C", "from-env", 1);

  load_dotenv(path);
  EXPECT_EQ(process_env("FRAMERELAY_TEST_DOTENV_A").value_or(""), "1");
  EXPECT_EQ(process_env("FRAMERELAY_TEST_DOTENV_B").value_or(""), "two words");
  EXPECT_EQ(process_env("FRAMERELAY_TEST_DOTENV_C").value_or(""), "from-env");
  EXPECT_FALSE(process_env("FRAMERELAY_TEST_DOTENV_MISSING").has_value());

  std::remove(path.c_str());
  load_dotenv(path);  // missing file is not an error
}
