#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>

#include <unistd.h>

#include <gtest/gtest.h>

#include "smolink/config.hpp"

namespace {

const char* const kKeys[] = {"PORT", "BASE_URL", "DB_HOST", "DB_PORT", "DB_USER", "DB_PASSWORD", "DB_NAME",
                             "LOG_LEVEL", "SMOLINK_TEST_QUOTED", "SMOLINK_TEST_EXPORTED"};

class ConfigTest : public ::testing::Test {
 protected:
  void SetUp() override { ClearEnv(); }
  void TearDown() override {
    ClearEnv();
    if (!env_path_.empty()) {
      std::remove(env_path_.c_str());
    }
  }

  static void ClearEnv() {
    for (const char* key : kKeys) {
      ::unsetenv(key);
    }
  }

  std::string WriteEnvFile(const std::string& content) {
    char path[] = "/tmp/smolink_env_XXXXXX";
    int fd = ::mkstemp(path);
    EXPECT_NE(fd, -1);
    ::close(fd);
    env_path_ = path;
    std::ofstream out(env_path_);
    out << content;
    return env_path_;
  }

  std::string env_path_;
};

}  // namespace

TEST_F(ConfigTest, DefaultsWhenEnvironmentEmpty) {
  auto cfg = smolink::LoadConfigFromEnv();
  EXPECT_EQ(cfg.port, 9000);
  EXPECT_EQ(cfg.base_url, "http://localhost:9000");
  EXPECT_EQ(cfg.db_host, "127.0.0.1");
  EXPECT_EQ(cfg.db_port, 3306);
  EXPECT_EQ(cfg.db_name, "smolink");
  EXPECT_EQ(cfg.log_level, "info");
}

TEST_F(ConfigTest, ReadsEnvironmentAndTrimsBaseUrl) {
  ::setenv("PORT", "8081", 1);
  ::setenv("BASE_URL", "https://short.example/", 1);
  ::setenv("DB_NAME", "links_db", 1);
  auto cfg = smolink::LoadConfigFromEnv();
  EXPECT_EQ(cfg.port, 8081);
  EXPECT_EQ(cfg.base_url, "https://short.example");
  EXPECT_EQ(cfg.db_name, "links_db");
}

TEST_F(ConfigTest, RejectsInvalidPort) {
  ::setenv("PORT", "90x", 1);
  EXPECT_THROW(smolink::LoadConfigFromEnv(), std::invalid_argument);
  ::setenv("PORT", "70000", 1);
  EXPECT_THROW(smolink::LoadConfigFromEnv(), std::invalid_argument);
}

TEST_F(ConfigTest, DotEnvFillsUnsetVariablesOnly) {
  ::setenv("DB_HOST", "from-env", 1);
  auto path = WriteEnvFile(
      "# comment\n"
      "\n"
      "BASE_URL=https://s.example\n"
      "DB_HOST=from-file\n"
      "SMOLINK_TEST_QUOTED=\"quoted value\"\n"
      "export SMOLINK_TEST_EXPORTED='x'\n"
      "not a pair\n");
  ASSERT_TRUE(smolink::LoadDotEnv(path));
  EXPECT_STREQ(std::getenv("BASE_URL"), "https://s.example");
  EXPECT_STREQ(std::getenv("DB_HOST"), "from-env");
  EXPECT_STREQ(std::getenv("SMOLINK_TEST_QUOTED"), "quoted value");
  EXPECT_STREQ(std::getenv("SMOLINK_TEST_EXPORTED"), "x");
}

TEST_F(ConfigTest, MissingDotEnvReportsFalse) {
  EXPECT_FALSE(smolink::LoadDotEnv("/nonexistent/smolink/.env"));
}
