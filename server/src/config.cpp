/*
 * 설명: .env 파일과 환경변수에서 서버 설정을 읽는다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp
 */
#include "smolink/config.hpp"

#include <cstdlib>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace smolink {
namespace {
std::string Trim(const std::string& value) {
  const char* ws = " \t\r\n";
  auto begin = value.find_first_not_of(ws);
  if (begin == std::string::npos) {
    return "";
  }
  auto end = value.find_last_not_of(ws);
  return value.substr(begin, end - begin + 1);
}

std::string Unquote(const std::string& value) {
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

unsigned short ParsePort(const std::string& key, const std::string& value) {
  std::size_t idx = 0;
  unsigned long parsed = 0;
  try {
    parsed = std::stoul(value, &idx);
  } catch (const std::exception&) {
    throw std::invalid_argument(key + " 값이 숫자가 아닙니다: " + value);
  }
  if (idx != value.size() || parsed > std::numeric_limits<unsigned short>::max()) {
    throw std::invalid_argument(key + " 값이 올바른 포트가 아닙니다: " + value);
  }
  return static_cast<unsigned short>(parsed);
}
}  // namespace

bool LoadDotEnv(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return false;
  }
  std::string line;
  while (std::getline(file, line)) {
    line = Trim(line);
    if (line.empty() || line.front() == '#') {
      continue;
    }
    if (line.rfind("export ", 0) == 0) {
      line = Trim(line.substr(7));
    }
    auto eq = line.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    auto key = Trim(line.substr(0, eq));
    auto value = Unquote(Trim(line.substr(eq + 1)));
    if (key.empty()) {
      continue;
    }
    // 이미 설정된 환경변수가 우선한다.
    if (::setenv(key.c_str(), value.c_str(), 0) != 0) {
      throw std::runtime_error("환경변수 설정 실패: " + key);
    }
  }
  return true;
}

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };

  AppConfig cfg;
  cfg.port = ParsePort("PORT", get_env("PORT", "9000"));
  cfg.base_url = get_env("BASE_URL", "http://localhost:9000");
  while (!cfg.base_url.empty() && cfg.base_url.back() == '/') {
    cfg.base_url.pop_back();
  }
  cfg.db_host = get_env("DB_HOST", "127.0.0.1");
  cfg.db_port = ParsePort("DB_PORT", get_env("DB_PORT", "3306"));
  cfg.db_user = get_env("DB_USER", "smolink");
  cfg.db_password = get_env("DB_PASSWORD", "smolink");
  cfg.db_name = get_env("DB_NAME", "smolink");
  cfg.log_level = get_env("LOG_LEVEL", "info");
  return cfg;
}

}  // namespace smolink
