/*
 * 설명: MariaDB 연결 수명과 오류 변환을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "smolink/db_client.hpp"

namespace smolink {

MariaDbClient::MariaDbClient(const DbConfig& config) : config_(config) {}

MYSQL* MariaDbClient::Connect() const {
  MYSQL* conn = mysql_init(nullptr);
  if (!conn) {
    throw DbException("MariaDB 초기화 실패", 0);
  }
  if (mysql_options(conn, MYSQL_OPT_CONNECT_TIMEOUT, &connect_timeout_seconds_) != 0) {
    mysql_close(conn);
    throw DbException("연결 타임아웃 설정 실패", 0);
  }
  if (!mysql_real_connect(conn, config_.host.c_str(), config_.user.c_str(), config_.password.c_str(),
                          config_.database.c_str(), config_.port, nullptr, 0)) {
    unsigned int code = mysql_errno(conn);
    std::string message = std::string("연결 실패: ") + mysql_error(conn);
    mysql_close(conn);
    throw DbException(message, code);
  }
  if (mysql_set_character_set(conn, "utf8mb4") != 0) {
    unsigned int code = mysql_errno(conn);
    std::string message = std::string("문자셋 설정 실패: ") + mysql_error(conn);
    mysql_close(conn);
    throw DbException(message, code);
  }
  return conn;
}

void MariaDbClient::WithConnection(const std::function<void(MYSQL*)>& work) const {
  MYSQL* conn = Connect();
  try {
    work(conn);
  } catch (...) {
    mysql_close(conn);
    throw;
  }
  mysql_close(conn);
}

std::string MariaDbClient::Escape(MYSQL* conn, const std::string& value) const {
  std::string escaped;
  escaped.resize(value.size() * 2 + 1);
  auto len = mysql_real_escape_string(conn, escaped.data(), value.c_str(), value.size());
  escaped.resize(len);
  return escaped;
}

void MariaDbClient::RaiseError(MYSQL* conn, const std::string& ctx) const {
  unsigned int code = mysql_errno(conn);
  std::string message = ctx + ": " + mysql_error(conn);
  throw DbException(message, code);
}

}  // namespace smolink
