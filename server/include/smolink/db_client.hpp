/*
 * 설명: MariaDB 연결과 오류 변환을 캡슐화한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/mariadb_link_store_it_test.cpp
 */
#pragma once

#include <functional>
#include <stdexcept>
#include <string>

#include <mariadb/mysql.h>

namespace smolink {

struct DbConfig {
  std::string host;
  unsigned short port;
  std::string user;
  std::string password;
  std::string database;
};

class DbException : public std::runtime_error {
 public:
  DbException(const std::string& message, unsigned int code)
      : std::runtime_error(message), code(code) {}
  unsigned int code;
};

// 작업마다 연결을 새로 열고 닫는다. 실패는 재시도하지 않고 DbException으로 전파한다.
class MariaDbClient {
 public:
  explicit MariaDbClient(const DbConfig& config);

  void WithConnection(const std::function<void(MYSQL*)>& work) const;

  [[noreturn]] void RaiseError(MYSQL* conn, const std::string& ctx) const;

  std::string Escape(MYSQL* conn, const std::string& value) const;

 private:
  MYSQL* Connect() const;

  DbConfig config_;
  unsigned int connect_timeout_seconds_ = 2;
};

}  // namespace smolink
