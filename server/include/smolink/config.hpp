/*
 * 설명: 서버 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/config_test.cpp
 */
#pragma once

#include <string>

namespace smolink {

struct AppConfig {
  unsigned short port;
  std::string base_url;
  std::string db_host;
  unsigned short db_port;
  std::string db_user;
  std::string db_password;
  std::string db_name;
  std::string log_level;
};

// KEY=VALUE 형식의 파일을 읽어 아직 설정되지 않은 환경변수만 채운다.
// 파일을 열 수 없으면 false를 반환한다.
bool LoadDotEnv(const std::string& path);

AppConfig LoadConfigFromEnv();

}  // namespace smolink
