/*
 * 설명: 서버 진입점으로 환경설정을 로드하고 저장소를 준비한 뒤 실행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/link_flow_test.cpp
 */
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>

#include "smolink/app.hpp"

int main() {
  using namespace smolink;
  const char* env_file = std::getenv("SMOLINK_ENV_FILE");
  std::string env_path = env_file ? std::string{env_file} : std::string{".env"};
  try {
    if (!LoadDotEnv(env_path)) {
      std::cerr << env_path << " 파일이 없어 환경변수만 사용합니다\n";
    }
  } catch (const std::exception& ex) {
    std::cerr << ".env 로딩 실패: " << ex.what() << "\n";
    return 1;
  }

  AppConfig config;
  try {
    config = LoadConfigFromEnv();
  } catch (const std::exception& ex) {
    std::cerr << "설정 오류: " << ex.what() << "\n";
    return 1;
  }

  ServerApp app(config);
  if (!app.Bootstrap()) {
    return 1;
  }
  return app.Run() ? 0 : 1;
}
