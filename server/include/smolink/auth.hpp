/*
 * 설명: Authorization 헤더의 Bearer 토큰을 저장된 토큰과 비교한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/auth_test.cpp, server/tests/e2e/link_flow_test.cpp
 */
#pragma once

#include <memory>
#include <optional>
#include <string>

#include "smolink/link_store.hpp"

namespace smolink {

// "Bearer "가 처음 나타난 위치 뒤의 문자열. 접두어가 없거나 토큰이 비어 있으면 nullopt.
std::optional<std::string> ExtractBearerToken(const std::string& header_value);

class Authorizer {
 public:
  explicit Authorizer(std::shared_ptr<LinkStore> store);

  // 헤더 누락, 접두어 누락, 잘못된 토큰을 구분하지 않고 모두 false.
  bool Authorize(const std::optional<std::string>& header_value) const;

 private:
  std::shared_ptr<LinkStore> store_;
};

}  // namespace smolink
