/*
 * 설명: Bearer 토큰 추출과 저장소 기반 인증 검사를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/auth_test.cpp
 */
#include "smolink/auth.hpp"

#include <utility>

namespace smolink {

std::optional<std::string> ExtractBearerToken(const std::string& header_value) {
  const std::string prefix = "Bearer ";
  auto pos = header_value.find(prefix);
  if (pos == std::string::npos) {
    return std::nullopt;
  }
  auto token = header_value.substr(pos + prefix.size());
  if (token.empty()) {
    return std::nullopt;
  }
  return token;
}

Authorizer::Authorizer(std::shared_ptr<LinkStore> store) : store_(std::move(store)) {}

bool Authorizer::Authorize(const std::optional<std::string>& header_value) const {
  if (!header_value || header_value->empty()) {
    return false;
  }
  auto token = ExtractBearerToken(*header_value);
  if (!token) {
    return false;
  }
  return store_->ValidateToken(*token);
}

}  // namespace smolink
