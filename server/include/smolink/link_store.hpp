/*
 * 설명: 단축 링크와 인증 토큰 저장소의 추상 인터페이스를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/link_flow_test.cpp, server/tests/it/mariadb_link_store_it_test.cpp
 */
#pragma once

#include <optional>
#include <string>

namespace smolink {

struct ShortUrl {
  std::string token;
  std::string url;
};

// 저장 오류는 DbException으로 던진다. 구현체는 여러 요청 스레드에서 동시에 호출된다.
class LinkStore {
 public:
  virtual ~LinkStore() = default;

  virtual void EnsureSchema() = 0;
  virtual ShortUrl Insert(const std::string& original_url) = 0;
  virtual std::optional<std::string> Lookup(const std::string& short_path) = 0;
  virtual bool ValidateToken(const std::string& token) = 0;
  // 이미 토큰이 있으면 nullopt를 반환하고 아무것도 하지 않는다.
  virtual std::optional<std::string> ProvisionDefaultToken() = 0;
};

std::string MakeShortUrl(const std::string& base_url, const std::string& token);

}  // namespace smolink
