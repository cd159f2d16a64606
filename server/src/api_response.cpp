/*
 * 설명: 단축 URL 생성 응답 본문을 만든다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/api_response_test.cpp
 */
#include "smolink/api_response.hpp"

namespace smolink {

nlohmann::json MakeShortUrlBody(const std::string& short_url) {
  nlohmann::json body;
  body["url"] = short_url;
  body["shorturl"] = short_url;
  return body;
}

}  // namespace smolink
