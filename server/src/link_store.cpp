/*
 * 설명: 저장소 구현체들이 공유하는 단축 URL 조립 규칙.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "smolink/link_store.hpp"

namespace smolink {

std::string MakeShortUrl(const std::string& base_url, const std::string& token) {
  return base_url + "/" + token;
}

}  // namespace smolink
