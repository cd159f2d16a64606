/*
 * 설명: 요청 대상과 URL 문자열을 파싱하는 보조 함수를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/uri_test.cpp
 */
#pragma once

#include <optional>
#include <string>
#include <unordered_map>

namespace smolink {

struct RequestTarget {
  std::string path;
  std::string query;
};

RequestTarget SplitTarget(const std::string& target);

// %XX 시퀀스를 디코딩한다. plus_as_space가 참이면 '+'를 공백으로 바꾼다.
// 잘못된 시퀀스가 있으면 nullopt.
std::optional<std::string> PercentDecode(const std::string& value, bool plus_as_space);

// 같은 키가 여러 번 나오면 첫 값을 유지한다. 디코딩할 수 없는 쌍은 버린다.
std::unordered_map<std::string, std::string> ParseQueryParams(const std::string& query);

bool IsAbsoluteUri(const std::string& value);

// 요청 경로를 디코딩하고 모든 '/'를 제거한 토큰을 돌려준다.
std::optional<std::string> ExtractShortToken(const std::string& path);

}  // namespace smolink
