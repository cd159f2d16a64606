/*
 * 설명: HTTP 응답 본문 생성을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/api_response_test.cpp
 */
#pragma once

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace smolink {

inline constexpr std::string_view kUnauthorized = "Unauthorized";
inline constexpr std::string_view kMalformedUrl = "Malformed URL";
inline constexpr std::string_view kCreateFailed = "Failed to create short url";
inline constexpr std::string_view kExpandFailed = "Failed to get full url";
inline constexpr std::string_view kMethodNotSupported = "Method not supported";

nlohmann::json MakeShortUrlBody(const std::string& short_url);

}  // namespace smolink
