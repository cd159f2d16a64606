/*
 * 설명: 단축 토큰과 기본 인증 토큰을 무작위로 생성한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/token_generator_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace smolink {

constexpr std::size_t kShortTokenLength = 22;
inline constexpr char kShortTokenAlphabet[] = "23456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

// 128비트 난수를 base57로 인코딩한 22자 토큰. 유일성은 저장소의 기본키가 보장한다.
std::string GenerateShortToken();

// 버전 4 UUID 문자열 (8-4-4-4-12, 소문자 hex).
std::string GenerateAuthorizationToken();

}  // namespace smolink
