/*
 * 설명: OpenSSL 난수로 단축 토큰과 UUID 형식 인증 토큰을 만든다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/token_generator_test.cpp
 */
#include "smolink/token_generator.hpp"

#include <algorithm>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <openssl/bn.h>
#include <openssl/rand.h>

namespace smolink {
namespace {
constexpr std::size_t kRandomBytes = 16;
constexpr BN_ULONG kAlphabetSize = sizeof(kShortTokenAlphabet) - 1;

std::vector<unsigned char> RandomBytes(std::size_t count) {
  std::vector<unsigned char> buffer(count);
  if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
    throw std::runtime_error("난수 생성 실패");
  }
  return buffer;
}

std::string BytesToHex(const unsigned char* data, std::size_t len) {
  std::ostringstream oss;
  for (std::size_t i = 0; i < len; ++i) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
  }
  return oss.str();
}
}  // namespace

std::string GenerateShortToken() {
  auto bytes = RandomBytes(kRandomBytes);
  std::unique_ptr<BIGNUM, decltype(&BN_free)> value(
      BN_bin2bn(bytes.data(), static_cast<int>(bytes.size()), nullptr), &BN_free);
  if (!value) {
    throw std::runtime_error("BIGNUM 변환 실패");
  }

  // 하위 자리부터 채운 뒤 뒤집는다. 2^128 < 57^22 이므로 22자리면 충분하다.
  std::string token;
  token.reserve(kShortTokenLength);
  while (!BN_is_zero(value.get())) {
    BN_ULONG rem = BN_div_word(value.get(), kAlphabetSize);
    if (rem == static_cast<BN_ULONG>(-1)) {
      throw std::runtime_error("BIGNUM 나눗셈 실패");
    }
    token.push_back(kShortTokenAlphabet[rem]);
  }
  while (token.size() < kShortTokenLength) {
    token.push_back(kShortTokenAlphabet[0]);
  }
  std::reverse(token.begin(), token.end());
  return token;
}

std::string GenerateAuthorizationToken() {
  auto bytes = RandomBytes(kRandomBytes);
  bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0f) | 0x40);
  bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3f) | 0x80);
  auto hex = BytesToHex(bytes.data(), bytes.size());
  return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" + hex.substr(16, 4) + "-" +
         hex.substr(20);
}

}  // namespace smolink
