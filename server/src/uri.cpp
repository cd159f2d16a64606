/*
 * 설명: 요청 대상 분리, 퍼센트 디코딩, 절대 URI 검사를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/uri_test.cpp
 */
#include "smolink/uri.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>

namespace smolink {
namespace {
int HexValue(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

bool IsSchemeChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
}

bool HasInvalidChar(const std::string& value) {
  return std::any_of(value.begin(), value.end(), [](char c) {
    auto uc = static_cast<unsigned char>(c);
    return uc <= 0x20 || uc == 0x7f;
  });
}
}  // namespace

RequestTarget SplitTarget(const std::string& target) {
  RequestTarget out;
  auto qpos = target.find('?');
  if (qpos == std::string::npos) {
    out.path = target;
  } else {
    out.path = target.substr(0, qpos);
    out.query = target.substr(qpos + 1);
  }
  return out;
}

std::optional<std::string> PercentDecode(const std::string& value, bool plus_as_space) {
  std::string out;
  out.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    char c = value[i];
    if (c == '%') {
      if (i + 2 >= value.size()) {
        return std::nullopt;
      }
      int hi = HexValue(value[i + 1]);
      int lo = HexValue(value[i + 2]);
      if (hi < 0 || lo < 0) {
        return std::nullopt;
      }
      out.push_back(static_cast<char>(hi * 16 + lo));
      i += 2;
    } else if (c == '+' && plus_as_space) {
      out.push_back(' ');
    } else {
      out.push_back(c);
    }
  }
  return out;
}

std::unordered_map<std::string, std::string> ParseQueryParams(const std::string& query) {
  std::unordered_map<std::string, std::string> params;
  std::size_t pos = 0;
  while (pos <= query.size()) {
    auto amp = query.find('&', pos);
    std::string pair = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
    if (!pair.empty()) {
      auto eq = pair.find('=');
      auto key = PercentDecode(pair.substr(0, eq), true);
      auto value = eq == std::string::npos ? std::optional<std::string>{""} : PercentDecode(pair.substr(eq + 1), true);
      if (key && value) {
        params.emplace(*key, *value);
      }
    }
    if (amp == std::string::npos) {
      break;
    }
    pos = amp + 1;
  }
  return params;
}

bool IsAbsoluteUri(const std::string& value) {
  if (value.empty() || HasInvalidChar(value)) {
    return false;
  }
  auto colon = value.find(':');
  if (colon == std::string::npos || colon == 0) {
    return false;
  }
  if (!std::isalpha(static_cast<unsigned char>(value[0]))) {
    return false;
  }
  if (!std::all_of(value.begin(), value.begin() + static_cast<std::ptrdiff_t>(colon), IsSchemeChar)) {
    return false;
  }
  std::string rest = value.substr(colon + 1);
  if (rest.empty()) {
    return false;
  }
  if (rest.rfind("//", 0) == 0) {
    auto authority_end = rest.find_first_of("/?#", 2);
    std::string authority = rest.substr(2, authority_end == std::string::npos ? std::string::npos : authority_end - 2);
    auto at = authority.rfind('@');
    std::string host = at == std::string::npos ? authority : authority.substr(at + 1);
    if (host.empty() || host.front() == ':') {
      return false;
    }
  }
  // 퍼센트 인코딩이 깨진 값은 거부한다.
  auto fragment = rest.find('#');
  return PercentDecode(rest.substr(0, fragment), false).has_value();
}

std::optional<std::string> ExtractShortToken(const std::string& path) {
  if (path.empty() || path.front() != '/') {
    return std::nullopt;
  }
  auto decoded = PercentDecode(path, false);
  if (!decoded) {
    return std::nullopt;
  }
  std::string token = *decoded;
  token.erase(std::remove(token.begin(), token.end(), '/'), token.end());
  return token;
}

}  // namespace smolink
