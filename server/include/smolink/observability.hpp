/*
 * 설명: 구조화 로그와 로그 레벨 필터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

namespace smolink {

enum class LogLevel { kDebug = 0, kInfo = 1, kError = 2 };

LogLevel ParseLogLevel(const std::string& text);

struct LogContext {
  std::string trace_id;
  std::string method;
  std::string name;
  unsigned int status{0};
  long latency_ms{0};
};

class Observability {
 public:
  explicit Observability(LogLevel level = LogLevel::kInfo);

  std::string NextTraceId();
  void Log(const LogContext& ctx) const;
  void Debug(const std::string& message, const nlohmann::json& fields = nlohmann::json::object()) const;
  void Info(const std::string& message, const nlohmann::json& fields = nlohmann::json::object()) const;
  void Error(const std::string& message, const nlohmann::json& fields = nlohmann::json::object()) const;
  // 운영자가 반드시 봐야 하는 메시지. 로그 레벨과 무관하게 stdout에 쓴다.
  void Notice(const std::string& message, const nlohmann::json& fields = nlohmann::json::object()) const;

 private:
  void Write(LogLevel level, const std::string& message, const nlohmann::json& fields) const;
  void Emit(LogLevel level, const std::string& message, const nlohmann::json& fields) const;

  LogLevel level_;
  std::atomic<std::uint64_t> trace_counter_{0};
  mutable std::mutex out_mutex_;
};

}  // namespace smolink
