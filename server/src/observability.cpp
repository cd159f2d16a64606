/*
 * 설명: 요청 단위 구조화 로그와 운영 메시지를 출력한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "smolink/observability.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace smolink {
namespace {
std::string CurrentTimestamp() {
  using clock = std::chrono::system_clock;
  auto now = clock::now();
  auto itt = clock::to_time_t(now);
  std::tm tm{};
  gmtime_r(&itt, &tm);
  std::ostringstream ss;
  ss << std::put_time(&tm, "%FT%TZ");
  return ss.str();
}

const char* LevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}
}  // namespace

LogLevel ParseLogLevel(const std::string& text) {
  if (text == "debug") {
    return LogLevel::kDebug;
  }
  if (text == "error") {
    return LogLevel::kError;
  }
  return LogLevel::kInfo;
}

Observability::Observability(LogLevel level) : level_(level) {}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::Log(const LogContext& ctx) const {
  if (level_ > LogLevel::kInfo) {
    return;
  }
  nlohmann::json log_json;
  log_json["ts"] = CurrentTimestamp();
  log_json["traceId"] = ctx.trace_id;
  log_json["eventName"] = ctx.name;
  log_json["method"] = ctx.method;
  log_json["status"] = ctx.status;
  log_json["latencyMs"] = ctx.latency_ms;
  std::lock_guard<std::mutex> lock(out_mutex_);
  std::cout << log_json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

void Observability::Debug(const std::string& message, const nlohmann::json& fields) const {
  Write(LogLevel::kDebug, message, fields);
}

void Observability::Info(const std::string& message, const nlohmann::json& fields) const {
  Write(LogLevel::kInfo, message, fields);
}

void Observability::Error(const std::string& message, const nlohmann::json& fields) const {
  Write(LogLevel::kError, message, fields);
}

void Observability::Notice(const std::string& message, const nlohmann::json& fields) const {
  Emit(LogLevel::kInfo, message, fields);
}

void Observability::Write(LogLevel level, const std::string& message, const nlohmann::json& fields) const {
  if (level < level_) {
    return;
  }
  Emit(level, message, fields);
}

void Observability::Emit(LogLevel level, const std::string& message, const nlohmann::json& fields) const {
  nlohmann::json log_json = fields.is_object() ? fields : nlohmann::json::object();
  log_json["ts"] = CurrentTimestamp();
  log_json["level"] = LevelName(level);
  log_json["message"] = message;
  std::lock_guard<std::mutex> lock(out_mutex_);
  auto& out = level == LogLevel::kError ? std::cerr : std::cout;
  out << log_json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

}  // namespace smolink
