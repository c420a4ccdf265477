#pragma once

// ---------------------------------------------------------------------------
// log_types.hpp
//
// 로거 서브시스템에서 사용하는 구조화 로그 타입 정의.
//
// [순환 의존성 방지 설계]
// - HookMode, AuditResult 등 도메인 enum 을 직접 include 하지 않는다.
//   호출자가 문자열(mode, result)로 변환해 전달한다.
//
// [민감정보 취급 주의]
// - 스크립트 입력/출력 원문은 로그에 싣지 않는다 (trace span 전용).
// - PermissionDecisionLog 는 결과만 기록한다. 정책 스크립트 본문 / 속성 값 금지.
// ---------------------------------------------------------------------------

#include "common/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// LogLevel
//   로거의 최소 출력 레벨. config 에서 주입.
// ---------------------------------------------------------------------------
enum class LogLevel : std::uint8_t {
    kTrace = 0,
    kDebug = 1,
    kInfo  = 2,
    kWarn  = 3,
    kError = 4,
};

// parse_log_level
//   "trace"|"debug"|"info"|"warn"|"error" → LogLevel. 알 수 없는 값은 std::nullopt.
[[nodiscard]] inline std::optional<LogLevel> parse_log_level(std::string_view name) noexcept {
    if (name == "trace") return LogLevel::kTrace;
    if (name == "debug") return LogLevel::kDebug;
    if (name == "info")  return LogLevel::kInfo;
    if (name == "warn")  return LogLevel::kWarn;
    if (name == "error") return LogLevel::kError;
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// DispatchLog
//   hook 디스패치 1회의 결과.
//   mode   : "blocking" | "async" | "enrichment"
//   outcome: "allowed" | "blocked" | "scheduled" | "error"
//   error  : blocking 스크립트가 반환한 error 문자열 (있을 때만)
// ---------------------------------------------------------------------------
struct DispatchLog {
    std::string                    hook_name{};
    std::string                    mode{};
    std::string                    trace_id{};
    std::uint32_t                  script_count{0};
    std::string                    outcome{};
    std::string                    error{};
    Timestamp                      timestamp{};
    std::chrono::microseconds      duration{0};
};

// ---------------------------------------------------------------------------
// ScriptFailureLog
//   스크립트 예외 / 예산 초과 / 잘못된 반환 형태.
//   async hook 의 실패는 이 로그로만 관측된다.
// ---------------------------------------------------------------------------
struct ScriptFailureLog {
    std::string hook_name{};
    std::string script_id{};
    std::string trace_id{};
    std::string reason{};
    Timestamp   timestamp{};
};

// ---------------------------------------------------------------------------
// PermissionDecisionLog
//   check_permission 1회의 판정.
//   result       : "allowed" | "denied" | "error"
//   policy_source: "tuple" | "permission"
// ---------------------------------------------------------------------------
struct PermissionDecisionLog {
    std::string                    subject_type{};
    std::string                    subject_id{};
    std::string                    entity_type{};
    std::string                    entity_id{};
    std::string                    permission{};
    std::string                    result{};
    std::string                    policy_source{};
    Timestamp                      timestamp{};
    std::chrono::microseconds      duration{0};
};
