#pragma once

// ---------------------------------------------------------------------------
// structured_logger.hpp
//
// spdlog 기반 구조화 JSON 로거 인터페이스.
//
// [설계 원칙]
// - 싱글턴 금지: 생성자 주입 방식으로 의존성을 명시적으로 표현한다.
//   dispatcher / evaluator 는 StructuredLogger* 를 받으며 nullptr 이면 기록하지 않는다.
// - 고빈도 경로(log_dispatch, log_permission)는 const-ref 파라미터를 사용한다.
//
// [JSON 스키마 일관성]
// 모든 구조체 필드를 snake_case JSON 키로 직렬화한다.
// ---------------------------------------------------------------------------

#include "log_types.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

#include <spdlog/logger.h>

// ---------------------------------------------------------------------------
// StructuredLogger
//   DispatchLog / ScriptFailureLog / PermissionDecisionLog 를 JSON 한 줄로 기록한다.
//   내부 진단용 debug/info/warn/error 메서드도 제공한다.
// ---------------------------------------------------------------------------
class StructuredLogger {
public:
    // 생성자
    //   min_level  : 이 레벨 미만의 로그는 기록하지 않는다.
    //   log_path   : 로그 파일 경로 (디렉터리가 아닌 파일 경로)
    //   logger_name: spdlog 레지스트리 등록 이름 (프로세스 내 유일해야 함)
    //   spdlog 싱크 생성 실패 시 std::runtime_error.
    explicit StructuredLogger(LogLevel                     min_level,
                              const std::filesystem::path& log_path,
                              std::string                  logger_name = "hookwarden");

    ~StructuredLogger();

    StructuredLogger(const StructuredLogger&)            = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;
    StructuredLogger(StructuredLogger&&)                 = delete;
    StructuredLogger& operator=(StructuredLogger&&)      = delete;

    // log_dispatch
    //   hook 디스패치 결과. blocked/error 는 warn, 그 외 info.
    void log_dispatch(const DispatchLog& entry);

    // log_script_failure
    //   스크립트 실패 (warn).
    void log_script_failure(const ScriptFailureLog& entry);

    // log_permission
    //   권한 판정 (info). error 결과는 warn.
    void log_permission(const PermissionDecisionLog& entry);

    void debug(std::string_view msg);
    void info(std::string_view msg);
    void warn(std::string_view msg);
    void error(std::string_view msg);

    // flush
    //   테스트 / 종료 직전 강제 플러시.
    void flush();

    [[nodiscard]] LogLevel min_level() const noexcept { return min_level_; }

private:
    [[nodiscard]] bool enabled(LogLevel level) const noexcept;

    LogLevel                        min_level_;
    std::filesystem::path           log_path_;
    std::string                     logger_name_;
    std::shared_ptr<spdlog::logger> logger_;
};
