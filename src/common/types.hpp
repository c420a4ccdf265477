#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// Timestamp
//   엔진 전역에서 사용하는 시각 타입. 레코드의 created_at / started_at 등.
// ---------------------------------------------------------------------------
using Timestamp = std::chrono::system_clock::time_point;

// ---------------------------------------------------------------------------
// EngineErrorCode
//   hook 디스패치 / 권한 평가 단계에서 발생 가능한 오류 분류.
//
//   kValidation    : hook 입력 / 권한 스키마 불일치 (호출자 책임, 스크립트 미실행)
//   kSandbox       : 스크립트 예외, 잘못된 반환 형태, 시간/명령/메모리 예산 초과
//   kPoolExhausted : acquire 타임아웃 내 인터프리터 없음 (일시적, 재시도 가능)
//   kModel         : 존재하지 않는 relation 참조 또는 순환 상속 (쓰기 시점 거부)
//   kAuditWrite    : 감사 로그 기록 실패 (호출자에게 전파 금지)
//   kNotFound      : 미등록 hook / 모델 / 스크립트
//   kInternal      : 그 외 내부 오류
// ---------------------------------------------------------------------------
enum class EngineErrorCode : std::uint8_t {
    kValidation    = 0,
    kSandbox       = 1,
    kPoolExhausted = 2,
    kModel         = 3,
    kAuditWrite    = 4,
    kNotFound      = 5,
    kInternal      = 6,
};

// ---------------------------------------------------------------------------
// EngineError
//   실패 시 반환되는 오류 정보.
//   std::expected<T, EngineError> 패턴과 함께 사용한다.
// ---------------------------------------------------------------------------
struct EngineError {
    EngineErrorCode code{EngineErrorCode::kInternal};
    std::string     message{};  // 사람이 읽을 수 있는 오류 설명
    std::string     context{};  // 오류 발생 위치 (hook 이름, script id 등 로깅용)
};

// ---------------------------------------------------------------------------
// error_code_name
//   로그/제어 소켓 응답용 문자열 변환.
// ---------------------------------------------------------------------------
[[nodiscard]] constexpr std::string_view error_code_name(EngineErrorCode code) noexcept {
    switch (code) {
        case EngineErrorCode::kValidation:    return "validation_error";
        case EngineErrorCode::kSandbox:       return "sandbox_error";
        case EngineErrorCode::kPoolExhausted: return "pool_exhausted";
        case EngineErrorCode::kModel:         return "model_error";
        case EngineErrorCode::kAuditWrite:    return "audit_write_error";
        case EngineErrorCode::kNotFound:      return "not_found";
        case EngineErrorCode::kInternal:      return "internal_error";
    }
    return "internal_error";
}

// ---------------------------------------------------------------------------
// make_error
//   EngineError 생성 헬퍼.
// ---------------------------------------------------------------------------
[[nodiscard]] inline EngineError make_error(EngineErrorCode code,
                                            std::string     message,
                                            std::string     context = {}) {
    return EngineError{code, std::move(message), std::move(context)};
}

// ---------------------------------------------------------------------------
// to_epoch_ms
//   Timestamp → Unix epoch 밀리초 (직렬화용).
// ---------------------------------------------------------------------------
[[nodiscard]] inline std::int64_t to_epoch_ms(Timestamp tp) noexcept {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count();
}
