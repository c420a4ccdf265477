#pragma once

// ---------------------------------------------------------------------------
// audit_log.hpp
//
// 권한 평가 감사 로그 (append-only, best-effort).
//
// append 실패는 EngineError{kAuditWrite} 로 보고되지만 PermissionEvaluator 는
// 경고 로그만 남기고 판정을 그대로 반환한다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "common/value.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <expected>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class PolicySource : std::uint8_t {
    kTuple      = 0,  // relation 검사만으로 판정
    kPermission = 1,  // permission 정책 스크립트까지 평가
};

enum class AuditResult : std::uint8_t {
    kAllowed = 0,
    kDenied  = 1,
    kError   = 2,
};

[[nodiscard]] constexpr std::string_view to_string(PolicySource source) noexcept {
    return source == PolicySource::kPermission ? "permission" : "tuple";
}

[[nodiscard]] constexpr std::string_view to_string(AuditResult result) noexcept {
    switch (result) {
        case AuditResult::kAllowed: return "allowed";
        case AuditResult::kDenied:  return "denied";
        case AuditResult::kError:   return "error";
    }
    return "error";
}

struct AuditLogEntry {
    std::string                entity_type{};
    std::string                entity_id{};
    std::string                permission{};
    std::string                subject_type{};
    std::string                subject_id{};
    PolicySource               policy_source{PolicySource::kTuple};
    AuditResult                result{AuditResult::kDenied};
    std::optional<std::string> error_message{};
    Value                      context_snapshot{};
    double                     execution_time_ms{0.0};
    Timestamp                  created_at{};
};

class AuditLog {
public:
    virtual ~AuditLog() = default;

    [[nodiscard]] virtual std::expected<void, EngineError> append(AuditLogEntry entry) = 0;

    // recent
    //   최신 항목부터 최대 limit 개.
    [[nodiscard]] virtual std::vector<AuditLogEntry> recent(std::size_t limit) const = 0;
};

// ---------------------------------------------------------------------------
// InMemoryAuditLog
//   최대 capacity 개를 보관하고 초과 시 가장 오래된 항목부터 버린다.
// ---------------------------------------------------------------------------
class InMemoryAuditLog final : public AuditLog {
public:
    explicit InMemoryAuditLog(std::size_t capacity = 10000);

    [[nodiscard]] std::expected<void, EngineError> append(AuditLogEntry entry) override;

    [[nodiscard]] std::vector<AuditLogEntry> recent(std::size_t limit) const override;

    [[nodiscard]] std::size_t size() const;

private:
    std::size_t               capacity_;
    mutable std::mutex        mutex_;
    std::deque<AuditLogEntry> entries_;
};
