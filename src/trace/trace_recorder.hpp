#pragma once

// ---------------------------------------------------------------------------
// trace_recorder.hpp
//
// hook 디스패치 1회 = Trace 1개, 스크립트 실행 1회 = Span 1개.
// Span 은 trace 당 평면 목록이며 started_at 순으로 조회된다.
//
// [I/O 저장 규칙]
// - input / output 은 compact JSON 으로 저장하고 max_io_bytes 를 넘으면
//   "...(truncated N bytes)" 표식과 함께 자른다.
//
// [보존 정리 (cleanup)]
// - started_at < cutoff 인 span 을 먼저 지우고,
//   남은 span 이 없고 started_at < cutoff 인 종료된 trace 를 지운다.
//   아직 end_trace 되지 않은 trace 는 남긴다 (이후 record_span / end_trace 가 유효).
// - 하나의 lock 안에서 수행하므로 중간 상태(고아 span)는 관측되지 않는다.
// - 스스로 스케줄링하지 않는다. 외부 스케줄러가 제어 소켓 cleanup 으로 호출한다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "common/value.hpp"

#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

enum class SpanStatus : std::uint8_t {
    kSuccess = 0,
    kBlocked = 1,
    kError   = 2,
};

enum class TraceOutcome : std::uint8_t {
    kRunning = 0,
    kSuccess = 1,
    kBlocked = 2,
    kError   = 3,
};

[[nodiscard]] constexpr std::string_view to_string(SpanStatus status) noexcept {
    switch (status) {
        case SpanStatus::kSuccess: return "success";
        case SpanStatus::kBlocked: return "blocked";
        case SpanStatus::kError:   return "error";
    }
    return "error";
}

[[nodiscard]] constexpr std::string_view to_string(TraceOutcome outcome) noexcept {
    switch (outcome) {
        case TraceOutcome::kRunning: return "running";
        case TraceOutcome::kSuccess: return "success";
        case TraceOutcome::kBlocked: return "blocked";
        case TraceOutcome::kError:   return "error";
    }
    return "error";
}

struct Trace {
    std::string              id{};
    std::string              hook_name{};
    std::string              trigger_event{};
    Timestamp                started_at{};
    std::optional<Timestamp> ended_at{};
    TraceOutcome             outcome{TraceOutcome::kRunning};
    std::string              status_message{};
};

struct Span {
    std::string                id{};
    std::string                trace_id{};
    std::string                script_id{};
    std::string                script_name{};
    Timestamp                  started_at{};
    Timestamp                  ended_at{};
    std::int64_t               duration_ms{0};
    SpanStatus                 status{SpanStatus::kSuccess};
    std::string                input{};   // 잘린 JSON
    std::string                output{};  // 잘린 JSON (오류 시 빈 문자열)
    std::optional<std::string> error{};
};

// SpanRecord: record_span 입력
struct SpanRecord {
    std::string                trace_id{};
    std::string                script_id{};
    std::string                script_name{};
    Timestamp                  started_at{};
    Timestamp                  ended_at{};
    SpanStatus                 status{SpanStatus::kSuccess};
    Value                      input{};
    std::optional<Value>       output{};
    std::optional<std::string> error{};
};

struct CleanupResult {
    std::uint64_t deleted_spans{0};
    std::uint64_t deleted_traces{0};
};

// ---------------------------------------------------------------------------
// TraceRecorder (추상 인터페이스)
// ---------------------------------------------------------------------------
class TraceRecorder {
public:
    virtual ~TraceRecorder() = default;

    [[nodiscard]] virtual std::string start_trace(std::string_view hook_name,
                                                  std::string_view trigger_event,
                                                  Timestamp        started_at) = 0;

    [[nodiscard]] std::string start_trace(std::string_view hook_name,
                                          std::string_view trigger_event) {
        return start_trace(hook_name, trigger_event, std::chrono::system_clock::now());
    }

    // record_span
    //   미등록 trace → kNotFound. 성공 시 span id.
    [[nodiscard]] virtual std::expected<std::string, EngineError> record_span(SpanRecord record) = 0;

    // end_trace
    //   이미 종료되었거나 미등록이면 false.
    virtual bool end_trace(std::string_view trace_id, TraceOutcome outcome,
                           std::string status_message) = 0;

    [[nodiscard]] virtual CleanupResult cleanup(Timestamp cutoff) = 0;

    [[nodiscard]] virtual std::optional<Trace> find_trace(std::string_view trace_id) const = 0;
    [[nodiscard]] virtual std::vector<Span>    spans_for(std::string_view trace_id) const = 0;
    [[nodiscard]] virtual std::vector<Trace>   recent_traces(std::size_t limit) const = 0;
};

// ---------------------------------------------------------------------------
// InMemoryTraceRecorder
// ---------------------------------------------------------------------------
class InMemoryTraceRecorder final : public TraceRecorder {
public:
    explicit InMemoryTraceRecorder(std::size_t max_io_bytes);

    using TraceRecorder::start_trace;

    [[nodiscard]] std::string start_trace(std::string_view hook_name,
                                          std::string_view trigger_event,
                                          Timestamp        started_at) override;

    [[nodiscard]] std::expected<std::string, EngineError> record_span(SpanRecord record) override;

    bool end_trace(std::string_view trace_id, TraceOutcome outcome,
                   std::string status_message) override;

    [[nodiscard]] CleanupResult cleanup(Timestamp cutoff) override;

    [[nodiscard]] std::optional<Trace> find_trace(std::string_view trace_id) const override;
    [[nodiscard]] std::vector<Span>    spans_for(std::string_view trace_id) const override;
    [[nodiscard]] std::vector<Trace>   recent_traces(std::size_t limit) const override;

    [[nodiscard]] std::size_t trace_count() const;
    [[nodiscard]] std::size_t span_count() const;

private:
    std::size_t                                              max_io_bytes_;
    mutable std::shared_mutex                                mutex_;
    std::map<std::string, Trace, std::less<>>                traces_;
    std::map<std::string, std::vector<Span>, std::less<>>    spans_;  // trace_id → spans
    std::uint64_t                                            next_trace_{1};
    std::uint64_t                                            next_span_{1};
};
