#pragma once

// ---------------------------------------------------------------------------
// pipeline_dispatcher.hpp
//
// hook 이름 + 입력을 받아 바인딩된 스크립트를 모드별 규칙으로 실행한다.
//
// [dispatch 흐름]
//   1. hook 조회 (미등록 → kNotFound), 입력 스키마 검사 (위반 → kValidation)
//      실패 시 스크립트 실행 없음, trace 없음.
//   2. enabled 바인딩이 없으면 {allowed:true} (풀 미사용, trace 없음)
//   3. trace 시작 → 모드별 실행 → trace 종료
//
// [모드별 규칙]
//   kBlocking   : ordinal 순 순차 실행. 첫 allowed:false 에서 중단하고 그 error 반환.
//   kAsync      : 바인딩마다 io_context 에 독립 코루틴을 띄우고 즉시 {allowed:true}.
//                 마지막 태스크가 trace 를 종료한다.
//   kEnrichment : 순차 실행, data 를 얕은 병합 (뒤의 키가 이김).
//                 allowed:false 가 나오면 누적 data 를 버리고 false 반환.
//
// [실패 처리]
//   스크립트 예외 / 예산 초과 / 잘못된 반환 / 소스 누락
//     → blocking, enrichment: allowed:false + sandbox 메시지
//     → async: 로그와 span 에만 기록
//   kPoolExhausted 는 거부가 아니라 오류로 호출자에게 전달한다 (재시도 가능).
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "common/value.hpp"
#include "hooks/hook_registry.hpp"
#include "logger/structured_logger.hpp"
#include "pipeline/script_repository.hpp"
#include "sandbox/sandbox_bridge.hpp"
#include "stats/engine_stats.hpp"
#include "trace/trace_recorder.hpp"

#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

struct HookResult {
    bool                       allowed{true};
    std::optional<std::string> error{};
    std::optional<Value>       data{};  // enrichment 전용 (object)
};

// apply_enrichment
//   allowed 이고 data 가 object 일 때만 target 에 얕은 병합한다.
//   target 이 null 이면 object 로 초기화된다.
void apply_enrichment(const HookResult& result, Value& target);

class PipelineDispatcher {
public:
    // 생성자
    //   logger     : nullptr 이면 구조화 로그를 남기지 않는다.
    //   io_executor: async 모드 태스크를 띄울 이벤트 루프 executor
    PipelineDispatcher(const HookRegistry&      registry,
                       const ScriptRepository&  scripts,
                       SandboxBridge&           bridge,
                       TraceRecorder&           traces,
                       EngineStats&             stats,
                       StructuredLogger*        logger,
                       asio::any_io_executor    io_executor);

    PipelineDispatcher(const PipelineDispatcher&)            = delete;
    PipelineDispatcher& operator=(const PipelineDispatcher&) = delete;

    [[nodiscard]] asio::awaitable<std::expected<HookResult, EngineError>>
    dispatch(std::string hook_name, Value input);

private:
    // ExecutionOutcome: 스크립트 1회 실행 결과
    struct ExecutionOutcome {
        bool                       failed{false};   // 예외 / 예산 / 형태 위반 / 소스 누락
        bool                       allowed{false};
        std::optional<std::string> error{};
        std::optional<Value>       data{};
        std::optional<EngineError> pool_error{};    // kPoolExhausted 전파용
    };

    struct AsyncBatch;

    [[nodiscard]] asio::awaitable<ExecutionOutcome>
    execute_binding(const HookDefinition& hook, const BoundScript& binding,
                    const std::string& trace_id, const Value& input);

    [[nodiscard]] asio::awaitable<std::expected<HookResult, EngineError>>
    run_sequential(const HookDefinition& hook, const std::vector<BoundScript>& bindings,
                   const std::string& trace_id, const Value& input);

    [[nodiscard]] asio::awaitable<void>
    run_async_binding(HookDefinition hook, BoundScript binding,
                      std::shared_ptr<AsyncBatch> batch, Value input);

    void finish_dispatch(const HookDefinition& hook, const std::string& trace_id,
                         std::uint32_t script_count, std::string_view outcome,
                         const std::string& error, Timestamp started_at);

    const HookRegistry&      registry_;
    const ScriptRepository&  scripts_;
    SandboxBridge&           bridge_;
    TraceRecorder&           traces_;
    EngineStats&             stats_;
    StructuredLogger*        logger_;
    asio::any_io_executor    io_executor_;
};
