#include "pipeline/pipeline_dispatcher.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>

#include <boost/asio/co_spawn.hpp>
#include <spdlog/spdlog.h>

namespace {

std::string default_block_message(std::string_view script_id) {
    return "Blocked by pipeline policy (script " + std::string{script_id} + ")";
}

std::string trigger_event_for(const HookDefinition& hook) {
    return std::string{to_string(hook.group)} + "." + hook.name;
}

}  // namespace

// ---------------------------------------------------------------------------
// AsyncBatch
//   async 디스패치 1회에 속한 태스크들의 공유 상태.
//   remaining 이 0 이 되는 태스크가 trace 를 종료한다.
// ---------------------------------------------------------------------------
struct PipelineDispatcher::AsyncBatch {
    std::string                trace_id;
    std::atomic<std::size_t>   remaining;
    std::atomic<std::uint32_t> failures{0};

    AsyncBatch(std::string id, std::size_t count)
        : trace_id(std::move(id)), remaining(count) {}
};

void apply_enrichment(const HookResult& result, Value& target) {
    if (!result.allowed || !result.data || !result.data->is_object()) {
        return;
    }
    if (target.is_null()) {
        target = Value::object();
    }
    if (!target.is_object()) {
        return;
    }
    auto& dest = target.as_object();
    for (const auto& [key, value] : result.data->as_object()) {
        dest.insert_or_assign(key, value);
    }
}

PipelineDispatcher::PipelineDispatcher(const HookRegistry&     registry,
                                       const ScriptRepository& scripts,
                                       SandboxBridge&          bridge,
                                       TraceRecorder&          traces,
                                       EngineStats&            stats,
                                       StructuredLogger*       logger,
                                       asio::any_io_executor   io_executor)
    : registry_(registry)
    , scripts_(scripts)
    , bridge_(bridge)
    , traces_(traces)
    , stats_(stats)
    , logger_(logger)
    , io_executor_(std::move(io_executor))
{}

asio::awaitable<std::expected<HookResult, EngineError>>
PipelineDispatcher::dispatch(std::string hook_name, Value input) {
    const auto started_at = std::chrono::system_clock::now();

    const HookDefinition* hook = registry_.find(hook_name);
    if (hook == nullptr) {
        co_return std::unexpected(make_error(EngineErrorCode::kNotFound,
                                             "unknown hook '" + hook_name + "'", hook_name));
    }
    if (auto valid = registry_.validate_input(hook_name, input); !valid) {
        spdlog::debug("[pipeline] {} input rejected: {}", hook_name, valid.error().message);
        co_return std::unexpected(valid.error());
    }

    auto bindings = scripts_.bindings_for(hook_name);
    std::erase_if(bindings, [](const BoundScript& b) { return !b.enabled; });
    if (bindings.empty()) {
        co_return HookResult{};
    }

    const std::string trace_id = traces_.start_trace(hook->name, trigger_event_for(*hook), started_at);
    const auto        count    = static_cast<std::uint32_t>(bindings.size());

    // -----------------------------------------------------------------------
    // async: 독립 태스크로 띄우고 즉시 반환
    // -----------------------------------------------------------------------
    if (hook->mode == HookMode::kAsync) {
        auto batch = std::make_shared<AsyncBatch>(trace_id, bindings.size());
        for (const auto& binding : bindings) {
            asio::co_spawn(
                io_executor_,
                run_async_binding(*hook, binding, batch, input),
                [hook_name, script_id = binding.script_id](std::exception_ptr eptr) {
                    if (eptr) {
                        try { std::rethrow_exception(eptr); }
                        catch (const std::exception& e) {
                            spdlog::error("[pipeline] async {} script {} exception: {}",
                                          hook_name, script_id, e.what());
                        }
                    }
                });
        }
        stats_.on_async_scheduled();
        finish_dispatch(*hook, trace_id, count, "scheduled", {}, started_at);
        co_return HookResult{};
    }

    // -----------------------------------------------------------------------
    // blocking / enrichment: 순차 실행
    // -----------------------------------------------------------------------
    auto result = co_await run_sequential(*hook, bindings, trace_id, input);
    if (!result) {
        traces_.end_trace(trace_id, TraceOutcome::kError, result.error().message);
        stats_.on_dispatch(Outcome::kError);
        finish_dispatch(*hook, trace_id, count, "error", result.error().message, started_at);
        co_return std::unexpected(result.error());
    }

    if (result->allowed) {
        traces_.end_trace(trace_id, TraceOutcome::kSuccess, {});
        stats_.on_dispatch(Outcome::kAllowed);
        finish_dispatch(*hook, trace_id, count, "allowed", {}, started_at);
    } else {
        const std::string message = result->error.value_or(std::string{});
        traces_.end_trace(trace_id, TraceOutcome::kBlocked, message);
        stats_.on_dispatch(Outcome::kDenied);
        finish_dispatch(*hook, trace_id, count, "blocked", message, started_at);
    }
    co_return result;
}

// ---------------------------------------------------------------------------
// run_sequential
//   blocking 과 enrichment 의 공통 루프. 첫 거부 / 실패에서 중단한다.
// ---------------------------------------------------------------------------
asio::awaitable<std::expected<HookResult, EngineError>>
PipelineDispatcher::run_sequential(const HookDefinition&           hook,
                                   const std::vector<BoundScript>& bindings,
                                   const std::string&              trace_id,
                                   const Value&                    input) {
    Value::Object merged;

    for (const auto& binding : bindings) {
        ExecutionOutcome outcome = co_await execute_binding(hook, binding, trace_id, input);

        if (outcome.pool_error) {
            co_return std::unexpected(*outcome.pool_error);
        }

        if (outcome.failed || !outcome.allowed) {
            HookResult denied;
            denied.allowed = false;
            denied.error   = (outcome.error && !outcome.error->empty())
                                 ? *outcome.error
                                 : default_block_message(binding.script_id);
            co_return denied;
        }

        if (hook.mode == HookMode::kEnrichment && outcome.data) {
            for (auto& [key, value] : outcome.data->as_object()) {
                merged.insert_or_assign(key, std::move(value));
            }
        }
    }

    HookResult result;
    if (hook.mode == HookMode::kEnrichment && !merged.empty()) {
        result.data = Value{std::move(merged)};
    }
    co_return result;
}

asio::awaitable<void>
PipelineDispatcher::run_async_binding(HookDefinition              hook,
                                      BoundScript                 binding,
                                      std::shared_ptr<AsyncBatch> batch,
                                      Value                       input) {
    try {
        ExecutionOutcome outcome = co_await execute_binding(hook, binding, batch->trace_id, input);
        if (outcome.failed) {
            batch->failures.fetch_add(1, std::memory_order_relaxed);
        }
    } catch (const std::exception& e) {
        batch->failures.fetch_add(1, std::memory_order_relaxed);
        spdlog::error("[pipeline] async {} script {} aborted: {}",
                      hook.name, binding.script_id, e.what());
    }

    // 마지막 태스크가 trace 종료
    if (batch->remaining.fetch_sub(1, std::memory_order_acq_rel) == 1) {
        const auto failures = batch->failures.load(std::memory_order_relaxed);
        if (failures == 0) {
            traces_.end_trace(batch->trace_id, TraceOutcome::kSuccess, {});
        } else {
            traces_.end_trace(batch->trace_id, TraceOutcome::kError,
                              std::to_string(failures) + " async script(s) failed");
        }
    }
}

// ---------------------------------------------------------------------------
// execute_binding
//   스크립트 1회 실행 = span 1개. 실패 사유는 span.error 와 script_failure 로그에 남는다.
// ---------------------------------------------------------------------------
asio::awaitable<PipelineDispatcher::ExecutionOutcome>
PipelineDispatcher::execute_binding(const HookDefinition& hook,
                                    const BoundScript&    binding,
                                    const std::string&    trace_id,
                                    const Value&          input) {
    SpanRecord span;
    span.trace_id   = trace_id;
    span.script_id  = binding.script_id;
    span.started_at = std::chrono::system_clock::now();
    span.input      = input;

    ExecutionOutcome outcome;
    const auto script = scripts_.find_script(binding.script_id);

    if (!script) {
        outcome.failed = true;
        outcome.error  = "script '" + binding.script_id + "' not found";
    } else {
        span.script_name = script->name;
        auto result = co_await bridge_.run_hook_script(binding.script_id, script->source_code, input);

        if (!result) {
            outcome.failed = true;
            outcome.error  = result.error().message;
            if (result.error().code == EngineErrorCode::kPoolExhausted) {
                outcome.pool_error = result.error();
            }
        } else if (auto valid = registry_.validate_output(hook, *result); !valid) {
            outcome.failed = true;
            outcome.error  = valid.error().message;
            span.output    = *result;
        } else {
            outcome.allowed = result->find("allowed")->as_bool();
            if (const Value* err = result->find("error"); err != nullptr && err->is_string()) {
                outcome.error = err->as_string();
            }
            if (const Value* data = result->find("data"); data != nullptr && data->is_object()) {
                outcome.data = *data;
            }
            span.output = std::move(*result);
        }
    }

    span.ended_at = std::chrono::system_clock::now();
    if (outcome.failed) {
        span.status = SpanStatus::kError;
        span.error  = outcome.error;
    } else {
        span.status = outcome.allowed ? SpanStatus::kSuccess : SpanStatus::kBlocked;
    }

    if (auto recorded = traces_.record_span(std::move(span)); !recorded) {
        spdlog::warn("[pipeline] failed to record span: {}", recorded.error().message);
    }

    if (outcome.failed) {
        stats_.on_script_failure();
        spdlog::warn("[pipeline] {} script {} failed: {}",
                     hook.name, binding.script_id, outcome.error.value_or(""));
        if (logger_ != nullptr) {
            logger_->log_script_failure(ScriptFailureLog{
                .hook_name = hook.name,
                .script_id = binding.script_id,
                .trace_id  = trace_id,
                .reason    = outcome.error.value_or(""),
                .timestamp = std::chrono::system_clock::now(),
            });
        }
    }
    co_return outcome;
}

void PipelineDispatcher::finish_dispatch(const HookDefinition& hook,
                                         const std::string&    trace_id,
                                         std::uint32_t         script_count,
                                         std::string_view      outcome,
                                         const std::string&    error,
                                         Timestamp             started_at) {
    if (logger_ == nullptr) {
        return;
    }
    const auto now = std::chrono::system_clock::now();
    logger_->log_dispatch(DispatchLog{
        .hook_name    = hook.name,
        .mode         = std::string{to_string(hook.mode)},
        .trace_id     = trace_id,
        .script_count = script_count,
        .outcome      = std::string{outcome},
        .error        = error,
        .timestamp    = now,
        .duration     = std::chrono::duration_cast<std::chrono::microseconds>(now - started_at),
    });
}
