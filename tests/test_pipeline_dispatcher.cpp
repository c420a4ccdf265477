// ---------------------------------------------------------------------------
// test_pipeline_dispatcher.cpp
//
// PipelineDispatcher 단위 테스트.
//
// [테스트 범위]
// - 미등록 hook / 입력 스키마 위반 → 스크립트 실행 없음, trace 없음
// - 바인딩 없음 / 비활성 바인딩 → {allowed:true}, trace 없음
// - blocking: 첫 거부에서 중단, 이후 스크립트 미실행, 거부 error 그대로 반환
// - blocking: 스크립트 오류 / 소스 누락 / 잘못된 반환 → 거부 (fail closed)
// - enrichment: ordinal 순 last-write-wins 병합, 거부 시 누적 data 폐기
// - async: 결과를 기다리지 않고 반환, 마지막 태스크가 trace 종료
// - 풀 고갈은 거부가 아니라 kPoolExhausted 오류
// - EngineStats 카운터
//
// [테스트 패턴]
// - 이벤트 루프와 script executor 모두 로컬 io_context 하나를 사용한다.
//   async 태스크는 dispatch 코루틴이 반환된 뒤에야 실행된다.
// ---------------------------------------------------------------------------

#include "hooks/hook_registry.hpp"
#include "pipeline/pipeline_dispatcher.hpp"
#include "pipeline/script_repository.hpp"
#include "sandbox/interpreter_pool.hpp"
#include "sandbox/sandbox_bridge.hpp"
#include "sandbox/secret_store.hpp"
#include "stats/engine_stats.hpp"
#include "trace/trace_recorder.hpp"

#include <gtest/gtest.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>

#include <exception>
#include <memory>
#include <optional>
#include <string>

namespace {

void rethrow_handler(std::exception_ptr eptr) {
    if (eptr) {
        std::rethrow_exception(eptr);
    }
}

Value signup_input(std::string email) {
    return Value::object({{"email", std::move(email)}, {"name", "Test"}});
}

Value token_input() {
    return Value::object({
        {"user", Value::object({{"id", "u1"}, {"email", "u1@example.com"}})},
        {"token", Value::object({{"sub", "u1"}})},
    });
}

} // namespace

// ---------------------------------------------------------------------------
// Fixture
// ---------------------------------------------------------------------------
class PipelineDispatcherTest : public ::testing::Test {
protected:
    PipelineDispatcherTest() {
        pool_config_.max_size           = 2;
        pool_config_.acquire_timeout_ms = 50;
        sandbox_config_.script_timeout_ms  = 200;
        sandbox_config_.memory_limit_bytes = 4u * 1024u * 1024u;

        pool_   = std::make_unique<InterpreterPool>(pool_config_, sandbox_config_.memory_limit_bytes);
        bridge_ = std::make_unique<SandboxBridge>(*pool_, secrets_, sandbox_config_,
                                                  ioc_.get_executor());
        dispatcher_ = std::make_unique<PipelineDispatcher>(
            hooks_, scripts_, *bridge_, traces_, stats_, nullptr, ioc_.get_executor());
    }

    void add_script(const std::string& hook, const std::string& id, std::string source,
                    std::int32_t ordinal = 0, bool enabled = true) {
        ASSERT_TRUE(scripts_.create_script(id, id, std::move(source)).has_value());
        scripts_.bind(BoundScript{hook, id, ordinal, enabled});
    }

    // dispatch: io_context 를 끝까지 돌린다 (async 태스크 포함)
    std::expected<HookResult, EngineError> dispatch(std::string hook, Value input) {
        std::optional<std::expected<HookResult, EngineError>> out;
        asio::co_spawn(ioc_, [&]() -> asio::awaitable<void> {
            out = co_await dispatcher_->dispatch(hook, input);
        }, rethrow_handler);
        ioc_.run();
        ioc_.restart();
        return std::move(*out);
    }

    std::optional<Trace> last_trace() const {
        auto recent = traces_.recent_traces(1);
        if (recent.empty()) {
            return std::nullopt;
        }
        return recent.front();
    }

    asio::io_context                    ioc_;
    PoolConfig                          pool_config_;
    SandboxConfig                       sandbox_config_;
    HookRegistry                        hooks_;
    InMemoryScriptRepository            scripts_;
    InMemorySecretStore                 secrets_;
    InMemoryTraceRecorder               traces_{4096};
    EngineStats                         stats_;
    std::unique_ptr<InterpreterPool>    pool_;
    std::unique_ptr<SandboxBridge>      bridge_;
    std::unique_ptr<PipelineDispatcher> dispatcher_;
};

// ---------------------------------------------------------------------------
// 사전 검사
// ---------------------------------------------------------------------------
TEST_F(PipelineDispatcherTest, UnknownHook_NotFound) {
    auto result = dispatch("before_teleport", Value::object());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, EngineErrorCode::kNotFound);
    EXPECT_EQ(traces_.trace_count(), 0u);
}

TEST_F(PipelineDispatcherTest, InvalidInput_RejectedWithoutExecution) {
    add_script("before_signup", "never", "error('must not run')");

    auto result = dispatch("before_signup", Value::object({{"name", "no email"}}));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, EngineErrorCode::kValidation);
    EXPECT_EQ(traces_.trace_count(), 0u) << "validation failures must not open a trace";
    EXPECT_EQ(pool_->gauges().created, 0u);
}

TEST_F(PipelineDispatcherTest, NoBindings_AllowedWithoutTrace) {
    auto result = dispatch("before_signup", signup_input("a@example.com"));
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_TRUE(result->allowed);
    EXPECT_FALSE(result->error.has_value());
    EXPECT_EQ(traces_.trace_count(), 0u);
}

TEST_F(PipelineDispatcherTest, DisabledBinding_Skipped) {
    add_script("before_signup", "deny", "return { allowed = false, error = 'x' }", 0, false);

    auto result = dispatch("before_signup", signup_input("a@example.com"));
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->allowed) << "disabled binding must not run";
}

// ---------------------------------------------------------------------------
// blocking
// ---------------------------------------------------------------------------
TEST_F(PipelineDispatcherTest, BlockedDomain_ReturnsScriptError) {
    add_script("before_signup", "domain_filter", R"(
        if helpers.matches(context.email, '@blocked%.com$') then
            return { allowed = false, error = "domain blocked" }
        end
        return { allowed = true }
    )");

    auto blocked = dispatch("before_signup", signup_input("user@blocked.com"));
    ASSERT_TRUE(blocked.has_value()) << blocked.error().message;
    EXPECT_FALSE(blocked->allowed);
    EXPECT_EQ(blocked->error, "domain blocked");

    auto allowed = dispatch("before_signup", signup_input("user@example.com"));
    ASSERT_TRUE(allowed.has_value());
    EXPECT_TRUE(allowed->allowed);

    const auto snap = stats_.snapshot();
    EXPECT_EQ(snap.dispatch.denied, 1u);
    EXPECT_EQ(snap.dispatch.allowed, 1u);
}

TEST_F(PipelineDispatcherTest, Blocking_StopsAtFirstDenial) {
    add_script("before_signup", "first",  "return { allowed = true }", 1);
    add_script("before_signup", "second", "return { allowed = false, error = 'second says no' }", 2);
    add_script("before_signup", "third",  "return { allowed = false, error = 'third says no' }", 3);

    auto result = dispatch("before_signup", signup_input("a@example.com"));
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->allowed);
    EXPECT_EQ(result->error, "second says no");

    const auto trace = last_trace();
    ASSERT_TRUE(trace.has_value());
    EXPECT_EQ(trace->outcome, TraceOutcome::kBlocked);
    EXPECT_EQ(trace->status_message, "second says no");
    EXPECT_EQ(trace->trigger_event, "authentication.before_signup");

    const auto spans = traces_.spans_for(trace->id);
    ASSERT_EQ(spans.size(), 2u) << "third script must never execute";
    EXPECT_EQ(spans[0].script_id, "first");
    EXPECT_EQ(spans[0].status, SpanStatus::kSuccess);
    EXPECT_EQ(spans[1].script_id, "second");
    EXPECT_EQ(spans[1].status, SpanStatus::kBlocked);
}

TEST_F(PipelineDispatcherTest, Blocking_DenialWithoutMessage_UsesDefault) {
    add_script("before_signup", "quiet", "return { allowed = false }");

    auto result = dispatch("before_signup", signup_input("a@example.com"));
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->allowed);
    EXPECT_EQ(result->error, "Blocked by pipeline policy (script quiet)");
}

TEST_F(PipelineDispatcherTest, Blocking_ScriptErrorFailsClosed) {
    add_script("before_signup", "broken", "error('kaboom')");

    auto result = dispatch("before_signup", signup_input("a@example.com"));
    ASSERT_TRUE(result.has_value()) << "script errors are denials, not dispatch errors";
    EXPECT_FALSE(result->allowed);
    ASSERT_TRUE(result->error.has_value());
    EXPECT_NE(result->error->find("kaboom"), std::string::npos) << *result->error;

    const auto trace = last_trace();
    ASSERT_TRUE(trace.has_value());
    const auto spans = traces_.spans_for(trace->id);
    ASSERT_EQ(spans.size(), 1u);
    EXPECT_EQ(spans[0].status, SpanStatus::kError);
    EXPECT_TRUE(spans[0].error.has_value());
    EXPECT_EQ(stats_.snapshot().script_failures, 1u);
}

TEST_F(PipelineDispatcherTest, Blocking_TimeoutFailsClosed) {
    add_script("before_signup", "spin", "while true do end");

    auto result = dispatch("before_signup", signup_input("a@example.com"));
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->allowed);
    EXPECT_EQ(result->error, "script execution timeout");
}

TEST_F(PipelineDispatcherTest, Blocking_MalformedResultFailsClosed) {
    add_script("before_signup", "nil_result", "return nil");

    auto result = dispatch("before_signup", signup_input("a@example.com"));
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->allowed);
    ASSERT_TRUE(result->error.has_value());
    EXPECT_NE(result->error->find("malformed result"), std::string::npos) << *result->error;
}

TEST_F(PipelineDispatcherTest, Blocking_MissingScriptFailsClosed) {
    scripts_.bind(BoundScript{"before_signup", "ghost", 0, true});

    auto result = dispatch("before_signup", signup_input("a@example.com"));
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->allowed);
    EXPECT_EQ(result->error, "script 'ghost' not found");
}

// ---------------------------------------------------------------------------
// enrichment
// ---------------------------------------------------------------------------
TEST_F(PipelineDispatcherTest, Enrichment_LastWriteWinsInOrdinalOrder) {
    add_script("token_build", "late",  "return { allowed = true, data = { plan = 'pro' } }", 20);
    add_script("token_build", "early", "return { allowed = true, data = { plan = 'free', org = 'acme' } }", 10);

    auto result = dispatch("token_build", token_input());
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_TRUE(result->allowed);
    ASSERT_TRUE(result->data.has_value());
    EXPECT_EQ(*result->data, Value::object({{"org", "acme"}, {"plan", "pro"}}));
}

TEST_F(PipelineDispatcherTest, Enrichment_DenialDiscardsAccumulatedData) {
    add_script("token_build", "adds",   "return { allowed = true, data = { org = 'acme' } }", 1);
    add_script("token_build", "vetoes", "return { allowed = false }", 2);

    auto result = dispatch("token_build", token_input());
    ASSERT_TRUE(result.has_value());
    EXPECT_FALSE(result->allowed);
    EXPECT_FALSE(result->data.has_value()) << "accumulated data must be discarded";
}

TEST_F(PipelineDispatcherTest, ApplyEnrichment_MergesOnlyWhenAllowed) {
    Value claims = Value::object({{"sub", "u1"}, {"plan", "free"}});

    HookResult denied;
    denied.allowed = false;
    denied.data    = Value::object({{"plan", "pro"}});
    apply_enrichment(denied, claims);
    EXPECT_EQ(claims.string_or("plan", ""), "free");

    HookResult allowed;
    allowed.data = Value::object({{"plan", "pro"}, {"org", "acme"}});
    apply_enrichment(allowed, claims);
    EXPECT_EQ(claims, Value::object({{"sub", "u1"}, {"plan", "pro"}, {"org", "acme"}}));

    Value empty;
    apply_enrichment(allowed, empty);
    EXPECT_TRUE(empty.is_object());
}

// ---------------------------------------------------------------------------
// async
// ---------------------------------------------------------------------------
TEST_F(PipelineDispatcherTest, Async_ReturnsBeforeScriptsComplete) {
    add_script("after_signup", "audit", "return { allowed = true }");
    add_script("after_signup", "notify", "return { allowed = true }", 1);

    std::optional<std::expected<HookResult, EngineError>> out;
    std::size_t spans_at_return = 99;
    TraceOutcome outcome_at_return = TraceOutcome::kSuccess;

    Value input = Value::object({{"user", Value::object({{"id", "u1"}})}});
    asio::co_spawn(ioc_, [&]() -> asio::awaitable<void> {
        out = co_await dispatcher_->dispatch("after_signup", input);
        const auto trace  = last_trace();
        spans_at_return   = trace ? traces_.spans_for(trace->id).size() : 0;
        outcome_at_return = trace ? trace->outcome : TraceOutcome::kError;
    }, rethrow_handler);
    ioc_.run();

    ASSERT_TRUE(out.has_value());
    ASSERT_TRUE(out->has_value());
    EXPECT_TRUE((*out)->allowed);
    EXPECT_EQ(spans_at_return, 0u) << "dispatch must not wait for async scripts";
    EXPECT_EQ(outcome_at_return, TraceOutcome::kRunning);

    const auto trace = last_trace();
    ASSERT_TRUE(trace.has_value());
    EXPECT_EQ(trace->outcome, TraceOutcome::kSuccess) << "last task closes the trace";
    EXPECT_EQ(traces_.spans_for(trace->id).size(), 2u);
    EXPECT_EQ(stats_.snapshot().async_scheduled, 1u);
}

TEST_F(PipelineDispatcherTest, Async_FailureRecordedNotReturned) {
    add_script("after_signup", "crash", "error('async boom')");

    auto result = dispatch("after_signup", Value::object({{"user", Value::object({{"id", "u1"}})}}));
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->allowed) << "async failures never reach the caller";

    const auto trace = last_trace();
    ASSERT_TRUE(trace.has_value());
    EXPECT_EQ(trace->outcome, TraceOutcome::kError);
    EXPECT_EQ(trace->status_message, "1 async script(s) failed");
    EXPECT_EQ(stats_.snapshot().script_failures, 1u);
}

// ---------------------------------------------------------------------------
// PoolExhausted_IsErrorNotDenial
// ---------------------------------------------------------------------------
TEST_F(PipelineDispatcherTest, PoolExhausted_IsErrorNotDenial) {
    add_script("before_signup", "ok", "return { allowed = true }");

    std::optional<std::expected<HookResult, EngineError>> out;
    asio::co_spawn(ioc_, [&]() -> asio::awaitable<void> {
        auto a = co_await pool_->acquire();
        auto b = co_await pool_->acquire();
        EXPECT_TRUE(a.has_value() && b.has_value());
        out = co_await dispatcher_->dispatch("before_signup", signup_input("a@example.com"));
    }, rethrow_handler);
    ioc_.run();

    ASSERT_TRUE(out.has_value());
    ASSERT_FALSE(out->has_value());
    EXPECT_EQ(out->error().code, EngineErrorCode::kPoolExhausted);

    const auto trace = last_trace();
    ASSERT_TRUE(trace.has_value());
    EXPECT_EQ(trace->outcome, TraceOutcome::kError);
    EXPECT_EQ(stats_.snapshot().dispatch.errors, 1u);
}
