// ---------------------------------------------------------------------------
// test_trace_recorder.cpp
//
// InMemoryTraceRecorder 단위 테스트.
//
// [테스트 범위]
// - start / record_span / end_trace 생명주기, 중복 종료 거부
// - 미등록 trace 에 span 기록 → kNotFound
// - span 은 started_at 순 조회, I/O 는 max_io_bytes 로 잘림
// - cleanup: 오래된 span 먼저, span 이 남지 않은 오래된 종료 trace 만 삭제,
//   진행 중 trace 보존
// - recent_traces: 최신순 limit
// ---------------------------------------------------------------------------

#include "trace/trace_recorder.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>

namespace {

using namespace std::chrono_literals;

SpanRecord span_at(const std::string& trace_id, Timestamp started, std::string script_id = "s1") {
    SpanRecord record;
    record.trace_id    = trace_id;
    record.script_id   = script_id;
    record.script_name = std::move(script_id);
    record.started_at  = started;
    record.ended_at    = started + 5ms;
    record.input       = Value::object({{"email", "a@b.com"}});
    record.output      = Value::object({{"allowed", true}});
    return record;
}

} // namespace

// ---------------------------------------------------------------------------
// 생명주기
// ---------------------------------------------------------------------------
TEST(TraceRecorder, Lifecycle) {
    InMemoryTraceRecorder recorder{4096};
    const auto now = std::chrono::system_clock::now();

    const std::string id = recorder.start_trace("before_signup", "authentication.before_signup", now);
    auto running = recorder.find_trace(id);
    ASSERT_TRUE(running.has_value());
    EXPECT_EQ(running->outcome, TraceOutcome::kRunning);
    EXPECT_FALSE(running->ended_at.has_value());

    auto span_id = recorder.record_span(span_at(id, now));
    ASSERT_TRUE(span_id.has_value()) << span_id.error().message;

    EXPECT_TRUE(recorder.end_trace(id, TraceOutcome::kBlocked, "domain blocked"));
    EXPECT_FALSE(recorder.end_trace(id, TraceOutcome::kSuccess, "")) << "trace ends only once";

    const auto ended = recorder.find_trace(id);
    ASSERT_TRUE(ended.has_value());
    EXPECT_EQ(ended->outcome, TraceOutcome::kBlocked);
    EXPECT_EQ(ended->status_message, "domain blocked");
    EXPECT_TRUE(ended->ended_at.has_value());

    const auto spans = recorder.spans_for(id);
    ASSERT_EQ(spans.size(), 1u);
    EXPECT_EQ(spans[0].id, *span_id);
    EXPECT_EQ(spans[0].duration_ms, 5);
    EXPECT_EQ(spans[0].input, R"({"email":"a@b.com"})");
    EXPECT_EQ(spans[0].output, R"({"allowed":true})");
}

TEST(TraceRecorder, SpanForUnknownTrace_NotFound) {
    InMemoryTraceRecorder recorder{4096};
    auto result = recorder.record_span(span_at("trc_404", std::chrono::system_clock::now()));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, EngineErrorCode::kNotFound);
    EXPECT_FALSE(recorder.end_trace("trc_404", TraceOutcome::kError, "x"));
}

TEST(TraceRecorder, SpansOrderedByStart) {
    InMemoryTraceRecorder recorder{4096};
    const auto now = std::chrono::system_clock::now();
    const auto id  = recorder.start_trace("after_signup", "authentication.after_signup", now);

    ASSERT_TRUE(recorder.record_span(span_at(id, now + 20ms, "late")).has_value());
    ASSERT_TRUE(recorder.record_span(span_at(id, now + 10ms, "early")).has_value());

    const auto spans = recorder.spans_for(id);
    ASSERT_EQ(spans.size(), 2u);
    EXPECT_EQ(spans[0].script_id, "early");
    EXPECT_EQ(spans[1].script_id, "late");
}

TEST(TraceRecorder, LargeIoTruncated) {
    InMemoryTraceRecorder recorder{32};
    const auto now = std::chrono::system_clock::now();
    const auto id  = recorder.start_trace("before_signup", "authentication.before_signup", now);

    auto record  = span_at(id, now);
    record.input = Value::object({{"blob", std::string(200, 'x')}});
    record.output.reset();
    record.error  = std::string(100, 'e');
    record.status = SpanStatus::kError;
    ASSERT_TRUE(recorder.record_span(std::move(record)).has_value());

    const auto spans = recorder.spans_for(id);
    ASSERT_EQ(spans.size(), 1u);
    EXPECT_NE(spans[0].input.find("...(truncated"), std::string::npos) << spans[0].input;
    EXPECT_TRUE(spans[0].output.empty());
    ASSERT_TRUE(spans[0].error.has_value());
    EXPECT_NE(spans[0].error->find("...(truncated"), std::string::npos);
}

// ---------------------------------------------------------------------------
// cleanup
// ---------------------------------------------------------------------------

// Cleanup_OldSpanOfRecentTrace
//   span 은 cutoff 이전, trace 의 started_at 은 cutoff 이후.
//   span 만 삭제되고 trace 는 남는다.
TEST(TraceRecorder, Cleanup_OldSpanOfRecentTrace) {
    InMemoryTraceRecorder recorder{4096};
    const auto cutoff = std::chrono::system_clock::now();

    const auto id = recorder.start_trace("before_signup", "authentication.before_signup",
                                         cutoff + 1s);
    ASSERT_TRUE(recorder.record_span(span_at(id, cutoff - 1s)).has_value());

    const auto result = recorder.cleanup(cutoff);
    EXPECT_EQ(result.deleted_spans, 1u);
    EXPECT_EQ(result.deleted_traces, 0u);
    EXPECT_TRUE(recorder.find_trace(id).has_value());
    EXPECT_TRUE(recorder.spans_for(id).empty());
}

TEST(TraceRecorder, Cleanup_RemovesOldTracesWithoutSpans) {
    InMemoryTraceRecorder recorder{4096};
    const auto cutoff = std::chrono::system_clock::now();

    const auto old_id   = recorder.start_trace("before_signup", "authentication.before_signup",
                                               cutoff - 1h);
    const auto mixed_id = recorder.start_trace("token_build", "apikey.token_build", cutoff - 1h);
    const auto new_id   = recorder.start_trace("after_signup", "authentication.after_signup",
                                               cutoff + 1s);
    ASSERT_TRUE(recorder.record_span(span_at(old_id, cutoff - 1h)).has_value());
    ASSERT_TRUE(recorder.record_span(span_at(mixed_id, cutoff - 1h)).has_value());
    ASSERT_TRUE(recorder.record_span(span_at(mixed_id, cutoff + 1s)).has_value());
    for (const auto& id : {old_id, mixed_id, new_id}) {
        ASSERT_TRUE(recorder.end_trace(id, TraceOutcome::kSuccess, ""));
    }

    const auto result = recorder.cleanup(cutoff);
    EXPECT_EQ(result.deleted_spans, 2u);
    EXPECT_EQ(result.deleted_traces, 1u);

    EXPECT_FALSE(recorder.find_trace(old_id).has_value());
    EXPECT_TRUE(recorder.find_trace(mixed_id).has_value()) << "trace still has a recent span";
    EXPECT_EQ(recorder.spans_for(mixed_id).size(), 1u);
    EXPECT_TRUE(recorder.find_trace(new_id).has_value());
    EXPECT_EQ(recorder.trace_count(), 2u);
    EXPECT_EQ(recorder.span_count(), 1u);

    const auto again = recorder.cleanup(cutoff);
    EXPECT_EQ(again.deleted_spans, 0u);
    EXPECT_EQ(again.deleted_traces, 0u);
}

// Cleanup_KeepsInFlightTrace
//   cutoff 이전에 시작했지만 아직 첫 span 도 없고 종료되지 않은 trace 는 남는다.
TEST(TraceRecorder, Cleanup_KeepsInFlightTrace) {
    InMemoryTraceRecorder recorder{4096};
    const auto cutoff = std::chrono::system_clock::now();

    const auto running = recorder.start_trace("after_signup", "authentication.after_signup",
                                              cutoff - 1h);
    const auto result  = recorder.cleanup(cutoff);
    EXPECT_EQ(result.deleted_traces, 0u);

    ASSERT_TRUE(recorder.record_span(span_at(running, cutoff + 1s)).has_value());
    EXPECT_TRUE(recorder.end_trace(running, TraceOutcome::kSuccess, ""));

    const auto later = recorder.cleanup(cutoff + 1h);
    EXPECT_EQ(later.deleted_spans, 1u);
    EXPECT_EQ(later.deleted_traces, 1u) << "ended trace is eligible once its spans are gone";
}

// ---------------------------------------------------------------------------
// recent_traces
// ---------------------------------------------------------------------------
TEST(TraceRecorder, RecentTraces_NewestFirst) {
    InMemoryTraceRecorder recorder{4096};
    const auto now = std::chrono::system_clock::now();
    const auto a = recorder.start_trace("h", "g.h", now - 2s);
    const auto b = recorder.start_trace("h", "g.h", now);
    const auto c = recorder.start_trace("h", "g.h", now - 1s);

    const auto recent = recorder.recent_traces(2);
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_EQ(recent[0].id, b);
    EXPECT_EQ(recent[1].id, c);
    EXPECT_NE(recent[1].id, a);
}
