#include "trace/trace_recorder.hpp"

#include <algorithm>
#include <chrono>
#include <mutex>

#include <spdlog/spdlog.h>

InMemoryTraceRecorder::InMemoryTraceRecorder(std::size_t max_io_bytes)
    : max_io_bytes_(max_io_bytes)
{}

std::string InMemoryTraceRecorder::start_trace(std::string_view hook_name,
                                               std::string_view trigger_event,
                                               Timestamp        started_at) {
    std::unique_lock lock(mutex_);
    std::string id = "trc_" + std::to_string(next_trace_++);

    Trace trace;
    trace.id            = id;
    trace.hook_name     = std::string{hook_name};
    trace.trigger_event = std::string{trigger_event};
    trace.started_at    = started_at;
    traces_.emplace(id, std::move(trace));
    spans_[id];
    return id;
}

std::expected<std::string, EngineError> InMemoryTraceRecorder::record_span(SpanRecord record) {
    // 직렬화는 lock 밖에서
    std::string input  = record.input.to_json_truncated(max_io_bytes_);
    std::string output = record.output ? record.output->to_json_truncated(max_io_bytes_)
                                       : std::string{};
    std::optional<std::string> error;
    if (record.error) {
        error = truncate_text(*record.error, max_io_bytes_);
    }

    std::unique_lock lock(mutex_);
    const auto it = spans_.find(record.trace_id);
    if (it == spans_.end()) {
        return std::unexpected(make_error(EngineErrorCode::kNotFound,
                                          "trace '" + record.trace_id + "' not found",
                                          record.trace_id));
    }

    Span span;
    span.id          = "spn_" + std::to_string(next_span_++);
    span.trace_id    = std::move(record.trace_id);
    span.script_id   = std::move(record.script_id);
    span.script_name = std::move(record.script_name);
    span.started_at  = record.started_at;
    span.ended_at    = record.ended_at;
    span.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                           record.ended_at - record.started_at).count();
    span.status      = record.status;
    span.input       = std::move(input);
    span.output      = std::move(output);
    span.error       = std::move(error);

    std::string id = span.id;
    it->second.push_back(std::move(span));
    return id;
}

bool InMemoryTraceRecorder::end_trace(std::string_view trace_id, TraceOutcome outcome,
                                      std::string status_message) {
    std::unique_lock lock(mutex_);
    const auto it = traces_.find(trace_id);
    if (it == traces_.end() || it->second.ended_at.has_value()) {
        return false;
    }
    it->second.ended_at       = std::chrono::system_clock::now();
    it->second.outcome        = outcome;
    it->second.status_message = truncate_text(status_message, max_io_bytes_);
    return true;
}

CleanupResult InMemoryTraceRecorder::cleanup(Timestamp cutoff) {
    CleanupResult result;
    {
        std::unique_lock lock(mutex_);

        // 1. 오래된 span
        for (auto& [trace_id, spans] : spans_) {
            result.deleted_spans += std::erase_if(spans, [cutoff](const Span& s) {
                return s.started_at < cutoff;
            });
        }

        // 2. span 이 남지 않은 오래된 trace (진행 중인 trace 는 제외)
        for (auto it = traces_.begin(); it != traces_.end();) {
            const auto span_it = spans_.find(it->first);
            const bool no_spans = span_it == spans_.end() || span_it->second.empty();
            const bool ended    = it->second.ended_at.has_value();
            if (ended && no_spans && it->second.started_at < cutoff) {
                if (span_it != spans_.end()) {
                    spans_.erase(span_it);
                }
                it = traces_.erase(it);
                ++result.deleted_traces;
            } else {
                ++it;
            }
        }
    }

    spdlog::info("[trace] cleanup cutoff_ms={} deleted_spans={} deleted_traces={}",
                 to_epoch_ms(cutoff), result.deleted_spans, result.deleted_traces);
    return result;
}

std::optional<Trace> InMemoryTraceRecorder::find_trace(std::string_view trace_id) const {
    std::shared_lock lock(mutex_);
    const auto it = traces_.find(trace_id);
    if (it == traces_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Span> InMemoryTraceRecorder::spans_for(std::string_view trace_id) const {
    std::vector<Span> out;
    {
        std::shared_lock lock(mutex_);
        const auto it = spans_.find(trace_id);
        if (it == spans_.end()) {
            return out;
        }
        out = it->second;
    }
    std::stable_sort(out.begin(), out.end(), [](const Span& a, const Span& b) {
        return a.started_at < b.started_at;
    });
    return out;
}

std::vector<Trace> InMemoryTraceRecorder::recent_traces(std::size_t limit) const {
    std::vector<Trace> out;
    {
        std::shared_lock lock(mutex_);
        out.reserve(traces_.size());
        for (const auto& [id, trace] : traces_) {
            out.push_back(trace);
        }
    }
    std::sort(out.begin(), out.end(), [](const Trace& a, const Trace& b) {
        return a.started_at > b.started_at;
    });
    if (out.size() > limit) {
        out.resize(limit);
    }
    return out;
}

std::size_t InMemoryTraceRecorder::trace_count() const {
    std::shared_lock lock(mutex_);
    return traces_.size();
}

std::size_t InMemoryTraceRecorder::span_count() const {
    std::shared_lock lock(mutex_);
    std::size_t total = 0;
    for (const auto& [id, spans] : spans_) {
        total += spans.size();
    }
    return total;
}
