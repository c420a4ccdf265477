// ---------------------------------------------------------------------------
// structured_logger.cpp
//
// spdlog 기반 구조화 JSON 로거 구현.
// ---------------------------------------------------------------------------

#include "logger/structured_logger.hpp"

#include "common/value.hpp"  // json_escape

#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <spdlog/common.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

namespace {

// ---------------------------------------------------------------------------
// Helper: ISO8601 timestamp 포맷 (UTC, 밀리초)
// ---------------------------------------------------------------------------
std::string format_iso8601(const Timestamp& tp) {
    const auto duration = tp.time_since_epoch();
    const auto seconds  = std::chrono::duration_cast<std::chrono::seconds>(duration);
    const auto millis   = std::chrono::duration_cast<std::chrono::milliseconds>(duration) - seconds;

    const std::time_t time_t_val = std::chrono::system_clock::to_time_t(tp);
    std::tm           tm_val{};
    gmtime_r(&time_t_val, &tm_val);

    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0')
        << std::setw(3) << millis.count() << 'Z';
    return oss.str();
}

spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::kTrace: return spdlog::level::trace;
        case LogLevel::kDebug: return spdlog::level::debug;
        case LogLevel::kInfo:  return spdlog::level::info;
        case LogLevel::kWarn:  return spdlog::level::warn;
        case LogLevel::kError: return spdlog::level::err;
    }
    return spdlog::level::info;
}

}  // namespace

// ---------------------------------------------------------------------------
// StructuredLogger 생성자
// ---------------------------------------------------------------------------
StructuredLogger::StructuredLogger(LogLevel                     min_level,
                                   const std::filesystem::path& log_path,
                                   std::string                  logger_name)
    : min_level_(min_level)
    , log_path_(log_path)
    , logger_name_(std::move(logger_name))
{
    try {
        if (log_path_.has_parent_path()) {
            std::filesystem::create_directories(log_path_.parent_path());
        }

        // 싱크: stdout + rotating file
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_sink_mt>());

        // Rotating file sink (50MB, 5개 파일 유지)
        constexpr std::size_t kMaxFileSize = 50u * 1024u * 1024u;
        constexpr std::size_t kMaxFiles    = 5;
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_path_.string(), kMaxFileSize, kMaxFiles));

        logger_ = std::make_shared<spdlog::logger>(logger_name_, sinks.begin(), sinks.end());
        logger_->set_level(to_spdlog_level(min_level_));

        // 구조화 로그는 각 메서드에서 JSON 본문을 만든다. 패턴은 메시지 그대로.
        logger_->set_pattern("%v");
        logger_->flush_on(spdlog::level::warn);

        spdlog::register_logger(logger_);
    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    } catch (const std::filesystem::filesystem_error& ex) {
        throw std::runtime_error(std::string("Logger directory creation failed: ") + ex.what());
    }
}

StructuredLogger::~StructuredLogger() {
    if (logger_) {
        logger_->flush();
        spdlog::drop(logger_name_);
    }
}

bool StructuredLogger::enabled(LogLevel level) const noexcept {
    return logger_ && static_cast<int>(level) >= static_cast<int>(min_level_);
}

// ---------------------------------------------------------------------------
// log_dispatch: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::log_dispatch(const DispatchLog& entry) {
    const bool degraded = entry.outcome == "blocked" || entry.outcome == "error";
    if (!enabled(degraded ? LogLevel::kWarn : LogLevel::kInfo)) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":"hook_dispatch","hook":")" << json_escape(entry.hook_name)
         << R"(","mode":")" << json_escape(entry.mode)
         << R"(","trace_id":")" << json_escape(entry.trace_id)
         << R"(","script_count":)" << entry.script_count
         << R"(,"outcome":")" << json_escape(entry.outcome) << '"';
    if (!entry.error.empty()) {
        json << R"(,"error":")" << json_escape(entry.error) << '"';
    }
    json << R"(,"timestamp":")" << format_iso8601(entry.timestamp)
         << R"(","duration_us":)" << entry.duration.count() << '}';

    if (degraded) {
        logger_->warn(json.str());
    } else {
        logger_->info(json.str());
    }
}

// ---------------------------------------------------------------------------
// log_script_failure: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::log_script_failure(const ScriptFailureLog& entry) {
    if (!enabled(LogLevel::kWarn)) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":"script_failure","hook":")" << json_escape(entry.hook_name)
         << R"(","script_id":")" << json_escape(entry.script_id)
         << R"(","trace_id":")" << json_escape(entry.trace_id)
         << R"(","reason":")" << json_escape(entry.reason)
         << R"(","timestamp":")" << format_iso8601(entry.timestamp) << R"("})";

    logger_->warn(json.str());
}

// ---------------------------------------------------------------------------
// log_permission: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::log_permission(const PermissionDecisionLog& entry) {
    const bool failed = entry.result == "error";
    if (!enabled(failed ? LogLevel::kWarn : LogLevel::kInfo)) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":"permission_decision","subject_type":")" << json_escape(entry.subject_type)
         << R"(","subject_id":")" << json_escape(entry.subject_id)
         << R"(","entity_type":")" << json_escape(entry.entity_type)
         << R"(","entity_id":")" << json_escape(entry.entity_id)
         << R"(","permission":")" << json_escape(entry.permission)
         << R"(","result":")" << json_escape(entry.result)
         << R"(","policy_source":")" << json_escape(entry.policy_source)
         << R"(","timestamp":")" << format_iso8601(entry.timestamp)
         << R"(","duration_us":)" << entry.duration.count() << '}';

    if (failed) {
        logger_->warn(json.str());
    } else {
        logger_->info(json.str());
    }
}

// ---------------------------------------------------------------------------
// 내부 진단용 spdlog 래퍼
// ---------------------------------------------------------------------------
void StructuredLogger::debug(std::string_view msg) {
    if (logger_) {
        logger_->debug(msg);
    }
}

void StructuredLogger::info(std::string_view msg) {
    if (logger_) {
        logger_->info(msg);
    }
}

void StructuredLogger::warn(std::string_view msg) {
    if (logger_) {
        logger_->warn(msg);
    }
}

void StructuredLogger::error(std::string_view msg) {
    if (logger_) {
        logger_->error(msg);
    }
}

void StructuredLogger::flush() {
    if (logger_) {
        logger_->flush();
    }
}
