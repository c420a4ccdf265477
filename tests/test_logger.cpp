// ---------------------------------------------------------------------------
// test_logger.cpp
//
// StructuredLogger 단위 테스트
//
// [테스트 범위]
// - hook_dispatch / script_failure / permission_decision 이벤트 JSON 필드
// - min_level 필터링 (warn 미만 억제)
// - 특수문자 escape
// - parse_log_level 문자열 변환
// ---------------------------------------------------------------------------

#include "config/yaml_value.hpp"
#include "logger/log_types.hpp"
#include "logger/structured_logger.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Fixture: Temporary log file
// ---------------------------------------------------------------------------
class StructuredLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string unique_name =
            std::string(info->test_suite_name()) + "_" + info->name();
        log_dir_  = fs::temp_directory_path() / "hookwarden_test_logs" / unique_name;
        log_file_ = log_dir_ / "test.log";
        fs::create_directories(log_dir_);
    }

    void TearDown() override {
        fs::remove_all(log_dir_);
    }

    // 로그 파일의 각 줄을 Value 로 파싱한다. JSON 이 아닌 줄은 건너뛴다.
    std::vector<Value> read_events() const {
        std::vector<Value> events;
        std::ifstream      file(log_file_);
        std::string        line;
        while (std::getline(file, line)) {
            if (line.empty() || line.front() != '{') {
                continue;
            }
            auto parsed = parse_json_value(line);
            if (parsed && parsed->is_object()) {
                events.push_back(std::move(*parsed));
            }
        }
        return events;
    }

    static std::string field(const Value& event, std::string_view key) {
        const Value* v = event.find(key);
        return (v != nullptr && v->is_string()) ? v->as_string() : std::string{};
    }

    fs::path log_dir_;
    fs::path log_file_;
};

// ---------------------------------------------------------------------------
// LogDispatch_WritesHookDispatchEvent
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, LogDispatch_WritesHookDispatchEvent) {
    {
        StructuredLogger logger{LogLevel::kInfo, log_file_, "dispatch_logger"};
        logger.log_dispatch(DispatchLog{
            .hook_name    = "before_signup",
            .mode         = "blocking",
            .trace_id     = "trc_1",
            .script_count = 2,
            .outcome      = "allowed",
            .error        = "",
            .timestamp    = std::chrono::system_clock::now(),
            .duration     = std::chrono::microseconds{150},
        });
        logger.flush();
    }

    const auto events = read_events();
    ASSERT_EQ(events.size(), 1u) << "exactly one event should be written";
    EXPECT_EQ(field(events[0], "event"), "hook_dispatch");
    EXPECT_EQ(field(events[0], "hook"), "before_signup");
    EXPECT_EQ(field(events[0], "mode"), "blocking");
    EXPECT_EQ(field(events[0], "outcome"), "allowed");
    EXPECT_EQ(events[0].find("error"), nullptr) << "empty error must be omitted";
    ASSERT_NE(events[0].find("script_count"), nullptr);
    EXPECT_EQ(events[0].find("script_count")->as_int(), 2);
    EXPECT_EQ(events[0].find("duration_us")->as_int(), 150);
}

// ---------------------------------------------------------------------------
// LogDispatch_BlockedCarriesError
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, LogDispatch_BlockedCarriesError) {
    {
        StructuredLogger logger{LogLevel::kInfo, log_file_, "blocked_logger"};
        logger.log_dispatch(DispatchLog{
            .hook_name = "before_signup",
            .mode      = "blocking",
            .trace_id  = "trc_7",
            .outcome   = "blocked",
            .error     = "Signups from spam.com are not allowed",
            .timestamp = std::chrono::system_clock::now(),
        });
        logger.flush();
    }

    const auto events = read_events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(field(events[0], "outcome"), "blocked");
    EXPECT_EQ(field(events[0], "error"), "Signups from spam.com are not allowed");
}

// ---------------------------------------------------------------------------
// LogScriptFailure_WritesReason
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, LogScriptFailure_WritesReason) {
    {
        StructuredLogger logger{LogLevel::kInfo, log_file_, "failure_logger"};
        logger.log_script_failure(ScriptFailureLog{
            .hook_name = "after_signup",
            .script_id = "audit_signup",
            .trace_id  = "trc_3",
            .reason    = "script exceeded time limit",
            .timestamp = std::chrono::system_clock::now(),
        });
        logger.flush();
    }

    const auto events = read_events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(field(events[0], "event"), "script_failure");
    EXPECT_EQ(field(events[0], "script_id"), "audit_signup");
    EXPECT_EQ(field(events[0], "reason"), "script exceeded time limit");
}

// ---------------------------------------------------------------------------
// LogPermission_WritesDecision
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, LogPermission_WritesDecision) {
    {
        StructuredLogger logger{LogLevel::kInfo, log_file_, "permission_logger"};
        logger.log_permission(PermissionDecisionLog{
            .subject_type  = "user",
            .subject_id    = "alice",
            .entity_type   = "document",
            .entity_id     = "doc1",
            .permission    = "read",
            .result        = "allowed",
            .policy_source = "tuple",
            .timestamp     = std::chrono::system_clock::now(),
            .duration      = std::chrono::microseconds{42},
        });
        logger.flush();
    }

    const auto events = read_events();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(field(events[0], "event"), "permission_decision");
    EXPECT_EQ(field(events[0], "subject_id"), "alice");
    EXPECT_EQ(field(events[0], "entity_type"), "document");
    EXPECT_EQ(field(events[0], "result"), "allowed");
    EXPECT_EQ(field(events[0], "policy_source"), "tuple");
}

// ---------------------------------------------------------------------------
// MinLevelWarn_SuppressesInfoEvents
//   warn 레벨 로거는 allowed 디스패치(info)를 기록하지 않고 blocked(warn)만 기록한다.
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, MinLevelWarn_SuppressesInfoEvents) {
    {
        StructuredLogger logger{LogLevel::kWarn, log_file_, "warn_logger"};
        logger.log_dispatch(DispatchLog{.hook_name = "before_signin", .outcome = "allowed"});
        logger.log_dispatch(DispatchLog{.hook_name = "before_signin", .outcome = "blocked"});
        logger.log_permission(PermissionDecisionLog{.permission = "read", .result = "denied"});
        logger.flush();
    }

    const auto events = read_events();
    ASSERT_EQ(events.size(), 1u) << "only the blocked dispatch passes the warn filter";
    EXPECT_EQ(field(events[0], "outcome"), "blocked");
}

// ---------------------------------------------------------------------------
// SpecialCharacters_AreEscaped
// ---------------------------------------------------------------------------
TEST_F(StructuredLoggerTest, SpecialCharacters_AreEscaped) {
    const std::string reason = "error: \"bad\" value\nline2\\end";
    {
        StructuredLogger logger{LogLevel::kInfo, log_file_, "escape_logger"};
        logger.log_script_failure(ScriptFailureLog{
            .hook_name = "token_build",
            .script_id = "claims",
            .reason    = reason,
            .timestamp = std::chrono::system_clock::now(),
        });
        logger.flush();
    }

    const auto events = read_events();
    ASSERT_EQ(events.size(), 1u) << "escaped event must stay on a single parseable line";
    EXPECT_EQ(field(events[0], "reason"), reason);
}

// ---------------------------------------------------------------------------
// ParseLogLevel
// ---------------------------------------------------------------------------
TEST(LogTypes, ParseLogLevel_KnownAndUnknown) {
    EXPECT_EQ(parse_log_level("trace"), LogLevel::kTrace);
    EXPECT_EQ(parse_log_level("debug"), LogLevel::kDebug);
    EXPECT_EQ(parse_log_level("info"),  LogLevel::kInfo);
    EXPECT_EQ(parse_log_level("warn"),  LogLevel::kWarn);
    EXPECT_EQ(parse_log_level("error"), LogLevel::kError);
    EXPECT_FALSE(parse_log_level("verbose").has_value()) << "unknown level must be rejected";
    EXPECT_FALSE(parse_log_level("").has_value());
}
