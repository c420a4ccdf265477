// ---------------------------------------------------------------------------
// test_sandbox_bridge.cpp
//
// SandboxBridge 단위 테스트.
//
// [테스트 범위]
// - hook / policy 스크립트 실행, context 전달, chunk 이름
// - secret(), helpers.matches / now / log / check_permission
// - 소스 크기 상한, policy 전용 시간 예산
// - 풀 고갈 시 kPoolExhausted 전파
//
// [테스트 패턴]
// - script_executor 로 같은 io_context 를 사용한다 (단일 스레드).
// ---------------------------------------------------------------------------

#include "sandbox/interpreter_pool.hpp"
#include "sandbox/sandbox_bridge.hpp"
#include "sandbox/secret_store.hpp"

#include <gtest/gtest.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>

#include <chrono>
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

} // namespace

// ---------------------------------------------------------------------------
// Fixture
// ---------------------------------------------------------------------------
class SandboxBridgeTest : public ::testing::Test {
protected:
    SandboxBridgeTest() {
        pool_config_.max_size           = 2;
        pool_config_.acquire_timeout_ms = 30;
        sandbox_config_.policy_timeout_ms = 50;
        sandbox_config_.max_script_size   = 256;
        sandbox_config_.max_instructions  = 0;
        sandbox_config_.memory_limit_bytes = 4u * 1024u * 1024u;
    }

    void SetUp() override {
        ASSERT_TRUE(secrets_.create("API_KEY", "k-123", "").has_value());
        pool_   = std::make_unique<InterpreterPool>(pool_config_, sandbox_config_.memory_limit_bytes);
        bridge_ = std::make_unique<SandboxBridge>(*pool_, secrets_, sandbox_config_,
                                                  ioc_.get_executor());
    }

    std::expected<Value, EngineError> run_hook(std::string source, Value context = Value::object()) {
        std::optional<std::expected<Value, EngineError>> out;
        asio::co_spawn(ioc_, [&]() -> asio::awaitable<void> {
            out = co_await bridge_->run_hook_script("test_script", source, context);
        }, rethrow_handler);
        ioc_.run();
        ioc_.restart();
        return std::move(*out);
    }

    std::expected<Value, EngineError> run_policy(std::string source, Value context = Value::object()) {
        std::optional<std::expected<Value, EngineError>> out;
        asio::co_spawn(ioc_, [&]() -> asio::awaitable<void> {
            out = co_await bridge_->run_policy_script("document.read", source, context);
        }, rethrow_handler);
        ioc_.run();
        ioc_.restart();
        return std::move(*out);
    }

    asio::io_context                 ioc_;
    PoolConfig                       pool_config_;
    SandboxConfig                    sandbox_config_;
    InMemorySecretStore              secrets_;
    std::unique_ptr<InterpreterPool> pool_;
    std::unique_ptr<SandboxBridge>   bridge_;
};

// ---------------------------------------------------------------------------
// 기본 실행
// ---------------------------------------------------------------------------
TEST_F(SandboxBridgeTest, HookScript_SeesContext) {
    auto result = run_hook("return { allowed = context.email ~= nil }",
                           Value::object({{"email", "a@b.com"}}));
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(*result, Value::object({{"allowed", true}}));
}

TEST_F(SandboxBridgeTest, Error_CarriesChunkName) {
    auto result = run_hook("error('nope')");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, EngineErrorCode::kSandbox);
    EXPECT_EQ(result.error().context, "script:test_script");
}

TEST_F(SandboxBridgeTest, OversizedSource_RejectedBeforeExecution) {
    std::string source = "return true --" + std::string(300, 'x');
    auto result = run_hook(source);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().message, "script exceeds size limit");
    EXPECT_EQ(pool_->gauges().created, 0u) << "no interpreter should be leased for oversized source";
}

// ---------------------------------------------------------------------------
// secret()
// ---------------------------------------------------------------------------
TEST_F(SandboxBridgeTest, Secret_ResolvesValue) {
    auto result = run_hook("return secret('API_KEY')");
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(*result, Value{"k-123"});
}

TEST_F(SandboxBridgeTest, Secret_UndefinedIsScriptError) {
    auto result = run_hook("return secret('MISSING')");
    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().message.find("secret 'MISSING' is not defined"), std::string::npos)
        << result.error().message;
}

// ---------------------------------------------------------------------------
// helpers
// ---------------------------------------------------------------------------
TEST_F(SandboxBridgeTest, HelpersMatches_LuaPattern) {
    auto hit = run_hook("return helpers.matches('bob@spam.com', '@spam%.com$')");
    ASSERT_TRUE(hit.has_value()) << hit.error().message;
    EXPECT_EQ(*hit, Value{true});

    auto miss = run_hook("return helpers.matches('bob@spamXcom', '@spam%.com$')");
    ASSERT_TRUE(miss.has_value()) << miss.error().message;
    EXPECT_EQ(*miss, Value{false}) << "%. must match a literal dot";
}

// ---------------------------------------------------------------------------
// HelpersMatches_LargeSubjectBounded
//   200KB 입력 + 되추적 패턴. 프로세스가 멈추거나 죽지 않고 스크립트 오류로 끝난다.
// ---------------------------------------------------------------------------
TEST_F(SandboxBridgeTest, HelpersMatches_LargeSubjectBounded) {
    const auto started = std::chrono::steady_clock::now();
    auto result = run_hook("return helpers.matches(string.rep('a', 200000), '.*b')");
    const auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_FALSE(result.has_value());
    EXPECT_NE(result.error().message.find("pattern too complex"), std::string::npos)
        << result.error().message;
    EXPECT_LT(elapsed, std::chrono::seconds(5));
    EXPECT_EQ(pool_->gauges().discarded, 0u) << "a rejected pattern leaves the interpreter usable";
}

TEST_F(SandboxBridgeTest, HelpersMatches_NestedQuantifierFinishes) {
    auto result = run_hook("return helpers.matches(string.rep('a', 28), '^(a*)*b$')");
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(*result, Value{false});

    auto pcall_result = run_hook(
        "local ok, err = pcall(helpers.matches, 'x', '[a') return { ok = ok, err = err }");
    ASSERT_TRUE(pcall_result.has_value()) << pcall_result.error().message;
    EXPECT_EQ((*pcall_result)["ok"], Value{false});
}

TEST_F(SandboxBridgeTest, HelpersNowAndLog) {
    auto result = run_hook("helpers.log('checking', 1, {a = 1}) return helpers.now()");
    ASSERT_TRUE(result.has_value()) << result.error().message;
    ASSERT_TRUE(result->is_int());
    EXPECT_GT(result->as_int(), 0);
}

TEST_F(SandboxBridgeTest, HelpersCheckPermission_FalseWithoutEvaluator) {
    auto result = run_hook("return helpers.check_permission('user','u1','document','d1','read')");
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(*result, Value{false});
}

TEST_F(SandboxBridgeTest, HelpersCheckPermission_DelegatesToRelationCheck) {
    std::string seen;
    bridge_->set_relation_check([&seen](std::string_view st, std::string_view sid,
                                        std::string_view et, std::string_view eid,
                                        std::string_view perm) {
        seen = std::string{st} + ":" + std::string{sid} + " " + std::string{perm} + " " +
               std::string{et} + ":" + std::string{eid};
        return sid == "u1";
    });

    auto allowed = run_hook("return helpers.check_permission('user','u1','document','d1','read')");
    ASSERT_TRUE(allowed.has_value()) << allowed.error().message;
    EXPECT_EQ(*allowed, Value{true});
    EXPECT_EQ(seen, "user:u1 read document:d1");

    auto bad_args = run_hook("return helpers.check_permission('user', 1)");
    ASSERT_FALSE(bad_args.has_value());
    EXPECT_NE(bad_args.error().message.find("must be a string"), std::string::npos);
}

// ---------------------------------------------------------------------------
// policy 예산
// ---------------------------------------------------------------------------
TEST_F(SandboxBridgeTest, PolicyScript_UsesPolicyTimeout) {
    auto result = run_policy("while true do end");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().message, "script execution timeout");
    EXPECT_EQ(result.error().context, "policy:document.read");
}

TEST_F(SandboxBridgeTest, PolicyScript_ReturnsBoolean) {
    auto result = run_policy("return context.attributes.level >= 3",
                             Value::object({{"attributes", Value::object({{"level", 5}})}}));
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(*result, Value{true});
}

// ---------------------------------------------------------------------------
// PoolExhausted_Propagated
// ---------------------------------------------------------------------------
TEST_F(SandboxBridgeTest, PoolExhausted_Propagated) {
    std::optional<std::expected<Value, EngineError>> out;
    asio::co_spawn(ioc_, [&]() -> asio::awaitable<void> {
        auto a = co_await pool_->acquire();
        auto b = co_await pool_->acquire();
        EXPECT_TRUE(a.has_value() && b.has_value());
        out = co_await bridge_->run_hook_script("starved", "return { allowed = true }",
                                                Value::object());
    }, rethrow_handler);
    ioc_.run();

    ASSERT_TRUE(out.has_value());
    ASSERT_FALSE(out->has_value());
    EXPECT_EQ(out->error().code, EngineErrorCode::kPoolExhausted);
}
