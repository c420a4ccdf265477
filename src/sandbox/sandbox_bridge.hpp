#pragma once

// ---------------------------------------------------------------------------
// sandbox_bridge.hpp
//
// 스크립트 1회 실행에 필요한 capability 표면을 구성하고 풀을 통해 실행한다.
//
// [스크립트에 보이는 표면]
//   context                 읽기 전용 (hook 입력 또는 정책 컨텍스트 스냅샷)
//   secret(name)            등록된 secret 만 조회. 미등록 → 스크립트 오류
//   helpers.log(...)        spdlog 로 기록 (최대 1KiB)
//   helpers.now()           epoch 밀리초
//   helpers.matches(s, p)   Lua 패턴 검사 (lua_pattern.hpp, 단계 예산 초과 → 스크립트 오류)
//   helpers.check_permission(subject_type, subject_id, entity_type, entity_id, permission)
//                           relation 기반 검사만 수행 (정책 스크립트 재진입 없음)
//   안전한 표준 라이브러리 (LuaInterpreter 참고)
//
// [실행 위치]
//   풀 acquire 는 호출 코루틴(io_context)에서, Lua 실행은 script_executor
//   (thread_pool) 에서 수행한다. 이벤트 루프는 Lua 실행 동안 블록되지 않는다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "common/value.hpp"
#include "config/engine_config.hpp"
#include "sandbox/interpreter_pool.hpp"
#include "sandbox/secret_store.hpp"

#include <expected>
#include <functional>
#include <string>
#include <string_view>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

// RelationCheck
//   helpers.check_permission 이 호출하는 동기 relation 검사.
using RelationCheck = std::function<bool(std::string_view subject_type,
                                         std::string_view subject_id,
                                         std::string_view entity_type,
                                         std::string_view entity_id,
                                         std::string_view permission)>;

class SandboxBridge {
public:
    SandboxBridge(InterpreterPool&       pool,
                  const SecretStore&     secrets,
                  const SandboxConfig&   config,
                  asio::any_io_executor  script_executor);

    SandboxBridge(const SandboxBridge&)            = delete;
    SandboxBridge& operator=(const SandboxBridge&) = delete;

    // set_relation_check
    //   PermissionEvaluator 생성 후 주입한다 (bridge ↔ evaluator 순환 의존 해소).
    //   설정 전에는 helpers.check_permission 이 항상 false.
    void set_relation_check(RelationCheck check);

    // run_hook_script
    //   hook 스크립트 실행. 크기 상한 max_script_size, 시간 예산 script_timeout_ms.
    [[nodiscard]] asio::awaitable<std::expected<Value, EngineError>>
    run_hook_script(std::string_view script_id, std::string_view source, const Value& context);

    // run_policy_script
    //   권한 정책 스크립트 실행. 크기 상한 max_policy_size, 시간 예산 policy_timeout_ms.
    [[nodiscard]] asio::awaitable<std::expected<Value, EngineError>>
    run_policy_script(std::string_view policy_name, std::string_view source, const Value& context);

    [[nodiscard]] const SandboxConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] asio::awaitable<std::expected<Value, EngineError>>
    execute(std::string chunk_name, std::string_view source, const Value& context,
            ExecutionLimits limits, std::size_t max_source_size);

    [[nodiscard]] ScriptEnvironment make_environment(const std::string& chunk_name,
                                                     const Value&       context) const;

    InterpreterPool&      pool_;
    const SecretStore&    secrets_;
    SandboxConfig         config_;
    asio::any_io_executor script_executor_;
    RelationCheck         relation_check_;
};
