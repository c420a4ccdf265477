#pragma once

// ---------------------------------------------------------------------------
// lua_interpreter.hpp
//
// 격리된 Lua 5.4 실행 컨텍스트 1개 (lua_State 소유).
//
// [격리 모델]
// - 생성 시 안전한 표준 라이브러리(base 일부, string, table, math, utf8)만 연다.
//   os / io / package / debug / coroutine 은 열지 않는다.
// - 매 run() 마다 새 _ENV 테이블을 만들고 라이브러리 테이블도 복사한다.
//   스크립트가 전역이나 string.* 를 바꿔도 다음 실행에 남지 않는다.
// - 바이너리 청크(bytecode) 로드 금지 (mode "t").
//
// [예산]
// - 메모리: lua_Alloc 에서 상한 초과 할당을 거부 → LUA_ERRMEM
// - 명령 수 / wall-clock: count hook 에서 검사 → 스크립트 오류로 중단
//   예산 초과 후에는 hook 주기를 1 로 낮춰 pcall 로 삼키더라도 즉시 재발생시킨다.
//
// [수명]
// - healthy() == false 인 인터프리터는 pool 로 돌아가지 않고 폐기된다.
//   (메모리 오류, C 함수 내부에서 시간 초과, 상태 손상)
//
// [스레드 모델]
// - lua_State 는 스레드 안전하지 않다. pool lease 를 가진 1개 스레드만 run() 호출.
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "common/value.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

struct lua_State;
struct lua_Debug;

// NativeFunction
//   스크립트에 노출되는 C++ 함수. 오류 문자열은 스크립트 오류로 변환된다.
using NativeFunction = std::function<std::expected<Value, std::string>(const std::vector<Value>&)>;

// ---------------------------------------------------------------------------
// ScriptEnvironment
//   run() 1회에 주입할 표면.
//   context : 읽기 전용 proxy 로 노출 (쓰기 시 오류)
//   globals : 최상위 함수 (예: secret)
//   tables  : 이름 → 함수 묶음 (예: helpers.log)
// ---------------------------------------------------------------------------
struct ScriptEnvironment {
    Value                                                     context{};
    std::map<std::string, NativeFunction>                     globals{};
    std::map<std::string, std::map<std::string, NativeFunction>> tables{};
};

struct ExecutionLimits {
    std::chrono::milliseconds timeout{10000};
    std::uint64_t             max_instructions{0};  // 0 = 무제한
};

class LuaInterpreter {
public:
    // 생성자
    //   lua_State 생성 실패 / 라이브러리 로드 실패 시 std::runtime_error.
    LuaInterpreter(std::uint64_t id, std::size_t memory_limit_bytes);
    ~LuaInterpreter();

    LuaInterpreter(const LuaInterpreter&)            = delete;
    LuaInterpreter& operator=(const LuaInterpreter&) = delete;
    LuaInterpreter(LuaInterpreter&&)                 = delete;
    LuaInterpreter& operator=(LuaInterpreter&&)      = delete;

    // run
    //   source 를 컴파일하고 env 를 _ENV 로 하여 실행한다.
    //   성공 시 첫 번째 반환값 (없으면 null). 실패 시 EngineError{kSandbox}.
    //   고정 메시지: "script execution timeout" | "instruction limit exceeded"
    //               | "memory limit exceeded"
    [[nodiscard]] std::expected<Value, EngineError> run(std::string_view         chunk_name,
                                                        std::string_view         source,
                                                        const ScriptEnvironment& env,
                                                        const ExecutionLimits&   limits);

    // check_syntax
    //   source 를 컴파일만 하고 실행하지 않는다 (텍스트 청크만 허용).
    //   스크립트 / 정책 저장 시점 검증용. 실패 시 Lua 컴파일러의 메시지.
    [[nodiscard]] static std::expected<void, std::string> check_syntax(std::string_view chunk_name,
                                                                       std::string_view source);

    [[nodiscard]] bool          healthy() const noexcept { return healthy_; }
    [[nodiscard]] std::uint64_t id() const noexcept { return id_; }
    [[nodiscard]] std::size_t   memory_in_use() const noexcept { return used_bytes_; }
    [[nodiscard]] std::uint64_t run_count() const noexcept { return run_count_; }

    [[nodiscard]] std::chrono::steady_clock::time_point created_at() const noexcept {
        return created_at_;
    }

    // mark_unhealthy
    //   외부(pool / bridge)에서 상태 손상을 감지했을 때 사용.
    void mark_unhealthy() noexcept { healthy_ = false; }

private:
    enum class Budget : std::uint8_t { kNone, kTimeout, kInstructions };

    static void* allocate(void* ud, void* ptr, std::size_t osize, std::size_t nsize) noexcept;
    static void  count_hook(lua_State* L, lua_Debug* ar);

    lua_State*                            state_{nullptr};
    std::uint64_t                         id_;
    std::size_t                           memory_limit_;
    std::size_t                           used_bytes_{0};
    bool                                  healthy_{true};
    std::uint64_t                         run_count_{0};
    std::chrono::steady_clock::time_point created_at_;

    // run() 동안만 유효한 예산 상태 (hook 에서 참조)
    std::chrono::steady_clock::time_point deadline_{};
    std::uint64_t                         max_instructions_{0};
    std::uint64_t                         executed_{0};
    Budget                                exceeded_{Budget::kNone};
};
