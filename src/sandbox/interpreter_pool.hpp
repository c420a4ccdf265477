#pragma once

// ---------------------------------------------------------------------------
// interpreter_pool.hpp
//
// LuaInterpreter 의 상한 있는 풀.
//
// [동작]
// - 유휴 인터프리터가 있으면 즉시 대여. 없고 총 수 < max_size 이면 새로 생성.
// - 그 외에는 FIFO 대기열에 들어가 acquire_timeout 동안 기다린다.
//   타임아웃 → EngineError{kPoolExhausted} (일시적, 재시도 가능).
//   상한을 넘는 임시(burst) 인터프리터는 만들지 않는다.
// - release 시 대기자가 있으면 가장 오래 기다린 대기자에게 직접 넘긴다.
//   (유휴 목록을 거치지 않으므로 새 요청이 대기자를 앞지르지 못한다)
// - healthy() == false 인 인터프리터는 폐기되고, 그 슬롯은 대기자에게 넘어간다.
// - 유휴 인터프리터가 idle_ttl 보다 오래되면 acquire 시 폐기 후 재생성한다.
//
// [스레드 모델]
// - 내부 상태는 mutex 로 보호된다. release 는 어느 스레드에서 호출해도 안전.
// - acquire 대기 타이머는 호출 코루틴의 executor 에 묶인다.
//   타이머 취소는 그 executor 로 post 하여 수행한다.
// - 풀은 자신을 쓰는 executor 보다 오래 살아야 한다. executor 가 먼저 파괴되면
//   남은 lease 는 풀로 돌아오고, 대기 중이던 acquire 는 대기열에서 빠진다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "config/engine_config.hpp"
#include "sandbox/lua_interpreter.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>

namespace asio = boost::asio;

class InterpreterPool;

// ---------------------------------------------------------------------------
// InterpreterLease
//   대여한 인터프리터의 RAII 핸들. 소멸 시 풀에 반환한다.
//   discard() 를 호출하면 반환 대신 폐기된다.
// ---------------------------------------------------------------------------
class InterpreterLease {
public:
    InterpreterLease() = default;
    InterpreterLease(InterpreterPool* pool, std::unique_ptr<LuaInterpreter> interpreter) noexcept;
    ~InterpreterLease();

    InterpreterLease(const InterpreterLease&)            = delete;
    InterpreterLease& operator=(const InterpreterLease&) = delete;

    InterpreterLease(InterpreterLease&& other) noexcept;
    InterpreterLease& operator=(InterpreterLease&& other) noexcept;

    [[nodiscard]] LuaInterpreter& operator*() const noexcept { return *interpreter_; }
    [[nodiscard]] LuaInterpreter* operator->() const noexcept { return interpreter_.get(); }
    [[nodiscard]] LuaInterpreter* get() const noexcept { return interpreter_.get(); }
    explicit operator bool() const noexcept { return interpreter_ != nullptr; }

    // discard
    //   상태 손상(예: 타임아웃 처리 중 예외)이 의심될 때 호출.
    void discard() noexcept;

    // release
    //   소멸 전에 명시적으로 반환한다. 이후 lease 는 비어 있다.
    void release();

private:
    InterpreterPool*                pool_{nullptr};
    std::unique_ptr<LuaInterpreter> interpreter_;
};

// ---------------------------------------------------------------------------
// PoolGauges
//   active   : 대여 중 (대기자에게 넘겨진 것 포함)
//   waiting  : acquire 대기열 길이
//   idle     : 유휴 목록 길이
//   created  : 누적 생성 수
//   discarded: 누적 폐기 수 (손상 + TTL 만료)
// ---------------------------------------------------------------------------
struct PoolGauges {
    std::uint64_t active{0};
    std::uint64_t waiting{0};
    std::uint64_t idle{0};
    std::uint64_t created{0};
    std::uint64_t discarded{0};
    std::uint64_t max_size{0};
};

class InterpreterPool {
public:
    using Factory = std::function<std::unique_ptr<LuaInterpreter>(std::uint64_t id)>;

    // 생성자
    //   memory_limit_bytes 로 LuaInterpreter 를 만드는 기본 factory 사용.
    InterpreterPool(const PoolConfig& config, std::size_t memory_limit_bytes);

    // 생성자 (factory 주입, 테스트용)
    InterpreterPool(const PoolConfig& config, Factory factory);

    ~InterpreterPool() = default;

    InterpreterPool(const InterpreterPool&)            = delete;
    InterpreterPool& operator=(const InterpreterPool&) = delete;
    InterpreterPool(InterpreterPool&&)                 = delete;
    InterpreterPool& operator=(InterpreterPool&&)      = delete;

    // acquire
    //   co_await pool.acquire() → lease 또는 kPoolExhausted / kInternal(생성 실패)
    [[nodiscard]] asio::awaitable<std::expected<InterpreterLease, EngineError>> acquire();

    // release
    //   InterpreterLease 소멸자가 호출한다. 직접 호출 시 nullptr 은 무시.
    void release(std::unique_ptr<LuaInterpreter> interpreter);

    [[nodiscard]] PoolGauges gauges() const;

private:
    struct IdleEntry {
        std::unique_ptr<LuaInterpreter> interpreter;
    };

    // Waiter
    //   granted == true 가 되면 handed 를 가져간다.
    //   handed == nullptr 이면 폐기된 슬롯을 넘겨받은 것이므로 새로 생성한다.
    struct Waiter {
        explicit Waiter(const asio::any_io_executor& executor) : timer(executor) {}
        asio::steady_timer              timer;
        std::unique_ptr<LuaInterpreter> handed;
        bool                            granted{false};
    };

    [[nodiscard]] std::expected<InterpreterLease, EngineError> create_for_slot();
    void abandon_waiter(const std::shared_ptr<Waiter>& waiter);
    [[nodiscard]] bool idle_expired(const LuaInterpreter& interpreter) const noexcept;

    PoolConfig                            config_;
    Factory                               factory_;

    mutable std::mutex                    mutex_;
    std::deque<IdleEntry>                 idle_;
    std::deque<std::shared_ptr<Waiter>>   waiters_;
    std::uint64_t                         total_{0};  // 존재 + 생성 예약된 인터프리터 수
    std::uint64_t                         active_{0};
    std::uint64_t                         created_{0};
    std::uint64_t                         discarded_{0};
    std::uint64_t                         next_id_{1};
};
