// ---------------------------------------------------------------------------
// test_interpreter_pool.cpp
//
// InterpreterPool 단위 테스트.
//
// [테스트 범위]
// - max_size 까지 생성, 반환 후 재사용 (같은 id)
// - 상한 도달 시 acquire_timeout → kPoolExhausted, 버스트 생성 없음
// - release 시 대기자에게 FIFO 순서로 직접 전달
// - 손상된 인터프리터 폐기 → 슬롯 재생성
// - factory 실패 → kInternal, 슬롯 반환
// - idle_ttl 만료 인터프리터 재생성
// - io_context 가 풀보다 먼저 파괴 → 대기 중 lease 반환, 대기자 제거
//
// [테스트 패턴]
// - 각 테스트는 로컬 io_context 에서 코루틴을 co_spawn 하고 run() 으로 완료시킨다.
// ---------------------------------------------------------------------------

#include "sandbox/interpreter_pool.hpp"

#include <gtest/gtest.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <chrono>
#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

constexpr std::size_t kMemoryLimit = 4u * 1024u * 1024u;

PoolConfig pool_config(std::uint32_t max_size, std::uint32_t timeout_ms,
                       std::uint32_t idle_ttl_sec = 300) {
    PoolConfig cfg;
    cfg.max_size           = max_size;
    cfg.acquire_timeout_ms = timeout_ms;
    cfg.idle_ttl_sec       = idle_ttl_sec;
    return cfg;
}

// rethrow_handler: 코루틴 내부 예외를 테스트 실패로 드러낸다
void rethrow_handler(std::exception_ptr eptr) {
    if (eptr) {
        std::rethrow_exception(eptr);
    }
}

asio::awaitable<void> sleep_for(std::chrono::milliseconds d) {
    asio::steady_timer timer{co_await asio::this_coro::executor};
    timer.expires_after(d);
    co_await timer.async_wait(asio::use_awaitable);
}

} // namespace

// ---------------------------------------------------------------------------
// CreatesUpToMax_ThenReuses
// ---------------------------------------------------------------------------
TEST(InterpreterPool, CreatesOnDemand_ThenReusesIdle) {
    asio::io_context ioc;
    InterpreterPool  pool{pool_config(2, 100), kMemoryLimit};

    std::uint64_t first_id  = 0;
    std::uint64_t reused_id = 0;
    asio::co_spawn(ioc, [&]() -> asio::awaitable<void> {
        {
            auto lease = co_await pool.acquire();
            EXPECT_TRUE(lease.has_value());
            first_id = (*lease)->id();
            EXPECT_EQ(pool.gauges().active, 1u);
        }
        EXPECT_EQ(pool.gauges().active, 0u);
        EXPECT_EQ(pool.gauges().idle, 1u);

        auto again = co_await pool.acquire();
        EXPECT_TRUE(again.has_value());
        reused_id = (*again)->id();
    }, rethrow_handler);
    ioc.run();

    EXPECT_EQ(first_id, reused_id) << "idle interpreter should be reused";
    const auto g = pool.gauges();
    EXPECT_EQ(g.created, 1u);
    EXPECT_EQ(g.max_size, 2u);
}

// ---------------------------------------------------------------------------
// Exhausted_TimesOut
//   상한 1, 첫 lease 를 쥔 채 두 번째 acquire → timeout 후 kPoolExhausted.
// ---------------------------------------------------------------------------
TEST(InterpreterPool, Exhausted_TimesOutWithoutBurst) {
    asio::io_context ioc;
    InterpreterPool  pool{pool_config(1, 50), kMemoryLimit};

    std::optional<EngineError> error;
    asio::co_spawn(ioc, [&]() -> asio::awaitable<void> {
        auto held = co_await pool.acquire();
        EXPECT_TRUE(held.has_value());

        const auto started = std::chrono::steady_clock::now();
        auto second = co_await pool.acquire();
        const auto waited = std::chrono::steady_clock::now() - started;

        EXPECT_FALSE(second.has_value());
        if (!second) {
            error = second.error();
        }
        EXPECT_GE(waited, std::chrono::milliseconds{40}) << "acquire must wait for the timeout";
    }, rethrow_handler);
    ioc.run();

    ASSERT_TRUE(error.has_value());
    EXPECT_EQ(error->code, EngineErrorCode::kPoolExhausted);
    EXPECT_EQ(pool.gauges().created, 1u) << "no burst interpreter may be created";
    EXPECT_EQ(pool.gauges().waiting, 0u) << "timed-out waiter must leave the queue";
}

// ---------------------------------------------------------------------------
// Release_HandsToWaitersInFifoOrder
// ---------------------------------------------------------------------------
TEST(InterpreterPool, Release_HandsToWaitersInFifoOrder) {
    asio::io_context ioc;
    InterpreterPool  pool{pool_config(1, 2000), kMemoryLimit};

    std::vector<std::string> order;

    asio::co_spawn(ioc, [&]() -> asio::awaitable<void> {
        auto held = co_await pool.acquire();
        EXPECT_TRUE(held.has_value());
        co_await sleep_for(std::chrono::milliseconds{30});
        EXPECT_EQ(pool.gauges().waiting, 2u);
        held->release();
    }, rethrow_handler);

    for (const char* name : {"first", "second"}) {
        asio::co_spawn(ioc, [&, name]() -> asio::awaitable<void> {
            co_await sleep_for(std::chrono::milliseconds{name == std::string{"first"} ? 5 : 10});
            auto lease = co_await pool.acquire();
            EXPECT_TRUE(lease.has_value()) << name << " should eventually be served";
            order.emplace_back(name);
            co_await sleep_for(std::chrono::milliseconds{5});
        }, rethrow_handler);
    }
    ioc.run();

    ASSERT_EQ(order.size(), 2u);
    EXPECT_EQ(order[0], "first");
    EXPECT_EQ(order[1], "second");
    EXPECT_EQ(pool.gauges().created, 1u) << "one interpreter must serve all callers";
}

// ---------------------------------------------------------------------------
// UnhealthyInterpreter_Discarded
// ---------------------------------------------------------------------------
TEST(InterpreterPool, UnhealthyInterpreter_Discarded) {
    asio::io_context ioc;
    InterpreterPool  pool{pool_config(1, 100), kMemoryLimit};

    std::uint64_t first_id  = 0;
    std::uint64_t second_id = 0;
    asio::co_spawn(ioc, [&]() -> asio::awaitable<void> {
        {
            auto lease = co_await pool.acquire();
            EXPECT_TRUE(lease.has_value());
            first_id = (*lease)->id();
            (*lease)->mark_unhealthy();
        }
        auto next = co_await pool.acquire();
        EXPECT_TRUE(next.has_value());
        second_id = (*next)->id();
    }, rethrow_handler);
    ioc.run();

    EXPECT_NE(first_id, second_id) << "damaged interpreter must not be reused";
    EXPECT_EQ(pool.gauges().discarded, 1u);
    EXPECT_EQ(pool.gauges().created, 2u);
}

TEST(InterpreterPool, LeaseDiscard_DropsInterpreter) {
    asio::io_context ioc;
    InterpreterPool  pool{pool_config(1, 100), kMemoryLimit};

    asio::co_spawn(ioc, [&]() -> asio::awaitable<void> {
        auto lease = co_await pool.acquire();
        EXPECT_TRUE(lease.has_value());
        lease->discard();
        EXPECT_FALSE((*lease)->healthy());
    }, rethrow_handler);
    ioc.run();

    const auto g = pool.gauges();
    EXPECT_EQ(g.active, 0u);
    EXPECT_EQ(g.idle, 0u);
    EXPECT_EQ(g.discarded, 1u);
}

// ---------------------------------------------------------------------------
// FactoryFailure_ReleasesSlot
// ---------------------------------------------------------------------------
TEST(InterpreterPool, FactoryFailure_ReleasesSlot) {
    asio::io_context ioc;
    int calls = 0;
    InterpreterPool pool{pool_config(1, 50), [&calls](std::uint64_t id) {
        if (++calls == 1) {
            throw std::runtime_error("lua_newstate failed");
        }
        return std::make_unique<LuaInterpreter>(id, kMemoryLimit);
    }};

    asio::co_spawn(ioc, [&]() -> asio::awaitable<void> {
        auto failed = co_await pool.acquire();
        EXPECT_FALSE(failed.has_value());
        if (!failed) {
            EXPECT_EQ(failed.error().code, EngineErrorCode::kInternal);
        }
        auto ok = co_await pool.acquire();
        EXPECT_TRUE(ok.has_value()) << "failed creation must give its slot back";
    }, rethrow_handler);
    ioc.run();

    EXPECT_EQ(calls, 2);
}

// ---------------------------------------------------------------------------
// IdleTtl_RecyclesOldInterpreter
//   idle_ttl_sec = 1. 1초 넘게 유휴였던 인터프리터는 acquire 시 재생성된다.
// ---------------------------------------------------------------------------
TEST(InterpreterPool, IdleTtl_RecyclesOldInterpreter) {
    asio::io_context ioc;
    InterpreterPool  pool{pool_config(1, 100, 1), kMemoryLimit};

    std::uint64_t first_id  = 0;
    std::uint64_t second_id = 0;
    asio::co_spawn(ioc, [&]() -> asio::awaitable<void> {
        {
            auto lease = co_await pool.acquire();
            first_id = (*lease)->id();
        }
        co_await sleep_for(std::chrono::milliseconds{1100});
        auto lease = co_await pool.acquire();
        second_id = (*lease)->id();
    }, rethrow_handler);
    ioc.run();

    EXPECT_NE(first_id, second_id);
    EXPECT_EQ(pool.gauges().discarded, 1u);
}

// ---------------------------------------------------------------------------
// ThirdAcquire_WaitsForRelease
//   max_size 2, 동시 acquire 3회. 세 번째는 대기 (waiting == 1) 하다가
//   앞선 lease 하나가 반환되면 그 인터프리터를 받는다.
// ---------------------------------------------------------------------------
TEST(InterpreterPool, ThirdAcquire_WaitsForRelease) {
    asio::io_context ioc;
    InterpreterPool  pool{pool_config(2, 2000), kMemoryLimit};

    std::uint64_t waiting_while_blocked = 0;
    std::uint64_t released_id           = 0;
    std::uint64_t third_id              = 0;
    bool          third_served          = false;

    asio::co_spawn(ioc, [&]() -> asio::awaitable<void> {
        auto first  = co_await pool.acquire();
        auto second = co_await pool.acquire();
        EXPECT_TRUE(first.has_value() && second.has_value());

        co_await sleep_for(std::chrono::milliseconds{30});
        waiting_while_blocked = pool.gauges().waiting;
        EXPECT_FALSE(third_served) << "third acquire must block while both are leased";

        released_id = (*first)->id();
        first->release();
        co_await sleep_for(std::chrono::milliseconds{10});
    }, rethrow_handler);

    asio::co_spawn(ioc, [&]() -> asio::awaitable<void> {
        co_await sleep_for(std::chrono::milliseconds{5});
        auto third = co_await pool.acquire();
        EXPECT_TRUE(third.has_value());
        if (third) {
            third_id = (*third)->id();
        }
        third_served = true;
    }, rethrow_handler);

    ioc.run();

    EXPECT_EQ(waiting_while_blocked, 1u);
    EXPECT_TRUE(third_served);
    EXPECT_EQ(third_id, released_id) << "released interpreter is handed to the waiter";
    EXPECT_EQ(pool.gauges().created, 2u);
}

// ---------------------------------------------------------------------------
// IoContextDestroyedFirst
//   lease 를 쥔 채 잠든 코루틴과 acquire 대기 중인 코루틴이 남은 상태로
//   io_context 를 먼저 파괴한다. lease 는 풀로 돌아오고 대기자는 사라진다.
// ---------------------------------------------------------------------------
TEST(InterpreterPool, IoContextDestroyedFirst_ReturnsLeaseAndDropsWaiter) {
    InterpreterPool pool{pool_config(1, 60000), kMemoryLimit};
    bool            waiter_served = false;

    {
        std::optional<asio::io_context> ioc{std::in_place};

        asio::co_spawn(*ioc, [&]() -> asio::awaitable<void> {
            auto lease = co_await pool.acquire();
            EXPECT_TRUE(lease.has_value());
            co_await sleep_for(std::chrono::hours{1});
        }, asio::detached);

        asio::co_spawn(*ioc, [&]() -> asio::awaitable<void> {
            auto lease = co_await pool.acquire();
            waiter_served = lease.has_value();
        }, asio::detached);

        ioc->poll();
        const auto before = pool.gauges();
        EXPECT_EQ(before.active, 1u);
        EXPECT_EQ(before.waiting, 1u);

        ioc.reset();
    }

    EXPECT_FALSE(waiter_served);
    const auto after = pool.gauges();
    EXPECT_EQ(after.active, 0u);
    EXPECT_EQ(after.waiting, 0u);
    EXPECT_EQ(after.idle, 1u);
    EXPECT_EQ(after.created, 1u);
}
