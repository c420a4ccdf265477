#pragma once

// ---------------------------------------------------------------------------
// engine_stats.hpp
//
// 디스패치 / 권한 검사 결과 카운터. 헤더 전용 (atomic inline 구현).
//
// [스레드 안전성]
// - on_dispatch / on_permission / on_script_failure:
//   io_context 스레드와 script worker 스레드에서 concurrent 호출 안전.
// - snapshot(): 제어 소켓 stats 명령에서 호출. mutex 없음.
//
// [격리 원칙]
// - 카운터 갱신은 noexcept. 통계가 디스패치 / 권한 검사를 실패시키지 않는다.
// ---------------------------------------------------------------------------

#include <atomic>
#include <chrono>
#include <cstdint>

enum class Outcome : std::uint8_t {
    kAllowed = 0,
    kDenied  = 1,
    kError   = 2,
};

// ---------------------------------------------------------------------------
// OutcomeCounts / EngineStatsSnapshot
//   deny_rate: denied / total (total == 0 이면 0.0)
// ---------------------------------------------------------------------------
struct OutcomeCounts {
    std::uint64_t allowed{0};
    std::uint64_t denied{0};
    std::uint64_t errors{0};
    double        deny_rate{0.0};

    [[nodiscard]] std::uint64_t total() const noexcept { return allowed + denied + errors; }
};

struct EngineStatsSnapshot {
    OutcomeCounts                         dispatch{};
    OutcomeCounts                         permission{};
    std::uint64_t                         async_scheduled{0};
    std::uint64_t                         script_failures{0};
    double                                uptime_sec{0.0};
    std::chrono::system_clock::time_point captured_at{};
};

class EngineStats {
public:
    EngineStats() noexcept
        : started_at_(std::chrono::steady_clock::now())
    {}

    EngineStats(const EngineStats&)            = delete;
    EngineStats& operator=(const EngineStats&) = delete;
    EngineStats(EngineStats&&)                 = delete;
    EngineStats& operator=(EngineStats&&)      = delete;

    // on_dispatch
    //   blocking / enrichment 디스패치 1회의 최종 결과.
    void on_dispatch(Outcome outcome) noexcept { bump(dispatch_, outcome); }

    // on_async_scheduled
    //   async 디스패치는 결과를 기다리지 않으므로 별도로 센다.
    void on_async_scheduled() noexcept {
        async_scheduled_.fetch_add(1, std::memory_order_relaxed);
    }

    void on_script_failure() noexcept {
        script_failures_.fetch_add(1, std::memory_order_relaxed);
    }

    void on_permission(Outcome outcome) noexcept { bump(permission_, outcome); }

    [[nodiscard]] EngineStatsSnapshot snapshot() const noexcept {
        const auto elapsed = std::chrono::steady_clock::now() - started_at_;
        return EngineStatsSnapshot{
            .dispatch        = load(dispatch_),
            .permission      = load(permission_),
            .async_scheduled = async_scheduled_.load(std::memory_order_relaxed),
            .script_failures = script_failures_.load(std::memory_order_relaxed),
            .uptime_sec      = std::chrono::duration<double>(elapsed).count(),
            .captured_at     = std::chrono::system_clock::now(),
        };
    }

private:
    struct Counters {
        std::atomic<std::uint64_t> allowed{0};
        std::atomic<std::uint64_t> denied{0};
        std::atomic<std::uint64_t> errors{0};
    };

    static void bump(Counters& c, Outcome outcome) noexcept {
        switch (outcome) {
            case Outcome::kAllowed: c.allowed.fetch_add(1, std::memory_order_relaxed); break;
            case Outcome::kDenied:  c.denied.fetch_add(1, std::memory_order_relaxed);  break;
            case Outcome::kError:   c.errors.fetch_add(1, std::memory_order_relaxed);  break;
        }
    }

    [[nodiscard]] static OutcomeCounts load(const Counters& c) noexcept {
        OutcomeCounts out;
        out.allowed = c.allowed.load(std::memory_order_relaxed);
        out.denied  = c.denied.load(std::memory_order_relaxed);
        out.errors  = c.errors.load(std::memory_order_relaxed);
        const auto total = out.total();
        if (total > 0) {
            out.deny_rate = static_cast<double>(out.denied) / static_cast<double>(total);
        }
        return out;
    }

    Counters                                    dispatch_;
    Counters                                    permission_;
    std::atomic<std::uint64_t>                  async_scheduled_{0};
    std::atomic<std::uint64_t>                  script_failures_{0};
    std::chrono::steady_clock::time_point       started_at_;
};
