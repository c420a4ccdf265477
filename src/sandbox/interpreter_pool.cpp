#include "sandbox/interpreter_pool.hpp"

#include <algorithm>
#include <utility>
#include <string>
#include <vector>

#include <boost/asio/post.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <spdlog/spdlog.h>

namespace {

template <typename WaiterPtr>
void wake_waiter(const WaiterPtr& waiter) {
    // 타이머는 대기 코루틴의 executor 에서만 건드린다
    asio::post(waiter->timer.get_executor(), [waiter]() { waiter->timer.cancel(); });
}

}  // namespace

// ---------------------------------------------------------------------------
// InterpreterLease
// ---------------------------------------------------------------------------
InterpreterLease::InterpreterLease(InterpreterPool*                pool,
                                   std::unique_ptr<LuaInterpreter> interpreter) noexcept
    : pool_(pool)
    , interpreter_(std::move(interpreter))
{}

InterpreterLease::~InterpreterLease() {
    release();
}

InterpreterLease::InterpreterLease(InterpreterLease&& other) noexcept
    : pool_(std::exchange(other.pool_, nullptr))
    , interpreter_(std::move(other.interpreter_))
{}

InterpreterLease& InterpreterLease::operator=(InterpreterLease&& other) noexcept {
    if (this != &other) {
        release();
        pool_        = std::exchange(other.pool_, nullptr);
        interpreter_ = std::move(other.interpreter_);
    }
    return *this;
}

void InterpreterLease::discard() noexcept {
    if (interpreter_) {
        interpreter_->mark_unhealthy();
    }
}

void InterpreterLease::release() {
    if (pool_ != nullptr && interpreter_) {
        pool_->release(std::move(interpreter_));
    }
    pool_ = nullptr;
}

// ---------------------------------------------------------------------------
// InterpreterPool 생성자
// ---------------------------------------------------------------------------
InterpreterPool::InterpreterPool(const PoolConfig& config, std::size_t memory_limit_bytes)
    : InterpreterPool(config, [memory_limit_bytes](std::uint64_t id) {
          return std::make_unique<LuaInterpreter>(id, memory_limit_bytes);
      })
{}

InterpreterPool::InterpreterPool(const PoolConfig& config, Factory factory)
    : config_(config)
    , factory_(std::move(factory))
{
    spdlog::info("[interpreter_pool] max_size={} acquire_timeout_ms={} idle_ttl_sec={}",
                 config_.max_size, config_.acquire_timeout_ms, config_.idle_ttl_sec);
}

bool InterpreterPool::idle_expired(const LuaInterpreter& interpreter) const noexcept {
    if (config_.idle_ttl_sec == 0) {
        return false;
    }
    const auto age = std::chrono::steady_clock::now() - interpreter.created_at();
    return age > std::chrono::seconds(config_.idle_ttl_sec);
}

// ---------------------------------------------------------------------------
// acquire
// ---------------------------------------------------------------------------
asio::awaitable<std::expected<InterpreterLease, EngineError>> InterpreterPool::acquire() {
    const auto executor = co_await asio::this_coro::executor;

    std::vector<std::unique_ptr<LuaInterpreter>> expired;  // lock 밖에서 파괴
    std::shared_ptr<Waiter>                      waiter;
    bool                                         reserved = false;
    {
        std::lock_guard lock(mutex_);

        while (!idle_.empty()) {
            auto interpreter = std::move(idle_.front().interpreter);
            idle_.pop_front();
            if (idle_expired(*interpreter)) {
                expired.push_back(std::move(interpreter));
                --total_;
                ++discarded_;
                continue;
            }
            ++active_;
            co_return InterpreterLease{this, std::move(interpreter)};
        }

        if (total_ < config_.max_size) {
            ++total_;
            ++active_;
            reserved = true;
        } else {
            waiter = std::make_shared<Waiter>(executor);
            waiter->timer.expires_after(std::chrono::milliseconds(config_.acquire_timeout_ms));
            waiters_.push_back(waiter);
        }
    }

    if (!expired.empty()) {
        spdlog::debug("[interpreter_pool] recycled {} idle interpreter(s) past ttl", expired.size());
        expired.clear();
    }

    if (reserved) {
        co_return create_for_slot();
    }

    // ── FIFO 대기 ───────────────────────────────────────────────────────
    // 재개 없이 프레임이 파괴되면 (io_context 종료) 대기열에서 빠진다.
    struct AbandonGuard {
        InterpreterPool*        pool;
        std::shared_ptr<Waiter> waiter;
        ~AbandonGuard() {
            if (waiter) {
                pool->abandon_waiter(waiter);
            }
        }
    };
    AbandonGuard guard{this, waiter};

    boost::system::error_code ec;
    co_await waiter->timer.async_wait(asio::redirect_error(asio::use_awaitable, ec));
    guard.waiter.reset();

    {
        std::lock_guard lock(mutex_);
        if (!waiter->granted) {
            const auto it = std::find(waiters_.begin(), waiters_.end(), waiter);
            if (it != waiters_.end()) {
                waiters_.erase(it);
            }
            spdlog::warn("[interpreter_pool] acquire timed out after {}ms (active={}, waiting={})",
                         config_.acquire_timeout_ms, active_, waiters_.size());
            co_return std::unexpected(make_error(
                EngineErrorCode::kPoolExhausted,
                "no interpreter available within " +
                    std::to_string(config_.acquire_timeout_ms) + "ms",
                "interpreter_pool"));
        }
        if (waiter->handed) {
            co_return InterpreterLease{this, std::move(waiter->handed)};
        }
    }

    // 폐기된 슬롯을 넘겨받음 → 새로 생성
    co_return create_for_slot();
}

// ---------------------------------------------------------------------------
// create_for_slot
//   호출 전에 total_ / active_ 가 이미 예약되어 있어야 한다.
// ---------------------------------------------------------------------------
std::expected<InterpreterLease, EngineError> InterpreterPool::create_for_slot() {
    std::uint64_t id = 0;
    {
        std::lock_guard lock(mutex_);
        id = next_id_++;
    }

    std::unique_ptr<LuaInterpreter> interpreter;
    std::string                     failure;
    try {
        interpreter = factory_(id);
    } catch (const std::exception& e) {
        failure = e.what();
    }

    if (!interpreter) {
        if (failure.empty()) {
            failure = "factory returned no interpreter";
        }

        std::shared_ptr<Waiter> wake;
        {
            std::lock_guard lock(mutex_);
            --total_;
            --active_;
            if (!waiters_.empty()) {
                wake = waiters_.front();
                waiters_.pop_front();
                wake->granted = true;
                ++total_;
                ++active_;
            }
        }
        if (wake) {
            wake_waiter(wake);
        }

        spdlog::error("[interpreter_pool] failed to create interpreter {}: {}", id, failure);
        return std::unexpected(make_error(EngineErrorCode::kInternal,
                                          "failed to create interpreter: " + failure,
                                          "interpreter_pool"));
    }

    {
        std::lock_guard lock(mutex_);
        ++created_;
    }
    spdlog::debug("[interpreter_pool] created interpreter {}", id);
    return InterpreterLease{this, std::move(interpreter)};
}

// ---------------------------------------------------------------------------
// abandon_waiter
//   대기 코루틴이 끝나지 못하고 사라진 경우. 아직 대기열에 있으면 제거하고,
//   이미 넘겨받은 인터프리터는 release 로, 슬롯만 받았으면 예약을 되돌린다.
// ---------------------------------------------------------------------------
void InterpreterPool::abandon_waiter(const std::shared_ptr<Waiter>& waiter) {
    std::unique_ptr<LuaInterpreter> handed;
    {
        std::lock_guard lock(mutex_);
        const auto it = std::find(waiters_.begin(), waiters_.end(), waiter);
        if (it != waiters_.end()) {
            waiters_.erase(it);
            return;
        }
        if (!waiter->granted) {
            return;
        }
        if (!waiter->handed) {
            --total_;
            --active_;
            return;
        }
        handed = std::move(waiter->handed);
    }
    spdlog::debug("[interpreter_pool] waiter abandoned, returning interpreter {}", handed->id());
    release(std::move(handed));
}

// ---------------------------------------------------------------------------
// release
// ---------------------------------------------------------------------------
void InterpreterPool::release(std::unique_ptr<LuaInterpreter> interpreter) {
    if (!interpreter) {
        return;
    }

    std::unique_ptr<LuaInterpreter> doomed;
    std::shared_ptr<Waiter>         wake;
    {
        std::lock_guard lock(mutex_);
        if (!interpreter->healthy()) {
            doomed = std::move(interpreter);
            --total_;
            --active_;
            ++discarded_;
            if (!waiters_.empty()) {
                // 슬롯만 넘긴다. 대기자가 새 인터프리터를 만든다.
                wake = waiters_.front();
                waiters_.pop_front();
                wake->granted = true;
                ++total_;
                ++active_;
            }
        } else if (!waiters_.empty()) {
            wake = waiters_.front();
            waiters_.pop_front();
            wake->handed  = std::move(interpreter);
            wake->granted = true;
        } else {
            --active_;
            idle_.push_back(IdleEntry{std::move(interpreter)});
        }
    }

    if (wake) {
        wake_waiter(wake);
    }
    if (doomed) {
        spdlog::warn("[interpreter_pool] discarded interpreter {} after {} run(s)",
                     doomed->id(), doomed->run_count());
    }
}

PoolGauges InterpreterPool::gauges() const {
    std::lock_guard lock(mutex_);
    return PoolGauges{
        .active    = active_,
        .waiting   = waiters_.size(),
        .idle      = idle_.size(),
        .created   = created_,
        .discarded = discarded_,
        .max_size  = config_.max_size,
    };
}
