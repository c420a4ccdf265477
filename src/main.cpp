#include "authz/audit_log.hpp"
#include "authz/model_store.hpp"
#include "authz/permission_evaluator.hpp"
#include "authz/policy_version_store.hpp"
#include "authz/registration_grants.hpp"
#include "authz/tuple_store.hpp"
#include "config/config_loader.hpp"
#include "config/workspace_loader.hpp"
#include "control/control_server.hpp"
#include "hooks/hook_registry.hpp"
#include "logger/structured_logger.hpp"
#include "pipeline/pipeline_dispatcher.hpp"
#include "pipeline/script_repository.hpp"
#include "sandbox/interpreter_pool.hpp"
#include "sandbox/sandbox_bridge.hpp"
#include "sandbox/secret_store.hpp"
#include "stats/engine_stats.hpp"
#include "trace/trace_recorder.hpp"

#include <spdlog/spdlog.h>

#include <csignal>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <optional>
#include <string>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/thread_pool.hpp>

// ---------------------------------------------------------------------------
// Helper: 환경변수 읽기 (없으면 기본값 반환)
// ---------------------------------------------------------------------------
namespace {

std::string env_str(const char* name, std::string default_val) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val != nullptr && val[0] != '\0') {
        return val;
    }
    return default_val;
}

// ---------------------------------------------------------------------------
// ExecutorShutdown
//   엔진 객체보다 뒤에 선언해서 먼저 파괴된다.
//   worker 를 멈추고 io_context 를 파괴하면 남은 코루틴 프레임이 풀려나며
//   lease / 대기자가 아직 살아 있는 InterpreterPool 로 돌아간다.
// ---------------------------------------------------------------------------
struct ExecutorShutdown {
    std::optional<boost::asio::thread_pool>& workers;
    std::optional<boost::asio::io_context>&  ioc;

    ~ExecutorShutdown() {
        if (workers) {
            workers->stop();
            workers->join();
            workers.reset();
        }
        ioc.reset();
    }
};

} // namespace

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int /*argc*/, char* /*argv*/[]) {

    // ── 설정 로드 (파일 → 환경변수 override) ───────────────────────────
    const std::string config_path    = env_str("HOOKWARDEN_CONFIG",    "config/hookwarden.yaml");
    const std::string workspace_path = env_str("HOOKWARDEN_WORKSPACE", "");

    EngineConfig config;
    if (std::filesystem::exists(config_path)) {
        auto loaded = ConfigLoader::load(config_path);
        if (!loaded) {
            return EXIT_FAILURE;
        }
        config = std::move(*loaded);
    } else {
        spdlog::warn("config file '{}' not found, using defaults", config_path);
    }
    config.global.control_socket = env_str("HOOKWARDEN_SOCKET", config.global.control_socket);
    config.global.log_level      = env_str("LOG_LEVEL",         config.global.log_level);

    const auto level = parse_log_level(config.global.log_level);
    if (!level) {
        spdlog::error("invalid log level '{}'", config.global.log_level);
        return EXIT_FAILURE;
    }

    spdlog::info("Starting hookwarden engine");
    spdlog::info("Config: {}", config_path);
    spdlog::info("Workspace: {}", workspace_path.empty() ? "<none>" : workspace_path);
    spdlog::info("Control socket: {}", config.global.control_socket);
    spdlog::info("Log level: {}", config.global.log_level);
    spdlog::info("Script workers: {}", config.global.worker_threads);

    try {
        StructuredLogger logger{*level, config.global.log_path};

        // ── 저장소 ─────────────────────────────────────────────────────
        HookRegistry               hooks;
        InMemoryScriptRepository   scripts;
        InMemorySecretStore        secrets;
        InMemoryTupleStore         tuples;
        InMemoryPolicyVersionStore policy_versions;
        InMemoryModelStore         models{tuples, &policy_versions};
        InMemoryAuditLog           audit;
        InMemoryTraceRecorder      traces{config.trace.max_io_bytes};
        EngineStats                stats;
        RegistrationGrantStore     grants;

        if (!workspace_path.empty()) {
            auto seeded = WorkspaceLoader::load(
                workspace_path, WorkspaceTargets{hooks, scripts, models, tuples, secrets});
            if (!seeded) {
                return EXIT_FAILURE;
            }
        }

        // ── 실행 계층 ──────────────────────────────────────────────────
        std::optional<boost::asio::io_context>  ioc{std::in_place};
        std::optional<boost::asio::thread_pool> script_workers{std::in_place,
                                                               config.global.worker_threads};

        InterpreterPool pool{config.pool, config.sandbox.memory_limit_bytes};
        SandboxBridge   bridge{pool, secrets, config.sandbox, script_workers->get_executor()};

        PermissionEvaluator evaluator{models, tuples, &bridge, audit, stats, &logger};
        bridge.set_relation_check(
            [&evaluator](std::string_view subject_type, std::string_view subject_id,
                         std::string_view entity_type, std::string_view entity_id,
                         std::string_view permission) {
                return evaluator.check_relation(subject_type, subject_id, entity_type,
                                                entity_id, permission);
            });

        PipelineDispatcher dispatcher{hooks, scripts, bridge, traces, stats, &logger,
                                      ioc->get_executor()};

        ExecutorShutdown executor_shutdown{script_workers, ioc};

        ControlServer control{
            config.global.control_socket,
            ControlServices{dispatcher, evaluator, traces, stats, pool, config.trace,
                            &grants, &tuples},
            *ioc};

        // ── 시그널 처리 (graceful shutdown) ────────────────────────────
        boost::asio::signal_set signals{*ioc, SIGINT, SIGTERM};
        signals.async_wait([&](const boost::system::error_code& ec, int signo) {
            if (ec) {
                return;
            }
            spdlog::info("signal {} received, shutting down", signo);
            control.stop();
            ioc->stop();
        });

        boost::asio::co_spawn(*ioc, control.run(),
            [](std::exception_ptr eptr) {
                if (eptr) {
                    try {
                        std::rethrow_exception(eptr);
                    } catch (const std::exception& e) {
                        spdlog::error("control server terminated: {}", e.what());
                    }
                }
            });

        ioc->run();

        // 비동기 hook 작업은 기다리지 않는다 (ExecutorShutdown 이 정리)
        logger.flush();
    } catch (const std::exception& e) {
        spdlog::error("fatal: {}", e.what());
        return EXIT_FAILURE;
    }

    // ── 종료 처리 ───────────────────────────────────────────────────────
    spdlog::info("hookwarden engine stopped");

    return EXIT_SUCCESS;
}
