#pragma once

// ---------------------------------------------------------------------------
// control_server.hpp
//
// Unix Domain Socket 제어 서버. identity provider (프로세스 외부 호출자) 와
// 운영 도구가 디스패치 / 권한 검사 / 통계 / 보존 정리를 요청한다.
//
// [프로토콜: 길이 프리픽스 + JSON]
//   요청 / 응답 프레임: [4byte LE 길이][JSON 본문]
//   성공: {"ok": true,  "payload": {...}}
//   실패: {"ok": false, "error": "<메시지>", "code": "<error_code_name>"}
//   연결 하나에서 여러 요청을 순차 처리한다. EOF 에서 종료.
//
// [지원 커맨드]
//   {"command":"stats"}
//       EngineStats + 풀 gauge
//   {"command":"dispatch","hook":"before_signup","input":{...}}
//       HookResult {allowed, error?, data?}
//   {"command":"check_permission","subject_type":..,"subject_id":..,
//    "entity_type":..,"entity_id":..,"permission":..,"attributes":{...}?}
//       {"allowed": bool}  거부 사유는 노출하지 않는다
//   {"command":"cleanup","cutoff_ms":N} 또는 {"command":"cleanup","retention_days":N}
//       둘 다 없으면 설정의 retention_days. {deleted_spans, deleted_traces, purged_grants}
//   {"command":"queue_grants","email":..,"grants":[{entity_type,entity_id,relation}],
//    "ttl_sec":N?}
//       가입 완료 후 부여할 relation 적재. {queued}
//   {"command":"clear_grants","email":..}
//       가입 실패 시 적용 없이 제거. {cleared}
//
//   after_signup 디스패치가 성공하면 input.user.{id,email} 로 대기 grant 를 적용한다.
//
// [스레드/비동기 모델]
//   Boost.Asio co_await 기반. io_context 는 외부에서 주입.
//   stop() 은 acceptor 를 닫아 run() 을 종료시킨다.
// ---------------------------------------------------------------------------

#include "authz/permission_evaluator.hpp"
#include "authz/registration_grants.hpp"
#include "authz/tuple_store.hpp"
#include "config/engine_config.hpp"
#include "pipeline/pipeline_dispatcher.hpp"
#include "sandbox/interpreter_pool.hpp"
#include "stats/engine_stats.hpp"
#include "trace/trace_recorder.hpp"

#include <atomic>
#include <filesystem>
#include <string>
#include <string_view>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/local/stream_protocol.hpp>

// ControlServices
//   제어 서버가 호출하는 엔진 구성요소. 모두 서버보다 오래 살아야 한다.
struct ControlServices {
    PipelineDispatcher&    dispatcher;
    PermissionEvaluator&   evaluator;
    TraceRecorder&         traces;
    EngineStats&           stats;
    const InterpreterPool& pool;
    TraceConfig            trace_config;
    // 둘 다 있어야 grant 커맨드와 after_signup 적용이 동작한다
    RegistrationGrantStore* grants{nullptr};
    TupleStore*             tuples{nullptr};
};

class ControlServer {
public:
    ControlServer(const std::filesystem::path& socket_path,
                  ControlServices              services,
                  asio::io_context&            ioc);

    ~ControlServer();

    ControlServer(const ControlServer&)            = delete;
    ControlServer& operator=(const ControlServer&) = delete;
    ControlServer(ControlServer&&)                 = delete;
    ControlServer& operator=(ControlServer&&)      = delete;

    // run
    //   기존 소켓 파일 제거 → bind/listen → accept 루프.
    asio::awaitable<void> run();

    void stop();

    // handle_request
    //   JSON 요청 본문 하나를 처리해 응답 JSON 을 만든다. 소켓 I/O 와 분리되어 있다.
    [[nodiscard]] asio::awaitable<std::string> handle_request(std::string_view request_json);

private:
    asio::awaitable<void> handle_client(asio::local::stream_protocol::socket socket);

    [[nodiscard]] std::string handle_stats() const;
    [[nodiscard]] asio::awaitable<std::string> handle_dispatch(const Value& request);
    [[nodiscard]] asio::awaitable<std::string> handle_check_permission(const Value& request);
    [[nodiscard]] std::string handle_cleanup(const Value& request);
    [[nodiscard]] std::string handle_queue_grants(const Value& request);
    [[nodiscard]] std::string handle_clear_grants(const Value& request);

    void apply_signup_grants(const Value& input);

    std::filesystem::path                  socket_path_;
    ControlServices                        services_;
    asio::io_context&                      ioc_;
    asio::local::stream_protocol::acceptor acceptor_;
    std::atomic<bool>                      stop_requested_{false};
};
