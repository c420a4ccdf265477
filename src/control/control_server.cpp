// ---------------------------------------------------------------------------
// control_server.cpp
//
// ControlServer 구현. 요청/응답 모두 4byte LE 길이 프리픽스 + JSON 바디.
// 요청 JSON 은 yaml-cpp 로 파싱하고 응답은 Value::to_json 으로 직렬화한다.
// ---------------------------------------------------------------------------

#include "control/control_server.hpp"

#include "config/yaml_value.hpp"

#include <spdlog/spdlog.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <iterator>
#include <vector>

namespace {

// {"ok":true,"payload":<data>}
std::string make_ok_response(const Value& payload) {
    return fmt::format(R"({{"ok":true,"payload":{}}})", payload.to_json());
}

// {"ok":false,"error":"<msg>","code":"<code>"}
std::string make_error_response(std::string_view msg, std::string_view code = "bad_request") {
    return fmt::format(R"({{"ok":false,"error":"{}","code":"{}"}})",
                       json_escape(msg), json_escape(code));
}

std::string make_error_response(const EngineError& error) {
    return make_error_response(error.message, error_code_name(error.code));
}

std::array<uint8_t, 4> encode_le4(uint32_t val) {
    return {
        static_cast<uint8_t>(val),
        static_cast<uint8_t>(val >> 8),
        static_cast<uint8_t>(val >> 16),
        static_cast<uint8_t>(val >> 24),
    };
}

uint32_t decode_le4(const std::array<uint8_t, 4>& buf) {
    return static_cast<uint32_t>(buf[0])
         | (static_cast<uint32_t>(buf[1]) << 8)
         | (static_cast<uint32_t>(buf[2]) << 16)
         | (static_cast<uint32_t>(buf[3]) << 24);
}

Value outcome_counts(const OutcomeCounts& c) {
    return Value::object({
        {"allowed",   static_cast<std::int64_t>(c.allowed)},
        {"denied",    static_cast<std::int64_t>(c.denied)},
        {"errors",    static_cast<std::int64_t>(c.errors)},
        {"deny_rate", c.deny_rate},
    });
}

// required_string
//   요청 object 의 필수 문자열 필드. 없거나 문자열이 아니면 nullptr.
const std::string* required_string(const Value& request, std::string_view key) {
    const Value* field = request.find(key);
    if (field == nullptr || !field->is_string() || field->as_string().empty()) {
        return nullptr;
    }
    return &field->as_string();
}

// 단일 요청 최대 크기 (4MiB)
constexpr uint32_t kMaxRequestSize = 4u * 1024u * 1024u;

}  // namespace

ControlServer::ControlServer(const std::filesystem::path& socket_path,
                             ControlServices              services,
                             asio::io_context&            ioc)
    : socket_path_{socket_path}
    , services_{services}
    , ioc_{ioc}
    , acceptor_{ioc}
{}

ControlServer::~ControlServer() {
    stop();
}

void ControlServer::stop() {
    if (stop_requested_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    auto close_acceptor = [this]() {
        boost::system::error_code ec;
        acceptor_.cancel(ec);
        if (ec && ec != asio::error::bad_descriptor) {
            spdlog::warn("[control] stop: acceptor cancel error: {}", ec.message());
        }
        acceptor_.close(ec);
        if (ec && ec != asio::error::bad_descriptor) {
            spdlog::warn("[control] stop: acceptor close error: {}", ec.message());
        }
    };

    // acceptor 는 io_context 스레드에서만 만진다
    if (ioc_.stopped()) {
        close_acceptor();
        return;
    }
    asio::post(ioc_, std::move(close_acceptor));
}

asio::awaitable<void> ControlServer::run() {
    using stream_protocol = asio::local::stream_protocol;

    if (stop_requested_.load(std::memory_order_acquire)) {
        co_return;
    }

    std::error_code fs_ec;
    std::filesystem::remove(socket_path_, fs_ec);
    if (fs_ec && fs_ec != std::make_error_code(std::errc::no_such_file_or_directory)) {
        spdlog::error("[control] failed to remove old socket {}: {}",
                      socket_path_.string(), fs_ec.message());
        co_return;
    }

    boost::system::error_code ec;
    acceptor_.open(stream_protocol(), ec);
    if (ec) {
        spdlog::error("[control] open error: {}", ec.message());
        co_return;
    }
    acceptor_.bind(stream_protocol::endpoint{socket_path_.string()}, ec);
    if (ec) {
        spdlog::error("[control] bind error on {}: {}", socket_path_.string(), ec.message());
        co_return;
    }
    acceptor_.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
        spdlog::error("[control] listen error: {}", ec.message());
        co_return;
    }

    spdlog::info("[control] listening on {}", socket_path_.string());

    for (;;) {
        if (stop_requested_.load(std::memory_order_acquire)) {
            co_return;
        }

        stream_protocol::socket client_socket{ioc_};
        boost::system::error_code accept_ec;
        co_await acceptor_.async_accept(client_socket,
                                        asio::redirect_error(asio::use_awaitable, accept_ec));
        if (accept_ec) {
            if (accept_ec == asio::error::operation_aborted ||
                accept_ec == boost::system::errc::bad_file_descriptor) {
                spdlog::info("[control] accept loop stopped");
            } else {
                spdlog::error("[control] accept error: {}", accept_ec.message());
            }
            co_return;
        }

        asio::co_spawn(ioc_, handle_client(std::move(client_socket)),
                       [](std::exception_ptr eptr) {
                           if (eptr) {
                               try { std::rethrow_exception(eptr); }
                               catch (const std::exception& e) {
                                   spdlog::error("[control] client handler exception: {}", e.what());
                               }
                           }
                       });
    }
}

// ---------------------------------------------------------------------------
// handle_client
//   요청 헤더 → 바디 → handle_request → 응답. EOF 까지 반복.
// ---------------------------------------------------------------------------
asio::awaitable<void> ControlServer::handle_client(asio::local::stream_protocol::socket socket) {
    for (;;) {
        boost::system::error_code ec;

        std::array<uint8_t, 4> req_hdr{};
        const std::size_t hdr_n = co_await asio::async_read(
            socket, asio::buffer(req_hdr), asio::redirect_error(asio::use_awaitable, ec));
        if (ec) {
            if (ec != asio::error::eof) {
                spdlog::warn("[control] read header error: {}", ec.message());
            }
            co_return;
        }
        if (hdr_n != req_hdr.size()) {
            spdlog::warn("[control] short header ({} bytes)", hdr_n);
            co_return;
        }

        const uint32_t body_len = decode_le4(req_hdr);
        if (body_len == 0 || body_len > kMaxRequestSize) {
            spdlog::warn("[control] invalid body length {}", body_len);
            co_return;
        }

        std::vector<char> body_buf(body_len);
        const std::size_t body_n = co_await asio::async_read(
            socket, asio::buffer(body_buf), asio::redirect_error(asio::use_awaitable, ec));
        if (ec || body_n != body_len) {
            spdlog::warn("[control] read body error ({}/{} bytes): {}", body_n, body_len,
                         ec ? ec.message() : "short read");
            co_return;
        }

        const std::string response_body =
            co_await handle_request(std::string_view{body_buf.data(), body_n});

        const auto resp_hdr = encode_le4(static_cast<uint32_t>(response_body.size()));
        std::array<asio::const_buffer, 2> bufs{
            asio::buffer(resp_hdr),
            asio::buffer(response_body),
        };
        const std::size_t write_n = co_await asio::async_write(
            socket, bufs, asio::redirect_error(asio::use_awaitable, ec));
        if (ec) {
            spdlog::warn("[control] write error: {}", ec.message());
            co_return;
        }
        spdlog::debug("[control] response_bytes={}", write_n);
    }
}

asio::awaitable<std::string> ControlServer::handle_request(std::string_view request_json) {
    auto parsed = parse_json_value(request_json);
    if (!parsed) {
        co_return make_error_response("malformed request: " + parsed.error());
    }
    const Value& request = *parsed;
    if (!request.is_object()) {
        co_return make_error_response("request must be a JSON object");
    }

    const std::string* command = required_string(request, "command");
    if (command == nullptr) {
        spdlog::warn("[control] missing or malformed 'command' field");
        co_return make_error_response("missing or malformed 'command' field");
    }

    if (*command == "stats") {
        co_return handle_stats();
    }
    if (*command == "dispatch") {
        co_return co_await handle_dispatch(request);
    }
    if (*command == "check_permission") {
        co_return co_await handle_check_permission(request);
    }
    if (*command == "cleanup") {
        co_return handle_cleanup(request);
    }
    if (*command == "queue_grants") {
        co_return handle_queue_grants(request);
    }
    if (*command == "clear_grants") {
        co_return handle_clear_grants(request);
    }

    spdlog::warn("[control] unknown command '{}'", *command);
    co_return make_error_response(fmt::format("unknown command '{}'", *command));
}

std::string ControlServer::handle_stats() const {
    const EngineStatsSnapshot snap   = services_.stats.snapshot();
    const PoolGauges          gauges = services_.pool.gauges();

    return make_ok_response(Value::object({
        {"dispatch",        outcome_counts(snap.dispatch)},
        {"permission",      outcome_counts(snap.permission)},
        {"async_scheduled", static_cast<std::int64_t>(snap.async_scheduled)},
        {"script_failures", static_cast<std::int64_t>(snap.script_failures)},
        {"uptime_sec",      snap.uptime_sec},
        {"pool", Value::object({
            {"active",    static_cast<std::int64_t>(gauges.active)},
            {"waiting",   static_cast<std::int64_t>(gauges.waiting)},
            {"idle",      static_cast<std::int64_t>(gauges.idle)},
            {"created",   static_cast<std::int64_t>(gauges.created)},
            {"discarded", static_cast<std::int64_t>(gauges.discarded)},
            {"max_size",  static_cast<std::int64_t>(gauges.max_size)},
        })},
        {"captured_at_ms",  to_epoch_ms(snap.captured_at)},
    }));
}

asio::awaitable<std::string> ControlServer::handle_dispatch(const Value& request) {
    const std::string* hook = required_string(request, "hook");
    if (hook == nullptr) {
        co_return make_error_response("dispatch requires 'hook'");
    }
    const Value* input = request.find("input");
    Value        input_value = input != nullptr ? *input : Value::object();

    auto result = co_await services_.dispatcher.dispatch(*hook, input_value);
    if (!result) {
        co_return make_error_response(result.error());
    }
    if (*hook == "after_signup") {
        apply_signup_grants(input_value);
    }

    Value payload = Value::object({{"allowed", result->allowed}});
    if (result->error) {
        payload["error"] = *result->error;
    }
    if (result->data) {
        payload["data"] = *result->data;
    }
    co_return make_ok_response(payload);
}

asio::awaitable<std::string> ControlServer::handle_check_permission(const Value& request) {
    static constexpr std::string_view kFields[] = {
        "subject_type", "subject_id", "entity_type", "entity_id", "permission",
    };
    std::string values[std::size(kFields)];
    for (std::size_t i = 0; i < std::size(kFields); ++i) {
        const std::string* field = required_string(request, kFields[i]);
        if (field == nullptr) {
            co_return make_error_response(fmt::format("check_permission requires '{}'", kFields[i]));
        }
        values[i] = *field;
    }

    const Value* attributes = request.find("attributes");
    const bool allowed = co_await services_.evaluator.check_permission(
        values[0], values[1], values[2], values[3], values[4],
        attributes != nullptr ? *attributes : Value{});

    co_return make_ok_response(Value::object({{"allowed", allowed}}));
}

std::string ControlServer::handle_cleanup(const Value& request) {
    const auto now = std::chrono::system_clock::now();
    Timestamp  cutoff;

    if (const Value* cutoff_ms = request.find("cutoff_ms"); cutoff_ms != nullptr) {
        if (!cutoff_ms->is_int() || cutoff_ms->as_int() < 0) {
            return make_error_response("'cutoff_ms' must be a non-negative integer");
        }
        cutoff = Timestamp{std::chrono::milliseconds(cutoff_ms->as_int())};
    } else if (const Value* days = request.find("retention_days"); days != nullptr) {
        if (!days->is_int() || days->as_int() < 0) {
            return make_error_response("'retention_days' must be a non-negative integer");
        }
        cutoff = now - std::chrono::hours(24) * days->as_int();
    } else {
        cutoff = now - std::chrono::hours(24) * services_.trace_config.retention_days;
    }

    const CleanupResult result = services_.traces.cleanup(cutoff);
    const std::size_t   purged = services_.grants != nullptr
                                     ? services_.grants->purge_expired(now)
                                     : 0;
    return make_ok_response(Value::object({
        {"deleted_spans",  static_cast<std::int64_t>(result.deleted_spans)},
        {"deleted_traces", static_cast<std::int64_t>(result.deleted_traces)},
        {"purged_grants",  static_cast<std::int64_t>(purged)},
        {"cutoff_ms",      to_epoch_ms(cutoff)},
    }));
}

// ---------------------------------------------------------------------------
// registration grants
// ---------------------------------------------------------------------------
std::string ControlServer::handle_queue_grants(const Value& request) {
    if (services_.grants == nullptr || services_.tuples == nullptr) {
        return make_error_response("registration grants are not enabled");
    }
    const std::string* email = required_string(request, "email");
    if (email == nullptr) {
        return make_error_response("queue_grants requires 'email'");
    }
    const Value* list = request.find("grants");
    if (list == nullptr || !list->is_array() || list->as_array().empty()) {
        return make_error_response("queue_grants requires a non-empty 'grants' array");
    }

    std::vector<PendingGrant> grants;
    grants.reserve(list->as_array().size());
    for (const auto& item : list->as_array()) {
        const std::string* entity_type = item.is_object() ? required_string(item, "entity_type") : nullptr;
        const std::string* entity_id   = item.is_object() ? required_string(item, "entity_id") : nullptr;
        const std::string* relation    = item.is_object() ? required_string(item, "relation") : nullptr;
        if (entity_type == nullptr || entity_id == nullptr || relation == nullptr) {
            return make_error_response(
                "each grant requires 'entity_type', 'entity_id' and 'relation'");
        }
        grants.push_back(PendingGrant{*entity_type, *entity_id, *relation});
    }

    std::chrono::seconds ttl{0};
    if (const Value* ttl_sec = request.find("ttl_sec"); ttl_sec != nullptr) {
        if (!ttl_sec->is_int() || ttl_sec->as_int() <= 0) {
            return make_error_response("'ttl_sec' must be a positive integer");
        }
        ttl = std::chrono::seconds(ttl_sec->as_int());
    }

    const auto count = grants.size();
    services_.grants->queue(*email, std::move(grants), ttl);
    spdlog::info("[control] queued {} grant(s) for pending signup", count);
    return make_ok_response(Value::object({{"queued", static_cast<std::int64_t>(count)}}));
}

std::string ControlServer::handle_clear_grants(const Value& request) {
    if (services_.grants == nullptr) {
        return make_error_response("registration grants are not enabled");
    }
    const std::string* email = required_string(request, "email");
    if (email == nullptr) {
        return make_error_response("clear_grants requires 'email'");
    }
    return make_ok_response(Value::object({{"cleared", services_.grants->clear(*email)}}));
}

// apply_signup_grants
//   after_signup 입력의 user.id / user.email 로 대기 grant 를 tuple 로 기록한다.
//   실패는 로그만 남기고 디스패치 결과에는 영향을 주지 않는다.
void ControlServer::apply_signup_grants(const Value& input) {
    if (services_.grants == nullptr || services_.tuples == nullptr) {
        return;
    }
    const Value* user = input.find("user");
    if (user == nullptr || !user->is_object()) {
        return;
    }
    const std::string* user_id = required_string(*user, "id");
    const std::string* email   = required_string(*user, "email");
    if (user_id == nullptr || email == nullptr) {
        return;
    }

    auto applied = apply_pending_grants(*services_.grants, *services_.tuples, *user_id, *email);
    if (!applied) {
        spdlog::error("[control] pending grants for user {} not applied: {}", *user_id,
                      applied.error().message);
    }
}
