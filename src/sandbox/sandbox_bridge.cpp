#include "sandbox/sandbox_bridge.hpp"

#include "sandbox/lua_pattern.hpp"

#include <chrono>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <spdlog/spdlog.h>

namespace {

constexpr std::size_t kMaxLogMessage = 1024;

std::string render_log_args(const std::vector<Value>& args) {
    std::string text;
    for (const auto& arg : args) {
        if (!text.empty()) {
            text += ' ';
        }
        text += arg.is_string() ? arg.as_string() : arg.to_json();
    }
    return truncate_text(text, kMaxLogMessage);
}

std::expected<std::string, std::string> string_arg(const std::vector<Value>& args,
                                                   std::size_t               index,
                                                   std::string_view          function) {
    if (index >= args.size() || !args[index].is_string()) {
        return std::unexpected(std::string{function} + ": argument #" +
                               std::to_string(index + 1) + " must be a string");
    }
    return args[index].as_string();
}

}  // namespace

SandboxBridge::SandboxBridge(InterpreterPool&      pool,
                             const SecretStore&    secrets,
                             const SandboxConfig&  config,
                             asio::any_io_executor script_executor)
    : pool_(pool)
    , secrets_(secrets)
    , config_(config)
    , script_executor_(std::move(script_executor))
{}

void SandboxBridge::set_relation_check(RelationCheck check) {
    relation_check_ = std::move(check);
}

asio::awaitable<std::expected<Value, EngineError>>
SandboxBridge::run_hook_script(std::string_view script_id, std::string_view source,
                               const Value& context) {
    ExecutionLimits limits;
    limits.timeout          = std::chrono::milliseconds(config_.script_timeout_ms);
    limits.max_instructions = config_.max_instructions;
    co_return co_await execute("script:" + std::string{script_id}, source, context, limits,
                               config_.max_script_size);
}

asio::awaitable<std::expected<Value, EngineError>>
SandboxBridge::run_policy_script(std::string_view policy_name, std::string_view source,
                                 const Value& context) {
    ExecutionLimits limits;
    limits.timeout          = std::chrono::milliseconds(config_.policy_timeout_ms);
    limits.max_instructions = config_.max_instructions;
    co_return co_await execute("policy:" + std::string{policy_name}, source, context, limits,
                               config_.max_policy_size);
}

// ---------------------------------------------------------------------------
// execute
//   1. 크기 검사  2. 풀 acquire  3. worker 에서 실행  4. lease 반환 (RAII)
// ---------------------------------------------------------------------------
asio::awaitable<std::expected<Value, EngineError>>
SandboxBridge::execute(std::string chunk_name, std::string_view source, const Value& context,
                       ExecutionLimits limits, std::size_t max_source_size) {
    if (source.size() > max_source_size) {
        co_return std::unexpected(make_error(EngineErrorCode::kSandbox,
                                             "script exceeds size limit", chunk_name));
    }

    auto lease = co_await pool_.acquire();
    if (!lease) {
        co_return std::unexpected(lease.error());
    }

    const ScriptEnvironment env = make_environment(chunk_name, context);
    LuaInterpreter&         interpreter = **lease;

    std::expected<Value, EngineError> result;
    try {
        result = co_await asio::co_spawn(
            script_executor_,
            [&]() -> asio::awaitable<std::expected<Value, EngineError>> {
                co_return interpreter.run(chunk_name, source, env, limits);
            },
            asio::use_awaitable);
    } catch (const std::exception& e) {
        lease->discard();
        spdlog::error("[sandbox] {} aborted: {}", chunk_name, e.what());
        result = std::unexpected(make_error(EngineErrorCode::kSandbox,
                                            std::string{"script execution failed: "} + e.what(),
                                            chunk_name));
    }
    co_return result;
}

// ---------------------------------------------------------------------------
// make_environment
//   NativeFunction 은 worker 스레드에서 호출된다. 캡처 대상은 thread-safe 해야 한다.
// ---------------------------------------------------------------------------
ScriptEnvironment SandboxBridge::make_environment(const std::string& chunk_name,
                                                  const Value&       context) const {
    ScriptEnvironment env;
    env.context = context;

    const SecretStore* secrets = &secrets_;
    env.globals["secret"] = [secrets](const std::vector<Value>& args)
        -> std::expected<Value, std::string> {
        auto name = string_arg(args, 0, "secret");
        if (!name) {
            return std::unexpected(name.error());
        }
        auto value = secrets->lookup(*name);
        if (!value) {
            return std::unexpected("secret '" + *name + "' is not defined");
        }
        return Value{std::move(*value)};
    };

    auto& helpers = env.tables["helpers"];

    helpers["log"] = [chunk_name](const std::vector<Value>& args)
        -> std::expected<Value, std::string> {
        spdlog::info("[script] {}: {}", chunk_name, render_log_args(args));
        return Value{};
    };

    helpers["now"] = [](const std::vector<Value>&) -> std::expected<Value, std::string> {
        return Value{to_epoch_ms(std::chrono::system_clock::now())};
    };

    helpers["matches"] = [chunk_name](const std::vector<Value>& args)
        -> std::expected<Value, std::string> {
        auto text = string_arg(args, 0, "matches");
        if (!text) {
            return std::unexpected(text.error());
        }
        auto pattern = string_arg(args, 1, "matches");
        if (!pattern) {
            return std::unexpected(pattern.error());
        }
        auto found = lua_pattern_find(*text, *pattern);
        if (!found) {
            spdlog::warn("[script] {}: pattern '{}' rejected: {}", chunk_name,
                         truncate_text(*pattern, 128), found.error());
            return std::unexpected("matches: " + found.error());
        }
        return Value{*found};
    };

    const RelationCheck check = relation_check_;
    helpers["check_permission"] = [check](const std::vector<Value>& args)
        -> std::expected<Value, std::string> {
        std::string parts[5];
        for (std::size_t i = 0; i < 5; ++i) {
            auto part = string_arg(args, i, "check_permission");
            if (!part) {
                return std::unexpected(part.error());
            }
            parts[i] = std::move(*part);
        }
        if (!check) {
            return Value{false};
        }
        return Value{check(parts[0], parts[1], parts[2], parts[3], parts[4])};
    };

    return env;
}
