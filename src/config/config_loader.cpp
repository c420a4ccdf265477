// ---------------------------------------------------------------------------
// config_loader.cpp
//
// YAML 설정 파일을 로드하여 EngineConfig 구조체로 파싱한다.
//
// [설계 원칙]
// - All-or-nothing: 파싱 / 검증 실패 시 부분 설정을 반환하지 않는다.
// - 필드 누락 시 기본값(구조체 기본값)을 적용한다.
// - 숫자 필드에 타입이 맞지 않는 값이 오면 오류로 처리한다 (조용한 fallback 금지).
//   잘못된 timeout 이 기본값으로 묻히면 운영자가 의도한 제한이 적용되지 않는다.
//
// [값 범위 검증]
// - pool.max_size >= 1
// - global.worker_threads >= 1
// - sandbox.*_timeout_ms >= 1
// - sandbox.memory_limit_bytes >= 256KiB (Lua 표준 라이브러리 로드 최소치)
// ---------------------------------------------------------------------------

#include "config/config_loader.hpp"

#include <cstdint>
#include <string>

#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>

namespace {

constexpr std::size_t kMinMemoryLimit = 256u * 1024u;

// ---------------------------------------------------------------------------
// 내부 헬퍼: 스칼라 읽기. 노드가 없으면 fallback, 타입 불일치면 YAML 예외 전파.
// ---------------------------------------------------------------------------
template <typename T>
[[nodiscard]] T read_scalar(const YAML::Node& node, const T& fallback) {
    if (!node || node.IsNull()) {
        return fallback;
    }
    if (!node.IsScalar()) {
        throw YAML::TypedBadConversion<T>(node.Mark());
    }
    return node.as<T>();
}

[[nodiscard]] GlobalConfig parse_global(const YAML::Node& node) {
    GlobalConfig cfg{};
    if (!node || !node.IsMap()) {
        return cfg;
    }
    cfg.log_level      = read_scalar<std::string>(node["log_level"], cfg.log_level);
    cfg.log_path       = read_scalar<std::string>(node["log_path"], cfg.log_path);
    cfg.worker_threads = read_scalar<std::uint32_t>(node["worker_threads"], cfg.worker_threads);
    cfg.control_socket = read_scalar<std::string>(node["control_socket"], cfg.control_socket);
    return cfg;
}

[[nodiscard]] PoolConfig parse_pool(const YAML::Node& node) {
    PoolConfig cfg{};
    if (!node || !node.IsMap()) {
        return cfg;
    }
    cfg.max_size           = read_scalar<std::uint32_t>(node["max_size"], cfg.max_size);
    cfg.acquire_timeout_ms = read_scalar<std::uint32_t>(node["acquire_timeout_ms"], cfg.acquire_timeout_ms);
    cfg.idle_ttl_sec       = read_scalar<std::uint32_t>(node["idle_ttl_sec"], cfg.idle_ttl_sec);
    return cfg;
}

[[nodiscard]] SandboxConfig parse_sandbox(const YAML::Node& node) {
    SandboxConfig cfg{};
    if (!node || !node.IsMap()) {
        return cfg;
    }
    cfg.script_timeout_ms  = read_scalar<std::uint32_t>(node["script_timeout_ms"], cfg.script_timeout_ms);
    cfg.policy_timeout_ms  = read_scalar<std::uint32_t>(node["policy_timeout_ms"], cfg.policy_timeout_ms);
    cfg.max_instructions   = read_scalar<std::uint64_t>(node["max_instructions"], cfg.max_instructions);
    cfg.memory_limit_bytes = read_scalar<std::size_t>(node["memory_limit_bytes"], cfg.memory_limit_bytes);
    cfg.max_script_size    = read_scalar<std::size_t>(node["max_script_size"], cfg.max_script_size);
    cfg.max_policy_size    = read_scalar<std::size_t>(node["max_policy_size"], cfg.max_policy_size);
    return cfg;
}

[[nodiscard]] TraceConfig parse_trace(const YAML::Node& node) {
    TraceConfig cfg{};
    if (!node || !node.IsMap()) {
        return cfg;
    }
    cfg.retention_days = read_scalar<std::uint32_t>(node["retention_days"], cfg.retention_days);
    cfg.max_io_bytes   = read_scalar<std::size_t>(node["max_io_bytes"], cfg.max_io_bytes);
    return cfg;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: 값 범위 검증. 실패 시 오류 메시지, 성공 시 빈 문자열.
// ---------------------------------------------------------------------------
[[nodiscard]] std::string validate(const EngineConfig& cfg) {
    if (cfg.pool.max_size == 0) {
        return "pool.max_size must be at least 1";
    }
    if (cfg.global.worker_threads == 0) {
        return "global.worker_threads must be at least 1";
    }
    if (cfg.sandbox.script_timeout_ms == 0 || cfg.sandbox.policy_timeout_ms == 0) {
        return "sandbox timeouts must be at least 1ms";
    }
    if (cfg.sandbox.memory_limit_bytes < kMinMemoryLimit) {
        return fmt::format("sandbox.memory_limit_bytes must be at least {}", kMinMemoryLimit);
    }
    if (cfg.sandbox.max_script_size == 0 || cfg.sandbox.max_policy_size == 0) {
        return "sandbox script size limits must be positive";
    }
    const auto& lvl = cfg.global.log_level;
    if (lvl != "trace" && lvl != "debug" && lvl != "info" && lvl != "warn" && lvl != "error") {
        return fmt::format("global.log_level '{}' is not one of trace|debug|info|warn|error", lvl);
    }
    return {};
}

[[nodiscard]] std::expected<EngineConfig, std::string> parse_root(const YAML::Node& root,
                                                                  std::string_view  origin) {
    if (!root || root.IsNull()) {
        // 빈 문서 → 전체 기본값
        return EngineConfig{};
    }
    if (!root.IsMap()) {
        const std::string err = fmt::format(
            "config_loader: '{}' is not a valid YAML map (top-level)", origin);
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    EngineConfig cfg{};
    const char* section = "global";
    try {
        cfg.global  = parse_global(root["global"]);
        section     = "pool";
        cfg.pool    = parse_pool(root["pool"]);
        section     = "sandbox";
        cfg.sandbox = parse_sandbox(root["sandbox"]);
        section     = "trace";
        cfg.trace   = parse_trace(root["trace"]);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format(
            "config_loader: error parsing '{}' section of '{}' at line {}: {}",
            section, origin, e.mark.line + 1, e.msg);
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    if (auto problem = validate(cfg); !problem.empty()) {
        const std::string err = fmt::format("config_loader: {} ({})", problem, origin);
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    spdlog::info(
        "config_loader: config loaded: pool.max_size={}, script_timeout_ms={}, "
        "retention_days={}",
        cfg.pool.max_size, cfg.sandbox.script_timeout_ms, cfg.trace.retention_days);
    return cfg;
}

}  // namespace

// ---------------------------------------------------------------------------
// ConfigLoader::load
// ---------------------------------------------------------------------------
std::expected<EngineConfig, std::string>
ConfigLoader::load(const std::filesystem::path& config_path) {
    std::error_code ec;
    const auto canonical_path = std::filesystem::canonical(config_path, ec);
    if (ec) {
        const std::string err = fmt::format(
            "config_loader: cannot resolve config path '{}': {}",
            config_path.string(), ec.message());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    spdlog::info("config_loader: loading config from '{}'", canonical_path.string());

    YAML::Node root;
    try {
        root = YAML::LoadFile(canonical_path.string());
    } catch (const YAML::BadFile& e) {
        const std::string err = fmt::format(
            "config_loader: cannot open file '{}': {}", canonical_path.string(), e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::ParserException& e) {
        const std::string err = fmt::format(
            "config_loader: YAML parse error in '{}' at line {}, col {}: {}",
            canonical_path.string(), e.mark.line + 1, e.mark.column + 1, e.msg);
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format(
            "config_loader: YAML error in '{}': {}", canonical_path.string(), e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    return parse_root(root, canonical_path.string());
}

std::expected<EngineConfig, std::string>
ConfigLoader::load_from_string(std::string_view yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string{yaml_text});
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format(
            "config_loader: YAML parse error at line {}, col {}: {}",
            e.mark.line + 1, e.mark.column + 1, e.msg);
        spdlog::error("{}", err);
        return std::unexpected(err);
    }
    return parse_root(root, "<string>");
}
