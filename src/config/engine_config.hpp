#pragma once

// ---------------------------------------------------------------------------
// engine_config.hpp
//
// 엔진 설정 구조체 정의 (헤더만, 구현 없음).
// yaml-cpp 를 통해 config/hookwarden.yaml 에서 로드된다.
//
// [설계 원칙]
// - 이 헤더는 다른 프로젝트 헤더에 의존하지 않는다 (독립적).
// - 모든 멤버는 기본값을 명시한다. YAML 에 키가 없으면 기본값 유지.
// - 값 범위 검증은 ConfigLoader::load 에서 수행한다 (all-or-nothing).
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <string>

// ---------------------------------------------------------------------------
// GlobalConfig
//   log_level     : "trace"|"debug"|"info"|"warn"|"error"
//   worker_threads: 스크립트 실행 전용 thread_pool 크기
// ---------------------------------------------------------------------------
struct GlobalConfig {
    std::string   log_level{"info"};
    std::string   log_path{"/tmp/hookwarden.log"};
    std::uint32_t worker_threads{4};
    std::string   control_socket{"/tmp/hookwarden.sock"};
};

// ---------------------------------------------------------------------------
// PoolConfig
//   max_size          : 동시에 존재할 수 있는 인터프리터 최대 수 (버스트 생성 없음)
//   acquire_timeout_ms: 대기열에서 이 시간을 넘기면 kPoolExhausted
//   idle_ttl_sec      : 유휴 인터프리터 재생성 주기 (0 = 무제한)
// ---------------------------------------------------------------------------
struct PoolConfig {
    std::uint32_t max_size{20};
    std::uint32_t acquire_timeout_ms{5000};
    std::uint32_t idle_ttl_sec{300};
};

// ---------------------------------------------------------------------------
// SandboxConfig
//   script_timeout_ms : hook 스크립트 wall-clock 예산
//   policy_timeout_ms : 권한 정책 스크립트 wall-clock 예산
//   max_instructions  : VM 명령 수 예산 (0 = 무제한, wall-clock 만 적용)
//   memory_limit_bytes: lua_State 당 할당 상한
//   max_script_size   : hook 스크립트 소스 최대 바이트
//   max_policy_size   : 정책 스크립트 소스 최대 바이트
// ---------------------------------------------------------------------------
struct SandboxConfig {
    std::uint32_t script_timeout_ms{10000};
    std::uint32_t policy_timeout_ms{1000};
    std::uint64_t max_instructions{5'000'000};
    std::size_t   memory_limit_bytes{16u * 1024u * 1024u};
    std::size_t   max_script_size{5120};
    std::size_t   max_policy_size{10240};
};

// ---------------------------------------------------------------------------
// TraceConfig
//   retention_days: cleanup 명령에 cutoff 가 없을 때 사용하는 보존 기간
//   max_io_bytes  : span input/output 저장 최대 바이트
// ---------------------------------------------------------------------------
struct TraceConfig {
    std::uint32_t retention_days{30};
    std::size_t   max_io_bytes{32768};
};

// ---------------------------------------------------------------------------
// EngineConfig
//   전체 설정 루트. ConfigLoader::load 가 반환하는 최종 결과물.
// ---------------------------------------------------------------------------
struct EngineConfig {
    GlobalConfig  global{};
    PoolConfig    pool{};
    SandboxConfig sandbox{};
    TraceConfig   trace{};
};
