#pragma once

// ---------------------------------------------------------------------------
// hook_registry.hpp
//
// identity provider 생명주기에서 스크립트를 연결할 수 있는 16개 hook 정의.
//
// [설계 원칙]
// - 정의는 생성자에서 한 번 만들어지고 이후 변경되지 않는다 (읽기 전용).
//   여러 스레드에서 lock 없이 find / get 을 호출해도 안전하다.
// - 실행 모드는 hook 이름에 고정된다. 관리자가 모드를 바꿀 수 없다.
//
// [모드별 출력 계약]
//   kBlocking   : {allowed: bool, error?: string}  false 면 원 작업 중단
//   kAsync      : {allowed: true}                   호출자는 결과를 기다리지 않음
//   kEnrichment : {allowed: bool, data?: object}    true 일 때만 data 병합
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "common/value.hpp"
#include "hooks/schema.hpp"

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

enum class HookMode : std::uint8_t {
    kBlocking   = 0,
    kAsync      = 1,
    kEnrichment = 2,
};

enum class HookGroup : std::uint8_t {
    kAuthentication = 0,
    kApiKey         = 1,
    kOAuthClient    = 2,
};

[[nodiscard]] constexpr std::string_view to_string(HookMode mode) noexcept {
    switch (mode) {
        case HookMode::kBlocking:   return "blocking";
        case HookMode::kAsync:      return "async";
        case HookMode::kEnrichment: return "enrichment";
    }
    return "blocking";
}

[[nodiscard]] constexpr std::string_view to_string(HookGroup group) noexcept {
    switch (group) {
        case HookGroup::kAuthentication: return "authentication";
        case HookGroup::kApiKey:         return "apikey";
        case HookGroup::kOAuthClient:    return "client";
    }
    return "authentication";
}

struct HookDefinition {
    std::string name{};
    HookMode    mode{HookMode::kBlocking};
    HookGroup   group{HookGroup::kAuthentication};
    Schema      input_schema{};
    Schema      output_schema{};
    std::string description{};
};

// ---------------------------------------------------------------------------
// HookRegistry
// ---------------------------------------------------------------------------
class HookRegistry {
public:
    HookRegistry();

    // find
    //   미등록 이름이면 nullptr. 반환 포인터는 registry 수명 동안 유효.
    [[nodiscard]] const HookDefinition* find(std::string_view name) const noexcept;

    // get
    //   미등록 이름이면 EngineError{kNotFound}.
    [[nodiscard]] std::expected<HookDefinition, EngineError> get(std::string_view name) const;

    // validate_input
    //   hook 입력 스키마 검사. 미등록 hook → kNotFound, 위반 → kValidation.
    [[nodiscard]] std::expected<void, EngineError> validate_input(std::string_view name,
                                                                  const Value&     input) const;

    // validate_output
    //   스크립트 반환값이 모드별 출력 계약을 만족하는지 검사 (위반 → kSandbox).
    [[nodiscard]] std::expected<void, EngineError> validate_output(const HookDefinition& hook,
                                                                   const Value& output) const;

    [[nodiscard]] const std::vector<HookDefinition>& all() const noexcept { return hooks_; }

private:
    std::vector<HookDefinition> hooks_;
};
