#pragma once

// ---------------------------------------------------------------------------
// script_repository.hpp
//
// 스크립트 소스와 hook 바인딩 저장소.
//
// [참조 규칙]
// - BoundScript 는 script_id 로만 소스를 참조한다 (본문 복사 없음).
//   소스를 수정하면 모든 바인딩이 다음 실행부터 새 본문을 사용한다.
// - bindings_for(hook) 은 ordinal 오름차순. 같은 ordinal 은 등록 순서 유지 (stable).
// ---------------------------------------------------------------------------

#include "common/types.hpp"

#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

struct ScriptSource {
    std::string id{};
    std::string name{};
    std::string source_code{};
    Timestamp   created_at{};
    Timestamp   updated_at{};
};

struct BoundScript {
    std::string   hook_name{};
    std::string   script_id{};
    std::int32_t  ordinal{0};
    bool          enabled{true};
};

// ---------------------------------------------------------------------------
// ScriptRepository (추상 인터페이스)
// ---------------------------------------------------------------------------
class ScriptRepository {
public:
    virtual ~ScriptRepository() = default;

    // create_script
    //   id 가 비어 있으면 생성한다. 같은 id 가 있거나 소스가 컴파일되지 않으면 kValidation.
    [[nodiscard]] virtual std::expected<ScriptSource, EngineError>
    create_script(std::string id, std::string name, std::string source_code) = 0;

    // update_source
    //   미등록 id → kNotFound. 컴파일되지 않는 소스 → kValidation (기존 소스 유지).
    [[nodiscard]] virtual std::expected<ScriptSource, EngineError>
    update_source(std::string_view id, std::string source_code) = 0;

    // remove_script
    //   해당 스크립트의 바인딩도 함께 제거한다.
    virtual bool remove_script(std::string_view id) = 0;

    [[nodiscard]] virtual std::optional<ScriptSource> find_script(std::string_view id) const = 0;

    // bind
    //   (hook, script) 쌍이 이미 있으면 ordinal / enabled 를 갱신한다.
    virtual void bind(BoundScript binding) = 0;

    virtual bool unbind(std::string_view hook_name, std::string_view script_id) = 0;

    virtual bool set_enabled(std::string_view hook_name, std::string_view script_id,
                             bool enabled) = 0;

    // bindings_for
    //   enabled 여부와 무관하게 정렬된 전체 목록.
    [[nodiscard]] virtual std::vector<BoundScript> bindings_for(std::string_view hook_name) const = 0;
};

// ---------------------------------------------------------------------------
// InMemoryScriptRepository
// ---------------------------------------------------------------------------
class InMemoryScriptRepository final : public ScriptRepository {
public:
    [[nodiscard]] std::expected<ScriptSource, EngineError>
    create_script(std::string id, std::string name, std::string source_code) override;

    [[nodiscard]] std::expected<ScriptSource, EngineError>
    update_source(std::string_view id, std::string source_code) override;

    bool remove_script(std::string_view id) override;

    [[nodiscard]] std::optional<ScriptSource> find_script(std::string_view id) const override;

    void bind(BoundScript binding) override;

    bool unbind(std::string_view hook_name, std::string_view script_id) override;

    bool set_enabled(std::string_view hook_name, std::string_view script_id, bool enabled) override;

    [[nodiscard]] std::vector<BoundScript> bindings_for(std::string_view hook_name) const override;

private:
    struct BindingEntry {
        BoundScript   binding;
        std::uint64_t sequence{0};  // 동일 ordinal 의 안정 정렬 키
    };

    mutable std::shared_mutex                              mutex_;
    std::map<std::string, ScriptSource, std::less<>>       scripts_;
    std::vector<BindingEntry>                              bindings_;
    std::uint64_t                                          next_sequence_{1};
    std::uint64_t                                          next_id_{1};
};
