#pragma once

// ---------------------------------------------------------------------------
// workspace_loader.hpp
//
// 기동 시 YAML workspace 파일로 저장소를 시드한다.
//
// [문서 구조]
//   secrets:  [{name, value | value_env, description?}]
//   scripts:  [{id, name?, source}]
//   bindings: [{hook, script, ordinal?, enabled?}]
//   models:   [{entity_type, description?, relations: {R: [..]},
//               permissions: {P: {relation, description?, policy?, policy_engine?}}}]
//   tuples:   [{entity_type, entity_id, relation, subject_type, subject_id}]
//
// [적용 순서]
//   secrets → scripts → bindings → models → tuples.
//   첫 오류에서 중단한다. 이미 적용된 항목은 되돌리지 않는다.
// ---------------------------------------------------------------------------

#include "authz/model_store.hpp"
#include "authz/tuple_store.hpp"
#include "hooks/hook_registry.hpp"
#include "pipeline/script_repository.hpp"
#include "sandbox/secret_store.hpp"

#include <cstddef>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

struct WorkspaceTargets {
    const HookRegistry& hooks;
    ScriptRepository&   scripts;
    ModelStore&         models;
    TupleStore&         tuples;
    SecretStore&        secrets;
};

struct WorkspaceSummary {
    std::size_t secrets{0};
    std::size_t scripts{0};
    std::size_t bindings{0};
    std::size_t models{0};
    std::size_t tuples{0};
};

class WorkspaceLoader {
public:
    [[nodiscard]] static std::expected<WorkspaceSummary, std::string>
    load(const std::filesystem::path& workspace_path, const WorkspaceTargets& targets);

    [[nodiscard]] static std::expected<WorkspaceSummary, std::string>
    load_from_string(std::string_view yaml_text, const WorkspaceTargets& targets);
};
