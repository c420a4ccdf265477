#pragma once

// ---------------------------------------------------------------------------
// authorization_model.hpp
//
// entity type 별 relation / permission 정의와 relation 상속 closure.
//
// [relation 상속 표기]
//   relations[R] = R 을 함의하는 relation 목록.
//   예) {owner: [], editor: [owner], viewer: [editor]}
//       owner → editor → viewer  (owner 는 viewer 도 만족)
//
// [closure]
//   closure[R] = R 을 만족시키는 모든 relation (R 자신 포함).
//   모델 쓰기 시점에 한 번 계산한다. 읽기 경로는 그래프를 다시 걷지 않는다.
//
// [검증 (validate_model)]
//   - entity_type / relation / permission 이름은 비어 있으면 안 된다.
//   - 함의 목록의 relation 과 permission.relation 은 모델에 존재해야 한다.
//   - 상속 그래프는 비순환이어야 한다 (DFS 색 표시).
//   위반 시 EngineError{kModel}.
// ---------------------------------------------------------------------------

#include "common/types.hpp"

#include <expected>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

struct PermissionRule {
    std::string                relation{};
    std::string                description{};
    std::optional<std::string> policy{};            // 정책 스크립트 (없으면 relation 만 검사)
    std::string                policy_engine{"lua"};
};

using RelationMap     = std::map<std::string, std::vector<std::string>, std::less<>>;
using PermissionMap   = std::map<std::string, PermissionRule, std::less<>>;
using RelationSet     = std::set<std::string, std::less<>>;
using RelationClosure = std::map<std::string, RelationSet, std::less<>>;

// ModelDefinition: 관리자가 제출하는 모델 본문
struct ModelDefinition {
    std::string   entity_type{};
    std::string   description{};
    RelationMap   relations{};
    PermissionMap permissions{};
};

// AuthorizationModel: 저장된 모델 (불변 스냅샷으로 공유)
struct AuthorizationModel {
    std::string     id{};           // rename 후에도 유지되는 안정 id
    std::string     entity_type{};
    std::string     description{};
    RelationMap     relations{};
    PermissionMap   permissions{};
    RelationClosure closure{};
    bool            is_system{false};
    Timestamp       created_at{};
    Timestamp       updated_at{};

    [[nodiscard]] const PermissionRule* find_permission(std::string_view name) const noexcept;

    // satisfying_relations
    //   required 를 만족시키는 relation 집합. 미정의 relation 이면 nullptr.
    [[nodiscard]] const RelationSet* satisfying_relations(std::string_view required) const noexcept;
};

[[nodiscard]] std::expected<void, EngineError> validate_model(const ModelDefinition& definition);

// compute_closure
//   validate_model 을 통과한 정의에 대해서만 호출한다.
[[nodiscard]] RelationClosure compute_closure(const RelationMap& relations);
