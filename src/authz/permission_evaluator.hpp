#pragma once

// ---------------------------------------------------------------------------
// permission_evaluator.hpp
//
// relation 기반 + 속성 기반 권한 판정.
//
// [check_permission 흐름]
//   1. entity_type 모델 조회 → permission 의 required relation
//   2. closure 에서 required relation 을 만족하는 relation 집합
//   3. subject 확장: subject 자신 + tuple (group, G, member, subject) 로
//      전이적으로 속한 모든 group (방문 집합으로 순환 허용)
//   4. (entity_id 또는 "*", relation ∈ 집합, subject ∈ 확장) tuple 탐색
//   5. permission 에 정책 스크립트가 있으면 relation 검사를 통과한 경우에만 실행.
//      true 또는 {allowed = true} 를 반환해야 허용.
//
// [fail closed]
//   모델 / permission 미정의, 스크립트 오류, 내부 예외 → 거부.
//   평가 1회당 AuditLogEntry 정확히 1개 (기록 실패는 경고만).
// ---------------------------------------------------------------------------

#include "authz/audit_log.hpp"
#include "authz/model_store.hpp"
#include "authz/tuple_store.hpp"
#include "common/value.hpp"
#include "logger/structured_logger.hpp"
#include "sandbox/sandbox_bridge.hpp"
#include "stats/engine_stats.hpp"

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

#include <boost/asio/awaitable.hpp>

// group 소속 tuple 의 entity type / relation
inline constexpr std::string_view kGroupEntityType     = "group";
inline constexpr std::string_view kGroupMemberRelation = "member";

struct SubjectRef {
    std::string type{};
    std::string id{};

    friend bool operator==(const SubjectRef&, const SubjectRef&) = default;
};

class PermissionEvaluator {
public:
    // bridge: nullptr 이면 정책 스크립트가 붙은 permission 은 항상 거부된다.
    // logger: nullptr 이면 구조화 로그를 남기지 않는다.
    PermissionEvaluator(const ModelStore& models,
                        const TupleStore& tuples,
                        SandboxBridge*    bridge,
                        AuditLog&         audit,
                        EngineStats&      stats,
                        StructuredLogger* logger);

    PermissionEvaluator(const PermissionEvaluator&)            = delete;
    PermissionEvaluator& operator=(const PermissionEvaluator&) = delete;

    [[nodiscard]] asio::awaitable<bool>
    check_permission(std::string subject_type, std::string subject_id,
                     std::string entity_type, std::string entity_id,
                     std::string permission, Value attributes = {});

    // check_relation
    //   정책 스크립트 없이 relation 만 검사하는 동기 버전 (helpers.check_permission 용).
    //   감사 로그를 남기지 않는다.
    [[nodiscard]] bool check_relation(std::string_view subject_type, std::string_view subject_id,
                                      std::string_view entity_type, std::string_view entity_id,
                                      std::string_view permission) const;

    // expand_subjects
    //   subject 자신이 첫 원소. 이후 BFS 순서의 group.
    [[nodiscard]] std::vector<SubjectRef> expand_subjects(std::string_view subject_type,
                                                          std::string_view subject_id) const;

private:
    struct RelationMatch {
        bool                  matched{false};
        const PermissionRule* rule{nullptr};
        ModelPtr              model{};    // rule 의 수명 유지
        std::string           reason{};   // 불일치 사유 (로그용)
    };

    [[nodiscard]] RelationMatch match_relation(std::string_view subject_type,
                                               std::string_view subject_id,
                                               std::string_view entity_type,
                                               std::string_view entity_id,
                                               std::string_view permission) const;

    void record(AuditLogEntry entry, std::chrono::steady_clock::time_point started);

    const ModelStore& models_;
    const TupleStore& tuples_;
    SandboxBridge*    bridge_;
    AuditLog&         audit_;
    EngineStats&      stats_;
    StructuredLogger* logger_;
};
