#include "authz/permission_evaluator.hpp"

#include <deque>
#include <exception>
#include <set>
#include <utility>

#include <spdlog/spdlog.h>

namespace {

// interpret_policy_result
//   true / false 또는 {allowed = bool}. 그 외 형태는 오류.
std::expected<bool, std::string> interpret_policy_result(const Value& result) {
    if (result.is_bool()) {
        return result.as_bool();
    }
    if (const Value* allowed = result.find("allowed"); allowed != nullptr && allowed->is_bool()) {
        return allowed->as_bool();
    }
    return std::unexpected("policy returned malformed result: expected boolean or "
                           "{allowed = boolean}, got " + std::string{result.type_name()});
}

Outcome to_outcome(AuditResult result) noexcept {
    switch (result) {
        case AuditResult::kAllowed: return Outcome::kAllowed;
        case AuditResult::kDenied:  return Outcome::kDenied;
        case AuditResult::kError:   return Outcome::kError;
    }
    return Outcome::kError;
}

}  // namespace

PermissionEvaluator::PermissionEvaluator(const ModelStore& models,
                                         const TupleStore& tuples,
                                         SandboxBridge*    bridge,
                                         AuditLog&         audit,
                                         EngineStats&      stats,
                                         StructuredLogger* logger)
    : models_(models)
    , tuples_(tuples)
    , bridge_(bridge)
    , audit_(audit)
    , stats_(stats)
    , logger_(logger)
{}

// ---------------------------------------------------------------------------
// expand_subjects
//   BFS. (group, G, member, current) tuple 마다 group:G 를 추가한다.
// ---------------------------------------------------------------------------
std::vector<SubjectRef> PermissionEvaluator::expand_subjects(std::string_view subject_type,
                                                             std::string_view subject_id) const {
    std::vector<SubjectRef>                      subjects;
    std::set<std::pair<std::string, std::string>> visited;
    std::deque<SubjectRef>                       queue;

    SubjectRef self{std::string{subject_type}, std::string{subject_id}};
    visited.emplace(self.type, self.id);
    subjects.push_back(self);
    queue.push_back(std::move(self));

    while (!queue.empty()) {
        const SubjectRef current = std::move(queue.front());
        queue.pop_front();

        for (const auto& tuple : tuples_.find_by_subject(current.type, current.id)) {
            if (tuple.entity_type != kGroupEntityType || tuple.relation != kGroupMemberRelation) {
                continue;
            }
            if (!visited.emplace(std::string{kGroupEntityType}, tuple.entity_id).second) {
                continue;
            }
            SubjectRef group{std::string{kGroupEntityType}, tuple.entity_id};
            subjects.push_back(group);
            queue.push_back(std::move(group));
        }
    }
    return subjects;
}

PermissionEvaluator::RelationMatch
PermissionEvaluator::match_relation(std::string_view subject_type, std::string_view subject_id,
                                    std::string_view entity_type, std::string_view entity_id,
                                    std::string_view permission) const {
    RelationMatch match;
    match.model = models_.find(entity_type);
    if (!match.model) {
        match.reason = "no authorization model for '" + std::string{entity_type} + "'";
        return match;
    }

    match.rule = match.model->find_permission(permission);
    if (match.rule == nullptr) {
        match.reason = "permission '" + std::string{permission} + "' not defined";
        return match;
    }

    const RelationSet* relations = match.model->satisfying_relations(match.rule->relation);
    if (relations == nullptr) {
        match.reason = "relation '" + match.rule->relation + "' not defined";
        return match;
    }

    const auto subjects = expand_subjects(subject_type, subject_id);
    for (const auto& subject : subjects) {
        for (const auto& relation : *relations) {
            TupleKey key{std::string{entity_type}, std::string{entity_id}, relation,
                         subject.type, subject.id};
            if (tuples_.find_exact(key)) {
                match.matched = true;
                return match;
            }
            if (entity_id != kWildcardEntityId) {
                key.entity_id = std::string{kWildcardEntityId};
                if (tuples_.find_exact(key)) {
                    match.matched = true;
                    return match;
                }
            }
        }
    }
    match.reason = "no matching tuple";
    return match;
}

bool PermissionEvaluator::check_relation(std::string_view subject_type, std::string_view subject_id,
                                         std::string_view entity_type, std::string_view entity_id,
                                         std::string_view permission) const {
    try {
        return match_relation(subject_type, subject_id, entity_type, entity_id, permission).matched;
    } catch (const std::exception& e) {
        spdlog::error("[authz] relation check failed: {}", e.what());
        return false;
    }
}

// ---------------------------------------------------------------------------
// check_permission
//   어떤 경로로 끝나든 record() 를 정확히 한 번 호출한다.
// ---------------------------------------------------------------------------
asio::awaitable<bool>
PermissionEvaluator::check_permission(std::string subject_type, std::string subject_id,
                                      std::string entity_type, std::string entity_id,
                                      std::string permission, Value attributes) {
    const auto started = std::chrono::steady_clock::now();

    if (attributes.is_null()) {
        attributes = Value::object();
    }

    AuditLogEntry entry;
    entry.entity_type   = entity_type;
    entry.entity_id     = entity_id;
    entry.permission    = permission;
    entry.subject_type  = subject_type;
    entry.subject_id    = subject_id;
    entry.policy_source = PolicySource::kTuple;
    entry.result        = AuditResult::kDenied;

    Value context = Value::object({
        {"subject",    Value::object({{"type", subject_type}, {"id", subject_id}})},
        {"entity",     Value::object({{"type", entity_type}, {"id", entity_id}})},
        {"permission", permission},
        {"attributes", attributes},
        {"timestamp",  to_epoch_ms(std::chrono::system_clock::now())},
    });

    try {
        const RelationMatch match =
            match_relation(subject_type, subject_id, entity_type, entity_id, permission);

        if (!match.matched) {
            spdlog::debug("[authz] {}:{} {} {}:{} denied: {}", subject_type, subject_id,
                          permission, entity_type, entity_id, match.reason);
        } else if (!match.rule->policy) {
            entry.result = AuditResult::kAllowed;
        } else {
            entry.policy_source = PolicySource::kPermission;
            if (bridge_ == nullptr) {
                entry.result        = AuditResult::kError;
                entry.error_message = "policy engine unavailable";
            } else {
                auto result = co_await bridge_->run_policy_script(entity_type + "." + permission,
                                                                  *match.rule->policy, context);
                if (!result) {
                    entry.result        = AuditResult::kError;
                    entry.error_message = result.error().message;
                } else if (auto verdict = interpret_policy_result(*result); !verdict) {
                    entry.result        = AuditResult::kError;
                    entry.error_message = verdict.error();
                } else {
                    entry.result = *verdict ? AuditResult::kAllowed : AuditResult::kDenied;
                }
            }
        }
    } catch (const std::exception& e) {
        entry.result        = AuditResult::kError;
        entry.error_message = e.what();
    }

    if (entry.result == AuditResult::kError) {
        spdlog::warn("[authz] {}:{} {} {}:{} failed closed: {}", subject_type, subject_id,
                     permission, entity_type, entity_id, entry.error_message.value_or(""));
    }

    entry.context_snapshot = std::move(context);
    const bool allowed     = entry.result == AuditResult::kAllowed;
    record(std::move(entry), started);
    co_return allowed;
}

// ---------------------------------------------------------------------------
// record
//   감사 로그 / 통계 / 구조화 로그. 감사 기록 실패는 판정에 영향 없음.
// ---------------------------------------------------------------------------
void PermissionEvaluator::record(AuditLogEntry entry, std::chrono::steady_clock::time_point started) {
    const auto elapsed = std::chrono::steady_clock::now() - started;
    entry.execution_time_ms = std::chrono::duration<double, std::milli>(elapsed).count();
    entry.created_at        = std::chrono::system_clock::now();

    stats_.on_permission(to_outcome(entry.result));

    if (logger_ != nullptr) {
        logger_->log_permission(PermissionDecisionLog{
            .subject_type  = entry.subject_type,
            .subject_id    = entry.subject_id,
            .entity_type   = entry.entity_type,
            .entity_id     = entry.entity_id,
            .permission    = entry.permission,
            .result        = std::string{to_string(entry.result)},
            .policy_source = std::string{to_string(entry.policy_source)},
            .timestamp     = entry.created_at,
            .duration      = std::chrono::duration_cast<std::chrono::microseconds>(elapsed),
        });
    }

    try {
        if (auto appended = audit_.append(std::move(entry)); !appended) {
            spdlog::warn("[authz] audit write failed: {}", appended.error().message);
        }
    } catch (const std::exception& e) {
        spdlog::warn("[authz] audit write failed: {}", e.what());
    }
}
