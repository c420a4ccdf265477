#include "authz/authorization_model.hpp"

#include <cstdint>
#include <unordered_map>

namespace {

enum class Mark : std::uint8_t { kWhite, kGrey, kBlack };

// find_cycle
//   relation 에서 시작하는 DFS. grey 노드를 다시 만나면 순환.
//   path 에 현재 탐색 경로를 쌓아 오류 메시지에 사용한다.
bool find_cycle(const RelationMap&                      relations,
                const std::string&                      relation,
                std::unordered_map<std::string, Mark>&  marks,
                std::vector<std::string>&               path) {
    marks[relation] = Mark::kGrey;
    path.push_back(relation);

    const auto it = relations.find(relation);
    if (it != relations.end()) {
        for (const auto& implied_by : it->second) {
            const Mark mark = marks[implied_by];
            if (mark == Mark::kGrey) {
                path.push_back(implied_by);
                return true;
            }
            if (mark == Mark::kWhite && find_cycle(relations, implied_by, marks, path)) {
                return true;
            }
        }
    }

    path.pop_back();
    marks[relation] = Mark::kBlack;
    return false;
}

std::string join_path(const std::vector<std::string>& path) {
    // 순환 시작점부터만 출력
    const std::string& closing = path.back();
    std::size_t start = 0;
    for (std::size_t i = 0; i + 1 < path.size(); ++i) {
        if (path[i] == closing) {
            start = i;
            break;
        }
    }
    std::string out;
    for (std::size_t i = start; i < path.size(); ++i) {
        if (!out.empty()) {
            out += " -> ";
        }
        out += path[i];
    }
    return out;
}

void collect(const RelationMap& relations, const std::string& relation, RelationSet& out) {
    if (!out.insert(relation).second) {
        return;
    }
    const auto it = relations.find(relation);
    if (it == relations.end()) {
        return;
    }
    for (const auto& implied_by : it->second) {
        collect(relations, implied_by, out);
    }
}

}  // namespace

const PermissionRule* AuthorizationModel::find_permission(std::string_view name) const noexcept {
    const auto it = permissions.find(name);
    return it == permissions.end() ? nullptr : &it->second;
}

const RelationSet* AuthorizationModel::satisfying_relations(std::string_view required) const noexcept {
    const auto it = closure.find(required);
    return it == closure.end() ? nullptr : &it->second;
}

std::expected<void, EngineError> validate_model(const ModelDefinition& definition) {
    const auto& type = definition.entity_type;
    auto fail = [&type](std::string message) {
        return std::unexpected(make_error(EngineErrorCode::kModel, std::move(message), type));
    };

    if (type.empty()) {
        return fail("entity type must not be empty");
    }

    // 1. 이름 / 참조
    for (const auto& [relation, implied_by] : definition.relations) {
        if (relation.empty()) {
            return fail("relation name must not be empty");
        }
        for (const auto& other : implied_by) {
            if (!definition.relations.contains(other)) {
                return fail("relation '" + relation + "' references unknown relation '" +
                            other + "'");
            }
        }
    }

    for (const auto& [name, rule] : definition.permissions) {
        if (name.empty()) {
            return fail("permission name must not be empty");
        }
        if (!definition.relations.contains(rule.relation)) {
            return fail("permission '" + name + "' references unknown relation '" +
                        rule.relation + "'");
        }
        if (rule.policy && rule.policy_engine != "lua") {
            return fail("permission '" + name + "' uses unsupported policy engine '" +
                        rule.policy_engine + "'");
        }
    }

    // 2. 순환
    std::unordered_map<std::string, Mark> marks;
    for (const auto& [relation, implied_by] : definition.relations) {
        if (marks[relation] != Mark::kWhite) {
            continue;
        }
        std::vector<std::string> path;
        if (find_cycle(definition.relations, relation, marks, path)) {
            return fail("relation inheritance cycle: " + join_path(path));
        }
    }
    return {};
}

RelationClosure compute_closure(const RelationMap& relations) {
    RelationClosure closure;
    for (const auto& [relation, implied_by] : relations) {
        collect(relations, relation, closure[relation]);
    }
    return closure;
}
