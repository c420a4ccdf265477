#include "authz/model_store.hpp"

#include "sandbox/lua_interpreter.hpp"

#include <chrono>
#include <mutex>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

namespace {

PermissionRule rule(std::string relation, std::string description = {}) {
    PermissionRule r;
    r.relation    = std::move(relation);
    r.description = std::move(description);
    return r;
}

AuthorizationModel build_model(ModelDefinition definition, std::string id, bool is_system,
                               Timestamp created_at) {
    AuthorizationModel model;
    model.id          = std::move(id);
    model.entity_type = std::move(definition.entity_type);
    model.description = std::move(definition.description);
    model.closure     = compute_closure(definition.relations);
    model.relations   = std::move(definition.relations);
    model.permissions = std::move(definition.permissions);
    model.is_system   = is_system;
    model.created_at  = created_at;
    model.updated_at  = std::chrono::system_clock::now();
    return model;
}

// ---------------------------------------------------------------------------
// check_policy_syntax
//   정책 스크립트는 저장 시점에 컴파일만 해 본다 (실행하지 않음).
//   컴파일되지 않는 정책이 하나라도 있으면 kModel.
// ---------------------------------------------------------------------------
std::expected<void, EngineError> check_policy_syntax(const ModelDefinition& definition) {
    for (const auto& [name, rule] : definition.permissions) {
        if (!rule.policy) {
            continue;
        }
        const std::string chunk = "policy:" + definition.entity_type + "." + name;
        if (auto compiled = LuaInterpreter::check_syntax(chunk, *rule.policy); !compiled) {
            return std::unexpected(make_error(
                EngineErrorCode::kModel,
                "permission '" + name + "' policy does not compile: " + compiled.error(),
                definition.entity_type));
        }
    }
    return {};
}

}  // namespace

// ---------------------------------------------------------------------------
// system_model_definitions
//   relations[R] = R 을 함의하는 relation 목록
// ---------------------------------------------------------------------------
std::vector<ModelDefinition> system_model_definitions() {
    std::vector<ModelDefinition> models;

    models.push_back(ModelDefinition{
        .entity_type = "platform",
        .description = "Core platform access levels",
        .relations   = {{"super_admin", {}}, {"admin", {"super_admin"}}, {"member", {"admin"}}},
        .permissions = {
            {"manage_platform", rule("admin")},
            {"member",          rule("member")},
            {"admin",           rule("admin")},
            {"super_admin",     rule("super_admin")},
        },
    });

    models.push_back(ModelDefinition{
        .entity_type = "users",
        .description = "User management permissions",
        .relations   = {{"admin", {}}, {"viewer", {"admin"}}},
        .permissions = {
            {"view",        rule("viewer")},
            {"create",      rule("admin")},
            {"update",      rule("admin")},
            {"delete",      rule("admin")},
            {"ban",         rule("admin")},
            {"impersonate", rule("admin")},
        },
    });

    models.push_back(ModelDefinition{
        .entity_type = "groups",
        .description = "User group management permissions",
        .relations   = {{"admin", {}}, {"editor", {"admin"}}, {"viewer", {"editor"}}},
        .permissions = {
            {"view",           rule("viewer")},
            {"create",         rule("admin")},
            {"update",         rule("editor")},
            {"delete",         rule("admin")},
            {"manage_members", rule("admin")},
        },
    });

    models.push_back(ModelDefinition{
        .entity_type = "clients",
        .description = "OAuth client application management",
        .relations   = {{"admin", {}}, {"viewer", {"admin"}}},
        .permissions = {
            {"view",          rule("viewer")},
            {"create",        rule("admin")},
            {"update",        rule("admin")},
            {"delete",        rule("admin")},
            {"manage_access", rule("admin")},
        },
    });

    return models;
}

InMemoryModelStore::InMemoryModelStore(const TupleStore& tuples, PolicyVersionStore* versions)
    : tuples_(tuples)
    , versions_(versions)
{
    const auto now = std::chrono::system_clock::now();
    for (auto& definition : system_model_definitions()) {
        if (auto valid = validate_model(definition); !valid) {
            throw std::logic_error("invalid system model: " + valid.error().message);
        }
        std::string type = definition.entity_type;
        std::string id   = "mdl_" + std::to_string(next_id_++);
        models_.emplace(std::move(type),
                        std::make_shared<const AuthorizationModel>(
                            build_model(std::move(definition), std::move(id), true, now)));
    }
}

// ---------------------------------------------------------------------------
// check_relations_unused
//   keep 에 없는 model 의 relation 중 tuple 이 참조하는 것이 있으면 kModel.
//   keep == nullptr 이면 모든 relation 을 검사한다 (삭제).
// ---------------------------------------------------------------------------
std::expected<void, EngineError>
InMemoryModelStore::check_relations_unused(const AuthorizationModel& model,
                                           const RelationMap*        keep) const {
    for (const auto& [relation, implied_by] : model.relations) {
        if (keep != nullptr && keep->contains(relation)) {
            continue;
        }
        const auto count = tuples_.count_by_relation(model.entity_type, relation);
        if (count > 0) {
            return std::unexpected(make_error(
                EngineErrorCode::kModel,
                "cannot remove relation '" + relation + "': " + std::to_string(count) +
                    " tuple(s) still use it",
                model.entity_type));
        }
    }
    return {};
}

std::expected<ModelPtr, EngineError>
InMemoryModelStore::upsert(ModelDefinition definition, std::string_view changed_by) {
    if (auto valid = validate_model(definition); !valid) {
        spdlog::warn("[model_store] rejected {}: {}", definition.entity_type, valid.error().message);
        return std::unexpected(valid.error());
    }
    if (auto compiled = check_policy_syntax(definition); !compiled) {
        spdlog::warn("[model_store] rejected {}: {}", definition.entity_type,
                     compiled.error().message);
        return std::unexpected(compiled.error());
    }

    std::vector<std::pair<std::string, std::string>> changed_policies;  // (permission, script)
    ModelPtr stored;
    {
        std::unique_lock lock(mutex_);
        const auto it       = models_.find(definition.entity_type);
        const ModelPtr prev = it != models_.end() ? it->second : nullptr;

        if (prev) {
            if (auto unused = check_relations_unused(*prev, &definition.relations); !unused) {
                spdlog::warn("[model_store] rejected {}: {}",
                             definition.entity_type, unused.error().message);
                return std::unexpected(unused.error());
            }
            for (const auto& [name, old_rule] : prev->permissions) {
                if (!definition.permissions.contains(name)) {
                    spdlog::warn("[model_store] {}: permission '{}' removed",
                                 definition.entity_type, name);
                }
            }
        }

        for (const auto& [name, new_rule] : definition.permissions) {
            if (!new_rule.policy) {
                continue;
            }
            const PermissionRule* old_rule = prev ? prev->find_permission(name) : nullptr;
            if (old_rule == nullptr || old_rule->policy != new_rule.policy) {
                changed_policies.emplace_back(name, *new_rule.policy);
            }
        }

        std::string id = prev ? prev->id : "mdl_" + std::to_string(next_id_++);
        const bool  is_system  = prev && prev->is_system;
        const auto  created_at = prev ? prev->created_at : std::chrono::system_clock::now();
        std::string type       = definition.entity_type;

        stored = std::make_shared<const AuthorizationModel>(
            build_model(std::move(definition), std::move(id), is_system, created_at));
        models_.insert_or_assign(std::move(type), stored);
    }

    if (versions_ != nullptr) {
        for (auto& [permission, script] : changed_policies) {
            PolicyKey key{stored->entity_type, permission, PolicyLevel::kPermission, {}};
            auto version = versions_->append(key, std::move(script), std::string{changed_by},
                                             "model upsert");
            if (!version) {
                spdlog::warn("[model_store] policy version not recorded: {}",
                             version.error().message);
            }
        }
    }

    spdlog::info("[model_store] upserted {} (id={}, relations={}, permissions={})",
                 stored->entity_type, stored->id, stored->relations.size(),
                 stored->permissions.size());
    return stored;
}

std::expected<void, EngineError> InMemoryModelStore::remove(std::string_view entity_type) {
    const std::string name{entity_type};
    std::unique_lock lock(mutex_);
    const auto it = models_.find(entity_type);
    if (it == models_.end()) {
        return std::unexpected(make_error(EngineErrorCode::kNotFound,
                                          "model '" + std::string{entity_type} + "' not found",
                                          std::string{entity_type}));
    }
    if (it->second->is_system) {
        return std::unexpected(make_error(EngineErrorCode::kModel,
                                          "system model '" + std::string{entity_type} +
                                              "' cannot be deleted",
                                          std::string{entity_type}));
    }
    if (auto unused = check_relations_unused(*it->second, nullptr); !unused) {
        return std::unexpected(unused.error());
    }

    models_.erase(it);
    spdlog::info("[model_store] removed {}", name);
    return {};
}

std::expected<ModelPtr, EngineError>
InMemoryModelStore::rename(std::string_view entity_type, std::string new_name) {
    // entity_type 이 저장된 모델의 이름을 가리킬 수 있으므로 erase 전에 복사한다
    const std::string old_name{entity_type};
    if (new_name.empty()) {
        return std::unexpected(make_error(EngineErrorCode::kModel,
                                          "entity type must not be empty",
                                          std::string{entity_type}));
    }

    std::unique_lock lock(mutex_);
    const auto it = models_.find(entity_type);
    if (it == models_.end()) {
        return std::unexpected(make_error(EngineErrorCode::kNotFound,
                                          "model '" + std::string{entity_type} + "' not found",
                                          std::string{entity_type}));
    }
    if (it->second->is_system) {
        return std::unexpected(make_error(EngineErrorCode::kModel,
                                          "system model '" + std::string{entity_type} +
                                              "' cannot be renamed",
                                          std::string{entity_type}));
    }
    if (models_.contains(new_name)) {
        return std::unexpected(make_error(EngineErrorCode::kModel,
                                          "model '" + new_name + "' already exists", new_name));
    }

    auto renamed         = std::make_shared<AuthorizationModel>(*it->second);
    renamed->entity_type = new_name;
    renamed->updated_at  = std::chrono::system_clock::now();
    ModelPtr stored      = std::move(renamed);

    models_.erase(it);
    models_.emplace(new_name, stored);

    spdlog::info("[model_store] renamed {} -> {} (id={})", old_name, new_name, stored->id);
    return stored;
}

ModelPtr InMemoryModelStore::find(std::string_view entity_type) const {
    std::shared_lock lock(mutex_);
    const auto it = models_.find(entity_type);
    return it == models_.end() ? nullptr : it->second;
}

ModelPtr InMemoryModelStore::find_by_id(std::string_view id) const {
    std::shared_lock lock(mutex_);
    for (const auto& [type, model] : models_) {
        if (model->id == id) {
            return model;
        }
    }
    return nullptr;
}

std::vector<ModelPtr> InMemoryModelStore::list() const {
    std::vector<ModelPtr> out;
    std::shared_lock      lock(mutex_);
    out.reserve(models_.size());
    for (const auto& [type, model] : models_) {
        out.push_back(model);
    }
    return out;
}
