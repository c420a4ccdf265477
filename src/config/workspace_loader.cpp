#include "config/workspace_loader.hpp"

#include <cstdlib>

#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>

namespace {

// WorkspaceError: 파싱 중 오류를 한 번에 빠져나가기 위한 내부 예외
struct WorkspaceError {
    std::string message;
};

[[nodiscard]] std::string required(const YAML::Node& item, const char* key, std::string_view where) {
    const YAML::Node node = item[key];
    if (!node || !node.IsScalar() || node.Scalar().empty()) {
        throw WorkspaceError{fmt::format("{}: '{}' is required (line {})",
                                         where, key, item.Mark().line + 1)};
    }
    return node.as<std::string>();
}

[[nodiscard]] std::string optional_str(const YAML::Node& item, const char* key,
                                       std::string fallback = {}) {
    const YAML::Node node = item[key];
    if (!node || node.IsNull()) {
        return fallback;
    }
    return node.as<std::string>();
}

void expect_sequence(const YAML::Node& node, std::string_view section) {
    if (node && !node.IsNull() && !node.IsSequence()) {
        throw WorkspaceError{fmt::format("'{}' must be a list", section)};
    }
}

std::size_t load_secrets(const YAML::Node& node, SecretStore& secrets) {
    expect_sequence(node, "secrets");
    std::size_t count = 0;
    for (const auto& item : node) {
        std::string name = required(item, "name", "secrets");
        std::string value;
        if (const YAML::Node env = item["value_env"]; env) {
            const char* raw = std::getenv(env.as<std::string>().c_str());
            if (raw == nullptr) {
                throw WorkspaceError{fmt::format("secrets: environment variable '{}' for '{}' is not set",
                                                 env.as<std::string>(), name)};
            }
            value = raw;
        } else {
            value = required(item, "value", "secrets");
        }

        auto created = secrets.create(name, std::move(value), optional_str(item, "description"));
        if (!created) {
            throw WorkspaceError{"secrets: " + created.error().message};
        }
        ++count;
    }
    return count;
}

std::size_t load_scripts(const YAML::Node& node, ScriptRepository& scripts) {
    expect_sequence(node, "scripts");
    std::size_t count = 0;
    for (const auto& item : node) {
        std::string id   = required(item, "id", "scripts");
        std::string name = optional_str(item, "name", id);
        auto created = scripts.create_script(std::move(id), std::move(name),
                                             required(item, "source", "scripts"));
        if (!created) {
            throw WorkspaceError{"scripts: " + created.error().message};
        }
        ++count;
    }
    return count;
}

std::size_t load_bindings(const YAML::Node& node, const HookRegistry& hooks,
                          ScriptRepository& scripts) {
    expect_sequence(node, "bindings");
    std::size_t count = 0;
    for (const auto& item : node) {
        BoundScript binding;
        binding.hook_name = required(item, "hook", "bindings");
        binding.script_id = required(item, "script", "bindings");
        binding.ordinal   = item["ordinal"] ? item["ordinal"].as<std::int32_t>() : 0;
        binding.enabled   = item["enabled"] ? item["enabled"].as<bool>() : true;

        if (hooks.find(binding.hook_name) == nullptr) {
            throw WorkspaceError{fmt::format("bindings: unknown hook '{}'", binding.hook_name)};
        }
        if (!scripts.find_script(binding.script_id)) {
            throw WorkspaceError{fmt::format("bindings: unknown script '{}'", binding.script_id)};
        }
        scripts.bind(std::move(binding));
        ++count;
    }
    return count;
}

std::size_t load_models(const YAML::Node& node, ModelStore& models) {
    expect_sequence(node, "models");
    std::size_t count = 0;
    for (const auto& item : node) {
        ModelDefinition definition;
        definition.entity_type = required(item, "entity_type", "models");
        definition.description = optional_str(item, "description");

        if (const YAML::Node relations = item["relations"]; relations) {
            if (!relations.IsMap()) {
                throw WorkspaceError{fmt::format("models: '{}' relations must be a map",
                                                 definition.entity_type)};
            }
            for (const auto& kv : relations) {
                auto& implied_by = definition.relations[kv.first.as<std::string>()];
                if (kv.second && !kv.second.IsNull()) {
                    implied_by = kv.second.as<std::vector<std::string>>();
                }
            }
        }

        if (const YAML::Node permissions = item["permissions"]; permissions) {
            if (!permissions.IsMap()) {
                throw WorkspaceError{fmt::format("models: '{}' permissions must be a map",
                                                 definition.entity_type)};
            }
            for (const auto& kv : permissions) {
                const std::string name = kv.first.as<std::string>();
                PermissionRule    rule;
                rule.relation      = required(kv.second, "relation", "models.permissions");
                rule.description   = optional_str(kv.second, "description");
                rule.policy_engine = optional_str(kv.second, "policy_engine", "lua");
                if (const YAML::Node policy = kv.second["policy"]; policy && !policy.IsNull()) {
                    rule.policy = policy.as<std::string>();
                }
                definition.permissions.emplace(name, std::move(rule));
            }
        }

        auto stored = models.upsert(std::move(definition), "workspace");
        if (!stored) {
            throw WorkspaceError{"models: " + stored.error().message};
        }
        ++count;
    }
    return count;
}

std::size_t load_tuples(const YAML::Node& node, const ModelStore& models, TupleStore& tuples) {
    expect_sequence(node, "tuples");
    std::size_t count = 0;
    for (const auto& item : node) {
        TupleKey key{
            required(item, "entity_type", "tuples"),
            required(item, "entity_id", "tuples"),
            required(item, "relation", "tuples"),
            required(item, "subject_type", "tuples"),
            required(item, "subject_id", "tuples"),
        };
        std::string entity_type_id;
        if (const ModelPtr model = models.find(key.entity_type)) {
            if (!model->relations.contains(key.relation)) {
                throw WorkspaceError{fmt::format("tuples: relation '{}' is not defined on '{}'",
                                                 key.relation, key.entity_type)};
            }
            entity_type_id = model->id;
        }

        auto created = tuples.create_if_not_exists(std::move(key), std::move(entity_type_id));
        if (!created) {
            throw WorkspaceError{"tuples: " + created.error().message};
        }
        ++count;
    }
    return count;
}

[[nodiscard]] std::expected<WorkspaceSummary, std::string>
apply(const YAML::Node& root, const WorkspaceTargets& targets, std::string_view origin) {
    WorkspaceSummary summary;
    if (!root || root.IsNull()) {
        return summary;
    }
    if (!root.IsMap()) {
        const std::string err = fmt::format("workspace_loader: '{}' is not a YAML map", origin);
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    try {
        summary.secrets  = load_secrets(root["secrets"], targets.secrets);
        summary.scripts  = load_scripts(root["scripts"], targets.scripts);
        summary.bindings = load_bindings(root["bindings"], targets.hooks, targets.scripts);
        summary.models   = load_models(root["models"], targets.models);
        summary.tuples   = load_tuples(root["tuples"], targets.models, targets.tuples);
    } catch (const WorkspaceError& e) {
        const std::string err = fmt::format("workspace_loader: {} ({})", e.message, origin);
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format("workspace_loader: invalid value in '{}' at line {}: {}",
                                            origin, e.mark.line + 1, e.msg);
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    spdlog::info("workspace_loader: secrets={} scripts={} bindings={} models={} tuples={}",
                 summary.secrets, summary.scripts, summary.bindings, summary.models,
                 summary.tuples);
    return summary;
}

}  // namespace

std::expected<WorkspaceSummary, std::string>
WorkspaceLoader::load(const std::filesystem::path& workspace_path, const WorkspaceTargets& targets) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(workspace_path.string());
    } catch (const YAML::BadFile& e) {
        const std::string err = fmt::format("workspace_loader: cannot open file '{}': {}",
                                            workspace_path.string(), e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format("workspace_loader: YAML parse error in '{}' at line {}: {}",
                                            workspace_path.string(), e.mark.line + 1, e.msg);
        spdlog::error("{}", err);
        return std::unexpected(err);
    }
    return apply(root, targets, workspace_path.string());
}

std::expected<WorkspaceSummary, std::string>
WorkspaceLoader::load_from_string(std::string_view yaml_text, const WorkspaceTargets& targets) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string{yaml_text});
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format("workspace_loader: YAML parse error at line {}: {}",
                                            e.mark.line + 1, e.msg);
        spdlog::error("{}", err);
        return std::unexpected(err);
    }
    return apply(root, targets, "<string>");
}
