#include "pipeline/script_repository.hpp"

#include "sandbox/lua_interpreter.hpp"

#include <algorithm>
#include <chrono>
#include <mutex>

#include <spdlog/spdlog.h>

namespace {

// check_script_syntax
//   저장 전에 컴파일만 해 본다. 실패 → kValidation.
std::expected<void, EngineError> check_script_syntax(const std::string& id,
                                                     std::string_view   source_code) {
    if (auto compiled = LuaInterpreter::check_syntax("script:" + id, source_code); !compiled) {
        spdlog::warn("[script_repository] rejected script {}: {}", id, compiled.error());
        return std::unexpected(make_error(EngineErrorCode::kValidation,
                                          "script does not compile: " + compiled.error(), id));
    }
    return {};
}

}  // namespace

std::expected<ScriptSource, EngineError>
InMemoryScriptRepository::create_script(std::string id, std::string name,
                                        std::string source_code) {
    std::unique_lock lock(mutex_);
    if (id.empty()) {
        id = "scr_" + std::to_string(next_id_++);
    }
    if (scripts_.contains(id)) {
        return std::unexpected(make_error(EngineErrorCode::kValidation,
                                          "script '" + id + "' already exists", id));
    }
    if (auto compiled = check_script_syntax(id, source_code); !compiled) {
        return std::unexpected(compiled.error());
    }

    const auto   now = std::chrono::system_clock::now();
    ScriptSource script{id, std::move(name), std::move(source_code), now, now};
    scripts_.emplace(std::move(id), script);
    return script;
}

std::expected<ScriptSource, EngineError>
InMemoryScriptRepository::update_source(std::string_view id, std::string source_code) {
    std::unique_lock lock(mutex_);
    const auto it = scripts_.find(id);
    if (it == scripts_.end()) {
        return std::unexpected(make_error(EngineErrorCode::kNotFound,
                                          "script '" + std::string{id} + "' not found",
                                          std::string{id}));
    }
    if (auto compiled = check_script_syntax(it->first, source_code); !compiled) {
        return std::unexpected(compiled.error());
    }
    it->second.source_code = std::move(source_code);
    it->second.updated_at  = std::chrono::system_clock::now();
    return it->second;
}

bool InMemoryScriptRepository::remove_script(std::string_view id) {
    std::unique_lock lock(mutex_);
    const auto it = scripts_.find(id);
    if (it == scripts_.end()) {
        return false;
    }
    scripts_.erase(it);
    std::erase_if(bindings_, [id](const BindingEntry& e) { return e.binding.script_id == id; });
    return true;
}

std::optional<ScriptSource> InMemoryScriptRepository::find_script(std::string_view id) const {
    std::shared_lock lock(mutex_);
    const auto it = scripts_.find(id);
    if (it == scripts_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void InMemoryScriptRepository::bind(BoundScript binding) {
    std::unique_lock lock(mutex_);
    const auto it = std::find_if(bindings_.begin(), bindings_.end(), [&](const BindingEntry& e) {
        return e.binding.hook_name == binding.hook_name &&
               e.binding.script_id == binding.script_id;
    });
    if (it != bindings_.end()) {
        it->binding.ordinal = binding.ordinal;
        it->binding.enabled = binding.enabled;
        return;
    }
    bindings_.push_back(BindingEntry{std::move(binding), next_sequence_++});
}

bool InMemoryScriptRepository::unbind(std::string_view hook_name, std::string_view script_id) {
    std::unique_lock lock(mutex_);
    return std::erase_if(bindings_, [&](const BindingEntry& e) {
        return e.binding.hook_name == hook_name && e.binding.script_id == script_id;
    }) > 0;
}

bool InMemoryScriptRepository::set_enabled(std::string_view hook_name,
                                           std::string_view script_id, bool enabled) {
    std::unique_lock lock(mutex_);
    for (auto& entry : bindings_) {
        if (entry.binding.hook_name == hook_name && entry.binding.script_id == script_id) {
            entry.binding.enabled = enabled;
            return true;
        }
    }
    return false;
}

std::vector<BoundScript> InMemoryScriptRepository::bindings_for(std::string_view hook_name) const {
    std::vector<BindingEntry> matched;
    {
        std::shared_lock lock(mutex_);
        for (const auto& entry : bindings_) {
            if (entry.binding.hook_name == hook_name) {
                matched.push_back(entry);
            }
        }
    }

    std::sort(matched.begin(), matched.end(), [](const BindingEntry& a, const BindingEntry& b) {
        if (a.binding.ordinal != b.binding.ordinal) {
            return a.binding.ordinal < b.binding.ordinal;
        }
        return a.sequence < b.sequence;
    });

    std::vector<BoundScript> out;
    out.reserve(matched.size());
    for (auto& entry : matched) {
        out.push_back(std::move(entry.binding));
    }
    return out;
}
