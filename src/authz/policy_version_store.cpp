#include "authz/policy_version_store.hpp"

#include <algorithm>
#include <chrono>
#include <mutex>

#include <spdlog/spdlog.h>

std::expected<PolicyVersion, EngineError>
InMemoryPolicyVersionStore::append(const PolicyKey& key, std::string script_source,
                                   std::string changed_by, std::string reason) {
    if (key.entity_type.empty() || key.permission.empty()) {
        return std::unexpected(make_error(EngineErrorCode::kValidation,
                                          "policy key requires entity_type and permission",
                                          "policy_versions"));
    }
    if ((key.level == PolicyLevel::kTuple) == key.tuple_id.empty()) {
        return std::unexpected(make_error(EngineErrorCode::kValidation,
                                          "tuple_id must be set only for tuple level policies",
                                          "policy_versions"));
    }

    PolicyVersion entry;
    {
        std::unique_lock lock(mutex_);
        auto& list = versions_[key];

        entry.key           = key;
        entry.script_source = std::move(script_source);
        entry.version       = list.empty() ? 1 : list.back().version + 1;
        entry.changed_by    = std::move(changed_by);
        entry.reason        = std::move(reason);
        entry.created_at    = std::chrono::system_clock::now();
        list.push_back(entry);
    }

    spdlog::info("[policy_versions] {}.{} ({}) -> v{} by {}",
                 key.entity_type, key.permission, to_string(key.level),
                 entry.version, entry.changed_by);
    return entry;
}

std::vector<PolicyVersion> InMemoryPolicyVersionStore::history(const PolicyKey& key,
                                                               std::size_t      limit) const {
    std::vector<PolicyVersion> out;
    std::shared_lock           lock(mutex_);
    const auto it = versions_.find(key);
    if (it == versions_.end()) {
        return out;
    }
    const auto& list  = it->second;
    const auto  count = std::min(limit, list.size());
    out.reserve(count);
    for (auto rit = list.rbegin(); rit != list.rend() && out.size() < count; ++rit) {
        out.push_back(*rit);
    }
    return out;
}

std::optional<PolicyVersion> InMemoryPolicyVersionStore::latest(const PolicyKey& key) const {
    std::shared_lock lock(mutex_);
    const auto it = versions_.find(key);
    if (it == versions_.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second.back();
}
