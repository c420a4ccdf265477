#include "sandbox/secret_store.hpp"

#include <chrono>
#include <mutex>

#include <spdlog/spdlog.h>

bool is_valid_secret_name(std::string_view name) noexcept {
    if (name.empty()) {
        return false;
    }
    const char first = name.front();
    if (!((first >= 'A' && first <= 'Z') || first == '_')) {
        return false;
    }
    for (const char ch : name.substr(1)) {
        const bool ok = (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') || ch == '_';
        if (!ok) {
            return false;
        }
    }
    return true;
}

std::expected<SecretInfo, EngineError>
InMemorySecretStore::create(std::string name, std::string value, std::string description) {
    if (!is_valid_secret_name(name)) {
        return std::unexpected(make_error(
            EngineErrorCode::kValidation,
            "secret name must match [A-Z_][A-Z0-9_]*", name));
    }

    std::unique_lock lock(mutex_);
    if (secrets_.contains(name)) {
        return std::unexpected(make_error(
            EngineErrorCode::kValidation, "secret '" + name + "' already exists", name));
    }

    Secret secret;
    secret.id              = "sec_" + std::to_string(next_id_++);
    secret.name            = name;
    secret.encrypted_value = std::move(value);
    secret.description     = std::move(description);
    secret.created_at      = std::chrono::system_clock::now();

    SecretInfo info{secret.id, secret.name, secret.description, secret.created_at};
    secrets_.emplace(std::move(name), std::move(secret));

    spdlog::info("[secret_store] secret '{}' created", info.name);
    return info;
}

std::expected<void, EngineError>
InMemorySecretStore::replace_value(std::string_view name, std::string value) {
    std::unique_lock lock(mutex_);
    const auto it = secrets_.find(name);
    if (it == secrets_.end()) {
        return std::unexpected(make_error(EngineErrorCode::kNotFound,
                                          "secret '" + std::string{name} + "' is not defined",
                                          std::string{name}));
    }
    it->second.encrypted_value = std::move(value);
    spdlog::info("[secret_store] secret '{}' value replaced", name);
    return {};
}

bool InMemorySecretStore::remove(std::string_view name) {
    std::unique_lock lock(mutex_);
    const auto it = secrets_.find(name);
    if (it == secrets_.end()) {
        return false;
    }
    secrets_.erase(it);
    spdlog::info("[secret_store] secret '{}' deleted", name);
    return true;
}

std::optional<std::string> InMemorySecretStore::lookup(std::string_view name) const {
    std::shared_lock lock(mutex_);
    const auto it = secrets_.find(name);
    if (it == secrets_.end()) {
        return std::nullopt;
    }
    return it->second.encrypted_value;
}

std::vector<SecretInfo> InMemorySecretStore::list_names() const {
    std::shared_lock lock(mutex_);
    std::vector<SecretInfo> out;
    out.reserve(secrets_.size());
    for (const auto& [name, secret] : secrets_) {
        out.push_back(SecretInfo{secret.id, secret.name, secret.description, secret.created_at});
    }
    return out;
}
