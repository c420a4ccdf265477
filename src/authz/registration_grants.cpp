#include "authz/registration_grants.hpp"

#include <algorithm>
#include <cctype>

#include <spdlog/spdlog.h>

namespace {

std::string normalize_email(std::string_view email) {
    std::string out{email};
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

}  // namespace

RegistrationGrantStore::RegistrationGrantStore(std::chrono::seconds default_ttl)
    : default_ttl_(default_ttl)
{}

void RegistrationGrantStore::queue(std::string_view          email,
                                   std::vector<PendingGrant> grants,
                                   std::chrono::seconds      ttl,
                                   Timestamp                 now) {
    const auto effective = ttl > std::chrono::seconds::zero() ? ttl : default_ttl_;
    std::lock_guard lock(mutex_);
    // 가입이 끝나지 않은 항목은 여기서 정리된다
    const auto expired = std::erase_if(entries_, [now](const auto& item) {
        return item.second.expires_at <= now;
    });
    if (expired > 0) {
        spdlog::debug("[registration_grants] dropped {} expired entr(ies)", expired);
    }
    entries_.insert_or_assign(normalize_email(email), Entry{std::move(grants), now + effective});
}

std::vector<PendingGrant> RegistrationGrantStore::consume(std::string_view email, Timestamp now) {
    std::lock_guard lock(mutex_);
    const auto it = entries_.find(normalize_email(email));
    if (it == entries_.end()) {
        return {};
    }
    Entry entry = std::move(it->second);
    entries_.erase(it);
    if (entry.expires_at <= now) {
        return {};
    }
    return std::move(entry.grants);
}

bool RegistrationGrantStore::has_pending(std::string_view email, Timestamp now) const {
    std::lock_guard lock(mutex_);
    const auto it = entries_.find(normalize_email(email));
    return it != entries_.end() && it->second.expires_at > now;
}

bool RegistrationGrantStore::clear(std::string_view email) {
    std::lock_guard lock(mutex_);
    return entries_.erase(normalize_email(email)) > 0;
}

std::size_t RegistrationGrantStore::purge_expired(Timestamp now) {
    std::lock_guard lock(mutex_);
    return std::erase_if(entries_, [now](const auto& item) {
        return item.second.expires_at <= now;
    });
}

std::size_t RegistrationGrantStore::size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

std::expected<std::size_t, EngineError>
apply_pending_grants(RegistrationGrantStore& store,
                     TupleStore&             tuples,
                     std::string_view        user_id,
                     std::string_view        email) {
    const auto grants = store.consume(email);
    if (grants.empty()) {
        return std::size_t{0};
    }

    std::size_t applied = 0;
    for (const auto& grant : grants) {
        auto created = tuples.create_if_not_exists(TupleKey{
            grant.entity_type, grant.entity_id, grant.relation, "user", std::string{user_id}});
        if (!created) {
            spdlog::error("[registration_grants] failed to apply grant {}:{}#{} for user {}: {}",
                          grant.entity_type, grant.entity_id, grant.relation, user_id,
                          created.error().message);
            return std::unexpected(created.error());
        }
        ++applied;
    }

    spdlog::info("[registration_grants] applied {} grant(s) to user {}", applied, user_id);
    return applied;
}
