#pragma once

// ---------------------------------------------------------------------------
// policy_version_store.hpp
//
// 권한 정책 스크립트 변경 이력 (append-only).
//
// 키 = (entity_type, permission, level, tuple_id)
//   level kPermission : 모델 permission 에 붙은 정책. tuple_id 는 비어 있어야 한다.
//   level kTuple      : 특정 tuple 에 붙은 정책. tuple_id 필수.
// version 은 키마다 1 부터 증가하며 재사용되지 않는다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"

#include <compare>
#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

enum class PolicyLevel : std::uint8_t {
    kPermission = 0,
    kTuple      = 1,
};

[[nodiscard]] constexpr std::string_view to_string(PolicyLevel level) noexcept {
    return level == PolicyLevel::kTuple ? "tuple" : "permission";
}

struct PolicyKey {
    std::string entity_type{};
    std::string permission{};
    PolicyLevel level{PolicyLevel::kPermission};
    std::string tuple_id{};

    friend auto operator<=>(const PolicyKey&, const PolicyKey&) = default;
};

struct PolicyVersion {
    PolicyKey     key{};
    std::string   script_source{};
    std::uint32_t version{0};
    std::string   changed_by{};
    std::string   reason{};
    Timestamp     created_at{};
};

class PolicyVersionStore {
public:
    virtual ~PolicyVersionStore() = default;

    // append
    //   잘못된 키 (빈 entity_type / permission, level 과 tuple_id 불일치) → kValidation.
    [[nodiscard]] virtual std::expected<PolicyVersion, EngineError>
    append(const PolicyKey& key, std::string script_source, std::string changed_by,
           std::string reason) = 0;

    // history
    //   최신 버전부터 최대 limit 개.
    [[nodiscard]] virtual std::vector<PolicyVersion> history(const PolicyKey& key,
                                                             std::size_t      limit) const = 0;

    [[nodiscard]] virtual std::optional<PolicyVersion> latest(const PolicyKey& key) const = 0;
};

class InMemoryPolicyVersionStore final : public PolicyVersionStore {
public:
    [[nodiscard]] std::expected<PolicyVersion, EngineError>
    append(const PolicyKey& key, std::string script_source, std::string changed_by,
           std::string reason) override;

    [[nodiscard]] std::vector<PolicyVersion> history(const PolicyKey& key,
                                                     std::size_t      limit) const override;

    [[nodiscard]] std::optional<PolicyVersion> latest(const PolicyKey& key) const override;

private:
    mutable std::shared_mutex                          mutex_;
    std::map<PolicyKey, std::vector<PolicyVersion>>    versions_;  // 오래된 순
};
