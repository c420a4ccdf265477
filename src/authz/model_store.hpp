#pragma once

// ---------------------------------------------------------------------------
// model_store.hpp
//
// AuthorizationModel 저장소. 모델은 불변 스냅샷(shared_ptr<const>)으로 공유되고
// upsert 는 스냅샷을 통째로 교체한다. 권한 검사 중인 reader 는 이전 스냅샷을
// 끝까지 사용한다.
//
// [쓰기 규칙]
// - upsert: validate_model 통과 + closure 계산 후 저장.
//   기존 모델에서 사라지는 relation 을 tuple 이 아직 참조하면 kModel 로 거부.
//   permission 정책 스크립트가 바뀌면 PolicyVersionStore 에 새 버전을 남긴다.
// - remove: 어떤 relation 이든 tuple 이 참조 중이면 거부.
// - rename: 안정 id 유지. tuple 의 이름 사본 갱신은 호출자가
//   TupleStore::refresh_entity_type 으로 별도 수행한다.
// - 시스템 모델 (platform, users, groups, clients) 은 생성 시 시드되며
//   삭제 / rename 할 수 없다.
// ---------------------------------------------------------------------------

#include "authz/authorization_model.hpp"
#include "authz/policy_version_store.hpp"
#include "authz/tuple_store.hpp"

#include <cstdint>
#include <expected>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

using ModelPtr = std::shared_ptr<const AuthorizationModel>;

class ModelStore {
public:
    virtual ~ModelStore() = default;

    [[nodiscard]] virtual std::expected<ModelPtr, EngineError>
    upsert(ModelDefinition definition, std::string_view changed_by) = 0;

    [[nodiscard]] virtual std::expected<void, EngineError> remove(std::string_view entity_type) = 0;

    [[nodiscard]] virtual std::expected<ModelPtr, EngineError>
    rename(std::string_view entity_type, std::string new_name) = 0;

    [[nodiscard]] virtual ModelPtr find(std::string_view entity_type) const = 0;
    [[nodiscard]] virtual ModelPtr find_by_id(std::string_view id) const = 0;
    [[nodiscard]] virtual std::vector<ModelPtr> list() const = 0;
};

// system_model_definitions
//   시드 대상 시스템 모델 정의.
[[nodiscard]] std::vector<ModelDefinition> system_model_definitions();

class InMemoryModelStore final : public ModelStore {
public:
    // versions: nullptr 이면 정책 이력을 남기지 않는다.
    explicit InMemoryModelStore(const TupleStore& tuples, PolicyVersionStore* versions = nullptr);

    [[nodiscard]] std::expected<ModelPtr, EngineError>
    upsert(ModelDefinition definition, std::string_view changed_by) override;

    [[nodiscard]] std::expected<void, EngineError> remove(std::string_view entity_type) override;

    [[nodiscard]] std::expected<ModelPtr, EngineError>
    rename(std::string_view entity_type, std::string new_name) override;

    [[nodiscard]] ModelPtr find(std::string_view entity_type) const override;
    [[nodiscard]] ModelPtr find_by_id(std::string_view id) const override;
    [[nodiscard]] std::vector<ModelPtr> list() const override;

private:
    [[nodiscard]] std::expected<void, EngineError>
    check_relations_unused(const AuthorizationModel& model, const RelationMap* keep) const;

    const TupleStore&                              tuples_;
    PolicyVersionStore*                            versions_;
    mutable std::shared_mutex                      mutex_;
    std::map<std::string, ModelPtr, std::less<>>   models_;  // entity_type → model
    std::uint64_t                                  next_id_{1};
};
