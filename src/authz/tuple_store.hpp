#pragma once

// ---------------------------------------------------------------------------
// tuple_store.hpp
//
// relation 부여 tuple 저장소.
//
// [키]
//   (entity_type, entity_id, relation, subject_type, subject_id) 는 유일하다.
//   entity_id == "*" 는 해당 entity type 전체에 대한 부여 (wildcard).
//
// [동시성]
//   create / remove 는 유일 키에 대한 멱등 연산이므로 짧은 unique lock 만 잡는다.
//   권한 검사는 shared lock 으로 읽어 쓰기를 막지 않는다.
//
// [entity type rename]
//   tuple 은 모델의 안정 id (entity_type_id) 와 이름 사본을 함께 가진다.
//   rename 후 refresh_entity_type 으로 이름 사본을 명시적으로 갱신한다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"

#include <compare>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

inline constexpr std::string_view kWildcardEntityId = "*";

struct TupleKey {
    std::string entity_type{};
    std::string entity_id{};
    std::string relation{};
    std::string subject_type{};
    std::string subject_id{};

    friend auto operator<=>(const TupleKey&, const TupleKey&) = default;
};

struct Tuple {
    std::string id{};
    std::string entity_type{};
    std::string entity_type_id{};
    std::string entity_id{};
    std::string relation{};
    std::string subject_type{};
    std::string subject_id{};
    Timestamp   created_at{};

    [[nodiscard]] TupleKey key() const {
        return TupleKey{entity_type, entity_id, relation, subject_type, subject_id};
    }
};

struct TupleCreateResult {
    Tuple tuple{};
    bool  created{false};  // false: 같은 키의 기존 tuple 반환
};

// ---------------------------------------------------------------------------
// TupleStore (추상 인터페이스)
// ---------------------------------------------------------------------------
class TupleStore {
public:
    virtual ~TupleStore() = default;

    // create_if_not_exists
    //   같은 키가 있으면 기존 tuple 을 그대로 반환한다 (멱등).
    //   빈 필드 → kValidation.
    [[nodiscard]] virtual std::expected<TupleCreateResult, EngineError>
    create_if_not_exists(TupleKey key, std::string entity_type_id = {}) = 0;

    virtual bool remove(const TupleKey& key) = 0;

    [[nodiscard]] virtual std::optional<Tuple> find_exact(const TupleKey& key) const = 0;

    [[nodiscard]] virtual std::vector<Tuple> find_by_subject(std::string_view subject_type,
                                                             std::string_view subject_id) const = 0;

    [[nodiscard]] virtual std::vector<Tuple> find_by_entity(std::string_view entity_type,
                                                            std::string_view entity_id) const = 0;

    [[nodiscard]] virtual std::size_t count_by_relation(std::string_view entity_type,
                                                        std::string_view relation) const = 0;

    // refresh_entity_type
    //   entity_type_id 가 일치하는 tuple 의 entity_type 이름을 new_name 으로 바꾼다.
    //   갱신된 tuple 수를 반환한다.
    virtual std::size_t refresh_entity_type(std::string_view entity_type_id,
                                            std::string_view new_name) = 0;
};

// ---------------------------------------------------------------------------
// InMemoryTupleStore
// ---------------------------------------------------------------------------
class InMemoryTupleStore final : public TupleStore {
public:
    [[nodiscard]] std::expected<TupleCreateResult, EngineError>
    create_if_not_exists(TupleKey key, std::string entity_type_id = {}) override;

    bool remove(const TupleKey& key) override;

    [[nodiscard]] std::optional<Tuple> find_exact(const TupleKey& key) const override;

    [[nodiscard]] std::vector<Tuple> find_by_subject(std::string_view subject_type,
                                                     std::string_view subject_id) const override;

    [[nodiscard]] std::vector<Tuple> find_by_entity(std::string_view entity_type,
                                                    std::string_view entity_id) const override;

    [[nodiscard]] std::size_t count_by_relation(std::string_view entity_type,
                                                std::string_view relation) const override;

    std::size_t refresh_entity_type(std::string_view entity_type_id,
                                    std::string_view new_name) override;

    [[nodiscard]] std::size_t size() const;

private:
    mutable std::shared_mutex      mutex_;
    std::map<TupleKey, Tuple>      tuples_;
    std::uint64_t                  next_id_{1};
};
