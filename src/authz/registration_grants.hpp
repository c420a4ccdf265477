#pragma once

// ---------------------------------------------------------------------------
// registration_grants.hpp
//
// 가입 진행 중인 이메일에 대해 "사용자 생성 후 부여할 relation" 을 잠시 보관한다.
//
// [수명 규칙]
// - 모든 항목은 TTL 을 가진다. 만료 항목은 consume 에서 무시되고
//   queue 할 때마다, 그리고 purge_expired 로 제거된다 (무한 증가 없음).
//
// [연결]
// - 제어 소켓 queue_grants / clear_grants 로 적재·취소한다.
// - after_signup 디스패치가 성공하면 input.user.{id,email} 로 apply_pending_grants.
// - consume 은 읽는 즉시 항목을 제거한다. 같은 가입 흐름이 두 번 적용되지 않는다.
// - 이메일은 소문자로 정규화한다.
// - 같은 이메일로 다시 queue 하면 기존 항목을 교체한다.
// ---------------------------------------------------------------------------

#include "authz/tuple_store.hpp"
#include "common/types.hpp"

#include <chrono>
#include <cstddef>
#include <expected>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

struct PendingGrant {
    std::string entity_type{};
    std::string entity_id{};
    std::string relation{};
};

class RegistrationGrantStore {
public:
    explicit RegistrationGrantStore(std::chrono::seconds default_ttl = std::chrono::minutes(15));

    // queue
    //   ttl 이 0 이면 default_ttl 사용. 만료된 다른 항목은 이 시점에 제거된다.
    void queue(std::string_view          email,
               std::vector<PendingGrant> grants,
               std::chrono::seconds      ttl = std::chrono::seconds::zero(),
               Timestamp                 now = std::chrono::system_clock::now());

    // consume
    //   항목을 꺼내며 제거한다. 없거나 만료되었으면 빈 목록.
    [[nodiscard]] std::vector<PendingGrant> consume(std::string_view email,
                                                    Timestamp now = std::chrono::system_clock::now());

    [[nodiscard]] bool has_pending(std::string_view email,
                                   Timestamp now = std::chrono::system_clock::now()) const;

    // clear
    //   가입 실패 시 적용 없이 제거.
    bool clear(std::string_view email);

    // purge_expired
    //   제거된 항목 수.
    std::size_t purge_expired(Timestamp now = std::chrono::system_clock::now());

    [[nodiscard]] std::size_t size() const;

private:
    struct Entry {
        std::vector<PendingGrant> grants;
        Timestamp                 expires_at;
    };

    std::chrono::seconds                          default_ttl_;
    mutable std::mutex                            mutex_;
    std::map<std::string, Entry, std::less<>>     entries_;
};

// apply_pending_grants
//   email 로 대기 중인 grant 를 꺼내 (entity, relation, "user", user_id) tuple 로 기록한다.
//   기록된 grant 수를 반환한다. tuple 생성 실패 시 그 오류를 반환하며
//   이미 꺼낸 항목은 다시 queue 되지 않는다.
[[nodiscard]] std::expected<std::size_t, EngineError>
apply_pending_grants(RegistrationGrantStore& store,
                     TupleStore&             tuples,
                     std::string_view        user_id,
                     std::string_view        email);
