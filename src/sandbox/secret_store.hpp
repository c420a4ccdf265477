#pragma once

// ---------------------------------------------------------------------------
// secret_store.hpp
//
// 관리자가 등록한 secret 레코드 저장소.
//
// [접근 규칙]
// - 엔진은 이름으로만 조회한다. 값 목록 / 일괄 export API 는 없다.
//   list_names() 는 이름과 설명만 돌려준다.
// - 이름 규칙: [A-Z_][A-Z0-9_]*  (생성 후 변경 불가)
// - 값은 교체만 가능 (replace_value). 생성 후 다시 표시되지 않는다.
// - 삭제 즉시 조회가 실패한다. 스크립트는 secret() 호출 시점에 저장소를 읽는다.
//
// [암호화]
// - encrypted_value 의 암복호화는 외부 저장소(KMS 등)의 책임이다.
//   InMemorySecretStore 는 전달받은 값을 그대로 보관한다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"

#include <expected>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

struct Secret {
    std::string id{};
    std::string name{};
    std::string encrypted_value{};
    std::string description{};
    Timestamp   created_at{};
};

// SecretInfo: 목록 조회용 (값 제외)
struct SecretInfo {
    std::string id{};
    std::string name{};
    std::string description{};
    Timestamp   created_at{};
};

// is_valid_secret_name
//   [A-Z_][A-Z0-9_]* 이면 true.
[[nodiscard]] bool is_valid_secret_name(std::string_view name) noexcept;

// ---------------------------------------------------------------------------
// SecretStore (추상 인터페이스)
// ---------------------------------------------------------------------------
class SecretStore {
public:
    virtual ~SecretStore() = default;

    // create
    //   이름 규칙 위반 → kValidation, 중복 이름 → kValidation.
    [[nodiscard]] virtual std::expected<SecretInfo, EngineError>
    create(std::string name, std::string value, std::string description) = 0;

    // replace_value
    //   미등록 이름 → kNotFound.
    [[nodiscard]] virtual std::expected<void, EngineError>
    replace_value(std::string_view name, std::string value) = 0;

    // remove
    //   삭제되면 true.
    virtual bool remove(std::string_view name) = 0;

    // lookup
    //   샌드박스 전용. 미등록 이름 → std::nullopt.
    [[nodiscard]] virtual std::optional<std::string> lookup(std::string_view name) const = 0;

    [[nodiscard]] virtual std::vector<SecretInfo> list_names() const = 0;
};

// ---------------------------------------------------------------------------
// InMemorySecretStore
//   std::shared_mutex 로 보호되는 map. 읽기(lookup)는 서로 블로킹하지 않는다.
// ---------------------------------------------------------------------------
class InMemorySecretStore final : public SecretStore {
public:
    [[nodiscard]] std::expected<SecretInfo, EngineError>
    create(std::string name, std::string value, std::string description) override;

    [[nodiscard]] std::expected<void, EngineError>
    replace_value(std::string_view name, std::string value) override;

    bool remove(std::string_view name) override;

    [[nodiscard]] std::optional<std::string> lookup(std::string_view name) const override;

    [[nodiscard]] std::vector<SecretInfo> list_names() const override;

private:
    mutable std::shared_mutex                     mutex_;
    std::map<std::string, Secret, std::less<>>    secrets_;
    std::uint64_t                                 next_id_{1};
};
