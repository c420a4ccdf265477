#pragma once

// ---------------------------------------------------------------------------
// schema.hpp
//
// hook 입력 / 출력 계약을 표현하는 작은 field-spec 트리와 검증기.
//
// [검증 규칙]
// - required 필드가 없거나 null 이면 실패.
// - optional 필드는 없거나 null 이면 통과, 값이 있으면 타입 검사.
// - 스키마에 없는 추가 필드는 허용한다 (identity provider 가 필드를 늘려도
//   기존 스크립트가 깨지지 않아야 한다).
// - 실패 메시지는 점 표기 경로를 포함한다: "request.ip: expected string".
// ---------------------------------------------------------------------------

#include "common/value.hpp"

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

enum class FieldType : std::uint8_t {
    kString,
    kEmail,        // '@' 1개, 로컬/도메인 비어있지 않음, 도메인에 '.' 포함
    kBool,
    kNumber,
    kStringArray,
    kObject,       // fields 로 하위 구조 검증
    kAnyObject,    // object 이기만 하면 통과 (token claims 등)
    kEnum,         // allowed_values 중 하나인 string
};

struct FieldSpec {
    std::string              name{};
    FieldType                type{FieldType::kString};
    bool                     required{true};
    std::vector<FieldSpec>   fields{};          // kObject 전용
    std::vector<std::string> allowed_values{};  // kEnum 전용
};

using Schema = std::vector<FieldSpec>;

// ---------------------------------------------------------------------------
// 스키마 빌더 헬퍼 (hook_registry.cpp 의 테이블 가독성용)
// ---------------------------------------------------------------------------
[[nodiscard]] FieldSpec required_field(std::string name, FieldType type);
[[nodiscard]] FieldSpec optional_field(std::string name, FieldType type);
[[nodiscard]] FieldSpec object_field(std::string name, Schema fields, bool is_required = true);
[[nodiscard]] FieldSpec enum_field(std::string name, std::vector<std::string> values,
                                   bool is_required = true);

// validate_schema
//   input 이 object 이고 schema 를 만족하면 성공. 실패 시 첫 위반 메시지.
[[nodiscard]] std::expected<void, std::string> validate_schema(const Schema& schema,
                                                               const Value&  input);

// is_valid_email
//   형식 검사만 수행한다 (도메인 실재 여부 확인 없음).
[[nodiscard]] bool is_valid_email(std::string_view email) noexcept;
