#pragma once

// ---------------------------------------------------------------------------
// value.hpp
//
// hook 입력 / 스크립트 출력 / 정책 컨텍스트를 표현하는 동적 값 타입.
// Lua 테이블 ↔ C++ 간 변환과 trace/log 용 JSON 직렬화의 공통 표현이다.
//
// [표현 범위]
//   null | bool | int64 | double | string | array | object
//   object 는 키 정렬(std::map) — 직렬화 결과가 결정적이다.
//
// [설계 노트]
// - Lua 는 정수/실수를 구분하므로 int64 와 double 을 별도 보존한다.
// - 외부 JSON 라이브러리 없이 직렬화한다 (logger 와 동일한 escape 규칙).
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

class Value {
public:
    using Array  = std::vector<Value>;
    using Object = std::map<std::string, Value, std::less<>>;

    Value() noexcept = default;
    Value(std::nullptr_t) noexcept {}
    Value(bool b) noexcept : data_{b} {}
    Value(int i) noexcept : data_{static_cast<std::int64_t>(i)} {}
    Value(std::int64_t i) noexcept : data_{i} {}
    Value(double d) noexcept : data_{d} {}
    Value(const char* s) : data_{std::string{s}} {}
    Value(std::string_view s) : data_{std::string{s}} {}
    Value(std::string s) noexcept : data_{std::move(s)} {}
    Value(Array a) noexcept : data_{std::move(a)} {}
    Value(Object o) noexcept : data_{std::move(o)} {}

    // object
    //   Value::object({{"allowed", true}, {"error", "blocked"}})
    [[nodiscard]] static Value object(
        std::initializer_list<std::pair<const std::string, Value>> fields = {});

    // array
    [[nodiscard]] static Value array(std::initializer_list<Value> items = {});

    [[nodiscard]] bool is_null()   const noexcept { return std::holds_alternative<std::monostate>(data_); }
    [[nodiscard]] bool is_bool()   const noexcept { return std::holds_alternative<bool>(data_); }
    [[nodiscard]] bool is_int()    const noexcept { return std::holds_alternative<std::int64_t>(data_); }
    [[nodiscard]] bool is_double() const noexcept { return std::holds_alternative<double>(data_); }
    [[nodiscard]] bool is_number() const noexcept { return is_int() || is_double(); }
    [[nodiscard]] bool is_string() const noexcept { return std::holds_alternative<std::string>(data_); }
    [[nodiscard]] bool is_array()  const noexcept { return std::holds_alternative<Array>(data_); }
    [[nodiscard]] bool is_object() const noexcept { return std::holds_alternative<Object>(data_); }

    // 타입이 다르면 std::bad_variant_access (프로그래밍 오류)
    [[nodiscard]] bool                as_bool()   const { return std::get<bool>(data_); }
    [[nodiscard]] std::int64_t        as_int()    const { return std::get<std::int64_t>(data_); }
    [[nodiscard]] double              as_double() const;  // int 도 허용
    [[nodiscard]] const std::string&  as_string() const { return std::get<std::string>(data_); }
    [[nodiscard]] const Array&        as_array()  const { return std::get<Array>(data_); }
    [[nodiscard]] const Object&       as_object() const { return std::get<Object>(data_); }
    [[nodiscard]] Array&              as_array()        { return std::get<Array>(data_); }
    [[nodiscard]] Object&             as_object()       { return std::get<Object>(data_); }

    // find
    //   object 의 key 조회. object 가 아니거나 키가 없으면 nullptr.
    [[nodiscard]] const Value* find(std::string_view key) const noexcept;

    // operator[]
    //   null 이면 빈 object 로 전환 후 key 삽입 (빌더 용도).
    Value& operator[](std::string_view key);

    // string_or
    //   key 가 string 이면 그 값, 아니면 fallback.
    [[nodiscard]] std::string string_or(std::string_view key, std::string_view fallback) const;

    // type_name
    //   "null" | "boolean" | "integer" | "number" | "string" | "array" | "object"
    [[nodiscard]] std::string_view type_name() const noexcept;

    // to_json
    //   compact JSON 직렬화. NaN/Inf 는 null 로 기록한다.
    [[nodiscard]] std::string to_json() const;

    // to_json_truncated
    //   max_bytes 초과 시 앞부분만 남기고 "...(truncated N bytes)" 표식을 붙인다.
    //   결과는 더 이상 유효한 JSON 이 아닐 수 있다 (trace 저장 전용).
    [[nodiscard]] std::string to_json_truncated(std::size_t max_bytes) const;

    friend bool operator==(const Value& lhs, const Value& rhs) = default;

private:
    void write_json(std::string& out) const;

    std::variant<std::monostate, bool, std::int64_t, double, std::string, Array, Object> data_{};
};

// ---------------------------------------------------------------------------
// json_escape
//   JSON 문자열 값 이스케이프 (따옴표 없이 내용만 반환).
// ---------------------------------------------------------------------------
[[nodiscard]] std::string json_escape(std::string_view sv);

// ---------------------------------------------------------------------------
// truncate_text
//   임의 문자열을 max_bytes 로 자른다. UTF-8 멀티바이트 경계를 넘지 않는다.
// ---------------------------------------------------------------------------
[[nodiscard]] std::string truncate_text(std::string_view text, std::size_t max_bytes);
