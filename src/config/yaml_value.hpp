#pragma once

// ---------------------------------------------------------------------------
// yaml_value.hpp
//
// yaml-cpp 노드 ↔ Value 변환.
// JSON 은 YAML 의 부분집합이므로 제어 소켓의 JSON 요청도 같은 경로로 파싱한다.
//
// [스칼라 타입 추론]
//   따옴표로 감싼 스칼라 → string
//   null / ~            → null
//   true / false        → bool
//   정수 전체 일치       → int64
//   실수 전체 일치       → double
//   그 외               → string
// ---------------------------------------------------------------------------

#include "common/value.hpp"

#include <expected>
#include <string>
#include <string_view>

#include <yaml-cpp/yaml.h>

// value_from_yaml
//   노드를 재귀 변환한다. 정의되지 않은 노드는 null.
[[nodiscard]] Value value_from_yaml(const YAML::Node& node);

// parse_json_value
//   JSON(또는 YAML) 문자열 → Value. 문법 오류 시 std::unexpected(메시지).
[[nodiscard]] std::expected<Value, std::string> parse_json_value(std::string_view text);
