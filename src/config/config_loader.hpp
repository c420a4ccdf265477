#pragma once

// ---------------------------------------------------------------------------
// config_loader.hpp
//
// YAML 엔진 설정 파일을 EngineConfig 로 로드한다.
//
// [설계 원칙]
// - load() 실패 시 std::unexpected(error_message) 반환.
//   부분적으로 파싱된 설정을 반환하지 않는다.
// - 파싱 실패 원인은 로깅하되, 파일 전체를 로그에 출력하지 않는다.
// ---------------------------------------------------------------------------

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

#include "engine_config.hpp"

class ConfigLoader {
public:
    // load
    //   지정된 경로의 YAML 파일을 읽어 EngineConfig 로 파싱한다.
    //   파일 없음, 문법 오류, 값 범위 오류 모두 실패로 처리한다.
    [[nodiscard]] static std::expected<EngineConfig, std::string>
    load(const std::filesystem::path& config_path);

    // load_from_string
    //   테스트 / 내장 기본 설정용. 규칙은 load 와 동일하다.
    [[nodiscard]] static std::expected<EngineConfig, std::string>
    load_from_string(std::string_view yaml_text);
};
