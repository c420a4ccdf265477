#pragma once

// ---------------------------------------------------------------------------
// lua_pattern.hpp
//
// helpers.matches 용 Lua 패턴 검사기 (단계 예산 포함).
//
// [지원 문법]  Lua 5.4 string.find 와 같은 의미
//   .  %a %c %d %g %l %p %s %u %w %x (대문자는 여집합)  %<기호> 리터럴
//   [set] [^set] (범위 a-z, 클래스 포함)  * + - ?  ^ (앞) $ (끝)
//   %bxy (균형 쌍)  %f[set] (frontier)
//   ( ) 캡처는 그룹 표시로만 취급 (결과는 bool 이므로 값은 반환하지 않음)
//   %1-%9 역참조는 지원하지 않는다 → 오류
//
// [예산]
//   Lua 의 string.find 는 C 코드 안에서 돌기 때문에 count hook 이 닿지 않는다.
//   이 구현은 문자 비교 횟수와 재귀 깊이를 세어 상한을 넘으면
//   "pattern too complex" 오류를 반환한다. 반환 시점이 항상 유한하다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

struct PatternLimits {
    std::size_t   max_pattern_size{1024};
    std::uint64_t max_steps{1'000'000};
    int           max_depth{200};
};

// lua_pattern_find
//   subject 안에서 pattern 이 한 번이라도 일치하면 true.
//   잘못된 패턴 / 예산 초과 → 오류 메시지.
[[nodiscard]] std::expected<bool, std::string>
lua_pattern_find(std::string_view subject, std::string_view pattern,
                 const PatternLimits& limits = {});
