#include "sandbox/lua_pattern.hpp"

#include <cctype>

namespace {

constexpr std::size_t kNoMatch = std::string_view::npos;
constexpr char        kEscape  = '%';

unsigned char uchar(char c) {
    return static_cast<unsigned char>(c);
}

bool match_class(unsigned char c, unsigned char cls) {
    bool result = false;
    switch (std::tolower(cls)) {
        case 'a': result = std::isalpha(c) != 0; break;
        case 'c': result = std::iscntrl(c) != 0; break;
        case 'd': result = std::isdigit(c) != 0; break;
        case 'g': result = std::isgraph(c) != 0; break;
        case 'l': result = std::islower(c) != 0; break;
        case 'p': result = std::ispunct(c) != 0; break;
        case 's': result = std::isspace(c) != 0; break;
        case 'u': result = std::isupper(c) != 0; break;
        case 'w': result = std::isalnum(c) != 0; break;
        case 'x': result = std::isxdigit(c) != 0; break;
        default:  return cls == c;
    }
    return std::isupper(cls) != 0 ? !result : result;
}

// ---------------------------------------------------------------------------
// PatternMatcher
//   오류는 error_ 에 기록하고 kNoMatch 로 되감는다. error_ 가 채워지면
//   모든 경로가 즉시 종료한다.
// ---------------------------------------------------------------------------
class PatternMatcher {
public:
    PatternMatcher(std::string_view subject, std::string_view pattern, const PatternLimits& limits)
        : subject_(subject)
        , pattern_(pattern)
        , limits_(limits)
    {}

    std::expected<bool, std::string> find() {
        const bool        anchored = !pattern_.empty() && pattern_[0] == '^';
        const std::size_t first    = anchored ? 1 : 0;

        std::size_t start = 0;
        do {
            const std::size_t end = match(start, first);
            if (!error_.empty()) {
                return std::unexpected(error_);
            }
            if (end != kNoMatch) {
                return true;
            }
            ++start;
        } while (start <= subject_.size() && !anchored);
        return false;
    }

private:
    std::size_t fail(std::string message) {
        if (error_.empty()) {
            error_ = std::move(message);
        }
        return kNoMatch;
    }

    bool tick() {
        if (++steps_ > limits_.max_steps) {
            fail("pattern too complex");
            return false;
        }
        return true;
    }

    std::size_t match(std::size_t s, std::size_t p) {
        if (depth_ >= limits_.max_depth) {
            return fail("pattern too complex");
        }
        ++depth_;
        const std::size_t end = match_items(s, p);
        --depth_;
        return end;
    }

    std::size_t match_items(std::size_t s, std::size_t p) {
        while (error_.empty()) {
            if (p == pattern_.size()) {
                return s;
            }
            if (!tick()) {
                break;
            }

            const char pc = pattern_[p];
            if (pc == '(' || pc == ')') {
                ++p;
                continue;
            }
            if (pc == '$' && p + 1 == pattern_.size()) {
                return s == subject_.size() ? s : kNoMatch;
            }
            if (pc == kEscape && p + 1 < pattern_.size()) {
                const char next = pattern_[p + 1];
                if (next == 'b') {
                    s = match_balance(s, p + 2);
                    if (s == kNoMatch) {
                        return kNoMatch;
                    }
                    p += 4;
                    continue;
                }
                if (next == 'f') {
                    p += 2;
                    if (p >= pattern_.size() || pattern_[p] != '[') {
                        return fail("missing '[' after '%f' in pattern");
                    }
                    const std::size_t ep = class_end(p);
                    if (ep == kNoMatch) {
                        return kNoMatch;
                    }
                    const unsigned char prev = s == 0 ? '\0' : uchar(subject_[s - 1]);
                    const unsigned char cur  = s < subject_.size() ? uchar(subject_[s]) : '\0';
                    if (!match_bracket(prev, p, ep - 1) && match_bracket(cur, p, ep - 1)) {
                        p = ep;
                        continue;
                    }
                    return kNoMatch;
                }
                if (std::isdigit(uchar(next)) != 0) {
                    return fail("back-references are not supported");
                }
            }

            const std::size_t ep = class_end(p);
            if (ep == kNoMatch) {
                return kNoMatch;
            }
            const bool matched = s < subject_.size() && single_match(uchar(subject_[s]), p, ep);
            const char suffix  = ep < pattern_.size() ? pattern_[ep] : '\0';

            switch (suffix) {
                case '?':
                    if (matched) {
                        const std::size_t end = match(s + 1, ep + 1);
                        if (end != kNoMatch || !error_.empty()) {
                            return end;
                        }
                    }
                    p = ep + 1;
                    continue;
                case '+':
                    return matched ? max_expand(s + 1, p, ep) : kNoMatch;
                case '*':
                    return max_expand(s, p, ep);
                case '-':
                    return min_expand(s, p, ep);
                default:
                    if (!matched) {
                        return kNoMatch;
                    }
                    ++s;
                    p = ep;
                    continue;
            }
        }
        return kNoMatch;
    }

    // class_end: 단일 문자 클래스의 다음 위치
    std::size_t class_end(std::size_t p) {
        const char c = pattern_[p++];
        if (c == kEscape) {
            if (p >= pattern_.size()) {
                return fail("malformed pattern (ends with '%')");
            }
            return p + 1;
        }
        if (c == '[') {
            if (p < pattern_.size() && pattern_[p] == '^') {
                ++p;
            }
            do {
                if (p >= pattern_.size()) {
                    return fail("malformed pattern (missing ']')");
                }
                const char cc = pattern_[p++];
                if (cc == kEscape && p < pattern_.size()) {
                    ++p;
                }
            } while (p >= pattern_.size() || pattern_[p] != ']');
            return p + 1;
        }
        return p;
    }

    bool single_match(unsigned char c, std::size_t p, std::size_t ep) const {
        switch (pattern_[p]) {
            case '.':     return true;
            case kEscape: return match_class(c, uchar(pattern_[p + 1]));
            case '[':     return match_bracket(c, p, ep - 1);
            default:      return uchar(pattern_[p]) == c;
        }
    }

    // match_bracket: p 는 '[', close 는 ']' 위치
    bool match_bracket(unsigned char c, std::size_t p, std::size_t close) const {
        bool positive = true;
        ++p;
        if (pattern_[p] == '^') {
            positive = false;
            ++p;
        }
        while (p < close) {
            if (pattern_[p] == kEscape) {
                ++p;
                if (match_class(c, uchar(pattern_[p]))) {
                    return positive;
                }
                ++p;
            } else if (p + 2 < close && pattern_[p + 1] == '-') {
                if (uchar(pattern_[p]) <= c && c <= uchar(pattern_[p + 2])) {
                    return positive;
                }
                p += 3;
            } else {
                if (uchar(pattern_[p]) == c) {
                    return positive;
                }
                ++p;
            }
        }
        return !positive;
    }

    std::size_t match_balance(std::size_t s, std::size_t p) {
        if (p + 1 >= pattern_.size()) {
            return fail("missing arguments to '%b'");
        }
        if (s >= subject_.size() || subject_[s] != pattern_[p]) {
            return kNoMatch;
        }
        const char open  = pattern_[p];
        const char close = pattern_[p + 1];
        int        level = 1;
        for (std::size_t i = s + 1; i < subject_.size(); ++i) {
            if (!tick()) {
                return kNoMatch;
            }
            if (subject_[i] == close) {
                if (--level == 0) {
                    return i + 1;
                }
            } else if (subject_[i] == open) {
                ++level;
            }
        }
        return kNoMatch;
    }

    std::size_t max_expand(std::size_t s, std::size_t p, std::size_t ep) {
        std::size_t count = 0;
        while (s + count < subject_.size() && single_match(uchar(subject_[s + count]), p, ep)) {
            if (!tick()) {
                return kNoMatch;
            }
            ++count;
        }
        for (;;) {
            const std::size_t end = match(s + count, ep + 1);
            if (end != kNoMatch || !error_.empty() || count == 0) {
                return end;
            }
            --count;
        }
    }

    std::size_t min_expand(std::size_t s, std::size_t p, std::size_t ep) {
        for (;;) {
            const std::size_t end = match(s, ep + 1);
            if (end != kNoMatch || !error_.empty()) {
                return end;
            }
            if (s < subject_.size() && single_match(uchar(subject_[s]), p, ep)) {
                ++s;
            } else {
                return kNoMatch;
            }
        }
    }

    std::string_view     subject_;
    std::string_view     pattern_;
    const PatternLimits& limits_;
    std::uint64_t        steps_{0};
    int                  depth_{0};
    std::string          error_;
};

}  // namespace

std::expected<bool, std::string>
lua_pattern_find(std::string_view subject, std::string_view pattern, const PatternLimits& limits) {
    if (pattern.size() > limits.max_pattern_size) {
        return std::unexpected(std::string{"pattern too long"});
    }
    PatternMatcher matcher{subject, pattern, limits};
    return matcher.find();
}
