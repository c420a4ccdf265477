// ---------------------------------------------------------------------------
// value.cpp
//
// Value 동적 타입 구현 및 JSON 직렬화.
// ---------------------------------------------------------------------------

#include "common/value.hpp"

#include <cmath>
#include <cstdio>

#include <fmt/format.h>

Value Value::object(std::initializer_list<std::pair<const std::string, Value>> fields) {
    return Value{Object{fields}};
}

Value Value::array(std::initializer_list<Value> items) {
    return Value{Array{items}};
}

double Value::as_double() const {
    if (const auto* i = std::get_if<std::int64_t>(&data_)) {
        return static_cast<double>(*i);
    }
    return std::get<double>(data_);
}

const Value* Value::find(std::string_view key) const noexcept {
    const auto* obj = std::get_if<Object>(&data_);
    if (obj == nullptr) {
        return nullptr;
    }
    const auto it = obj->find(key);
    return it == obj->end() ? nullptr : &it->second;
}

Value& Value::operator[](std::string_view key) {
    if (is_null()) {
        data_ = Object{};
    }
    auto& obj = std::get<Object>(data_);
    auto  it  = obj.find(key);
    if (it == obj.end()) {
        it = obj.emplace(std::string{key}, Value{}).first;
    }
    return it->second;
}

std::string Value::string_or(std::string_view key, std::string_view fallback) const {
    const Value* v = find(key);
    if (v != nullptr && v->is_string()) {
        return v->as_string();
    }
    return std::string{fallback};
}

std::string_view Value::type_name() const noexcept {
    switch (data_.index()) {
        case 0: return "null";
        case 1: return "boolean";
        case 2: return "integer";
        case 3: return "number";
        case 4: return "string";
        case 5: return "array";
        case 6: return "object";
        default: return "null";
    }
}

std::string Value::to_json() const {
    std::string out;
    out.reserve(64);
    write_json(out);
    return out;
}

std::string Value::to_json_truncated(std::size_t max_bytes) const {
    std::string json = to_json();
    if (json.size() <= max_bytes) {
        return json;
    }
    const std::size_t original = json.size();
    std::string out = truncate_text(json, max_bytes);
    out += fmt::format("...(truncated {} bytes)", original - out.size());
    return out;
}

void Value::write_json(std::string& out) const {
    switch (data_.index()) {
        case 0:
            out += "null";
            break;
        case 1:
            out += std::get<bool>(data_) ? "true" : "false";
            break;
        case 2:
            out += std::to_string(std::get<std::int64_t>(data_));
            break;
        case 3: {
            const double d = std::get<double>(data_);
            if (!std::isfinite(d)) {
                out += "null";
            } else {
                out += fmt::format("{}", d);
            }
            break;
        }
        case 4:
            out += '"';
            out += json_escape(std::get<std::string>(data_));
            out += '"';
            break;
        case 5: {
            out += '[';
            bool first = true;
            for (const auto& item : std::get<Array>(data_)) {
                if (!first) {
                    out += ',';
                }
                first = false;
                item.write_json(out);
            }
            out += ']';
            break;
        }
        case 6: {
            out += '{';
            bool first = true;
            for (const auto& [key, item] : std::get<Object>(data_)) {
                if (!first) {
                    out += ',';
                }
                first = false;
                out += '"';
                out += json_escape(key);
                out += "\":";
                item.write_json(out);
            }
            out += '}';
            break;
        }
        default:
            out += "null";
            break;
    }
}

std::string json_escape(std::string_view sv) {
    std::string out;
    out.reserve(sv.size() + 8);
    for (char c : sv) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\t': out += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8]{};
                    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-vararg)
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out += c;
                }
                break;
        }
    }
    return out;
}

std::string truncate_text(std::string_view text, std::size_t max_bytes) {
    if (text.size() <= max_bytes) {
        return std::string{text};
    }
    std::size_t cut = max_bytes;
    // UTF-8 continuation byte(10xxxxxx) 위에서 자르지 않는다
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0u) == 0x80u) {
        --cut;
    }
    return std::string{text.substr(0, cut)};
}
