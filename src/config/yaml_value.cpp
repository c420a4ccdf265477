#include "config/yaml_value.hpp"

#include <charconv>
#include <cstdint>
#include <cstdlib>

namespace {

Value scalar_to_value(const YAML::Node& node) {
    const std::string& raw = node.Scalar();

    // 따옴표 스칼라는 yaml-cpp 가 "!" 태그를 붙인다
    if (node.Tag() == "!") {
        return Value{raw};
    }
    if (raw.empty() || raw == "null" || raw == "~" || raw == "Null" || raw == "NULL") {
        return Value{};
    }
    if (raw == "true" || raw == "True" || raw == "TRUE") {
        return Value{true};
    }
    if (raw == "false" || raw == "False" || raw == "FALSE") {
        return Value{false};
    }

    std::int64_t iv{0};
    const char* begin = raw.data();
    const char* end   = raw.data() + raw.size();
    if (auto [ptr, ec] = std::from_chars(begin, end, iv); ec == std::errc{} && ptr == end) {
        return Value{iv};
    }

    char* parse_end = nullptr;
    const double dv = std::strtod(raw.c_str(), &parse_end);
    if (parse_end == end && (raw.find_first_of(".eE") != std::string::npos)) {
        return Value{dv};
    }

    return Value{raw};
}

}  // namespace

Value value_from_yaml(const YAML::Node& node) {
    if (!node || node.IsNull()) {
        return Value{};
    }
    if (node.IsScalar()) {
        return scalar_to_value(node);
    }
    if (node.IsSequence()) {
        Value::Array items;
        items.reserve(node.size());
        for (const auto& item : node) {
            items.push_back(value_from_yaml(item));
        }
        return Value{std::move(items)};
    }
    if (node.IsMap()) {
        Value::Object fields;
        for (const auto& kv : node) {
            fields.emplace(kv.first.as<std::string>(), value_from_yaml(kv.second));
        }
        return Value{std::move(fields)};
    }
    return Value{};
}

std::expected<Value, std::string> parse_json_value(std::string_view text) {
    try {
        const YAML::Node root = YAML::Load(std::string{text});
        return value_from_yaml(root);
    } catch (const YAML::ParserException& e) {
        return std::unexpected(std::string{"malformed document at line "} +
                               std::to_string(e.mark.line + 1) + ": " + e.msg);
    } catch (const YAML::Exception& e) {
        return std::unexpected(std::string{"malformed document: "} + e.what());
    }
}
