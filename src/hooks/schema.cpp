#include "hooks/schema.hpp"

#include <algorithm>
#include <cctype>

namespace {

std::string join_path(std::string_view prefix, std::string_view name) {
    if (prefix.empty()) {
        return std::string{name};
    }
    std::string path{prefix};
    path += '.';
    path += name;
    return path;
}

std::expected<void, std::string> validate_fields(const Schema&    schema,
                                                 const Value&     object,
                                                 std::string_view prefix);

std::expected<void, std::string> validate_field(const FieldSpec& spec,
                                                const Value&     value,
                                                const std::string& path) {
    switch (spec.type) {
        case FieldType::kString:
            if (!value.is_string()) {
                return std::unexpected(path + ": expected string, got " +
                                       std::string{value.type_name()});
            }
            return {};

        case FieldType::kEmail:
            if (!value.is_string() || !is_valid_email(value.as_string())) {
                return std::unexpected(path + ": expected a valid email address");
            }
            return {};

        case FieldType::kBool:
            if (!value.is_bool()) {
                return std::unexpected(path + ": expected boolean, got " +
                                       std::string{value.type_name()});
            }
            return {};

        case FieldType::kNumber:
            if (!value.is_number()) {
                return std::unexpected(path + ": expected number, got " +
                                       std::string{value.type_name()});
            }
            return {};

        case FieldType::kStringArray: {
            if (!value.is_array()) {
                return std::unexpected(path + ": expected array of strings, got " +
                                       std::string{value.type_name()});
            }
            const auto& items = value.as_array();
            for (std::size_t i = 0; i < items.size(); ++i) {
                if (!items[i].is_string()) {
                    return std::unexpected(path + "[" + std::to_string(i) +
                                           "]: expected string, got " +
                                           std::string{items[i].type_name()});
                }
            }
            return {};
        }

        case FieldType::kObject:
            if (!value.is_object()) {
                return std::unexpected(path + ": expected object, got " +
                                       std::string{value.type_name()});
            }
            return validate_fields(spec.fields, value, path);

        case FieldType::kAnyObject:
            if (!value.is_object()) {
                return std::unexpected(path + ": expected object, got " +
                                       std::string{value.type_name()});
            }
            return {};

        case FieldType::kEnum: {
            if (!value.is_string()) {
                return std::unexpected(path + ": expected string, got " +
                                       std::string{value.type_name()});
            }
            const auto& allowed = spec.allowed_values;
            if (std::find(allowed.begin(), allowed.end(), value.as_string()) == allowed.end()) {
                std::string joined;
                for (const auto& v : allowed) {
                    if (!joined.empty()) {
                        joined += '|';
                    }
                    joined += v;
                }
                return std::unexpected(path + ": must be one of " + joined);
            }
            return {};
        }
    }
    return std::unexpected(path + ": unsupported field type");
}

std::expected<void, std::string> validate_fields(const Schema&    schema,
                                                 const Value&     object,
                                                 std::string_view prefix) {
    for (const auto& spec : schema) {
        const std::string path  = join_path(prefix, spec.name);
        const Value*      value = object.find(spec.name);

        if (value == nullptr || value->is_null()) {
            if (spec.required) {
                return std::unexpected(path + ": required field is missing");
            }
            continue;
        }

        if (auto result = validate_field(spec, *value, path); !result) {
            return result;
        }
    }
    return {};
}

}  // namespace

FieldSpec required_field(std::string name, FieldType type) {
    return FieldSpec{std::move(name), type, true, {}, {}};
}

FieldSpec optional_field(std::string name, FieldType type) {
    return FieldSpec{std::move(name), type, false, {}, {}};
}

FieldSpec object_field(std::string name, Schema fields, bool is_required) {
    return FieldSpec{std::move(name), FieldType::kObject, is_required, std::move(fields), {}};
}

FieldSpec enum_field(std::string name, std::vector<std::string> values, bool is_required) {
    return FieldSpec{std::move(name), FieldType::kEnum, is_required, {}, std::move(values)};
}

std::expected<void, std::string> validate_schema(const Schema& schema, const Value& input) {
    if (!input.is_object()) {
        return std::unexpected("input: expected object, got " + std::string{input.type_name()});
    }
    return validate_fields(schema, input, "");
}

bool is_valid_email(std::string_view email) noexcept {
    const auto at = email.find('@');
    if (at == std::string_view::npos || at == 0 || at + 1 >= email.size()) {
        return false;
    }
    if (email.find('@', at + 1) != std::string_view::npos) {
        return false;
    }
    for (const char ch : email) {
        if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
            return false;
        }
    }
    const std::string_view domain = email.substr(at + 1);
    const auto dot = domain.find('.');
    return dot != std::string_view::npos && dot != 0 && dot + 1 < domain.size();
}
