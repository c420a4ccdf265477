#include "hooks/hook_registry.hpp"

#include <algorithm>

namespace {

// ---------------------------------------------------------------------------
// 공용 하위 스키마
// ---------------------------------------------------------------------------
Schema request_schema() {
    return {
        optional_field("ip", FieldType::kString),
        optional_field("user_agent", FieldType::kString),
        optional_field("origin", FieldType::kString),
    };
}

Schema user_schema() {
    return {
        required_field("id", FieldType::kString),
        optional_field("email", FieldType::kString),
        optional_field("name", FieldType::kString),
        optional_field("role", FieldType::kString),
    };
}

Schema session_schema() {
    return {
        required_field("id", FieldType::kString),
        required_field("user_id", FieldType::kString),
        optional_field("expires_at", FieldType::kString),
    };
}

Schema apikey_schema() {
    return {
        required_field("id", FieldType::kString),
        optional_field("name", FieldType::kString),
        required_field("user_id", FieldType::kString),
        optional_field("permissions", FieldType::kStringArray),
    };
}

Schema client_schema() {
    return {
        required_field("client_id", FieldType::kString),
        optional_field("name", FieldType::kString),
        optional_field("type", FieldType::kString),
        optional_field("redirect_uri", FieldType::kString),
    };
}

Schema output_for(HookMode mode) {
    switch (mode) {
        case HookMode::kBlocking:
            return {required_field("allowed", FieldType::kBool),
                    optional_field("error", FieldType::kString)};
        case HookMode::kAsync:
            return {required_field("allowed", FieldType::kBool)};
        case HookMode::kEnrichment:
            return {required_field("allowed", FieldType::kBool),
                    optional_field("data", FieldType::kAnyObject)};
    }
    return {};
}

HookDefinition make_hook(std::string name, HookMode mode, HookGroup group, Schema input,
                         std::string description) {
    HookDefinition def;
    def.name          = std::move(name);
    def.mode          = mode;
    def.group         = group;
    def.input_schema  = std::move(input);
    def.output_schema = output_for(mode);
    def.description   = std::move(description);
    return def;
}

}  // namespace

// ---------------------------------------------------------------------------
// HookRegistry 생성자: 16개 hook 정의
// ---------------------------------------------------------------------------
HookRegistry::HookRegistry() {
    using M = HookMode;
    using G = HookGroup;

    hooks_.reserve(16);

    // 인증 생명주기
    hooks_.push_back(make_hook(
        "before_signup", M::kBlocking, G::kAuthentication,
        {required_field("email", FieldType::kEmail), optional_field("name", FieldType::kString),
         object_field("request", request_schema(), false)},
        "Runs before a new account is created; may reject the sign-up."));
    hooks_.push_back(make_hook(
        "after_signup", M::kAsync, G::kAuthentication,
        {object_field("user", user_schema()), object_field("request", request_schema(), false)},
        "Runs after a new account has been created."));
    hooks_.push_back(make_hook(
        "before_signin", M::kBlocking, G::kAuthentication,
        {required_field("email", FieldType::kEmail),
         object_field("request", request_schema(), false)},
        "Runs before credentials are accepted; may reject the sign-in."));
    hooks_.push_back(make_hook(
        "after_signin", M::kAsync, G::kAuthentication,
        {object_field("user", user_schema()), object_field("session", session_schema())},
        "Runs after a session has been established."));
    hooks_.push_back(make_hook(
        "before_signout", M::kBlocking, G::kAuthentication,
        {object_field("user", user_schema()), object_field("session", session_schema())},
        "Runs before a session is terminated."));
    hooks_.push_back(make_hook(
        "token_build", M::kEnrichment, G::kAuthentication,
        {object_field("user", user_schema()), required_field("token", FieldType::kAnyObject)},
        "Runs while a token is assembled; returned data is merged into the claims."));

    // API key 생명주기
    hooks_.push_back(make_hook(
        "apikey_before_create", M::kBlocking, G::kApiKey,
        {required_field("user_id", FieldType::kString), optional_field("name", FieldType::kString),
         optional_field("permissions", FieldType::kStringArray)},
        "Runs before an API key is created."));
    hooks_.push_back(make_hook(
        "apikey_after_create", M::kAsync, G::kApiKey,
        {object_field("apikey", apikey_schema()), required_field("user_id", FieldType::kString)},
        "Runs after an API key has been created."));
    hooks_.push_back(make_hook(
        "apikey_before_exchange", M::kBlocking, G::kApiKey,
        {object_field("apikey", apikey_schema()),
         object_field("request", request_schema(), false)},
        "Runs before an API key is exchanged for an access token."));
    hooks_.push_back(make_hook(
        "apikey_after_exchange", M::kAsync, G::kApiKey,
        {object_field("apikey", apikey_schema())},
        "Runs after an API key exchange completed."));
    hooks_.push_back(make_hook(
        "apikey_before_revoke", M::kBlocking, G::kApiKey,
        {object_field("apikey", apikey_schema())},
        "Runs before an API key is revoked."));

    // OAuth client 생명주기
    hooks_.push_back(make_hook(
        "client_before_register", M::kBlocking, G::kOAuthClient,
        {required_field("name", FieldType::kString),
         required_field("redirect_urls", FieldType::kStringArray),
         enum_field("type", {"public", "confidential"}, false)},
        "Runs before an OAuth client is registered."));
    hooks_.push_back(make_hook(
        "client_after_register", M::kAsync, G::kOAuthClient,
        {object_field("client", client_schema())},
        "Runs after an OAuth client has been registered."));
    hooks_.push_back(make_hook(
        "client_before_authorize", M::kBlocking, G::kOAuthClient,
        {object_field("user", user_schema()), object_field("client", client_schema()),
         required_field("scopes", FieldType::kStringArray)},
        "Runs before a user authorizes an OAuth client."));
    hooks_.push_back(make_hook(
        "client_after_authorize", M::kAsync, G::kOAuthClient,
        {object_field("user", user_schema()), object_field("client", client_schema()),
         object_field("grant", {required_field("scopes", FieldType::kStringArray)})},
        "Runs after a user authorized an OAuth client."));
    hooks_.push_back(make_hook(
        "client_access_change", M::kAsync, G::kOAuthClient,
        {object_field("user", user_schema()), object_field("client", client_schema()),
         enum_field("action", {"grant", "revoke"})},
        "Runs when a user's access to an OAuth client is granted or revoked."));
}

const HookDefinition* HookRegistry::find(std::string_view name) const noexcept {
    const auto it = std::find_if(hooks_.begin(), hooks_.end(),
                                 [name](const HookDefinition& h) { return h.name == name; });
    return it == hooks_.end() ? nullptr : &*it;
}

std::expected<HookDefinition, EngineError> HookRegistry::get(std::string_view name) const {
    if (const auto* def = find(name)) {
        return *def;
    }
    return std::unexpected(make_error(EngineErrorCode::kNotFound,
                                      "unknown hook '" + std::string{name} + "'",
                                      std::string{name}));
}

std::expected<void, EngineError> HookRegistry::validate_input(std::string_view name,
                                                              const Value&     input) const {
    const auto* def = find(name);
    if (def == nullptr) {
        return std::unexpected(make_error(EngineErrorCode::kNotFound,
                                          "unknown hook '" + std::string{name} + "'",
                                          std::string{name}));
    }
    if (auto result = validate_schema(def->input_schema, input); !result) {
        return std::unexpected(make_error(EngineErrorCode::kValidation,
                                          std::move(result.error()), def->name));
    }
    return {};
}

std::expected<void, EngineError> HookRegistry::validate_output(const HookDefinition& hook,
                                                               const Value& output) const {
    if (auto result = validate_schema(hook.output_schema, output); !result) {
        return std::unexpected(make_error(EngineErrorCode::kSandbox,
                                          "script returned malformed result: " + result.error(),
                                          hook.name));
    }
    return {};
}
