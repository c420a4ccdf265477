// ---------------------------------------------------------------------------
// lua_interpreter.cpp
//
// Lua 5.4 C API 위에서 샌드박스 실행 컨텍스트를 구현한다.
//
// [longjmp 주의]
// Lua 오류는 longjmp 로 전파된다. lua_error / luaL_error 가 발생할 수 있는
// 구간에는 소멸자가 있는 C++ 객체를 살려두지 않는다.
// - 환경 구성, 라이브러리 로드는 lua_pcall 로 보호된 C 함수 안에서 수행
// - native 함수 호출(call_native)은 결과를 보호된 호출로 push 하고,
//   C++ 작업을 블록 안에서 끝낸 뒤 lua_error
// - Lua → Value 변환은 오류를 내지 않는 API (lua_next, lua_rawget*, lua_getmetatable)
//   만 사용한다
// ---------------------------------------------------------------------------

#include "sandbox/lua_interpreter.hpp"

#include <cstdlib>
#include <cstring>
#include <stdexcept>

#include <lua.hpp>
#include <spdlog/spdlog.h>

namespace {

constexpr int         kHookInterval   = 1000;  // count hook 주기 (VM 명령 수)
constexpr int         kMaxDepth       = 32;    // Value ↔ table 변환 최대 중첩
constexpr const char* kSafeEnvKey     = "hookwarden.safe_env";
constexpr const char* kReadonlyName   = "hookwarden.readonly";
const char            kProxyDataKey   = 0;  // 주소만 사용 (proxy 메타테이블의 light userdata 키)

constexpr const char* kSafeBaseFunctions[] = {
    "assert", "error",    "ipairs", "next",     "pairs",  "pcall",
    "select", "tonumber", "tostring", "type",   "xpcall",
};

constexpr const char* kStringExcluded[] = {"dump"};
constexpr const char* kMathExcluded[]   = {"randomseed"};

// ---------------------------------------------------------------------------
// 라이브러리 복사: lib 테이블을 새 테이블로 얕은 복사 (excluded 키 제외)
// 스택: [... lib] → [... lib copy]
// ---------------------------------------------------------------------------
template <std::size_t N>
void copy_filtered(lua_State* L, int lib_index, const char* const (&excluded)[N]) {
    lib_index = lua_absindex(L, lib_index);
    lua_newtable(L);
    const int copy = lua_gettop(L);
    lua_pushnil(L);
    while (lua_next(L, lib_index) != 0) {
        bool skip = false;
        if (lua_type(L, -2) == LUA_TSTRING) {
            const char* key = lua_tostring(L, -2);
            for (const char* ex : excluded) {
                if (std::strcmp(key, ex) == 0) {
                    skip = true;
                    break;
                }
            }
        }
        if (skip) {
            lua_pop(L, 1);
            continue;
        }
        lua_pushvalue(L, -2);
        lua_insert(L, -2);
        lua_rawset(L, copy);
    }
}

void copy_shallow(lua_State* L, int src) {
    static constexpr const char* const kNone[] = {""};
    copy_filtered(L, src, kNone);
}

// ---------------------------------------------------------------------------
// init_state (protected)
//   안전한 라이브러리만 열고 registry 에 환경 템플릿을 저장한다.
// ---------------------------------------------------------------------------
int init_state(lua_State* L) {
    luaL_requiref(L, LUA_GNAME, luaopen_base, 1);
    lua_pop(L, 1);
    luaL_requiref(L, LUA_STRLIBNAME, luaopen_string, 1);
    lua_pop(L, 1);
    luaL_requiref(L, LUA_TABLIBNAME, luaopen_table, 1);
    lua_pop(L, 1);
    luaL_requiref(L, LUA_MATHLIBNAME, luaopen_math, 1);
    lua_pop(L, 1);
    luaL_requiref(L, LUA_UTF8LIBNAME, luaopen_utf8, 1);
    lua_pop(L, 1);

    lua_newtable(L);
    const int safe = lua_gettop(L);
    lua_pushglobaltable(L);
    const int globals = lua_gettop(L);

    for (const char* name : kSafeBaseFunctions) {
        lua_getfield(L, globals, name);
        lua_setfield(L, safe, name);
    }

    lua_getfield(L, globals, LUA_STRLIBNAME);
    copy_filtered(L, -1, kStringExcluded);
    lua_setfield(L, safe, LUA_STRLIBNAME);
    lua_pop(L, 1);

    lua_getfield(L, globals, LUA_TABLIBNAME);
    copy_shallow(L, -1);
    lua_setfield(L, safe, LUA_TABLIBNAME);
    lua_pop(L, 1);

    lua_getfield(L, globals, LUA_MATHLIBNAME);
    copy_filtered(L, -1, kMathExcluded);
    lua_setfield(L, safe, LUA_MATHLIBNAME);
    lua_pop(L, 1);

    lua_getfield(L, globals, LUA_UTF8LIBNAME);
    copy_shallow(L, -1);
    lua_setfield(L, safe, LUA_UTF8LIBNAME);
    lua_pop(L, 1);

    // Lua 5.1 호환 별칭
    lua_getfield(L, safe, LUA_TABLIBNAME);
    lua_getfield(L, -1, "unpack");
    lua_setfield(L, safe, "unpack");
    lua_pop(L, 1);

    // 문자열 메서드 호출("x"):rep() 도 필터링된 string 테이블을 보도록 교체
    lua_pushliteral(L, "");
    if (lua_getmetatable(L, -1) != 0) {
        lua_getfield(L, safe, LUA_STRLIBNAME);
        lua_setfield(L, -2, "__index");
        lua_pushboolean(L, 0);
        lua_setfield(L, -2, "__metatable");
        lua_pop(L, 1);
    }
    lua_pop(L, 1);

    lua_pushvalue(L, safe);
    lua_setfield(L, LUA_REGISTRYINDEX, kSafeEnvKey);
    return 0;
}

// ---------------------------------------------------------------------------
// Value → Lua
// ---------------------------------------------------------------------------
void push_value(lua_State* L, const Value& value, int depth);

void push_object_fields(lua_State* L, const Value::Object& fields, int depth) {
    const int table = lua_gettop(L);
    for (const auto& [key, child] : fields) {
        lua_pushlstring(L, key.data(), key.size());
        push_value(L, child, depth + 1);
        lua_rawset(L, table);
    }
}

void push_array_items(lua_State* L, const Value::Array& items, int depth) {
    const int  table = lua_gettop(L);
    lua_Integer index = 1;
    for (const auto& child : items) {
        push_value(L, child, depth + 1);
        lua_rawseti(L, table, index++);
    }
}

void push_value(lua_State* L, const Value& value, int depth) {
    if (depth > kMaxDepth) {
        luaL_error(L, "value nesting too deep");
    }
    luaL_checkstack(L, 4, "value nesting too deep");

    if (value.is_null()) {
        lua_pushnil(L);
    } else if (value.is_bool()) {
        lua_pushboolean(L, value.as_bool() ? 1 : 0);
    } else if (value.is_int()) {
        lua_pushinteger(L, static_cast<lua_Integer>(value.as_int()));
    } else if (value.is_double()) {
        lua_pushnumber(L, static_cast<lua_Number>(value.as_double()));
    } else if (value.is_string()) {
        const auto& s = value.as_string();
        lua_pushlstring(L, s.data(), s.size());
    } else if (value.is_array()) {
        const auto& items = value.as_array();
        lua_createtable(L, static_cast<int>(items.size()), 0);
        push_array_items(L, items, depth);
    } else {
        const auto& fields = value.as_object();
        lua_createtable(L, 0, static_cast<int>(fields.size()));
        push_object_fields(L, fields, depth);
    }
}

// ---------------------------------------------------------------------------
// 읽기 전용 proxy
//   proxy = {} with metatable {__index=data, __newindex=error, __len, __pairs}
// ---------------------------------------------------------------------------
int readonly_newindex(lua_State* L) {
    return luaL_error(L, "context is read-only");
}

int readonly_len(lua_State* L) {
    lua_pushinteger(L, static_cast<lua_Integer>(lua_rawlen(L, lua_upvalueindex(1))));
    return 1;
}

int readonly_next(lua_State* L) {
    luaL_checktype(L, 1, LUA_TTABLE);
    lua_settop(L, 2);
    if (lua_next(L, 1) != 0) {
        return 2;
    }
    lua_pushnil(L);
    return 1;
}

int readonly_pairs(lua_State* L) {
    lua_pushcfunction(L, readonly_next);
    lua_pushvalue(L, lua_upvalueindex(1));
    lua_pushnil(L);
    return 3;
}

void push_readonly(lua_State* L, const Value& value, int depth) {
    if (!value.is_object() && !value.is_array()) {
        push_value(L, value, depth);
        return;
    }
    if (depth > kMaxDepth) {
        luaL_error(L, "value nesting too deep");
    }
    luaL_checkstack(L, 6, "value nesting too deep");

    // 원본 데이터 테이블 (하위 테이블도 proxy)
    if (value.is_array()) {
        const auto& items = value.as_array();
        lua_createtable(L, static_cast<int>(items.size()), 0);
        const int   data  = lua_gettop(L);
        lua_Integer index = 1;
        for (const auto& child : items) {
            push_readonly(L, child, depth + 1);
            lua_rawseti(L, data, index++);
        }
    } else {
        const auto& fields = value.as_object();
        lua_createtable(L, 0, static_cast<int>(fields.size()));
        const int data = lua_gettop(L);
        for (const auto& [key, child] : fields) {
            lua_pushlstring(L, key.data(), key.size());
            push_readonly(L, child, depth + 1);
            lua_rawset(L, data);
        }
    }
    const int data = lua_gettop(L);

    lua_newtable(L);
    const int proxy = lua_gettop(L);

    lua_createtable(L, 0, 6);
    lua_pushvalue(L, data);
    lua_setfield(L, -2, "__index");
    lua_pushcfunction(L, readonly_newindex);
    lua_setfield(L, -2, "__newindex");
    lua_pushvalue(L, data);
    lua_pushcclosure(L, readonly_len, 1);
    lua_setfield(L, -2, "__len");
    lua_pushvalue(L, data);
    lua_pushcclosure(L, readonly_pairs, 1);
    lua_setfield(L, -2, "__pairs");
    lua_pushstring(L, kReadonlyName);
    lua_setfield(L, -2, "__name");
    lua_pushboolean(L, 0);
    lua_setfield(L, -2, "__metatable");
    lua_pushvalue(L, data);
    lua_rawsetp(L, -2, &kProxyDataKey);
    lua_setmetatable(L, proxy);

    lua_remove(L, data);
}

// ---------------------------------------------------------------------------
// Lua → Value
// ---------------------------------------------------------------------------
std::expected<Value, std::string> to_value(lua_State* L, int index, int depth);

std::expected<Value, std::string> table_to_value(lua_State* L, int index, int depth) {
    if (depth > kMaxDepth) {
        return std::unexpected(std::string{"value nesting too deep"});
    }
    if (!lua_checkstack(L, 4)) {
        return std::unexpected(std::string{"value nesting too deep"});
    }

    // 읽기 전용 proxy 는 원본 데이터 테이블을 변환한다 (메타테이블의 kProxyDataKey)
    if (lua_getmetatable(L, index) != 0) {
        if (lua_rawgetp(L, -1, &kProxyDataKey) == LUA_TTABLE) {
            lua_remove(L, -2);
            auto inner = table_to_value(L, lua_gettop(L), depth);
            lua_pop(L, 1);
            return inner;
        }
        lua_pop(L, 2);
    }

    const auto length    = static_cast<lua_Integer>(lua_rawlen(L, index));
    lua_Integer key_count = 0;
    bool        sequence  = length > 0;

    lua_pushnil(L);
    while (lua_next(L, index) != 0) {
        ++key_count;
        if (!lua_isinteger(L, -2)) {
            sequence = false;
        } else {
            const lua_Integer k = lua_tointeger(L, -2);
            if (k < 1 || k > length) {
                sequence = false;
            }
        }
        lua_pop(L, 1);
    }
    sequence = sequence && key_count == length;

    if (sequence) {
        Value::Array items;
        items.reserve(static_cast<std::size_t>(length));
        for (lua_Integer i = 1; i <= length; ++i) {
            lua_rawgeti(L, index, i);
            auto item = to_value(L, lua_gettop(L), depth + 1);
            lua_pop(L, 1);
            if (!item) {
                return item;
            }
            items.push_back(std::move(*item));
        }
        return Value{std::move(items)};
    }

    Value::Object fields;
    lua_pushnil(L);
    while (lua_next(L, index) != 0) {
        std::string key;
        const int   key_type = lua_type(L, -2);
        if (key_type == LUA_TSTRING) {
            std::size_t len = 0;
            const char* data = lua_tolstring(L, -2, &len);
            key.assign(data, len);
        } else if (key_type == LUA_TNUMBER) {
            // lua_tolstring 은 key 를 변형하므로 사용하지 않는다
            key = lua_isinteger(L, -2) ? std::to_string(lua_tointeger(L, -2))
                                       : std::to_string(lua_tonumber(L, -2));
        } else {
            lua_pop(L, 2);
            return std::unexpected(std::string{"unsupported table key type '"} +
                                   lua_typename(L, key_type) + "'");
        }

        auto child = to_value(L, lua_gettop(L), depth + 1);
        if (!child) {
            lua_pop(L, 2);
            return child;
        }
        fields.insert_or_assign(std::move(key), std::move(*child));
        lua_pop(L, 1);
    }
    return Value{std::move(fields)};
}

std::expected<Value, std::string> to_value(lua_State* L, int index, int depth) {
    index = lua_absindex(L, index);
    switch (lua_type(L, index)) {
        case LUA_TNIL:
        case LUA_TNONE:
            return Value{};
        case LUA_TBOOLEAN:
            return Value{lua_toboolean(L, index) != 0};
        case LUA_TNUMBER:
            if (lua_isinteger(L, index)) {
                return Value{static_cast<std::int64_t>(lua_tointeger(L, index))};
            }
            return Value{static_cast<double>(lua_tonumber(L, index))};
        case LUA_TSTRING: {
            std::size_t len  = 0;
            const char* data = lua_tolstring(L, index, &len);
            return Value{std::string{data, len}};
        }
        case LUA_TTABLE:
            return table_to_value(L, index, depth);
        default:
            return std::unexpected(std::string{"cannot convert "} +
                                   luaL_typename(L, index) + " value");
    }
}

// ---------------------------------------------------------------------------
// native 함수 호출
//   upvalue 1: const NativeFunction*
//
//   Lua 오류는 longjmp 이므로 C++ 객체가 살아 있는 구간에서는 오류를 낼 수 있는
//   Lua API 를 직접 부르지 않는다. 인자 변환(to_value)은 할당 없는 API 만 쓰고,
//   결과 push 는 push_native_return 을 lua_pcall 로 감싸 실행한다.
//   C++ 객체가 모두 소멸한 뒤에 lua_error 로 다시 던진다.
// ---------------------------------------------------------------------------
struct NativeReturn {
    const Value*       value{nullptr};
    const std::string* failure{nullptr};
};

int push_native_return(lua_State* L) {
    const auto* ret = static_cast<const NativeReturn*>(lua_touserdata(L, 1));
    if (ret->failure != nullptr) {
        lua_pushlstring(L, ret->failure->data(), ret->failure->size());
    } else {
        push_value(L, *ret->value, 0);
    }
    return 1;
}

int call_native(lua_State* L) {
    const auto* fn = static_cast<const NativeFunction*>(lua_touserdata(L, lua_upvalueindex(1)));
    bool raise  = false;
    int  status = LUA_OK;
    {
        std::string                       failure;
        std::expected<Value, std::string> result;
        try {
            std::vector<Value> args;
            const int          argc = lua_gettop(L);
            args.reserve(static_cast<std::size_t>(argc));
            for (int i = 1; i <= argc && failure.empty(); ++i) {
                auto arg = to_value(L, i, 0);
                if (arg) {
                    args.push_back(std::move(*arg));
                } else {
                    failure = "bad argument #" + std::to_string(i) + ": " + arg.error();
                }
            }
            if (failure.empty()) {
                result = (*fn)(args);
                if (!result) {
                    failure = std::move(result.error());
                }
            }
        } catch (const std::exception& e) {
            failure = std::string{"helper failed: "} + e.what();
        }

        NativeReturn ret;
        if (failure.empty()) {
            ret.value = &*result;
        } else {
            ret.failure = &failure;
            raise       = true;
        }
        lua_settop(L, 0);
        lua_pushcfunction(L, push_native_return);
        lua_pushlightuserdata(L, &ret);
        status = lua_pcall(L, 1, 1, 0);
    }

    if (status != LUA_OK) {
        if (status == LUA_ERRMEM) {
            (*static_cast<LuaInterpreter**>(lua_getextraspace(L)))->mark_unhealthy();
        }
        return lua_error(L);
    }
    if (raise) {
        return lua_error(L);
    }
    return 1;
}

void push_native(lua_State* L, const NativeFunction& fn) {
    lua_pushlightuserdata(L, const_cast<NativeFunction*>(&fn));
    lua_pushcclosure(L, call_native, 1);
}

// ---------------------------------------------------------------------------
// build_environment (protected)
//   arg 1: const ScriptEnvironment*   → 새 _ENV 테이블 1개 반환
// ---------------------------------------------------------------------------
int build_environment(lua_State* L) {
    const auto* env = static_cast<const ScriptEnvironment*>(lua_touserdata(L, 1));
    lua_settop(L, 0);

    lua_newtable(L);
    const int target = lua_gettop(L);

    // 템플릿 복사. 라이브러리 테이블은 실행마다 새로 복사한다.
    lua_getfield(L, LUA_REGISTRYINDEX, kSafeEnvKey);
    const int safe = lua_gettop(L);
    lua_pushnil(L);
    while (lua_next(L, safe) != 0) {
        if (lua_type(L, -1) == LUA_TTABLE) {
            copy_shallow(L, -1);
            lua_replace(L, -2);
        }
        lua_pushvalue(L, -2);
        lua_insert(L, -2);
        lua_rawset(L, target);
    }
    lua_pop(L, 1);

    push_readonly(L, env->context, 0);
    lua_setfield(L, target, "context");

    for (const auto& [name, fn] : env->globals) {
        push_native(L, fn);
        lua_setfield(L, target, name.c_str());
    }
    for (const auto& [table_name, functions] : env->tables) {
        lua_createtable(L, 0, static_cast<int>(functions.size()));
        for (const auto& [name, fn] : functions) {
            push_native(L, fn);
            lua_setfield(L, -2, name.c_str());
        }
        lua_setfield(L, target, table_name.c_str());
    }
    return 1;
}

std::string pop_error_message(lua_State* L) {
    std::string message;
    if (lua_type(L, -1) == LUA_TSTRING) {
        std::size_t len  = 0;
        const char* data = lua_tolstring(L, -1, &len);
        message.assign(data, len);
    } else {
        message = std::string{"(error object is a "} + luaL_typename(L, -1) + " value)";
    }
    lua_pop(L, 1);
    return message;
}

}  // namespace

// ---------------------------------------------------------------------------
// allocate: 메모리 상한 적용 lua_Alloc
// ---------------------------------------------------------------------------
void* LuaInterpreter::allocate(void* ud, void* ptr, std::size_t osize, std::size_t nsize) noexcept {
    auto* self = static_cast<LuaInterpreter*>(ud);
    const std::size_t old_size = ptr != nullptr ? osize : 0;

    if (nsize == 0) {
        self->used_bytes_ -= old_size;
        std::free(ptr);
        return nullptr;
    }
    if (nsize > old_size && self->used_bytes_ - old_size + nsize > self->memory_limit_) {
        return nullptr;
    }

    void* block = std::realloc(ptr, nsize);
    if (block != nullptr) {
        self->used_bytes_ = self->used_bytes_ - old_size + nsize;
    }
    return block;
}

// ---------------------------------------------------------------------------
// count_hook: 명령 수 / wall-clock 예산 검사
// ---------------------------------------------------------------------------
void LuaInterpreter::count_hook(lua_State* L, lua_Debug* /*ar*/) {
    auto* self = *static_cast<LuaInterpreter**>(lua_getextraspace(L));

    if (self->exceeded_ == Budget::kNone) {
        self->executed_ += kHookInterval;
        if (self->max_instructions_ != 0 && self->executed_ > self->max_instructions_) {
            self->exceeded_ = Budget::kInstructions;
        } else if (std::chrono::steady_clock::now() >= self->deadline_) {
            self->exceeded_ = Budget::kTimeout;
        } else {
            return;
        }
        // 이후 모든 명령에서 재발생 (pcall 로 삼켜도 빠져나오지 못한다)
        lua_sethook(L, &LuaInterpreter::count_hook, LUA_MASKCOUNT, 1);
    }

    if (self->exceeded_ == Budget::kTimeout) {
        lua_pushliteral(L, "script execution timeout");
    } else {
        lua_pushliteral(L, "instruction limit exceeded");
    }
    lua_error(L);
}

// ---------------------------------------------------------------------------
// 생성자 / 소멸자
// ---------------------------------------------------------------------------
LuaInterpreter::LuaInterpreter(std::uint64_t id, std::size_t memory_limit_bytes)
    : id_(id)
    , memory_limit_(memory_limit_bytes)
    , created_at_(std::chrono::steady_clock::now())
{
    state_ = lua_newstate(&LuaInterpreter::allocate, this);
    if (state_ == nullptr) {
        throw std::runtime_error("lua_newstate failed (memory limit too small?)");
    }
    *static_cast<LuaInterpreter**>(lua_getextraspace(state_)) = this;

    lua_pushcfunction(state_, init_state);
    if (lua_pcall(state_, 0, 0, 0) != LUA_OK) {
        std::string message = pop_error_message(state_);
        lua_close(state_);
        state_ = nullptr;
        throw std::runtime_error("lua sandbox initialization failed: " + message);
    }
    lua_gc(state_, LUA_GCCOLLECT);
}

LuaInterpreter::~LuaInterpreter() {
    if (state_ != nullptr) {
        lua_close(state_);
    }
}

// ---------------------------------------------------------------------------
// check_syntax
// ---------------------------------------------------------------------------
std::expected<void, std::string> LuaInterpreter::check_syntax(std::string_view chunk_name,
                                                              std::string_view source) {
    lua_State* L = luaL_newstate();
    if (L == nullptr) {
        return std::unexpected(std::string{"lua_newstate failed"});
    }
    const std::string name   = "=" + std::string{chunk_name};
    const int         status = luaL_loadbufferx(L, source.data(), source.size(), name.c_str(), "t");
    std::expected<void, std::string> result;
    if (status != LUA_OK) {
        result = std::unexpected(pop_error_message(L));
    }
    lua_close(L);
    return result;
}

// ---------------------------------------------------------------------------
// run
// ---------------------------------------------------------------------------
std::expected<Value, EngineError> LuaInterpreter::run(std::string_view         chunk_name,
                                                      std::string_view         source,
                                                      const ScriptEnvironment& env,
                                                      const ExecutionLimits&   limits) {
    lua_State* L = state_;
    ++run_count_;
    lua_settop(L, 0);

    const std::string context{chunk_name};
    auto fail = [&](std::string message) {
        lua_settop(L, 0);
        lua_gc(L, LUA_GCCOLLECT);
        return std::unexpected(make_error(EngineErrorCode::kSandbox, std::move(message), context));
    };

    if (!healthy_) {
        return fail("interpreter is no longer usable");
    }

    // 1. 컴파일 (텍스트 청크만)
    const std::string name = "=" + context;
    int status = luaL_loadbufferx(L, source.data(), source.size(), name.c_str(), "t");
    if (status != LUA_OK) {
        if (status == LUA_ERRMEM) {
            healthy_ = false;
            lua_pop(L, 1);
            return fail("memory limit exceeded");
        }
        return fail("syntax error: " + pop_error_message(L));
    }

    // 2. 새 _ENV 구성
    lua_pushcfunction(L, build_environment);
    lua_pushlightuserdata(L, const_cast<ScriptEnvironment*>(&env));
    status = lua_pcall(L, 1, 1, 0);
    if (status != LUA_OK) {
        if (status == LUA_ERRMEM) {
            healthy_ = false;
            lua_pop(L, 1);
            return fail("memory limit exceeded");
        }
        return fail("failed to prepare script environment: " + pop_error_message(L));
    }
    if (lua_setupvalue(L, -2, 1) == nullptr) {
        lua_pop(L, 1);
    }

    // 3. 실행 (예산 hook 설치)
    exceeded_         = Budget::kNone;
    executed_         = 0;
    max_instructions_ = limits.max_instructions;
    deadline_         = std::chrono::steady_clock::now() + limits.timeout;

    const auto started = std::chrono::steady_clock::now();
    lua_sethook(L, &LuaInterpreter::count_hook, LUA_MASKCOUNT, kHookInterval);
    status = lua_pcall(L, 0, 1, 0);
    lua_sethook(L, nullptr, 0, 0);
    const auto elapsed = std::chrono::steady_clock::now() - started;

    if (exceeded_ == Budget::kTimeout) {
        return fail("script execution timeout");
    }
    if (exceeded_ == Budget::kInstructions) {
        return fail("instruction limit exceeded");
    }
    if (status == LUA_ERRMEM || (status != LUA_OK && !healthy_)) {
        // native 함수 안의 메모리 부족은 call_native 가 표시하고 일반 오류로 다시 던진다
        healthy_ = false;
        return fail("memory limit exceeded");
    }
    if (elapsed > limits.timeout) {
        // hook 이 닿지 않는 C 함수 안에서 예산을 넘겼다
        spdlog::warn("[lua] interpreter {} exceeded its time budget inside a native call",
                     id_);
        healthy_ = false;
        return fail("script execution timeout");
    }
    if (status == LUA_ERRERR) {
        return fail("error in error handling");
    }
    if (status != LUA_OK) {
        return fail(pop_error_message(L));
    }

    // 4. 결과 변환
    auto result = to_value(L, -1, 0);
    lua_settop(L, 0);
    lua_gc(L, LUA_GCCOLLECT);
    if (!result) {
        return std::unexpected(make_error(EngineErrorCode::kSandbox,
                                          "unsupported script result: " + result.error(),
                                          context));
    }
    return std::move(*result);
}
