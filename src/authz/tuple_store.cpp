#include "authz/tuple_store.hpp"

#include <chrono>
#include <mutex>

#include <spdlog/spdlog.h>

namespace {

const char* first_empty_field(const TupleKey& key) noexcept {
    if (key.entity_type.empty())  return "entity_type";
    if (key.entity_id.empty())    return "entity_id";
    if (key.relation.empty())     return "relation";
    if (key.subject_type.empty()) return "subject_type";
    if (key.subject_id.empty())   return "subject_id";
    return nullptr;
}

}  // namespace

std::expected<TupleCreateResult, EngineError>
InMemoryTupleStore::create_if_not_exists(TupleKey key, std::string entity_type_id) {
    if (const char* field = first_empty_field(key); field != nullptr) {
        return std::unexpected(make_error(EngineErrorCode::kValidation,
                                          std::string{"tuple field '"} + field + "' must not be empty",
                                          "tuple_store"));
    }

    std::unique_lock lock(mutex_);
    if (const auto it = tuples_.find(key); it != tuples_.end()) {
        return TupleCreateResult{it->second, false};
    }

    Tuple tuple;
    tuple.id             = "tpl_" + std::to_string(next_id_++);
    tuple.entity_type    = key.entity_type;
    tuple.entity_type_id = std::move(entity_type_id);
    tuple.entity_id      = key.entity_id;
    tuple.relation       = key.relation;
    tuple.subject_type   = key.subject_type;
    tuple.subject_id     = key.subject_id;
    tuple.created_at     = std::chrono::system_clock::now();

    auto [it, inserted] = tuples_.emplace(std::move(key), std::move(tuple));
    return TupleCreateResult{it->second, inserted};
}

bool InMemoryTupleStore::remove(const TupleKey& key) {
    std::unique_lock lock(mutex_);
    return tuples_.erase(key) > 0;
}

std::optional<Tuple> InMemoryTupleStore::find_exact(const TupleKey& key) const {
    std::shared_lock lock(mutex_);
    const auto it = tuples_.find(key);
    if (it == tuples_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Tuple> InMemoryTupleStore::find_by_subject(std::string_view subject_type,
                                                       std::string_view subject_id) const {
    std::vector<Tuple> out;
    std::shared_lock   lock(mutex_);
    for (const auto& [key, tuple] : tuples_) {
        if (key.subject_type == subject_type && key.subject_id == subject_id) {
            out.push_back(tuple);
        }
    }
    return out;
}

std::vector<Tuple> InMemoryTupleStore::find_by_entity(std::string_view entity_type,
                                                      std::string_view entity_id) const {
    std::vector<Tuple> out;
    std::shared_lock   lock(mutex_);
    for (const auto& [key, tuple] : tuples_) {
        if (key.entity_type == entity_type && key.entity_id == entity_id) {
            out.push_back(tuple);
        }
    }
    return out;
}

std::size_t InMemoryTupleStore::count_by_relation(std::string_view entity_type,
                                                  std::string_view relation) const {
    std::size_t      count = 0;
    std::shared_lock lock(mutex_);
    for (const auto& [key, tuple] : tuples_) {
        if (key.entity_type == entity_type && key.relation == relation) {
            ++count;
        }
    }
    return count;
}

// ---------------------------------------------------------------------------
// refresh_entity_type
//   키에 이름이 포함되므로 대상 tuple 을 꺼내 새 키로 다시 넣는다.
//   새 키가 이미 있으면 기존 tuple 을 유지하고 옮기는 쪽을 버린다.
// ---------------------------------------------------------------------------
std::size_t InMemoryTupleStore::refresh_entity_type(std::string_view entity_type_id,
                                                    std::string_view new_name) {
    if (entity_type_id.empty()) {
        return 0;
    }

    std::size_t updated = 0;
    {
        std::unique_lock   lock(mutex_);
        std::vector<Tuple> moved;
        for (auto it = tuples_.begin(); it != tuples_.end();) {
            if (it->second.entity_type_id == entity_type_id && it->second.entity_type != new_name) {
                moved.push_back(std::move(it->second));
                it = tuples_.erase(it);
            } else {
                ++it;
            }
        }
        for (auto& tuple : moved) {
            tuple.entity_type = std::string{new_name};
            TupleKey key = tuple.key();
            if (tuples_.emplace(std::move(key), std::move(tuple)).second) {
                ++updated;
            }
        }
    }

    spdlog::info("[tuple_store] refreshed entity type id={} name={} tuples={}",
                 entity_type_id, new_name, updated);
    return updated;
}

std::size_t InMemoryTupleStore::size() const {
    std::shared_lock lock(mutex_);
    return tuples_.size();
}
