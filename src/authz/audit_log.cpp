#include "authz/audit_log.hpp"

InMemoryAuditLog::InMemoryAuditLog(std::size_t capacity)
    : capacity_(capacity)
{}

std::expected<void, EngineError> InMemoryAuditLog::append(AuditLogEntry entry) {
    if (capacity_ == 0) {
        return std::unexpected(make_error(EngineErrorCode::kAuditWrite,
                                          "audit log has no capacity", "audit_log"));
    }
    std::lock_guard lock(mutex_);
    if (entries_.size() >= capacity_) {
        entries_.pop_front();
    }
    entries_.push_back(std::move(entry));
    return {};
}

std::vector<AuditLogEntry> InMemoryAuditLog::recent(std::size_t limit) const {
    std::vector<AuditLogEntry> out;
    std::lock_guard            lock(mutex_);
    for (auto it = entries_.rbegin(); it != entries_.rend() && out.size() < limit; ++it) {
        out.push_back(*it);
    }
    return out;
}

std::size_t InMemoryAuditLog::size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}
