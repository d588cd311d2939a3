#pragma once
#include <stdexcept>
#include <string>

namespace agentsync {

// ── Fatal command errors ────────────────────────────────────────────
// Raised during validation, before a command touches the filesystem.
enum class SyncErrorKind {
    not_initialized,
    unknown_consumer,
    unsupported_key,
    duplicate_rule_id,
    rule_not_found
};

inline const char* to_string(SyncErrorKind kind) {
    switch (kind) {
        case SyncErrorKind::not_initialized:   return "not_initialized";
        case SyncErrorKind::unknown_consumer:  return "unknown_consumer";
        case SyncErrorKind::unsupported_key:   return "unsupported_key";
        case SyncErrorKind::duplicate_rule_id: return "duplicate_rule_id";
        case SyncErrorKind::rule_not_found:    return "rule_not_found";
    }
    return "unknown";
}

class SyncError : public std::runtime_error {
public:
    SyncError(SyncErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    SyncErrorKind kind() const { return kind_; }

private:
    SyncErrorKind kind_;
};

} // namespace agentsync
