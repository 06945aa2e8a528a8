// d2m/cpp/include/d2m/filename_registry.h
#pragma once
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace d2m {

// Spaces -> '-', lower-case, drop everything outside [a-z0-9-_],
// collapse dash runs, trim dashes. Empty -> "unnamed".
std::string sanitize_name(const std::string& proposed);

// Batch-scoped unique output names. Shared by all Phase 1 workers.
class FilenameRegistry {
public:
    explicit FilenameRegistry(size_t max_suffix = 10000) : max_suffix_(max_suffix) {}

    FilenameRegistry(const FilenameRegistry&) = delete;
    FilenameRegistry& operator=(const FilenameRegistry&) = delete;

    // Reserve sanitize_name(proposed), or the first free "-2", "-3", ... variant.
    // Throws D2MException(NameExhausted) past max_suffix.
    std::string assign(const std::string& proposed_base_name);

    // Same, but waits until every smaller ticket has been assigned or released,
    // so the outcome depends only on ticket order, not on thread timing.
    std::string assign(size_t ticket, const std::string& proposed_base_name);

    // Give up a ticket without reserving a name (failed/cancelled document).
    void release(size_t ticket);

    bool contains(const std::string& name) const;
    size_t size() const;

private:
    std::string assign_locked(const std::string& proposed_base_name);
    void advance_locked();

    size_t max_suffix_;
    mutable std::mutex mu_;
    std::condition_variable turn_cv_;
    std::unordered_map<std::string, size_t> assigned_; // base name -> count
    std::unordered_set<std::string> taken_;            // every name handed out
    size_t next_ticket_{0};
    std::unordered_set<size_t> released_;
};

} // namespace d2m
