// d2m/cpp/src/filename_registry.cpp
#include "d2m/filename_registry.h"
#include "d2m/errors.h"

#include <cctype>

namespace d2m {

std::string sanitize_name(const std::string& proposed) {
    std::string out;
    out.reserve(proposed.size());

    for (char ch : proposed) {
        unsigned char c = (unsigned char)ch;
        if (c == ' ') c = '-';
        if (c >= 'A' && c <= 'Z') c = (unsigned char)(c - 'A' + 'a');

        const bool keep = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_';
        if (!keep) continue;
        if (c == '-' && !out.empty() && out.back() == '-') continue;
        out.push_back((char)c);
    }

    size_t a = 0;
    while (a < out.size() && out[a] == '-') ++a;
    size_t b = out.size();
    while (b > a && out[b - 1] == '-') --b;
    out = out.substr(a, b - a);

    if (out.empty()) out = "unnamed";
    return out;
}

std::string FilenameRegistry::assign_locked(const std::string& proposed_base_name) {
    const std::string base = sanitize_name(proposed_base_name);

    size_t& count = assigned_[base];
    size_t n = count + 1;
    std::string candidate;

    // "a-2" may already be taken literally by another document
    while (true) {
        if (n > 1 && n > max_suffix_) {
            throw D2MException(ErrorCode::NameExhausted,
                               "no free output name for '" + base + "' (tried up to -" +
                               std::to_string(max_suffix_) + ")");
        }
        candidate = (n == 1) ? base : base + "-" + std::to_string(n);
        if (!taken_.count(candidate)) break;
        ++n;
    }

    count = n;
    taken_.insert(candidate);
    return candidate;
}

void FilenameRegistry::advance_locked() {
    ++next_ticket_;
    while (released_.erase(next_ticket_)) ++next_ticket_;
    turn_cv_.notify_all();
}

std::string FilenameRegistry::assign(const std::string& proposed_base_name) {
    std::lock_guard<std::mutex> lk(mu_);
    return assign_locked(proposed_base_name);
}

std::string FilenameRegistry::assign(size_t ticket, const std::string& proposed_base_name) {
    std::unique_lock<std::mutex> lk(mu_);
    turn_cv_.wait(lk, [&] { return next_ticket_ == ticket; });

    try {
        std::string name = assign_locked(proposed_base_name);
        advance_locked();
        return name;
    } catch (...) {
        // the turn must pass on even when this ticket cannot get a name
        advance_locked();
        throw;
    }
}

void FilenameRegistry::release(size_t ticket) {
    std::lock_guard<std::mutex> lk(mu_);
    if (ticket < next_ticket_) return;
    if (ticket == next_ticket_) {
        advance_locked();
    } else {
        released_.insert(ticket);
    }
}

bool FilenameRegistry::contains(const std::string& name) const {
    std::lock_guard<std::mutex> lk(mu_);
    return taken_.count(name) != 0;
}

size_t FilenameRegistry::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return taken_.size();
}

} // namespace d2m
