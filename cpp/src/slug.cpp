// d2m/cpp/src/slug.cpp
#include "d2m/slug.h"

#include "text_common.h"

namespace d2m {

std::string slugify(std::string_view text, size_t max_len) {
    std::string s = fold_for_slug(text);
    if (max_len == 0 || utf8_length(s) <= max_len) return s;

    const size_t cut = utf8_prefix_bytes(s, max_len);

    // cut lands exactly on a word boundary
    if (cut < s.size() && s[cut] == '-') {
        s.resize(cut);
    } else {
        const size_t dash = s.rfind('-', cut);
        if (dash != std::string::npos && dash > 0) s.resize(dash);
        else s.resize(cut); // one long word: hard cut
    }

    while (!s.empty() && s.back() == '-') s.pop_back();
    return s;
}

namespace {

// "-N" appended within max_len: the base gives up code points, not the suffix.
std::string with_suffix(const std::string& base, int n, size_t max_len) {
    if (n == 1) return base;

    const std::string suffix = "-" + std::to_string(n);
    if (max_len == 0 || utf8_length(base) + suffix.size() <= max_len) return base + suffix;

    const size_t keep = max_len > suffix.size() ? max_len - suffix.size() : 0;
    std::string head = base.substr(0, utf8_prefix_bytes(base, keep));
    while (!head.empty() && head.back() == '-') head.pop_back();
    return head.empty() ? suffix.substr(1) : head + suffix;
}

} // namespace

std::string SlugAllocator::assign(std::string_view text) {
    std::string base = slugify(text, max_len_);
    if (base.empty()) base = "section";

    int& next = used_[base];
    std::string candidate;
    do {
        ++next;
        candidate = with_suffix(base, next, max_len_);
    } while (issued_.count(candidate));

    issued_.insert(candidate);
    return candidate;
}

} // namespace d2m
