// d2m/cpp/include/d2m/slug.h
#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

namespace d2m {

constexpr size_t kMaxSlugLength = 80; // code points

// Base slug: lower-case, runs of non-alphanumerics -> '-', trimmed, truncated
// at a word boundary where one exists within max_len. May return "".
std::string slugify(std::string_view text, size_t max_len = kMaxSlugLength);

// Per-document disambiguation: first "x", then "x-2", "x-3", ...
// Suffixed slugs stay within max_len by shortening the base.
class SlugAllocator {
public:
    explicit SlugAllocator(size_t max_len = kMaxSlugLength) : max_len_(max_len) {}

    std::string assign(std::string_view text);

private:
    size_t max_len_;
    std::unordered_map<std::string, int> used_; // base slug -> next suffix
    std::unordered_set<std::string> issued_;
};

} // namespace d2m
