// d2m/cpp/include/d2m/headings.h
#pragma once
#include <cstddef>
#include <string>
#include <vector>

#include "d2m/document.h"
#include "d2m/ir.h"
#include "d2m/slug.h"

namespace d2m {

constexpr const char* kWarnMultipleTopLevel = "multiple top-level headings, demoted";
constexpr const char* kWarnLevelSkip = "heading level skip corrected";

struct HeadingResult {
    std::vector<HeadingEntry> tree;
    std::vector<std::string> warnings;
    bool title_synthesized{false};
};

// Rewrites heading levels in place and assigns slugs. Never fails; every
// repair adds a warning (a synthesized title does not).
HeadingResult normalize_headings(std::vector<Block>& blocks,
                                 const std::string& fallback_title,
                                 size_t max_slug_len = kMaxSlugLength);

// "user_guide-v2" -> "User Guide V2"
std::string title_from_stem(const std::string& stem);

} // namespace d2m
