// d2m/cpp/src/headings.cpp
#include "d2m/headings.h"

#include <algorithm>
#include <cctype>

namespace d2m {

namespace {

std::string quote_title(const std::string& t) {
    return "'" + t + "'";
}

} // namespace

std::string title_from_stem(const std::string& stem) {
    std::string out;
    out.reserve(stem.size());

    bool word_start = true;
    for (char ch : stem) {
        unsigned char c = (unsigned char)ch;
        if (c == '-' || c == '_' || c == ' ') {
            if (!out.empty() && out.back() != ' ') out.push_back(' ');
            word_start = true;
            continue;
        }
        if (c < 0x80 && std::isalpha(c)) {
            out.push_back(word_start ? (char)std::toupper(c) : (char)std::tolower(c));
        } else {
            out.push_back(ch);
        }
        word_start = false;
    }
    while (!out.empty() && out.back() == ' ') out.pop_back();
    if (out.empty()) out = "Untitled";
    return out;
}

HeadingResult normalize_headings(std::vector<Block>& blocks,
                                 const std::string& fallback_title,
                                 size_t max_slug_len) {
    HeadingResult r;

    const bool has_h1 = std::any_of(blocks.begin(), blocks.end(), [](const Block& b) {
        const auto* h = std::get_if<Heading>(&b);
        return h && h->level == 1;
    });
    if (!has_h1) {
        Heading title;
        title.level = 1;
        title.text = fallback_title;
        blocks.insert(blocks.begin(), Block{std::move(title)});
        r.title_synthesized = true;
    }

    SlugAllocator slugs(max_slug_len);
    bool seen_h1 = false;
    int last_level = 0;

    for (auto& b : blocks) {
        auto* h = std::get_if<Heading>(&b);
        if (!h) continue;

        // validate_blocks rejects these before we get here; clamp anyway
        h->level = std::clamp(h->level, 1, 6);

        if (h->level == 1) {
            if (seen_h1) {
                h->level = 2;
                r.warnings.push_back(std::string(kWarnMultipleTopLevel) + ": " + quote_title(h->text));
            }
            seen_h1 = true;
        }

        if (last_level > 0 && h->level > last_level + 1) {
            const int from = h->level;
            h->level = last_level + 1;
            r.warnings.push_back(std::string(kWarnLevelSkip) + ": " + quote_title(h->text) +
                                 " (H" + std::to_string(from) + " -> H" + std::to_string(h->level) + ")");
        }
        last_level = h->level;

        h->id = slugs.assign(h->text);
        r.tree.push_back(HeadingEntry{h->level, *h->id, h->text});
    }

    return r;
}

} // namespace d2m
