// d2m/cpp/src/link_registry.cpp
#include "d2m/link_registry.h"
#include "d2m/errors.h"
#include "d2m/slug.h"

#include <filesystem>

#include "text_common.h"

namespace fs = std::filesystem;

namespace d2m {

namespace {

std::string normalize_key(const std::string& p) {
    std::string s = p;
    for (auto& c : s) {
        if (c == '\\') c = '/';
    }
    std::string out = fs::path(s).lexically_normal().generic_string();
    if (out.rfind("./", 0) == 0) out = out.substr(2);
    return out;
}

std::string filename_of(const std::string& p) {
    return fs::path(normalize_key(p)).filename().generic_string();
}

} // namespace

std::optional<std::string> LinkTarget::find_anchor(const std::string& anchor) const {
    const std::string a = trim_copy(anchor);
    if (a.empty()) return std::nullopt;

    auto it = slug_table.find(a);
    if (it != slug_table.end()) return it->second;

    for (const auto& h : headings) {
        if (h.slug == a) return h.slug;
    }

    const std::string want = slugify(a, max_slug_len);
    if (want.empty()) return std::nullopt;
    for (const auto& h : headings) {
        if (slugify(h.text, max_slug_len) == want) return h.slug;
    }
    return std::nullopt;
}

LinkTarget make_link_target(const std::string& source_path,
                            const std::string& output_path,
                            const std::vector<HeadingEntry>& headings,
                            size_t max_slug_len) {
    LinkTarget t;
    t.max_slug_len = max_slug_len;
    t.source_path = source_path;
    t.output_path = output_path;
    t.headings = headings;
    for (const auto& h : headings) {
        // first occurrence of a heading text wins
        t.slug_table.emplace(h.text, h.slug);
    }
    return t;
}

void LinkRegistry::publish(LinkTarget target) {
    std::lock_guard<std::mutex> lk(mu_);
    if (sealed_) {
        throw D2MException(ErrorCode::RegistrySealed,
                           "link registry is sealed, cannot publish " + target.source_path);
    }

    const std::string key = normalize_key(target.source_path);
    if (entries_.count(key)) {
        throw D2MException(ErrorCode::DuplicateSource, "duplicate source path: " + target.source_path);
    }

    by_filename_[filename_of(key)].push_back(key);
    entries_.emplace(key, std::move(target));
}

void LinkRegistry::seal() {
    std::lock_guard<std::mutex> lk(mu_);
    sealed_ = true;
}

bool LinkRegistry::sealed() const {
    std::lock_guard<std::mutex> lk(mu_);
    return sealed_;
}

std::optional<LinkTarget> LinkRegistry::lookup(const std::string& source_path) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = entries_.find(normalize_key(source_path));
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

std::optional<LinkTarget> LinkRegistry::find(const std::string& ref,
                                             const std::string& from_source_path) const {
    if (ref.empty()) return std::nullopt;

    std::lock_guard<std::mutex> lk(mu_);

    const std::string key = normalize_key(ref);
    auto it = entries_.find(key);
    if (it != entries_.end()) return it->second;

    const fs::path from_dir = fs::path(normalize_key(from_source_path)).parent_path();
    if (!from_dir.empty()) {
        const std::string rel = normalize_key((from_dir / key).generic_string());
        it = entries_.find(rel);
        if (it != entries_.end()) return it->second;
    }

    auto byname = by_filename_.find(filename_of(key));
    if (byname != by_filename_.end() && byname->second.size() == 1) {
        it = entries_.find(byname->second.front());
        if (it != entries_.end()) return it->second;
    }
    return std::nullopt;
}

size_t LinkRegistry::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return entries_.size();
}

} // namespace d2m
