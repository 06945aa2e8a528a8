// d2m/cpp/include/d2m/link_registry.h
#pragma once
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "d2m/document.h"
#include "d2m/slug.h"

namespace d2m {

struct LinkTarget {
    std::string source_path;
    std::string output_path;
    std::map<std::string, std::string> slug_table; // heading text -> final slug
    std::vector<HeadingEntry> headings;            // document order
    size_t max_slug_len{kMaxSlugLength};           // as used when the slugs were assigned

    // Final slug for an anchor or heading text; nullopt if nothing matches.
    std::optional<std::string> find_anchor(const std::string& anchor) const;
};

LinkTarget make_link_target(const std::string& source_path,
                            const std::string& output_path,
                            const std::vector<HeadingEntry>& headings,
                            size_t max_slug_len = kMaxSlugLength);

// source_path -> LinkTarget. Written during Phase 1 (one publish per document),
// sealed at the barrier, read-only afterwards.
class LinkRegistry {
public:
    LinkRegistry() = default;
    LinkRegistry(const LinkRegistry&) = delete;
    LinkRegistry& operator=(const LinkRegistry&) = delete;

    // Throws D2MException(RegistrySealed) after seal(), DuplicateSource on a repeat key.
    void publish(LinkTarget target);

    void seal();
    bool sealed() const;

    // Exact source_path key.
    std::optional<LinkTarget> lookup(const std::string& source_path) const;

    // Exact key, then `ref` resolved against `from_source_path`'s directory,
    // then a unique file-name match.
    std::optional<LinkTarget> find(const std::string& ref,
                                   const std::string& from_source_path) const;

    size_t size() const;

private:
    mutable std::mutex mu_;
    bool sealed_{false};
    std::unordered_map<std::string, LinkTarget> entries_;
    std::unordered_map<std::string, std::vector<std::string>> by_filename_;
};

} // namespace d2m
