// d2m/cpp/src/link_resolver.cpp
#include "d2m/link_resolver.h"
#include "d2m/errors.h"

#include <cctype>
#include <filesystem>
#include <iostream>

#include "text_common.h"

namespace fs = std::filesystem;

namespace d2m {

namespace {

struct SplitRef {
    std::string path;
    std::optional<std::string> fragment;
};

SplitRef split_fragment(const std::string& ref) {
    SplitRef r;
    const size_t hash = ref.find('#');
    if (hash == std::string::npos) {
        r.path = ref;
        return r;
    }
    r.path = ref.substr(0, hash);
    r.fragment = ref.substr(hash + 1);
    return r;
}

// target path as seen from the linking document's directory
std::string relative_output(const std::string& target_out, const std::string& from_out) {
    const fs::path from_dir = fs::path(from_out).parent_path();
    if (from_dir.empty()) return target_out;
    const fs::path rel = fs::path(target_out).lexically_relative(from_dir);
    return rel.empty() ? target_out : rel.generic_string();
}

void resolve_one(Link& link, const Document& doc, const LinkRegistry& links,
                 std::vector<std::string>& warnings) {
    if (is_external_ref(link.target_ref)) return;

    SplitRef sr = split_fragment(trim_copy(link.target_ref));
    std::optional<std::string> anchor = link.anchor;
    if ((!anchor || anchor->empty()) && sr.fragment && !sr.fragment->empty()) {
        anchor = percent_decode(*sr.fragment);
    }

    // "#Heading" -> this document
    if (sr.path.empty()) {
        auto self = links.lookup(doc.source_path);
        std::optional<std::string> slug;
        if (self && anchor) slug = self->find_anchor(*anchor);
        if (!slug) {
            warnings.push_back(std::string(kWarnAnchorNotFound) + ": #" + anchor.value_or(""));
            return;
        }
        link.target_ref.clear();
        link.anchor = *slug;
        link.resolved = true;
        return;
    }

    auto target = links.find(percent_decode(sr.path), doc.source_path);
    if (!target) {
        warnings.push_back(std::string(kWarnUnresolvedLink) + ": " + link.target_ref);
        return;
    }

    link.target_ref = relative_output(target->output_path, doc.output_path);
    link.resolved = true;

    if (anchor && !anchor->empty()) {
        if (auto slug = target->find_anchor(*anchor)) {
            link.anchor = *slug;
        } else {
            warnings.push_back(std::string(kWarnAnchorNotFound) + ": " + sr.path + "#" + *anchor);
            link.anchor.reset();
        }
    } else {
        link.anchor.reset();
    }
}

} // namespace

bool is_external_ref(const std::string& ref) {
    const std::string s = trim_copy(ref);
    if (s.rfind("//", 0) == 0) return true;

    // scheme = ALPHA *( ALPHA / DIGIT / "+" / "-" / "." ) ":"
    // single letters are drive letters (C:\docs\a.docx), not schemes
    const size_t colon = s.find(':');
    if (colon == std::string::npos || colon < 2) return false;
    if (!std::isalpha((unsigned char)s[0])) return false;
    for (size_t i = 1; i < colon; ++i) {
        const unsigned char c = (unsigned char)s[i];
        if (!std::isalnum(c) && c != '+' && c != '-' && c != '.') return false;
    }
    return true;
}

void resolve_links(Document& doc, const LinkRegistry& links) {
    if (doc.status != DocStatus::Phase1Done) return;

    try {
        std::vector<std::string> warnings;
        for (auto& b : doc.blocks) {
            if (auto* link = std::get_if<Link>(&b)) resolve_one(*link, doc, links, warnings);
        }
        for (auto& w : warnings) doc.diagnostics.warnings.push_back(std::move(w));
        doc.status = DocStatus::Resolved;
    } catch (const std::exception& e) {
        fail_document(doc, std::string("link resolution error: ") + e.what());
        std::cerr << "[d2m] phase2 failed: " << doc.source_path << ": " << e.what() << "\n";
    }
}

} // namespace d2m
