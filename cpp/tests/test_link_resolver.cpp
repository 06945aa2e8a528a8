#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "d2m/errors.h"
#include "d2m/link_resolver.h"
#include "d2m/processor.h"
#include "d2m/quality.h"

using namespace d2m;

static Block h(int level, const std::string& text) {
    Heading x;
    x.level = level;
    x.text = text;
    return x;
}

static Block mk_link(const std::string& target, const std::string& anchor = "") {
    Link l;
    l.target_ref = target;
    l.display_text = "see " + target;
    if (!anchor.empty()) l.anchor = anchor;
    return l;
}

static Document doc(const std::string& source, std::vector<Block> blocks) {
    DocumentInput in;
    in.source_path = source;
    in.converter = "test";
    in.blocks = std::move(blocks);
    return make_document(std::move(in));
}

static const Link& link_at(const Document& d, size_t i) {
    size_t seen = 0;
    for (const auto& b : d.blocks) {
        if (auto* l = std::get_if<Link>(&b)) {
            if (seen++ == i) return *l;
        }
    }
    throw std::out_of_range("no such link");
}

static size_t count_prefixed(const std::vector<std::string>& v, const char* prefix) {
    size_t n = 0;
    for (const auto& s : v) n += s.rfind(prefix, 0) == 0;
    return n;
}

int main() {
    assert(is_external_ref("https://example.com/x"));
    assert(is_external_ref("mailto:someone@example.com"));
    assert(is_external_ref("//cdn.example.com/a.png"));
    assert(is_external_ref("ftp://host/file"));
    assert(!is_external_ref("C:\\docs\\a.docx"));
    assert(!is_external_ref("docs/a.docx"));
    assert(!is_external_ref("#Overview"));
    assert(!is_external_ref("b.docx#Install Steps"));

    BatchOptions opt;
    FilenameRegistry names;
    LinkRegistry links;

    std::vector<Document> docs;
    docs.push_back(doc("docs/a.docx", {
        h(1, "Alpha"),
        h(2, "Overview"),
        mk_link("docs/b.docx", "Install Steps"),       // 0: exact key + anchor
        mk_link("b.docx#Install%20Steps"),             // 1: fragment, same directory
        mk_link("missing.docx"),                       // 2: unresolved
        mk_link("b.docx#Nope"),                        // 3: anchor not found
        mk_link("https://example.com"),                // 4: external
        mk_link("#Overview"),                          // 5: this document
        mk_link("../ref/c.pdf"),                       // 6: relative path
        mk_link("c.pdf"),                              // 7: unique file name
        mk_link("b.docx", "install-steps"),            // 8: existing slug
    }));
    docs.push_back(doc("docs/b.docx", {h(1, "Beta"), h(2, "Install Steps")}));
    docs.push_back(doc("ref/c.pdf", {h(1, "Gamma")}));
    docs.push_back(doc("bad.docx", {h(1, "Bad"), h(9, "Too deep")}));

    for (auto& d : docs) process_document(d, names, links, opt);

    assert(docs[0].status == DocStatus::Phase1Done);
    assert(docs[0].output_path == "docs/a.md");
    assert(docs[1].output_path == "docs/b.md");
    assert(docs[2].output_path == "ref/c.md");

    // Phase 1 leaves links alone
    assert(link_at(docs[0], 0).target_ref == "docs/b.docx");
    assert(!link_at(docs[0], 0).resolved);

    // malformed IR fails and is never published
    assert(docs[3].status == DocStatus::Failed);
    assert(!docs[3].diagnostics.errors.empty());
    assert(!links.lookup("bad.docx"));
    assert(links.size() == 3);

    links.seal();
    assert(links.sealed());

    bool threw = false;
    try {
        links.publish(make_link_target("late.docx", "late.md", {}));
    } catch (const D2MException& e) {
        threw = e.code() == ErrorCode::RegistrySealed;
    }
    assert(threw);

    for (auto& d : docs) resolve_links(d, links);
    const Document& a = docs[0];
    assert(a.status == DocStatus::Resolved);

    assert(link_at(a, 0).href() == "b.md#install-steps");
    assert(link_at(a, 0).resolved);
    assert(link_at(a, 1).href() == "b.md#install-steps");

    assert(!link_at(a, 2).resolved);
    assert(link_at(a, 2).target_ref == "missing.docx");

    assert(link_at(a, 3).resolved);
    assert(link_at(a, 3).href() == "b.md");

    assert(link_at(a, 4).target_ref == "https://example.com");
    assert(!link_at(a, 4).resolved);

    assert(link_at(a, 5).href() == "#overview");
    assert(link_at(a, 6).href() == "../ref/c.md");
    assert(link_at(a, 7).href() == "../ref/c.md");
    assert(link_at(a, 8).href() == "b.md#install-steps");

    assert(a.diagnostics.warnings.size() == 2);
    assert(count_prefixed(a.diagnostics.warnings, kWarnUnresolvedLink) == 1);
    assert(count_prefixed(a.diagnostics.warnings, kWarnAnchorNotFound) == 1);
    assert(a.diagnostics.errors.empty());
    assert(quality_score(a.diagnostics) == 1.0 - 2 * kWarningPenalty);

    // slug-equality matching uses the length the slugs were assigned with
    {
        const std::vector<HeadingEntry> hs = {{1, "installati", "Installation Guide"}};
        const LinkTarget short_target = make_link_target("s.docx", "s.md", hs, 10);
        assert(short_target.find_anchor("Installation Steps") == std::optional<std::string>("installati"));
        assert(short_target.find_anchor("installati").value() == "installati");

        const LinkTarget default_target = make_link_target("s.docx", "s.md", hs);
        assert(!default_target.find_anchor("Installation Steps"));
    }

    // failed documents are skipped by Phase 2
    assert(docs[3].status == DocStatus::Failed);

    std::cout << "OK\n";
    return 0;
}
