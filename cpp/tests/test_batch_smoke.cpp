#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "d2m/batch.h"

using namespace d2m;

static bool near(double a, double b) {
    return std::fabs(a - b) < 1e-9;
}

static Block h(int level, const std::string& text) {
    Heading x;
    x.level = level;
    x.text = text;
    return x;
}

static Block mk_link(const std::string& target, const std::string& anchor = "") {
    Link l;
    l.target_ref = target;
    l.display_text = target;
    if (!anchor.empty()) l.anchor = anchor;
    return l;
}

static DocumentInput input(const std::string& source, std::vector<Block> blocks) {
    DocumentInput in;
    in.source_path = source;
    in.converter = "test";
    in.blocks = std::move(blocks);
    return in;
}

static const Document& by_source(const BatchResult& r, const std::string& source) {
    for (const auto& d : r.documents) {
        if (d.source_path == source) return d;
    }
    throw std::out_of_range(source);
}

static BatchOptions threads(unsigned n) {
    BatchOptions opt;
    opt.max_threads = n;
    return opt;
}

int main() {
    // four clean documents, one malformed
    {
        std::vector<DocumentInput> in;
        for (int i = 0; i < 4; ++i) {
            in.push_back(input("doc" + std::to_string(i) + ".docx", {h(1, "Doc"), Paragraph{{"body"}}}));
        }
        in.push_back(input("broken.docx", {h(1, "Broken"), Table{}}));

        BatchResult r = run_batch(std::move(in), threads(4));
        assert(r.report.total == 5);
        assert(r.report.successful == 4);
        assert(r.report.failed == 1);
        assert(near(r.report.average_quality_score, 0.8));
        assert(by_source(r, "broken.docx").status == DocStatus::Failed);
        assert(!r.report.start_time.empty());
        assert(!r.report.end_time.empty());
    }

    // colliding names resolve the same way for any thread count
    {
        auto make = []() {
            std::vector<DocumentInput> in;
            in.push_back(input("other/user guide.pdf", {h(1, "Guide")}));
            in.push_back(input("docs/User Guide.docx", {h(1, "Guide")}));
            for (int i = 0; i < 40; ++i) {
                in.push_back(input("dir" + std::to_string(i) + "/Report.docx", {h(1, "Report")}));
            }
            return in;
        };

        std::map<std::string, std::string> baseline;
        for (unsigned n : {1u, 2u, 8u}) {
            BatchOptions opt = threads(n);
            opt.preserve_directories = false;
            BatchResult r = run_batch(make(), opt);

            assert(by_source(r, "docs/User Guide.docx").output_path == "user-guide.md");
            assert(by_source(r, "other/user guide.pdf").output_path == "user-guide-2.md");
            assert(by_source(r, "dir0/Report.docx").output_path == "report.md");
            assert(by_source(r, "dir1/Report.docx").output_path == "report-2.md");
            assert(by_source(r, "dir10/Report.docx").output_path == "report-3.md");

            std::map<std::string, std::string> got;
            for (const auto& d : r.documents) got[d.source_path] = d.output_path;
            if (baseline.empty()) baseline = got;
            assert(got == baseline);
        }
    }

    // cross-document links, one broken
    {
        std::vector<DocumentInput> in;
        in.push_back(input("a.docx", {h(1, "A"), mk_link("b.docx", "Install Steps"), mk_link("missing.docx")}));
        in.push_back(input("b.docx", {h(1, "B"), h(2, "Install Steps")}));

        BatchResult r = run_batch(std::move(in), threads(2));
        const Document& a = by_source(r, "a.docx");
        assert(a.status == DocStatus::Resolved);
        assert(near(a.quality_score, 0.95));
        assert(std::get<Link>(a.blocks[1]).href() == "b.md#install-steps");
        assert(near(by_source(r, "b.docx").quality_score, 1.0));
    }

    // extraction failure, scanned input, duplicate source
    {
        std::vector<DocumentInput> in;

        DocumentInput corrupt = input("corrupt.docx", {});
        corrupt.extraction_ok = false;
        corrupt.errors.push_back("corrupt file");
        in.push_back(corrupt);

        DocumentInput scan = input("scan.pdf", {Paragraph{{""}}});
        scan.special_case = SpecialCase::ScannedNoOcr;
        scan.warnings.push_back("no text layer");
        in.push_back(scan);

        in.push_back(input("dup.docx", {h(1, "One")}));
        in.push_back(input("dup.docx", {h(1, "Two")}));

        BatchResult r = run_batch(std::move(in), threads(4));
        assert(r.report.total == 4);

        const Document& c = by_source(r, "corrupt.docx");
        assert(c.status == DocStatus::Failed);
        assert(c.diagnostics.errors == std::vector<std::string>{"corrupt file"});

        const Document& s = by_source(r, "scan.pdf");
        assert(s.status == DocStatus::Resolved);
        assert(near(s.quality_score, 0.3));

        size_t dup_ok = 0, dup_failed = 0;
        for (const auto& d : r.documents) {
            if (d.source_path != "dup.docx") continue;
            if (d.status == DocStatus::Resolved) ++dup_ok;
            if (d.status == DocStatus::Failed) ++dup_failed;
        }
        assert(dup_ok == 1 && dup_failed == 1);
        assert(r.report.successful == 2);
    }

    // cancelled before start: nothing is processed, every document is reported
    {
        std::vector<DocumentInput> in;
        for (int i = 0; i < 10; ++i) in.push_back(input("c" + std::to_string(i) + ".docx", {h(1, "C")}));

        CancellationToken cancel;
        cancel.cancel();
        BatchResult r = run_batch(std::move(in), threads(4), cancel);

        assert(r.report.total == 10);
        assert(r.report.failed == 10);
        for (const auto& d : r.documents) {
            assert(d.cancelled);
            assert(d.output_path.empty());
            assert(d.diagnostics.errors.empty());
        }
        assert(r.report.documents[0].errors == std::vector<std::string>{"cancelled"});
    }

    // cancelled while running: whatever got started is finished, and no
    // resolved link points at a document that is not output
    for (int delay_us : {0, 50, 200, 1000, 5000}) {
        const int n = 3000;
        std::vector<DocumentInput> in;
        std::map<std::string, std::string> next_of;
        for (int i = 0; i < n; ++i) {
            const std::string self = "mid/d" + std::to_string(i) + ".docx";
            const std::string next = "mid/d" + std::to_string((i + 1) % n) + ".docx";
            next_of[self] = next;
            in.push_back(input(self, {h(1, "Doc"), h(2, "Next Steps"), mk_link(next, "Next Steps")}));
        }

        CancellationToken cancel;
        std::thread canceller([&]() {
            std::this_thread::sleep_for(std::chrono::microseconds(delay_us));
            cancel.cancel();
        });
        BatchResult r = run_batch(std::move(in), threads(4), cancel);
        canceller.join();

        assert(r.report.total == (uint64_t)n);
        assert(r.report.successful + r.report.failed == (uint64_t)n);

        std::map<std::string, const Document*> by_path;
        for (const auto& d : r.documents) by_path[d.source_path] = &d;

        for (const auto& d : r.documents) {
            assert(d.status == DocStatus::Resolved || d.status == DocStatus::Failed);
            if (d.cancelled) {
                assert(d.status == DocStatus::Failed);
                assert(d.output_path.empty());
                continue;
            }
            assert(d.status == DocStatus::Resolved);

            const Link& l = std::get<Link>(d.blocks[2]);
            const Document* target = by_path.at(next_of.at(d.source_path));
            if (target->status == DocStatus::Resolved) {
                assert(l.resolved);
                assert(l.href() == target->output_path.substr(4) + "#next-steps");
                assert(d.diagnostics.warnings.empty());
            } else {
                assert(target->cancelled);
                assert(!l.resolved);
                assert(l.target_ref == next_of.at(d.source_path));
                assert(d.diagnostics.warnings.size() == 1);
            }
        }
    }

    // long chain: every document links to the next one's second heading
    {
        const int n = 200;
        std::vector<DocumentInput> in;
        for (int i = 0; i < n; ++i) {
            const std::string next = "chain/d" + std::to_string((i + 1) % n) + ".docx";
            in.push_back(input("chain/d" + std::to_string(i) + ".docx",
                               {h(1, "Doc " + std::to_string(i)), h(2, "Next Steps"), mk_link(next, "Next Steps")}));
        }

        BatchResult r = run_batch(std::move(in), threads(8));
        assert(r.report.total == (uint64_t)n);
        assert(r.report.successful == (uint64_t)n);
        assert(near(r.report.average_quality_score, 1.0));
        for (const auto& d : r.documents) {
            const Link& l = std::get<Link>(d.blocks[2]);
            assert(l.resolved);
            assert(l.anchor && *l.anchor == "next-steps");
            assert(l.target_ref.rfind("d", 0) == 0);
        }
    }

    std::cout << "OK\n";
    return 0;
}
