// d2m/cpp/src/batch.cpp
#include "d2m/batch.h"
#include "d2m/filename_registry.h"
#include "d2m/format.h"
#include "d2m/link_registry.h"
#include "d2m/link_resolver.h"
#include "d2m/processor.h"
#include "d2m/quality.h"

#include <algorithm>
#include <chrono>
#include <exception>
#include <iostream>
#include <thread>

namespace d2m {

namespace {

// Fork-join over [0, n): workers claim indices in increasing order.
// Returns only after every worker has joined (the barrier).
template <class Fn>
void parallel_for(size_t n, unsigned n_threads, Fn&& fn) {
    if (n == 0) return;

    std::atomic<size_t> next{0};
    std::vector<std::exception_ptr> errs(n_threads);
    std::vector<std::thread> workers;
    workers.reserve(n_threads);

    for (unsigned t = 0; t < n_threads; ++t) {
        workers.emplace_back([&, t]() {
            try {
                while (true) {
                    const size_t i = next.fetch_add(1, std::memory_order_relaxed);
                    if (i >= n) break;
                    fn(i);
                }
            } catch (...) {
                errs[t] = std::current_exception();
            }
        });
    }

    for (auto& th : workers) th.join();
    for (auto& e : errs) {
        if (e) std::rethrow_exception(e);
    }
}

unsigned pick_threads(const BatchOptions& opt, size_t n_docs) {
    unsigned hw = std::thread::hardware_concurrency();
    if (hw == 0) hw = 4;
    const unsigned max_thr = opt.max_threads > 0 ? opt.max_threads : 16u;
    unsigned n = std::min<unsigned>(hw, max_thr);
    if (n_docs < (size_t)n) n = (unsigned)n_docs;
    if (n == 0) n = 1;
    return n;
}

double elapsed_ms(std::chrono::steady_clock::time_point t0) {
    using namespace std::chrono;
    return duration<double, std::milli>(steady_clock::now() - t0).count();
}

} // namespace

BatchResult run_batch(std::vector<DocumentInput> inputs,
                      const BatchOptions& opt,
                      const CancellationToken& cancel) {
    BatchResult out;
    const std::string started = utc_now_iso();

    std::vector<Document>& docs = out.documents;
    docs.reserve(inputs.size());
    for (auto& in : inputs) docs.push_back(make_document(std::move(in)));
    inputs.clear();

    // lexicographic by source_path: fixes name assignment order
    std::stable_sort(docs.begin(), docs.end(),
                     [](const Document& a, const Document& b) { return a.source_path < b.source_path; });

    std::vector<size_t> work;
    work.reserve(docs.size());
    for (size_t i = 0; i < docs.size(); ++i) {
        if (i > 0 && docs[i].source_path == docs[i - 1].source_path) {
            fail_document(docs[i], "duplicate source path: " + docs[i].source_path);
            std::cerr << "[d2m] duplicate source path skipped: " << docs[i].source_path << "\n";
            continue;
        }
        work.push_back(i);
    }

    out.threads = pick_threads(opt, work.size());

    FilenameRegistry names(opt.max_name_suffix);
    LinkRegistry links;

    // Phase 1: ticket k belongs to work[k]
    parallel_for(work.size(), out.threads, [&](size_t k) {
        Document& d = docs[work[k]];
        if (cancel.cancelled()) {
            names.release(k);
            cancel_document(d);
            return;
        }
        const auto t0 = std::chrono::steady_clock::now();
        process_document(d, names, links, opt, k);
        d.conversion_time_ms += elapsed_ms(t0);
    });

    // barrier passed: every entry that will ever exist is published
    links.seal();

    std::vector<size_t> ready;
    ready.reserve(work.size());
    for (size_t i : work) {
        if (docs[i].status == DocStatus::Phase1Done) ready.push_back(i);
    }

    if (cancel.cancelled() && opt.verbose) {
        std::cerr << "[d2m] cancelled after phase1, resolving " << ready.size() << " started documents\n";
    }

    // Phase 2: every published document is resolved, even after cancel()
    parallel_for(ready.size(), out.threads, [&](size_t k) {
        Document& d = docs[ready[k]];
        const auto t0 = std::chrono::steady_clock::now();
        resolve_links(d, links);
        d.conversion_time_ms += elapsed_ms(t0);
    });

    size_t n_cancelled = 0;
    for (auto& d : docs) {
        if (d.status == DocStatus::Resolved) d.quality_score = quality_score(d.diagnostics);
        else d.quality_score = 0.0;
        if (d.cancelled) ++n_cancelled;
    }

    out.report = aggregate_report(docs, started, utc_now_iso());

    if (n_cancelled > 0) {
        std::cerr << "[d2m] batch cancelled: " << n_cancelled << " of " << docs.size()
                  << " documents not processed\n";
    }
    if (opt.verbose) {
        std::cerr << "[d2m] batch done: total=" << out.report.total
                  << " ok=" << out.report.successful
                  << " failed=" << out.report.failed
                  << " avg_quality=" << out.report.average_quality_score
                  << " threads=" << out.threads << "\n";
    }
    return out;
}

} // namespace d2m
