// d2m/cpp/include/d2m/batch.h
#pragma once
#include <atomic>
#include <memory>
#include <vector>

#include "d2m/document.h"
#include "d2m/options.h"
#include "d2m/report.h"

namespace d2m {

// Shared cancel flag, checked before each Phase 1 document. Documents that
// completed Phase 1 are always resolved.
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { flag_->store(true, std::memory_order_relaxed); }
    bool cancelled() const { return flag_->load(std::memory_order_relaxed); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

struct BatchResult {
    std::vector<Document> documents; // ordered by source_path
    BatchReport report;
    unsigned threads{0};
};

// Phase 1 (parallel) -> barrier -> Phase 2 (parallel) -> scoring -> report.
// Per-document failures never abort the batch.
BatchResult run_batch(std::vector<DocumentInput> inputs,
                      const BatchOptions& opt,
                      const CancellationToken& cancel = CancellationToken{});

} // namespace d2m
