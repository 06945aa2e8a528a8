// d2m/cpp/src/document.cpp
#include "d2m/document.h"

namespace d2m {

const char* status_name(DocStatus s) {
    switch (s) {
        case DocStatus::Pending:    return "pending";
        case DocStatus::Phase1Done: return "phase1_done";
        case DocStatus::Resolved:   return "resolved";
        case DocStatus::Failed:     return "failed";
    }
    return "unknown";
}

const char* special_case_name(SpecialCase c) {
    switch (c) {
        case SpecialCase::ScannedNoOcr:   return "scanned_no_ocr";
        case SpecialCase::ScannedWithOcr: return "scanned_with_ocr";
    }
    return "unknown";
}

std::optional<SpecialCase> parse_special_case(const std::string& s) {
    if (s == "scanned_no_ocr") return SpecialCase::ScannedNoOcr;
    if (s == "scanned_with_ocr") return SpecialCase::ScannedWithOcr;
    return std::nullopt;
}

Document make_document(DocumentInput in) {
    Document d;
    d.source_path = std::move(in.source_path);
    d.converter = std::move(in.converter);
    d.extraction_ok = in.extraction_ok;
    d.blocks = std::move(in.blocks);
    d.raw_assets = std::move(in.raw_assets);
    d.diagnostics.warnings = std::move(in.warnings);
    d.diagnostics.errors = std::move(in.errors);
    d.diagnostics.special_case = in.special_case;
    d.status = DocStatus::Pending;
    return d;
}

void fail_document(Document& d, const std::string& reason) {
    d.diagnostics.errors.push_back(reason);
    if (d.failure_reason.empty()) d.failure_reason = reason;
    d.status = DocStatus::Failed;
    d.quality_score = 0.0;
}

void cancel_document(Document& d) {
    d.cancelled = true;
    d.failure_reason = "cancelled";
    d.status = DocStatus::Failed;
    d.quality_score = 0.0;
}

} // namespace d2m
