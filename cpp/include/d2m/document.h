// d2m/cpp/include/d2m/document.h
#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "d2m/ir.h"

namespace d2m {

enum class SpecialCase {
    ScannedNoOcr,
    ScannedWithOcr,
};

enum class DocStatus {
    Pending,
    Phase1Done,
    Resolved,
    Failed,
};

const char* status_name(DocStatus s);
const char* special_case_name(SpecialCase c);
std::optional<SpecialCase> parse_special_case(const std::string& s);

struct Diagnostics {
    std::vector<std::string> warnings;
    std::vector<std::string> errors;
    std::optional<SpecialCase> special_case;
};

struct HeadingEntry {
    int level{1};
    std::string slug;
    std::string text;
};

struct ExtractedAsset {
    std::string path;  // assigned_path
    std::string bytes;
};

// What the extraction collaborator hands over for one document.
struct DocumentInput {
    std::string source_path;
    std::string converter; // extractor name, echoed into the report
    bool extraction_ok{true};
    std::vector<Block> blocks;
    std::map<std::string, std::string> raw_assets; // image ref -> bytes
    std::optional<SpecialCase> special_case;
    std::vector<std::string> warnings;
    std::vector<std::string> errors;
};

struct Document {
    std::string source_path;
    std::string converter;
    bool extraction_ok{true};

    std::vector<Block> blocks;
    std::map<std::string, std::string> raw_assets;

    std::string output_path; // set once, by the filename registry
    std::vector<HeadingEntry> heading_tree;
    std::vector<ExtractedAsset> assets;

    Diagnostics diagnostics;
    double quality_score{0.0};
    DocStatus status{DocStatus::Pending};

    bool cancelled{false};
    std::string failure_reason;

    double conversion_time_ms{0.0};
};

Document make_document(DocumentInput in);

// Mark failed with an error diagnostic (processing errors).
void fail_document(Document& d, const std::string& reason);

// Mark failed without an error diagnostic.
void cancel_document(Document& d);

} // namespace d2m
