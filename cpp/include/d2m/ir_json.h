// d2m/cpp/include/d2m/ir_json.h
#pragma once
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>
#include <nlohmann/json.hpp>

#include "d2m/batch.h"
#include "d2m/document.h"

namespace d2m {

// One JSONL batch line -> DocumentInput. Asset "path" entries are read from
// disk relative to asset_base.
bool parse_document_line(std::string_view line,
                         const std::filesystem::path& asset_base,
                         DocumentInput& out,
                         std::string* err);

// Skips (and reports in errs) lines that fail to parse; false only if the
// file itself cannot be read.
bool load_batch_jsonl(const std::filesystem::path& jsonl,
                      const std::filesystem::path& asset_base,
                      std::vector<DocumentInput>& docs,
                      std::vector<std::string>* errs);

nlohmann::json to_json(const Block& b);
nlohmann::json to_json(const Document& d);

// Packaging hand-off: <output_path>.json per resolved document, assets,
// conversion-report.json. Throws D2MException(IoError).
void write_batch_outputs(const std::filesystem::path& out_root, const BatchResult& r);

} // namespace d2m
