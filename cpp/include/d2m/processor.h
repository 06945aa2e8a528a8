// d2m/cpp/include/d2m/processor.h
#pragma once
#include <cstddef>
#include <optional>
#include <string>

#include "d2m/document.h"
#include "d2m/filename_registry.h"
#include "d2m/link_registry.h"
#include "d2m/options.h"

namespace d2m {

// Output name proposed for a source path: its file stem.
std::string proposed_base_name(const std::string& source_path);

// Directory part of the output path (sanitized source dirs, or "").
std::string output_directory_for(const std::string& source_path, bool preserve_directories);

// Phase 1 for one document: unique name, headings, assets, registry entry.
// Links are left untouched. Errors are caught here: the document ends up
// Failed and nothing is published. With a ticket, the name is assigned in
// ticket order (see FilenameRegistry).
void process_document(Document& doc,
                      FilenameRegistry& names,
                      LinkRegistry& links,
                      const BatchOptions& opt,
                      std::optional<size_t> ticket = std::nullopt);

} // namespace d2m
