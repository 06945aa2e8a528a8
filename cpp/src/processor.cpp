// d2m/cpp/src/processor.cpp
#include "d2m/processor.h"
#include "d2m/assets.h"
#include "d2m/errors.h"
#include "d2m/headings.h"
#include "d2m/validator.h"

#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace d2m {

namespace {

fs::path source_as_path(const std::string& source_path) {
    std::string s = source_path;
    for (auto& c : s) {
        if (c == '\\') c = '/';
    }
    return fs::path(s).lexically_normal();
}

// Releases an unused ticket on every exit path.
struct TicketGuard {
    FilenameRegistry& names;
    std::optional<size_t> ticket;

    ~TicketGuard() {
        if (ticket) names.release(*ticket);
    }
};

} // namespace

std::string proposed_base_name(const std::string& source_path) {
    const std::string stem = source_as_path(source_path).stem().string();
    return stem.empty() ? std::string("unnamed") : stem;
}

std::string output_directory_for(const std::string& source_path, bool preserve_directories) {
    if (!preserve_directories) return std::string();

    fs::path out;
    for (const auto& part : source_as_path(source_path).parent_path()) {
        const std::string s = part.string();
        if (s.empty() || s == "/" || s == "." || s == "..") continue;
        out /= sanitize_name(s);
    }
    return out.generic_string();
}

void process_document(Document& doc,
                      FilenameRegistry& names,
                      LinkRegistry& links,
                      const BatchOptions& opt,
                      std::optional<size_t> ticket) {
    TicketGuard guard{names, ticket};

    try {
        if (doc.status != DocStatus::Pending) {
            throw D2MException(ErrorCode::InvalidArgs,
                               std::string("document is not pending: ") + status_name(doc.status));
        }
        if (doc.source_path.empty()) {
            throw D2MException(ErrorCode::MalformedIr, "malformed IR: empty source path");
        }
        if (!doc.extraction_ok) {
            // extractor already recorded why; keep its diagnostics as they are
            doc.status = DocStatus::Failed;
            doc.failure_reason = "extraction failed";
            if (doc.diagnostics.errors.empty()) doc.diagnostics.errors.push_back("extraction failed");
            doc.quality_score = 0.0;
            return;
        }

        const ValidationResult vr = validate_blocks(doc.blocks);
        if (!vr.ok) {
            for (size_t i = 0; i + 1 < vr.errors.size(); ++i) doc.diagnostics.errors.push_back(vr.errors[i]);
            throw D2MException(ErrorCode::MalformedIr, vr.errors.back());
        }

        // 1) unique output name
        std::string unique;
        if (ticket) {
            const size_t t = *ticket;
            guard.ticket.reset(); // assign() passes the turn on, even on throw
            unique = names.assign(t, proposed_base_name(doc.source_path));
        } else {
            unique = names.assign(proposed_base_name(doc.source_path));
        }

        const std::string dir = output_directory_for(doc.source_path, opt.preserve_directories);
        const fs::path out = dir.empty() ? fs::path(unique + opt.output_extension)
                                         : fs::path(dir) / (unique + opt.output_extension);
        doc.output_path = out.generic_string();

        // 2) headings
        const std::string title = title_from_stem(proposed_base_name(doc.source_path));
        HeadingResult hr = normalize_headings(doc.blocks, title, opt.max_slug_length);
        doc.heading_tree = std::move(hr.tree);
        for (auto& w : hr.warnings) doc.diagnostics.warnings.push_back(std::move(w));

        // 3) assets
        AssetOptions aopt;
        aopt.assets_root = opt.assets_root;
        aopt.sequence_width = opt.asset_sequence_width;

        AssetResult ar = relocate_assets(doc.blocks, doc.raw_assets, unique, doc.output_path, aopt);
        doc.assets = std::move(ar.assets);
        for (auto& w : ar.warnings) doc.diagnostics.warnings.push_back(std::move(w));
        doc.raw_assets.clear(); // bytes now live in doc.assets

        // 4) registry entry; links stay untouched until Phase 2
        links.publish(make_link_target(doc.source_path, doc.output_path, doc.heading_tree,
                                       opt.max_slug_length));

        doc.status = DocStatus::Phase1Done;

        if (opt.verbose) {
            std::cerr << "[d2m] phase1 " << doc.source_path << " -> " << doc.output_path
                      << " headings=" << doc.heading_tree.size()
                      << " assets=" << doc.assets.size() << "\n";
        }
    } catch (const D2MException& e) {
        fail_document(doc, e.what());
        std::cerr << "[d2m] phase1 failed: " << doc.source_path << " (" << error_code_name(e.code())
                  << "): " << e.what() << "\n";
    } catch (const std::exception& e) {
        fail_document(doc, std::string("processing error: ") + e.what());
        std::cerr << "[d2m] phase1 failed: " << doc.source_path << ": " << e.what() << "\n";
    }
}

} // namespace d2m
