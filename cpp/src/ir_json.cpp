// d2m/cpp/src/ir_json.cpp
#include "d2m/ir_json.h"
#include "d2m/errors.h"
#include "d2m/format.h"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>

#include <simdjson.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace d2m {

namespace {

std::string_view get_sv_or_empty(const simdjson::dom::element& e, const char* key) {
    std::string_view sv{};
    if (e.at_key(key).get(sv)) return std::string_view{};
    return sv;
}

bool get_bool_safe(const simdjson::dom::element& e, const char* key, bool defv) {
    simdjson::dom::element v;
    if (e.at_key(key).get(v)) return defv;

    bool b = defv;
    if (!v.get(b)) return b;
    return defv;
}

void get_string_list(const simdjson::dom::element& e, const char* key, std::vector<std::string>& out) {
    simdjson::dom::array arr;
    if (e.at_key(key).get(arr)) return;
    for (simdjson::dom::element v : arr) {
        std::string_view sv;
        if (!v.get(sv)) out.emplace_back(sv);
    }
}

bool read_file_bytes(const fs::path& p, std::string& out) {
    std::ifstream in(p, std::ios::binary);
    if (!in) return false;
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) return false;
    out = ss.str();
    return true;
}

bool parse_block(const simdjson::dom::element& e, Block& out, std::string* err) {
    const std::string_view type = get_sv_or_empty(e, "type");

    if (type == "heading") {
        Heading h;
        int64_t level = 0;
        if (e.at_key("level").get(level)) {
            if (err) *err = "heading without integer level";
            return false;
        }
        // saturate: anything outside 1..6 is left for validate_blocks to reject
        h.level = (int)std::clamp<int64_t>(level, std::numeric_limits<int>::min(),
                                           std::numeric_limits<int>::max());
        h.text = std::string(get_sv_or_empty(e, "text"));
        out = std::move(h);
        return true;
    }
    if (type == "paragraph") {
        Paragraph p;
        get_string_list(e, "runs", p.runs);
        const std::string_view text = get_sv_or_empty(e, "text");
        if (p.runs.empty() && !text.empty()) p.runs.emplace_back(text);
        out = std::move(p);
        return true;
    }
    if (type == "image") {
        Image img;
        img.source_ref = std::string(get_sv_or_empty(e, "ref"));
        img.alt_text = std::string(get_sv_or_empty(e, "alt"));
        out = std::move(img);
        return true;
    }
    if (type == "link") {
        Link l;
        l.target_ref = std::string(get_sv_or_empty(e, "target"));
        l.display_text = std::string(get_sv_or_empty(e, "text"));
        std::string_view anchor;
        if (!e.at_key("anchor").get(anchor) && !anchor.empty()) l.anchor = std::string(anchor);
        out = std::move(l);
        return true;
    }
    if (type == "table") {
        Table t;
        simdjson::dom::array rows;
        if (!e.at_key("rows").get(rows)) {
            for (simdjson::dom::element row : rows) {
                std::vector<std::string> cells;
                simdjson::dom::array arr;
                if (!row.get(arr)) {
                    for (simdjson::dom::element c : arr) {
                        std::string_view sv;
                        cells.emplace_back(c.get(sv) ? std::string_view{} : sv);
                    }
                }
                t.rows.push_back(std::move(cells));
            }
        }
        out = std::move(t);
        return true;
    }

    if (err) *err = "unknown block type '" + std::string(type) + "'";
    return false;
}

} // namespace

bool parse_document_line(std::string_view line,
                         const fs::path& asset_base,
                         DocumentInput& out,
                         std::string* err) {
    out = DocumentInput{};

    simdjson::dom::parser parser;
    simdjson::dom::element doc;
    if (parser.parse(line.data(), line.size()).get(doc)) {
        if (err) *err = "invalid JSON";
        return false;
    }

    std::string_view src;
    if (doc["source_path"].get(src) || src.empty()) {
        if (err) *err = "missing source_path";
        return false;
    }
    out.source_path = std::string(src);
    out.converter = std::string(get_sv_or_empty(doc, "converter"));
    out.extraction_ok = get_bool_safe(doc, "extraction_ok", true);

    const std::string_view sc = get_sv_or_empty(doc, "special_case");
    if (!sc.empty()) {
        out.special_case = parse_special_case(std::string(sc));
        if (!out.special_case) {
            if (err) *err = "unknown special_case '" + std::string(sc) + "'";
            return false;
        }
    }

    get_string_list(doc, "warnings", out.warnings);
    get_string_list(doc, "errors", out.errors);

    simdjson::dom::array blocks;
    if (!doc["blocks"].get(blocks)) {
        size_t i = 0;
        for (simdjson::dom::element b : blocks) {
            Block blk;
            std::string berr;
            if (!parse_block(b, blk, &berr)) {
                if (err) *err = "block " + std::to_string(i) + ": " + berr;
                return false;
            }
            out.blocks.push_back(std::move(blk));
            ++i;
        }
    }

    simdjson::dom::array assets;
    if (!doc["assets"].get(assets)) {
        for (simdjson::dom::element a : assets) {
            const std::string ref(get_sv_or_empty(a, "ref"));
            const std::string_view path = get_sv_or_empty(a, "path");
            if (ref.empty() || path.empty()) continue;

            fs::path p(path);
            if (p.is_relative()) p = asset_base / p;

            std::string bytes;
            if (!read_file_bytes(p, bytes)) {
                // left out: the relocator reports the image as missing
                std::cerr << "[d2m] cannot read asset " << p << " for " << out.source_path << "\n";
                continue;
            }
            out.raw_assets[ref] = std::move(bytes);
        }
    }

    return true;
}

bool load_batch_jsonl(const fs::path& jsonl,
                      const fs::path& asset_base,
                      std::vector<DocumentInput>& docs,
                      std::vector<std::string>* errs) {
    std::ifstream in(jsonl, std::ios::binary);
    if (!in) {
        if (errs) errs->push_back("cannot open " + jsonl.string());
        return false;
    }

    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) continue;

        DocumentInput d;
        std::string err;
        if (!parse_document_line(line, asset_base, d, &err)) {
            if (errs) errs->push_back("line " + std::to_string(line_no) + ": " + err);
            continue;
        }
        docs.push_back(std::move(d));
    }
    return true;
}

json to_json(const Block& b) {
    json j = std::visit(Overloaded{
        [](const Heading& h) {
            json j{{"level", h.level}, {"text", h.text}};
            j["id"] = h.id ? json(*h.id) : json(nullptr);
            return j;
        },
        [](const Paragraph& p) {
            return json{{"runs", p.runs}};
        },
        [](const Image& img) {
            json j{{"ref", img.source_ref}, {"alt", img.alt_text}};
            j["assigned_path"] = img.assigned_path ? json(*img.assigned_path) : json(nullptr);
            j["href"] = img.href;
            return j;
        },
        [](const Link& l) {
            json j{{"target", l.target_ref}, {"text", l.display_text}};
            j["anchor"] = l.anchor ? json(*l.anchor) : json(nullptr);
            j["resolved"] = l.resolved;
            j["href"] = l.href();
            return j;
        },
        [](const Table& t) {
            return json{{"rows", t.rows}};
        },
    }, b);
    j["type"] = block_kind(b);
    return j;
}

json to_json(const Document& d) {
    json j;
    j["source_path"] = d.source_path;
    j["output_path"] = d.output_path;
    j["status"] = status_name(d.status);
    j["quality_score"] = d.quality_score;
    j["special_case"] = d.diagnostics.special_case
        ? json(special_case_name(*d.diagnostics.special_case)) : json(nullptr);
    j["warnings"] = d.diagnostics.warnings;
    j["errors"] = d.diagnostics.errors;

    json headings = json::array();
    for (const auto& h : d.heading_tree) {
        headings.push_back({{"level", h.level}, {"slug", h.slug}, {"text", h.text}});
    }
    j["headings"] = std::move(headings);

    json assets = json::array();
    for (const auto& a : d.assets) {
        assets.push_back({{"path", a.path}, {"bytes", (uint64_t)a.bytes.size()}});
    }
    j["assets"] = std::move(assets);

    json blocks = json::array();
    for (const auto& b : d.blocks) blocks.push_back(to_json(b));
    j["blocks"] = std::move(blocks);
    return j;
}

void write_batch_outputs(const fs::path& out_root, const BatchResult& r) {
    std::error_code ec;
    fs::create_directories(out_root, ec);
    if (ec) throw D2MException(ErrorCode::IoError, "cannot create out_root: " + out_root.string() + " err=" + ec.message());

    for (const auto& d : r.documents) {
        if (d.status != DocStatus::Resolved) continue;

        const fs::path doc_file = out_root / (d.output_path + ".json");
        if (!write_file_atomic(doc_file, to_json(d).dump(2))) {
            throw D2MException(ErrorCode::IoError, "write failed: " + doc_file.string());
        }
        for (const auto& a : d.assets) {
            const fs::path p = out_root / a.path;
            if (!write_file_atomic(p, a.bytes)) {
                throw D2MException(ErrorCode::IoError, "write failed: " + p.string());
            }
        }
    }

    const fs::path report = out_root / "conversion-report.json";
    if (!write_file_atomic(report, to_json(r.report).dump(2))) {
        throw D2MException(ErrorCode::IoError, "write failed: " + report.string());
    }
}

} // namespace d2m
