#include <cassert>
#include <cmath>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>

#include "d2m/batch.h"
#include "d2m/ir_json.h"
#include "d2m/validator.h"

static std::filesystem::path mk_tmp_dir() {
    auto base = std::filesystem::temp_directory_path();
    auto p = base / ("d2m_test_" + std::to_string((uint64_t)std::time(nullptr)));
    std::filesystem::create_directories(p);
    return p;
}

static std::filesystem::path test_data_file(const char* name) {
#ifndef D2M_TEST_DATA_DIR
    return std::filesystem::path("cpp/tests/data") / name; // fallback
#else
    return std::filesystem::path(D2M_TEST_DATA_DIR) / name;
#endif
}

static nlohmann::json read_json(const std::filesystem::path& p) {
    std::ifstream in(p);
    std::stringstream ss;
    ss << in.rdbuf();
    return nlohmann::json::parse(ss.str());
}

int main() {
    // single line
    {
        d2m::DocumentInput d;
        std::string err;
        bool ok = d2m::parse_document_line(
            R"({"source_path":"x.docx","blocks":[{"type":"heading","level":2,"text":"T"},{"type":"paragraph","text":"p"}]})",
            ".", d, &err);
        assert(ok);
        assert(d.source_path == "x.docx");
        assert(d.extraction_ok);
        assert(d.blocks.size() == 2);
        assert(std::get<d2m::Heading>(d.blocks[0]).level == 2);
        assert(std::get<d2m::Paragraph>(d.blocks[1]).runs.size() == 1);

        // oversized levels must not wrap into 1..6
        ok = d2m::parse_document_line(
            R"({"source_path":"big.docx","blocks":[{"type":"heading","level":4294967298,"text":"T"}]})",
            ".", d, &err);
        assert(ok);
        assert(std::get<d2m::Heading>(d.blocks[0]).level == std::numeric_limits<int>::max());
        assert(!d2m::validate_blocks(d.blocks).ok);

        ok = d2m::parse_document_line(
            R"({"source_path":"neg.docx","blocks":[{"type":"heading","level":-4294967294,"text":"T"}]})",
            ".", d, &err);
        assert(ok);
        assert(!d2m::validate_blocks(d.blocks).ok);

        assert(!d2m::parse_document_line(R"({"blocks":[]})", ".", d, &err));
        assert(err == "missing source_path");
        assert(!d2m::parse_document_line(R"({"source_path":"y","blocks":[{"type":"video"}]})", ".", d, &err));
        assert(err.find("unknown block type") != std::string::npos);
        assert(!d2m::parse_document_line(R"({"source_path":"y","special_case":"blurry"})", ".", d, &err));
    }

    auto out_root = mk_tmp_dir();
    auto corpus = test_data_file("tiny_batch.jsonl");

    std::vector<d2m::DocumentInput> inputs;
    std::vector<std::string> errs;
    assert(d2m::load_batch_jsonl(corpus, corpus.parent_path(), inputs, &errs));
    assert(inputs.size() == 4);
    assert(errs.size() == 1);
    assert(errs[0].rfind("line 5:", 0) == 0);

    d2m::BatchOptions opt;
    opt.max_threads = 2;
    d2m::BatchResult r = d2m::run_batch(std::move(inputs), opt);

    assert(r.report.total == 4);
    assert(r.report.successful == 3);
    assert(r.report.failed == 1);
    assert(std::fabs(r.report.average_quality_score - (0.95 + 1.0 + 0.3) / 4.0) < 1e-9);

    d2m::write_batch_outputs(out_root, r);

    const auto guide_file = out_root / "manuals" / "user-guide.md.json";
    assert(std::filesystem::exists(guide_file));
    assert(std::filesystem::exists(out_root / "reference" / "api.md.json"));
    assert(std::filesystem::exists(out_root / "assets" / "user-guide" / "001.png"));
    assert(std::filesystem::file_size(out_root / "assets" / "user-guide" / "001.png") ==
           std::filesystem::file_size(test_data_file("assets/pixel.png")));
    assert(!std::filesystem::exists(out_root / "broken.md.json"));

    auto guide = read_json(guide_file);
    assert(guide["status"] == "resolved");
    assert(guide["warnings"].size() == 1);
    assert(guide["headings"][1]["level"] == 2);
    assert(guide["headings"][1]["slug"] == "install-steps");

    bool saw_image = false, saw_link = false;
    for (const auto& b : guide["blocks"]) {
        if (b["type"] == "image") {
            saw_image = true;
            assert(b["href"] == "../assets/user-guide/001.png");
        }
        if (b["type"] == "link" && b["resolved"] == true) {
            saw_link = true;
            assert(b["href"] == "../reference/api.md#endpoints");
        }
    }
    assert(saw_image && saw_link);

    auto api = read_json(out_root / "reference" / "api.md.json");
    assert(api["headings"][0]["text"] == "Api");
    bool back_link = false;
    for (const auto& b : api["blocks"]) {
        if (b["type"] == "link") back_link = b["href"] == "../manuals/user-guide.md#install-steps";
    }
    assert(back_link);

    auto report = read_json(out_root / "conversion-report.json");
    assert(report["total_files"] == 4);
    assert(report["files"][0]["source_file"] == "broken.xlsx");
    assert(report["files"][0]["output_file"].is_null());
    assert(report["files"][0]["errors"][0] == "cannot open workbook");
    assert(report["files"][3]["quality_score"] == 0.3);

    std::filesystem::remove_all(out_root);

    std::cout << "OK\n";
    return 0;
}
