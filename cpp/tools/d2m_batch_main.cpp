#include <iostream>
#include <string>
#include <filesystem>

#include <nlohmann/json.hpp>
#include "d2m/batch.h"
#include "d2m/ir_json.h"
#include "d2m/options.h"

static std::string arg_value(int& i, int argc, char** argv) {
    if (i + 1 >= argc) return "";
    return argv[++i];
}

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: d2m_batch <batch_jsonl> [--out DIR] [--assets-base DIR] [--threads N]"
                     " [--flat] [--text] [--verbose]\n";
        return 1;
    }

    std::filesystem::path batch = argv[1];
    std::filesystem::path out_root;
    std::filesystem::path asset_base = batch.parent_path();
    bool text = false;

    d2m::BatchOptions opt;
    d2m::apply_env_overrides(opt);

    for (int i = 2; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--out") out_root = arg_value(i, argc, argv);
        else if (a == "--assets-base") asset_base = arg_value(i, argc, argv);
        else if (a == "--threads") {
            const std::string v = arg_value(i, argc, argv);
            try {
                opt.max_threads = (unsigned)std::stoul(v);
            } catch (const std::exception&) {
                std::cerr << "d2m_batch: invalid --threads value: " << v << "\n";
                return 1;
            }
        }
        else if (a == "--flat") opt.preserve_directories = false;
        else if (a == "--text") text = true;
        else if (a == "--verbose") opt.verbose = true;
        else {
            std::cerr << "d2m_batch: unknown argument: " << a << "\n";
            return 1;
        }
    }

    try {
        std::vector<d2m::DocumentInput> docs;
        std::vector<std::string> errs;
        if (!d2m::load_batch_jsonl(batch, asset_base, docs, &errs)) {
            for (const auto& e : errs) std::cerr << "d2m_batch: " << e << "\n";
            return 2;
        }
        for (const auto& e : errs) std::cerr << "[d2m] skipped " << e << "\n";

        auto r = d2m::run_batch(std::move(docs), opt);

        if (!out_root.empty()) d2m::write_batch_outputs(out_root, r);

        if (text) std::cout << d2m::format_report_text(r.report);
        else std::cout << d2m::to_json(r.report).dump() << "\n";

        return r.report.failed == 0 ? 0 : 3;
    } catch (const std::exception& e) {
        std::cerr << "d2m_batch failed: " << e.what() << "\n";
        return 2;
    }
}
