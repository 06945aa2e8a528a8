// d2m/cpp/tools/d2m_validate_main.cpp
#include <iostream>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>
#include "d2m/ir_json.h"
#include "d2m/validator.h"

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: d2m_validate <batch_jsonl> [--assets-base DIR]\n";
        return 1;
    }

    std::filesystem::path batch = argv[1];
    std::filesystem::path asset_base = batch.parent_path();

    for (int i = 2; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--assets-base" && i + 1 < argc) asset_base = argv[++i];
    }

    std::vector<d2m::DocumentInput> docs;
    std::vector<std::string> errors;
    if (!d2m::load_batch_jsonl(batch, asset_base, docs, &errors)) {
        nlohmann::json j;
        j["ok"] = false;
        j["errors"] = errors;
        std::cout << j.dump() << "\n";
        return 2;
    }

    for (const auto& d : docs) {
        auto vr = d2m::validate_blocks(d.blocks);
        for (auto& e : vr.errors) errors.push_back(d.source_path + ": " + e);
    }

    nlohmann::json j;
    j["ok"] = errors.empty();
    j["documents"] = docs.size();
    j["errors"] = errors;

    std::cout << j.dump() << "\n";
    return errors.empty() ? 0 : 2;
}
