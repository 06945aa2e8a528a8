// d2m/cpp/include/d2m/options.h
#pragma once
#include <cstddef>
#include <string>

namespace d2m {

struct BatchOptions {
    // parallelism (capped by hardware_concurrency and batch size)
    unsigned max_threads{16};

    // output naming
    bool preserve_directories{true}; // keep sanitized source dirs in output_path
    std::string output_extension{".md"};
    size_t max_name_suffix{10000};   // "-2" ... "-N" before giving up

    // assets
    std::string assets_root{"assets"};
    unsigned asset_sequence_width{3};

    // anchors
    size_t max_slug_length{80};

    bool verbose{false};
};

// D2M_MAX_THREADS, D2M_VERBOSE, D2M_PRESERVE_DIRS
void apply_env_overrides(BatchOptions& opt);

} // namespace d2m
