// d2m/cpp/include/d2m/assets.h
#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "d2m/document.h"
#include "d2m/ir.h"

namespace d2m {

constexpr const char* kWarnImageMissing = "embedded image data missing";

struct AssetOptions {
    std::string assets_root{"assets"};
    unsigned sequence_width{3};
};

struct AssetResult {
    std::vector<ExtractedAsset> assets; // appearance order
    std::vector<std::string> warnings;
};

// Assigns assets/<doc_slug>/<seq>.<ext> to every Image with bytes and rewrites
// the blocks. No I/O: bytes are handed back for the packaging side.
AssetResult relocate_assets(std::vector<Block>& blocks,
                            const std::map<std::string, std::string>& raw_assets,
                            const std::string& doc_slug,
                            const std::string& doc_output_path,
                            const AssetOptions& opt = AssetOptions{});

// "png", "jpg", ... from the reference, or sniffed from the bytes, else "bin".
std::string asset_extension(const std::string& source_ref, std::string_view bytes);

} // namespace d2m
