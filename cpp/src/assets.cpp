// d2m/cpp/src/assets.cpp
#include "d2m/assets.h"

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <iomanip>
#include <sstream>

#include "text_common.h"

namespace fs = std::filesystem;

namespace d2m {

namespace {

bool starts_with_bytes(std::string_view s, const char* magic, size_t n) {
    return s.size() >= n && std::memcmp(s.data(), magic, n) == 0;
}

std::string sniff_extension(std::string_view b) {
    if (starts_with_bytes(b, "\x89PNG\r\n\x1a\n", 8)) return "png";
    if (starts_with_bytes(b, "\xFF\xD8\xFF", 3)) return "jpg";
    if (starts_with_bytes(b, "GIF87a", 6) || starts_with_bytes(b, "GIF89a", 6)) return "gif";
    if (starts_with_bytes(b, "BM", 2)) return "bmp";
    if (b.size() >= 12 && starts_with_bytes(b, "RIFF", 4) && std::memcmp(b.data() + 8, "WEBP", 4) == 0) return "webp";
    if (starts_with_bytes(b, "II*\0", 4) || starts_with_bytes(b, "MM\0*", 4)) return "tiff";

    const std::string head = trim_copy(b.substr(0, std::min<size_t>(b.size(), 256)));
    if (head.rfind("<svg", 0) == 0 || (head.rfind("<?xml", 0) == 0 && head.find("<svg") != std::string::npos)) {
        return "svg";
    }
    return "bin";
}

bool is_ext_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
}

std::string zero_pad(size_t n, unsigned width) {
    std::ostringstream oss;
    oss << std::setw((int)width) << std::setfill('0') << n;
    return oss.str();
}

} // namespace

std::string asset_extension(const std::string& source_ref, std::string_view bytes) {
    std::string ext = to_lower_copy(fs::path(source_ref).extension().string());
    if (!ext.empty() && ext[0] == '.') ext.erase(0, 1);

    bool ok = !ext.empty() && ext.size() <= 5;
    for (char c : ext) ok = ok && is_ext_char(c);
    if (ok) return ext == "jpeg" ? "jpg" : ext;

    return sniff_extension(bytes);
}

AssetResult relocate_assets(std::vector<Block>& blocks,
                            const std::map<std::string, std::string>& raw_assets,
                            const std::string& doc_slug,
                            const std::string& doc_output_path,
                            const AssetOptions& opt) {
    AssetResult r;

    const fs::path doc_dir = fs::path(doc_output_path).parent_path();
    const fs::path asset_dir = fs::path(opt.assets_root) / doc_slug;

    size_t seq = 0;
    for (auto& b : blocks) {
        auto* img = std::get_if<Image>(&b);
        if (!img) continue;

        auto it = raw_assets.find(img->source_ref);
        if (it == raw_assets.end()) {
            r.warnings.push_back(std::string(kWarnImageMissing) + ": " + img->source_ref);
            continue;
        }

        ++seq;
        const std::string name = zero_pad(seq, opt.sequence_width) + "." + asset_extension(img->source_ref, it->second);
        const fs::path assigned = asset_dir / name;

        img->assigned_path = assigned.generic_string();
        img->href = doc_dir.empty() ? *img->assigned_path
                                    : assigned.lexically_relative(doc_dir).generic_string();

        // no dedup: identical images are stored once per occurrence
        r.assets.push_back(ExtractedAsset{*img->assigned_path, it->second});
    }

    return r;
}

} // namespace d2m
