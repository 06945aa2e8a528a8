// d2m/cpp/src/validator.cpp
#include "d2m/validator.h"

#include <sstream>

#include "text_common.h"

namespace d2m {

ValidationResult validate_blocks(const std::vector<Block>& blocks) {
    ValidationResult vr;

    for (size_t i = 0; i < blocks.size(); ++i) {
        const Block& b = blocks[i];
        std::ostringstream oss;

        std::visit(Overloaded{
            [&](const Heading& h) {
                if (h.level < 1 || h.level > 6) {
                    oss << "block " << i << ": heading level " << h.level << " out of range 1..6";
                }
            },
            [&](const Paragraph&) {},
            [&](const Image& img) {
                if (trim_copy(img.source_ref).empty()) {
                    oss << "block " << i << ": image without source reference";
                }
            },
            [&](const Link& l) {
                if (trim_copy(l.target_ref).empty() && (!l.anchor || l.anchor->empty())) {
                    oss << "block " << i << ": link without target";
                }
            },
            [&](const Table& t) {
                if (t.rows.empty()) {
                    oss << "block " << i << ": table has no rows";
                }
            },
        }, b);

        const std::string msg = oss.str();
        if (!msg.empty()) vr.errors.push_back("malformed IR: " + msg);
    }

    vr.ok = vr.errors.empty();
    return vr;
}

} // namespace d2m
