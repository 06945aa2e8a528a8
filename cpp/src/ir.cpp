#include "d2m/ir.h"

namespace d2m {

std::string Link::href() const {
    if (!anchor || anchor->empty()) return target_ref;
    return target_ref + "#" + *anchor;
}

const char* block_kind(const Block& b) {
    return std::visit(Overloaded{
        [](const Heading&)   { return "heading"; },
        [](const Paragraph&) { return "paragraph"; },
        [](const Image&)     { return "image"; },
        [](const Link&)      { return "link"; },
        [](const Table&)     { return "table"; },
    }, b);
}

} // namespace d2m
