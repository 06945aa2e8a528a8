// d2m/cpp/include/d2m/link_resolver.h
#pragma once
#include <string>

#include "d2m/document.h"
#include "d2m/link_registry.h"

namespace d2m {

constexpr const char* kWarnUnresolvedLink = "unresolved internal link";
constexpr const char* kWarnAnchorNotFound = "anchor not found in target document";

// http:, mailto:, //host/... and so on.
bool is_external_ref(const std::string& ref);

// Phase 2 for one Phase1Done document. Broken links only add warnings.
void resolve_links(Document& doc, const LinkRegistry& links);

} // namespace d2m
