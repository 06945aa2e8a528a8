// d2m/cpp/common/text_common.h
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

// Slug folding (UTF-8 aware):
// - ASCII: lower, keep [a-z0-9]
// - Latin, Greek, Cyrillic, Armenian letters: lower, keep
// - other letter scripts (Hebrew, Arabic, Indic, Thai, Georgian, CJK, kana, hangul, ...)
//   and combining marks: keep as is
// - everything else (punctuation, spaces, invalid bytes) -> one '-' per run
// - no leading/trailing '-'
std::string fold_for_slug(std::string_view s);
void fold_for_slug_to(std::string_view s, std::string& out);

// Number of code points (invalid bytes count as one each).
size_t utf8_length(std::string_view s);

// Byte length of the first n code points.
size_t utf8_prefix_bytes(std::string_view s, size_t n_code_points);

// "%20" -> ' '; malformed escapes are kept verbatim.
std::string percent_decode(std::string_view s);

std::string to_lower_copy(std::string s);
std::string trim_copy(std::string_view s);
