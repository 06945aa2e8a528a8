// d2m/cpp/common/text_common.cpp
#include "text_common.h"

#include <algorithm>
#include <cctype>
#include <string_view>

namespace {

struct Utf8Dec {
    uint32_t cp{0};
    size_t   len{1};
    bool     ok{false};
};

static inline bool is_cont(unsigned char c) { return (c & 0xC0) == 0x80; }

static inline Utf8Dec decode_utf8(std::string_view s, size_t i) {
    Utf8Dec r{};
    if (i >= s.size()) return r;

    const unsigned char c0 = (unsigned char)s[i];
    if (c0 < 0x80) {
        r.cp = c0; r.len = 1; r.ok = true;
        return r;
    }

    size_t len = 0;
    if (c0 >= 0xC2 && c0 <= 0xDF) len = 2;
    else if (c0 >= 0xE0 && c0 <= 0xEF) len = 3;
    else if (c0 >= 0xF0 && c0 <= 0xF4) len = 4;
    else return r;

    if (i + len > s.size()) return r;

    const unsigned char c1 = (unsigned char)s[i + 1];
    if (!is_cont(c1)) return r;

    if (len == 2) {
        r.cp = ((uint32_t)(c0 & 0x1F) << 6) | (uint32_t)(c1 & 0x3F);
        r.len = 2; r.ok = true;
        return r;
    }

    const unsigned char c2 = (unsigned char)s[i + 2];
    if (!is_cont(c2)) return r;

    if (len == 3) {
        // overlong / surrogate checks
        if (c0 == 0xE0 && c1 < 0xA0) return r;
        if (c0 == 0xED && c1 >= 0xA0) return r;
        r.cp = ((uint32_t)(c0 & 0x0F) << 12)
             | ((uint32_t)(c1 & 0x3F) << 6)
             |  (uint32_t)(c2 & 0x3F);
        r.len = 3; r.ok = true;
        return r;
    }

    const unsigned char c3 = (unsigned char)s[i + 3];
    if (!is_cont(c3)) return r;

    if (c0 == 0xF0 && c1 < 0x90) return r;
    if (c0 == 0xF4 && c1 > 0x8F) return r;

    const uint32_t cp = ((uint32_t)(c0 & 0x07) << 18)
                      | ((uint32_t)(c1 & 0x3F) << 12)
                      | ((uint32_t)(c2 & 0x3F) << 6)
                      |  (uint32_t)(c3 & 0x3F);
    if (cp > 0x10FFFF) return r;

    r.cp = cp; r.len = 4; r.ok = true;
    return r;
}

static inline void append_utf8(uint32_t cp, std::string& out) {
    if (cp <= 0x7F) {
        out.push_back((char)cp);
    } else if (cp <= 0x7FF) {
        out.push_back((char)(0xC0 | ((cp >> 6) & 0x1F)));
        out.push_back((char)(0x80 | (cp & 0x3F)));
    } else if (cp <= 0xFFFF) {
        out.push_back((char)(0xE0 | ((cp >> 12) & 0x0F)));
        out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back((char)(0x80 | (cp & 0x3F)));
    } else {
        out.push_back((char)(0xF0 | ((cp >> 18) & 0x07)));
        out.push_back((char)(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back((char)(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back((char)(0x80 | (cp & 0x3F)));
    }
}

static inline bool is_ascii_alnum_lower(unsigned char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z');
}

static inline uint32_t to_lower_cp(uint32_t cp) {
    // ASCII
    if (cp >= 'A' && cp <= 'Z') return cp - 'A' + 'a';

    // Latin-1 À..Þ (minus ×)
    if (cp >= 0x00C0 && cp <= 0x00DE && cp != 0x00D7) return cp + 0x20;

    // Latin Extended-A: pairs upper/lower, with the odd-aligned block 0x139..0x148
    if (cp >= 0x0100 && cp <= 0x0137) return (cp % 2 == 0) ? cp + 1 : cp;
    if (cp >= 0x0139 && cp <= 0x0148) return (cp % 2 == 1) ? cp + 1 : cp;
    if (cp >= 0x014A && cp <= 0x0177) return (cp % 2 == 0) ? cp + 1 : cp;
    if (cp == 0x0178) return 0x00FF;
    if (cp == 0x0179 || cp == 0x017B || cp == 0x017D) return cp + 1;

    // Latin Extended-B: the regular pair blocks (Ǎ, Ș, Ț, ...)
    if (cp >= 0x01CD && cp <= 0x01DC) return (cp % 2 == 1) ? cp + 1 : cp;
    if (cp >= 0x01DE && cp <= 0x01EF) return (cp % 2 == 0) ? cp + 1 : cp;
    if (cp >= 0x01F8 && cp <= 0x021F) return (cp % 2 == 0) ? cp + 1 : cp;
    if (cp >= 0x0222 && cp <= 0x0233) return (cp % 2 == 0) ? cp + 1 : cp;

    // Greek: accented capitals, then Α..Ω
    if (cp == 0x0386) return 0x03AC;
    if (cp >= 0x0388 && cp <= 0x038A) return cp + 0x25;
    if (cp == 0x038C) return 0x03CC;
    if (cp == 0x038E || cp == 0x038F) return cp + 0x3F;
    if (cp >= 0x0391 && cp <= 0x03AB && cp != 0x03A2) return cp + 0x20;

    // Cyrillic А..Я, Ѐ..Џ, then the supplement pairs (Kazakh Ә Ғ Қ Ң Ө Ұ Ү Һ, ...)
    if (cp >= 0x0410 && cp <= 0x042F) return cp + 0x20;
    if (cp >= 0x0400 && cp <= 0x040F) return cp + 0x50;
    if (cp >= 0x0460 && cp <= 0x0481) return (cp % 2 == 0) ? cp + 1 : cp;
    if (cp >= 0x048A && cp <= 0x04BF) return (cp % 2 == 0) ? cp + 1 : cp;
    if (cp == 0x04C0) return 0x04CF;
    if (cp >= 0x04C1 && cp <= 0x04CE) return (cp % 2 == 1) ? cp + 1 : cp;
    if (cp >= 0x04D0 && cp <= 0x052F) return (cp % 2 == 0) ? cp + 1 : cp;

    // Armenian Ա..Ֆ
    if (cp >= 0x0531 && cp <= 0x0556) return cp + 0x30;

    // Latin Extended Additional (Vietnamese, ...)
    if (cp >= 0x1E00 && cp <= 0x1E95) return (cp % 2 == 0) ? cp + 1 : cp;
    if (cp >= 0x1EA0 && cp <= 0x1EFF) return (cp % 2 == 0) ? cp + 1 : cp;

    // fullwidth Ａ..Ｚ
    if (cp >= 0xFF21 && cp <= 0xFF3A) return cp + 0x20;

    return cp;
}

// Letters, digits and combining marks count as word characters. Script
// blocks are taken whole, minus their punctuation and symbols.
static inline bool is_word_cp(uint32_t cp) {
    if (cp <= 0x7F) return is_ascii_alnum_lower((unsigned char)cp);

    // Latin-1 letters
    if (cp >= 0x00C0 && cp <= 0x00FF) return cp != 0x00D7 && cp != 0x00F7;
    if (cp == 0x00AA || cp == 0x00B5 || cp == 0x00BA) return true;

    // Latin Extended-A/B, IPA, combining diacritics
    if (cp >= 0x0100 && cp <= 0x02AF) return true;
    if (cp >= 0x0300 && cp <= 0x036F) return true;

    // Greek and Coptic
    if (cp >= 0x0370 && cp <= 0x03FF) {
        return cp != 0x0375 && cp != 0x037E && cp != 0x0384 && cp != 0x0385 && cp != 0x0387 && cp != 0x03F6;
    }

    // Cyrillic, Cyrillic Supplement
    if (cp >= 0x0400 && cp <= 0x052F) return cp < 0x0482 || cp > 0x0489 || (cp >= 0x0483 && cp <= 0x0487);

    // Armenian
    if (cp >= 0x0531 && cp <= 0x0556) return true;
    if (cp >= 0x0561 && cp <= 0x0587) return true;

    // Hebrew: points and letters, not maqaf/sof pasuq/geresh
    if (cp >= 0x0591 && cp <= 0x05C7) return cp != 0x05BE && cp != 0x05C0 && cp != 0x05C3 && cp != 0x05C6;
    if (cp >= 0x05D0 && cp <= 0x05F2) return true;

    // Arabic, Syriac, Thaana, NKo, Samaritan, Mandaic, Arabic Extended
    if (cp >= 0x0600 && cp <= 0x08FF) {
        if (cp <= 0x060F) return false;                        // signs, comma, date separator
        if (cp == 0x061B || cp == 0x061D || cp == 0x061E || cp == 0x061F) return false;
        if (cp >= 0x066A && cp <= 0x066D) return false;        // percent, separators, star
        if (cp == 0x06D4 || cp == 0x06DD || cp == 0x06DE || cp == 0x06E9) return false;
        if (cp >= 0x0700 && cp <= 0x070F) return false;        // Syriac punctuation
        if (cp >= 0x07F6 && cp <= 0x07F9) return false;        // NKo punctuation
        if (cp >= 0x0830 && cp <= 0x083E) return false;        // Samaritan punctuation
        if (cp == 0x085E) return false;
        return true;
    }

    // Indic scripts (Devanagari .. Sinhala), minus dandas
    if (cp >= 0x0900 && cp <= 0x0DFF) return cp != 0x0964 && cp != 0x0965 && cp != 0x0970 && cp != 0x0DF4;

    // Thai, Lao, minus Baht sign and Thai punctuation
    if (cp >= 0x0E01 && cp <= 0x0EFF) return cp != 0x0E3F && cp != 0x0E4F && cp != 0x0E5A && cp != 0x0E5B;

    // Georgian, Hangul Jamo, Ethiopic
    if (cp >= 0x10A0 && cp <= 0x10FF) return cp != 0x10FB;
    if (cp >= 0x1100 && cp <= 0x11FF) return true;
    if (cp >= 0x1200 && cp <= 0x135A) return true;

    // Khmer letters and signs
    if (cp >= 0x1780 && cp <= 0x17D3) return true;
    if (cp >= 0x17E0 && cp <= 0x17E9) return true;

    // Latin Extended Additional, Greek Extended (minus spacing accents)
    if (cp >= 0x1E00 && cp <= 0x1EFF) return true;
    if (cp >= 0x1F00 && cp <= 0x1FFF) {
        return cp != 0x1FBD && !(cp >= 0x1FBF && cp <= 0x1FC1) && !(cp >= 0x1FCD && cp <= 0x1FCF) &&
               !(cp >= 0x1FDD && cp <= 0x1FDF) && !(cp >= 0x1FED && cp <= 0x1FEF) &&
               cp != 0x1FFD && cp != 0x1FFE;
    }

    // kana (minus the middle dot), CJK, hangul syllables
    if (cp >= 0x3041 && cp <= 0x30FF) return cp != 0x30A0 && cp != 0x30FB;
    if (cp >= 0x3400 && cp <= 0x4DBF) return true;
    if (cp >= 0x4E00 && cp <= 0x9FFF) return true;
    if (cp >= 0xAC00 && cp <= 0xD7AF) return true;
    if (cp >= 0xF900 && cp <= 0xFAFF) return true;

    // Arabic presentation forms, fullwidth digits and letters
    if (cp >= 0xFB1D && cp <= 0xFDFB) return cp != 0xFD3E && cp != 0xFD3F;
    if (cp >= 0xFE70 && cp <= 0xFEFC) return true;
    if (cp >= 0xFF10 && cp <= 0xFF19) return true;
    if (cp >= 0xFF41 && cp <= 0xFF5A) return true;

    // CJK extensions B..
    if (cp >= 0x20000 && cp <= 0x3134F) return true;

    return false;
}

} // namespace

void fold_for_slug_to(std::string_view s, std::string& out) {
    out.clear();
    out.reserve(s.size());

    bool prev_dash = true; // suppresses leading '-'

    for (size_t i = 0; i < s.size();) {
        const unsigned char b = (unsigned char)s[i];

        // ASCII fast path
        if (b < 0x80) {
            unsigned char c = b;
            if (c >= 'A' && c <= 'Z') c = (unsigned char)(c - 'A' + 'a');

            if (is_ascii_alnum_lower(c)) {
                out.push_back((char)c);
                prev_dash = false;
            } else if (!prev_dash) {
                out.push_back('-');
                prev_dash = true;
            }
            ++i;
            continue;
        }

        Utf8Dec d = decode_utf8(s, i);
        if (!d.ok) {
            if (!prev_dash) {
                out.push_back('-');
                prev_dash = true;
            }
            ++i;
            continue;
        }

        const uint32_t cp = to_lower_cp(d.cp);
        if (is_word_cp(cp)) {
            append_utf8(cp, out);
            prev_dash = false;
        } else if (!prev_dash) {
            out.push_back('-');
            prev_dash = true;
        }

        i += d.len;
    }

    if (!out.empty() && out.back() == '-') out.pop_back();
}

std::string fold_for_slug(std::string_view s) {
    std::string out;
    fold_for_slug_to(s, out);
    return out;
}

size_t utf8_length(std::string_view s) {
    size_t n = 0;
    for (size_t i = 0; i < s.size();) {
        Utf8Dec d = decode_utf8(s, i);
        i += d.ok ? d.len : 1;
        ++n;
    }
    return n;
}

size_t utf8_prefix_bytes(std::string_view s, size_t n_code_points) {
    size_t i = 0;
    size_t n = 0;
    while (i < s.size() && n < n_code_points) {
        Utf8Dec d = decode_utf8(s, i);
        i += d.ok ? d.len : 1;
        ++n;
    }
    return i;
}

static inline int hex_val(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string percent_decode(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            const int hi = hex_val(s[i + 1]);
            const int lo = hex_val(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back((char)((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        out.push_back(s[i]);
    }
    return out;
}

std::string to_lower_copy(std::string s) {
    for (auto& c : s) c = (char)std::tolower((unsigned char)c);
    return s;
}

std::string trim_copy(std::string_view s) {
    auto is_ws = [](unsigned char c) { return std::isspace(c) != 0; };
    size_t a = 0;
    while (a < s.size() && is_ws((unsigned char)s[a])) ++a;
    size_t b = s.size();
    while (b > a && is_ws((unsigned char)s[b - 1])) --b;
    return std::string(s.substr(a, b - a));
}
