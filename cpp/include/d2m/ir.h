// d2m/cpp/include/d2m/ir.h
#pragma once
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace d2m {

// Blocks as produced by the format-specific extractors.

struct Heading {
    int level{1};                  // 1..6
    std::string text;
    std::optional<std::string> id; // final slug, set by normalize_headings
};

struct Paragraph {
    std::vector<std::string> runs; // inline text runs, in order
};

struct Image {
    std::string source_ref;                   // key into DocumentInput::raw_assets
    std::string alt_text;
    std::optional<std::string> assigned_path; // "assets/<doc>/<seq>.<ext>", root relative
    std::string href;                         // assigned_path relative to the document
};

struct Link {
    std::string target_ref;
    std::string display_text;
    std::optional<std::string> anchor;
    bool resolved{false};

    // target_ref + "#anchor"
    std::string href() const;
};

struct Table {
    std::vector<std::vector<std::string>> rows;
};

using Block = std::variant<Heading, Paragraph, Image, Link, Table>;

template <class... Fs>
struct Overloaded : Fs... {
    using Fs::operator()...;
};
template <class... Fs>
Overloaded(Fs...) -> Overloaded<Fs...>;

const char* block_kind(const Block& b);

} // namespace d2m
