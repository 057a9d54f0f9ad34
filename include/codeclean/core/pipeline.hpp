#pragma once

#include "codeclean/core/language_profile.hpp"
#include "codeclean/core/line_diff.hpp"
#include <optional>
#include <string>
#include <vector>

namespace codeclean {

enum class EolTarget {
    UNCHANGED,
    LF,
    CRLF
};

struct Options {
    bool remove_comments = true;
    bool remove_extra_blank_lines = true;
    EolTarget eol_target = EolTarget::UNCHANGED;
    std::string language_override;     // Profile id; empty means classify by extension
};

struct CleanResult {
    std::string path;
    std::string language;              // Profile id, empty when unknown
    std::string original;
    std::string cleaned;
    std::vector<ChangedRange> changes;
    bool structurally_reformatted = false;
    std::vector<std::string> warnings;

    auto has_warnings() const -> bool { return !warnings.empty(); }
    auto changed() const -> bool { return original != cleaned; }
};

// Runs the enabled cleaning steps on one file's text. Pure: never touches storage.
//   JSON/XML: structural reformat (falls back to the original text on ParseError),
//             then line endings
//   others:   comments -> blank lines -> line endings
auto process(const std::string& path, const std::string& raw_text, const Options& options)
    -> CleanResult;

auto resolve_profile(const std::string& path, const Options& options,
                     std::vector<std::string>& warnings) -> const LanguageProfile*;

auto parse_eol_target(const std::string& text) -> std::optional<EolTarget>;
auto eol_target_name(EolTarget target) -> std::string;

} // namespace codeclean
