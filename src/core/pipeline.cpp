#include "codeclean/core/pipeline.hpp"
#include "codeclean/core/comment_stripper.hpp"
#include "codeclean/core/line_tools.hpp"
#include "codeclean/formatters/json_formatter.hpp"
#include "codeclean/formatters/parse_error.hpp"
#include "codeclean/formatters/xml_formatter.hpp"
#include "codeclean/string_utils.hpp"

namespace codeclean {

namespace {

auto to_eol(EolTarget target) -> Eol {
    return target == EolTarget::CRLF ? Eol::CRLF : Eol::LF;
}

auto format_structured(const LanguageProfile& profile, const std::string& text) -> std::string {
    switch (profile.structure) {
    case StructuredFormat::JSON:
        return format_json(text);
    case StructuredFormat::XML:
        return format_xml(text);
    case StructuredFormat::NONE:
        break;
    }
    return text;
}

} // namespace

auto resolve_profile(const std::string& path, const Options& options,
                     std::vector<std::string>& warnings) -> const LanguageProfile* {
    if (options.language_override.empty()) {
        return classify(path);
    }

    if (const auto* profile = find_profile(options.language_override)) {
        return profile;
    }
    warnings.push_back("unknown language '" + options.language_override
                       + "', comments left in place");
    return nullptr;
}

auto process(const std::string& path, const std::string& raw_text, const Options& options)
    -> CleanResult {
    CleanResult result{.path = path, .original = raw_text};
    const auto* profile = resolve_profile(path, options, result.warnings);
    result.language = profile ? profile->id : "";

    std::string text = raw_text;

    if (profile && profile->structure != StructuredFormat::NONE) {
        try {
            auto formatted = format_structured(*profile, raw_text);
            auto eol = options.eol_target == EolTarget::UNCHANGED ? detect_eol(raw_text)
                                                                  : to_eol(options.eol_target);
            text = normalize_eol(formatted, eol);
            result.structurally_reformatted = true;
        } catch (const ParseError& e) {
            // File is left exactly as it was
            result.warnings.emplace_back(e.what());
        }
    } else {
        if (options.remove_comments && profile) {
            auto stripped = strip_comments(text, *profile);
            text = std::move(stripped.text);
            result.warnings.insert(result.warnings.end(), stripped.warnings.begin(),
                                   stripped.warnings.end());
        }
        if (options.remove_extra_blank_lines) {
            text = consolidate_blank_lines(text);
        }
        if (options.eol_target != EolTarget::UNCHANGED) {
            text = normalize_eol(text, to_eol(options.eol_target));
        }
    }

    result.cleaned = std::move(text);
    result.changes = diff_lines(result.original, result.cleaned);
    return result;
}

auto parse_eol_target(const std::string& text) -> std::optional<EolTarget> {
    auto value = StringUtils::to_lowercase(StringUtils::trim(text));
    if (value == "lf" || value == "unix") {
        return EolTarget::LF;
    }
    if (value == "crlf" || value == "windows") {
        return EolTarget::CRLF;
    }
    if (value == "keep" || value == "unchanged") {
        return EolTarget::UNCHANGED;
    }
    return std::nullopt;
}

auto eol_target_name(EolTarget target) -> std::string {
    switch (target) {
    case EolTarget::UNCHANGED:
        return "keep";
    case EolTarget::LF:
        return "lf";
    case EolTarget::CRLF:
        return "crlf";
    }
    return "keep";
}

} // namespace codeclean
