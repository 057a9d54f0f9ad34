#include "codeclean/core/comment_stripper.hpp"
#include "codeclean/string_utils.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <optional>

namespace codeclean {

namespace {

constexpr size_t MAX_RAW_DELIMITER = 16;

// A '/' after one of these starts a regex literal rather than a division
constexpr std::string_view REGEX_PRECEDERS = "(,=:[!&|?{};+-*%~^";
constexpr std::array<std::string_view, 12> REGEX_KEYWORDS = {
    "return", "typeof", "instanceof", "case", "in", "of",
    "delete", "void", "throw", "new", "yield", "await"};

auto is_horizontal_space(char c) -> bool {
    return c == ' ' || c == '\t' || c == '\f' || c == '\v';
}

auto is_space(char c) -> bool {
    return is_horizontal_space(c) || c == '\n' || c == '\r';
}

auto is_word_char(char c) -> bool {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

// Length of the line terminator starting at pos (CRLF counts as one unit)
auto eol_length(std::string_view text, size_t pos) -> size_t {
    if (pos >= text.size()) {
        return 0;
    }
    if (text[pos] == '\r') {
        return (pos + 1 < text.size() && text[pos + 1] == '\n') ? 2 : 1;
    }
    return text[pos] == '\n' ? 1 : 0;
}

auto starts_with_ci(std::string_view text, size_t pos, std::string_view prefix) -> bool {
    if (pos + prefix.size() > text.size()) {
        return false;
    }
    for (size_t i = 0; i < prefix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(text[pos + i]))
            != std::tolower(static_cast<unsigned char>(prefix[i]))) {
            return false;
        }
    }
    return true;
}

struct QuoteMatch {
    const QuoteRule* rule = nullptr;
    size_t length{};                   // Opening text copied to the output
    std::string close;
};

class Scanner {
public:
    Scanner(std::string_view text, const LanguageProfile& profile)
        : text_(text), profile_(profile) {
        state_.output.reserve(text.size());
        state_.in_template_text = !profile.code_region_openers.empty();
    }

    auto run() -> StripResult {
        keep_shebang();
        while (state_.pos < text_.size()) {
            switch (state_.mode) {
            case ScanMode::CODE:
                step_code();
                break;
            case ScanMode::STRING:
                step_string();
                break;
            case ScanMode::LINE_COMMENT:
                step_line_comment();
                break;
            case ScanMode::BLOCK_COMMENT:
                step_block_comment();
                break;
            }
        }
        finish();
        return StripResult{.text = std::move(state_.output), .warnings = std::move(warnings_)};
    }

private:
    std::string_view text_;
    const LanguageProfile& profile_;
    ScanState state_;
    std::vector<std::string> warnings_;

    // "#!" on the first line is an interpreter directive, not a comment
    auto keep_shebang() -> void {
        const auto& markers = profile_.line_comments;
        if (!text_.starts_with("#!")
            || std::find(markers.begin(), markers.end(), "#") == markers.end()) {
            return;
        }
        while (state_.pos < text_.size() && eol_length(text_, state_.pos) == 0) {
            ++state_.pos;
        }
        state_.output.append(text_.substr(0, state_.pos));
        if (auto eol = eol_length(text_, state_.pos)) {
            copy_eol(eol);
        }
    }

    auto at(std::string_view marker) const -> bool {
        return StringUtils::starts_with_at(text_, state_.pos, marker);
    }

    auto copy_char() -> void {
        if (auto eol = eol_length(text_, state_.pos)) {
            copy_eol(eol);
            return;
        }
        state_.output.push_back(text_[state_.pos]);
        ++state_.pos;
    }

    // Copies `length` bytes that hold no line terminator
    auto copy_text(size_t length) -> void {
        state_.output.append(text_.substr(state_.pos, length));
        state_.pos += length;
    }

    auto copy_eol(size_t length) -> void {
        state_.output.append(text_.substr(state_.pos, length));
        state_.pos += length;
        ++state_.line;
        state_.output_line_start = state_.output.size();
    }

    auto skip_eol(size_t length) -> void {
        state_.pos += length;
        ++state_.line;
    }

    auto current_line_is_blank() const -> bool {
        return StringUtils::is_blank(
            std::string_view(state_.output).substr(state_.output_line_start));
    }

    auto trim_trailing_space() -> void {
        auto& out = state_.output;
        while (out.size() > state_.output_line_start && is_horizontal_space(out.back())) {
            out.pop_back();
        }
    }

    auto at_boundary() const -> bool {
        return state_.pos == 0 || is_space(text_[state_.pos - 1]);
    }

    // Delimiter of a raw string whose prefix ends at `start`, up to the '('
    auto raw_delimiter_at(size_t start) const -> std::optional<std::string_view> {
        for (size_t i = start; i < text_.size() && i - start <= MAX_RAW_DELIMITER; ++i) {
            char c = text_[i];
            if (c == '(') {
                return text_.substr(start, i - start);
            }
            if (is_space(c) || c == '\\' || c == ')' || c == '"') {
                return std::nullopt;
            }
        }
        return std::nullopt;
    }

    // Judged from the output, so a removed comment in between does not count
    auto regex_allowed() const -> bool {
        size_t next = state_.pos + 1;
        if (next < text_.size() && (text_[next] == '/' || text_[next] == '*')) {
            return false;
        }

        std::string_view out = state_.output;
        size_t end = out.size();
        while (end > state_.output_line_start && is_horizontal_space(out[end - 1])) {
            --end;
        }
        if (end == state_.output_line_start) {
            return true;
        }
        char last = out[end - 1];
        if ((last == '+' || last == '-') && end - state_.output_line_start >= 2
            && out[end - 2] == last) {
            return false;  // a++ / 2
        }
        if (REGEX_PRECEDERS.find(last) != std::string_view::npos) {
            return true;
        }

        size_t start = end;
        while (start > state_.output_line_start && is_word_char(out[start - 1])) {
            --start;
        }
        auto word = out.substr(start, end - start);
        return std::find(REGEX_KEYWORDS.begin(), REGEX_KEYWORDS.end(), word)
               != REGEX_KEYWORDS.end();
    }

    // Longest configured quote opener at the cursor, if quotes are active here
    auto match_quote() const -> QuoteMatch {
        QuoteMatch best;
        if (profile_.markup && !state_.in_tag) {
            return best;
        }
        for (const auto& rule : profile_.quotes) {
            if (!at(rule.open) || (best.rule && rule.open.size() <= best.rule->open.size())) {
                continue;
            }
            if (rule.regex_literal && !regex_allowed()) {
                continue;
            }
            if (rule.raw_delimiter) {
                auto delimiter = raw_delimiter_at(state_.pos + rule.open.size());
                if (!delimiter) {
                    continue;
                }
                best = QuoteMatch{.rule = &rule,
                                  .length = rule.open.size() + delimiter->size() + 1,
                                  .close = ")" + std::string(*delimiter) + rule.close};
                continue;
            }
            best = QuoteMatch{.rule = &rule, .length = rule.open.size(), .close = rule.close};
        }
        return best;
    }

    auto longest_block(const std::vector<BlockComment>& blocks) const -> const BlockComment* {
        const BlockComment* best = nullptr;
        for (const auto& block : blocks) {
            if (at(block.open) && (!best || block.open.size() > best->open.size())) {
                best = &block;
            }
        }
        return best;
    }

    auto match_block() const -> const BlockComment* {
        if (profile_.markup && state_.in_tag) {
            return nullptr;
        }
        return longest_block(profile_.block_comments);
    }

    auto match_line_marker() const -> size_t {
        if (profile_.comment_needs_boundary && !at_boundary()) {
            return 0;
        }
        size_t best = 0;
        for (const auto& marker : profile_.line_comments) {
            if (at(marker)) {
                best = std::max(best, marker.size());
            }
        }
        return best;
    }

    auto open_block_comment(const BlockComment& block) -> void {
        state_.mode = ScanMode::BLOCK_COMMENT;
        state_.active_block = &block;
        state_.block_depth = 1;
        state_.mode_start_line = state_.line;
        state_.comment_owns_line = current_line_is_blank();
        state_.pos += block.open.size();
    }

    auto step_code() -> void {
        if (state_.in_template_text) {
            step_template_text();
            return;
        }
        if (!profile_.code_region_close.empty() && at(profile_.code_region_close)) {
            copy_text(profile_.code_region_close.size());
            state_.in_template_text = true;
            return;
        }

        if (profile_.markup && !state_.raw_text_end.empty()) {
            if (!starts_with_ci(text_, state_.pos, state_.raw_text_end)) {
                copy_char();
                return;
            }
            state_.raw_text_end.clear();
        }

        if (auto quote = match_quote(); quote.rule) {
            state_.mode = ScanMode::STRING;
            state_.active_quote = quote.rule;
            state_.active_close = std::move(quote.close);
            state_.in_regex_class = false;
            state_.mode_start_line = state_.line;
            copy_text(quote.length);
            return;
        }

        if (const auto* block = match_block()) {
            open_block_comment(*block);
            return;
        }

        if (auto marker_length = match_line_marker()) {
            trim_trailing_space();
            state_.mode = ScanMode::LINE_COMMENT;
            state_.comment_owns_line = current_line_is_blank();
            state_.pos += marker_length;
            return;
        }

        if (profile_.markup) {
            track_tag();
        }
        copy_char();
    }

    // Outside embedded code only template comments are recognised
    auto step_template_text() -> void {
        for (const auto& opener : profile_.code_region_openers) {
            if (starts_with_ci(text_, state_.pos, opener)) {
                copy_text(opener.size());
                state_.in_template_text = false;
                return;
            }
        }
        if (const auto* block = longest_block(profile_.template_block_comments)) {
            open_block_comment(*block);
            return;
        }
        copy_char();
    }

    // Called on the character about to be copied in CODE mode
    auto track_tag() -> void {
        char c = text_[state_.pos];
        if (!state_.in_tag && c == '<' && state_.pos + 1 < text_.size()) {
            char next = text_[state_.pos + 1];
            if (std::isalpha(static_cast<unsigned char>(next)) || next == '/' || next == '!'
                || next == '?') {
                state_.in_tag = true;
                state_.pending_raw_element = raw_element_at(state_.pos + 1);
            }
        } else if (state_.in_tag && c == '>') {
            state_.in_tag = false;
            bool self_closing = state_.pos > 0 && text_[state_.pos - 1] == '/';
            if (!state_.pending_raw_element.empty() && !self_closing) {
                state_.raw_text_end = "</" + state_.pending_raw_element;
            }
            state_.pending_raw_element.clear();
        }
    }

    auto raw_element_at(size_t name_start) const -> std::string {
        size_t end = name_start;
        while (end < text_.size()
               && (std::isalnum(static_cast<unsigned char>(text_[end])) || text_[end] == '-')) {
            ++end;
        }
        auto name = StringUtils::to_lowercase(text_.substr(name_start, end - name_start));
        const auto& raw = profile_.raw_text_elements;
        return std::find(raw.begin(), raw.end(), name) != raw.end() ? name : std::string{};
    }

    auto step_string() -> void {
        const auto& rule = *state_.active_quote;

        if (rule.backslash_escapes && text_[state_.pos] == '\\'
            && state_.pos + 1 < text_.size()) {
            state_.output.push_back('\\');
            ++state_.pos;
            copy_char();
            return;
        }

        if (rule.regex_literal) {
            char c = text_[state_.pos];
            if (c == '[') {
                state_.in_regex_class = true;
            } else if (c == ']') {
                state_.in_regex_class = false;
            } else if (state_.in_regex_class && at(state_.active_close)) {
                copy_char();  // "/" inside a character class
                return;
            }
        }

        if (at(state_.active_close)) {
            copy_text(state_.active_close.size());
            state_.mode = ScanMode::CODE;
            state_.active_quote = nullptr;
            return;
        }

        if (eol_length(text_, state_.pos) > 0 && !rule.multiline) {
            warn_unterminated_string();
            state_.mode = ScanMode::CODE;
            state_.active_quote = nullptr;
            return;
        }

        copy_char();
    }

    auto step_line_comment() -> void {
        if (auto eol = eol_length(text_, state_.pos)) {
            state_.mode = ScanMode::CODE;
            if (state_.comment_owns_line) {
                trim_trailing_space();
                skip_eol(eol);
            }
            return;
        }

        for (const auto& terminator : profile_.line_comment_terminators) {
            if (at(terminator)) {
                // The terminator belongs to the code that follows
                state_.mode = ScanMode::CODE;
                if (!current_line_is_blank()) {
                    state_.output.push_back(' ');
                }
                return;
            }
        }
        ++state_.pos;
    }

    auto step_block_comment() -> void {
        const auto& block = *state_.active_block;

        if (profile_.nested_block_comments && at(block.open)) {
            ++state_.block_depth;
            state_.pos += block.open.size();
            return;
        }

        if (at(block.close)) {
            state_.pos += block.close.size();
            if (--state_.block_depth == 0) {
                state_.mode = ScanMode::CODE;
                state_.active_block = nullptr;
                close_block_comment();
            }
            return;
        }

        if (auto eol = eol_length(text_, state_.pos)) {
            skip_eol(eol);
            return;
        }
        ++state_.pos;
    }

    auto close_block_comment() -> void {
        size_t next = state_.pos;
        while (next < text_.size() && is_horizontal_space(text_[next])) {
            ++next;
        }

        auto eol = eol_length(text_, next);
        if (eol > 0 || next == text_.size()) {
            // Nothing but whitespace follows on this line
            trim_trailing_space();
            state_.pos = next;
            if (state_.comment_owns_line && state_.output.size() == state_.output_line_start) {
                skip_eol(eol);
            }
            return;
        }

        const auto& out = state_.output;
        if (out.size() == state_.output_line_start || is_horizontal_space(out.back())) {
            state_.pos = next;
        } else if (!is_space(text_[state_.pos])) {
            // Keep neighbouring tokens apart
            state_.output.push_back(' ');
        }
    }

    auto warn_unterminated_string() -> void {
        warnings_.push_back("unterminated string literal starting at line "
                            + std::to_string(state_.mode_start_line));
    }

    auto finish() -> void {
        switch (state_.mode) {
        case ScanMode::BLOCK_COMMENT:
            warnings_.push_back("unterminated block comment starting at line "
                                + std::to_string(state_.mode_start_line));
            trim_trailing_space();
            break;
        case ScanMode::STRING:
            warn_unterminated_string();
            break;
        case ScanMode::LINE_COMMENT:
        case ScanMode::CODE:
            break;
        }
    }
};

} // namespace

auto strip_comments(std::string_view text, const LanguageProfile& profile) -> StripResult {
    Scanner scanner(text, profile);
    return scanner.run();
}

} // namespace codeclean
