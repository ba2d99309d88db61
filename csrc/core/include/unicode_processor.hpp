#pragma once

#include <algorithm>
#include <array>
#include <functional>
#include <string_view>
#include <vector>
#include <utf8proc.h>

namespace chunkwise {

class UnicodeProcessor {
public:
    UnicodeProcessor(const std::string_view& text) : _text(text), _text_len(text.size()) {}

    // Spans separated by a blank line (a newline, optional whitespace, a newline). Trimmed, empties dropped.
    std::vector<std::string_view> split_paragraphs() const;

    // Spans closed by a run of terminal punctuation, which stays with its sentence. Trimmed, empties dropped.
    std::vector<std::string_view> split_sentences() const;

    // Byte offsets of extended grapheme cluster boundaries, starting with 0 and ending with the text size.
    // A byte that is not valid UTF-8 is a cluster of its own.
    std::vector<size_t> char_boundaries() const;

    // Strips leading and trailing whitespace code points (see is_space).
    static std::string_view trim(std::string_view input);
    static bool is_blank(std::string_view input) { return trim(input).empty(); }

    // \t through \r, U+FEFF, and the Zs, Zl and Zp categories (U+00A0, U+3000, U+2028, ...).
    static bool is_space(utf8proc_int32_t codepoint) {
        if (codepoint < 0) return false;
        if ((codepoint >= 0x09 && codepoint <= 0x0D) || codepoint == 0xFEFF) return true;
        const utf8proc_category_t category = utf8proc_category(codepoint);
        return category == UTF8PROC_CATEGORY_ZS || category == UTF8PROC_CATEGORY_ZL ||
               category == UTF8PROC_CATEGORY_ZP;
    }

private:
    struct Utf8Unit {
        size_t offset;
        size_t byte_len;
        utf8proc_int32_t codepoint;
    };
    using Utf8Visitor = std::function<void(size_t offset, size_t byte_len, utf8proc_int32_t codepoint)>;

    // Invalid bytes are visited one at a time with codepoint -1.
    void for_each_utf8_unit(const Utf8Visitor& visitor) const;
    std::vector<Utf8Unit> utf8_units() const;
    static bool is_sentence_terminator(utf8proc_int32_t codepoint) {
        return std::find(kTerminatorCodepoints.begin(), kTerminatorCodepoints.end(),
            static_cast<char32_t>(codepoint)) != kTerminatorCodepoints.end();
    }

    static const std::array<char32_t, 6> kTerminatorCodepoints;
    std::string_view _text;
    size_t _text_len = 0;
};

} // namespace chunkwise
