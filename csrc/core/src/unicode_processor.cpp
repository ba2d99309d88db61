#include "unicode_processor.hpp"
namespace chunkwise {

const std::array<char32_t, 6> UnicodeProcessor::kTerminatorCodepoints = {
    U'.',
    U'!',
    U'?',
    U'\u3002', // 。
    U'\uFF01', // ！
    U'\uFF1F', // ？
};

std::string_view UnicodeProcessor::trim(std::string_view input) {
    size_t begin = input.size();
    size_t end = 0;
    UnicodeProcessor(input).for_each_utf8_unit([&](size_t offset, size_t byte_len, utf8proc_int32_t codepoint) {
        if (is_space(codepoint)) return;
        if (begin == input.size()) begin = offset;
        end = offset + byte_len;
    });

    if (begin >= end) return input.substr(0, 0);
    return input.substr(begin, end - begin);
}

void UnicodeProcessor::for_each_utf8_unit(const Utf8Visitor& visitor) const {
    size_t i = 0;
    while (i < _text_len) {
        utf8proc_int32_t codepoint = -1;
        const utf8proc_ssize_t n = utf8proc_iterate(
            reinterpret_cast<const utf8proc_uint8_t*>(_text.data() + i),
            static_cast<utf8proc_ssize_t>(_text_len - i),
            &codepoint);

        if (n <= 0) {
            visitor(i, 1, -1);
            i += 1;
            continue;
        }

        visitor(i, static_cast<size_t>(n), codepoint);
        i += static_cast<size_t>(n);
    }
}

std::vector<UnicodeProcessor::Utf8Unit> UnicodeProcessor::utf8_units() const {
    std::vector<Utf8Unit> units;
    units.reserve(_text_len);
    for_each_utf8_unit([&](size_t offset, size_t byte_len, utf8proc_int32_t codepoint) {
        units.push_back(Utf8Unit{offset, byte_len, codepoint});
    });
    return units;
}

std::vector<std::string_view> UnicodeProcessor::split_paragraphs() const {
    std::vector<std::string_view> out;
    auto push_trimmed = [&](size_t begin, size_t end) {
        auto paragraph = trim(_text.substr(begin, end - begin));
        if (!paragraph.empty()) out.push_back(paragraph);
    };

    const std::vector<Utf8Unit> units = utf8_units();
    size_t start = 0;
    size_t i = 0;
    while (i < units.size()) {
        if (units[i].codepoint != '\n') {
            ++i;
            continue;
        }

        // The separator runs from this newline to the last newline of the whitespace run after it.
        size_t j = i + 1;
        size_t last_newline = units.size();
        while (j < units.size() && is_space(units[j].codepoint)) {
            if (units[j].codepoint == '\n') last_newline = j;
            ++j;
        }

        if (last_newline != units.size()) {
            push_trimmed(start, units[i].offset);
            start = units[last_newline].offset + 1;
        }
        i = j;
    }

    if (start < _text_len) push_trimmed(start, _text_len);
    return out;
}

std::vector<std::string_view> UnicodeProcessor::split_sentences() const {
    std::vector<std::string_view> out;
    auto push_trimmed = [&](size_t begin, size_t end) {
        auto sentence = trim(_text.substr(begin, end - begin));
        if (!sentence.empty()) out.push_back(sentence);
    };

    size_t sentence_start = 0;
    size_t run_end = std::string_view::npos;

    for_each_utf8_unit([&](size_t offset, size_t byte_len, utf8proc_int32_t codepoint) {
        if (is_sentence_terminator(codepoint)) {
            run_end = offset + byte_len;
            return;
        }
        if (run_end != std::string_view::npos) {
            push_trimmed(sentence_start, run_end);
            sentence_start = run_end;
            run_end = std::string_view::npos;
        }
    });

    if (sentence_start < _text_len) push_trimmed(sentence_start, _text_len);
    return out;
}

std::vector<size_t> UnicodeProcessor::char_boundaries() const {
    std::vector<size_t> out;
    out.reserve(_text_len + 1);
    out.push_back(0);
    if (_text.empty()) return out;

    utf8proc_int32_t prev = -1;
    utf8proc_int32_t state = 0;

    for_each_utf8_unit([&](size_t offset, size_t /*byte_len*/, utf8proc_int32_t codepoint) {
        if (offset == 0) {
            prev = codepoint;
            return;
        }
        if (codepoint < 0 || prev < 0) {
            out.push_back(offset);
            state = 0;
        } else if (utf8proc_grapheme_break_stateful(prev, codepoint, &state)) {
            out.push_back(offset);
        }
        prev = codepoint;
    });

    out.push_back(_text_len);
    return out;
}

} // namespace chunkwise
