#include "character_splitter.hpp"

#include <algorithm>
#include <iostream>

#include "unicode_processor.hpp"

namespace chunkwise {

void split_by_characters(std::string_view text, int budget, OracleSession& oracle, std::vector<Chunk>& out) {
    const std::string_view source = UnicodeProcessor::trim(text);
    if (source.empty()) return;

    // bounds[i] is the byte offset of character i; bounds[last] == source.size().
    const std::vector<size_t> bounds = UnicodeProcessor(source).char_boundaries();
    const size_t last = bounds.size() - 1;
    auto slice = [&](size_t from, size_t to) {
        return source.substr(bounds[from], bounds[to] - bounds[from]);
    };

    size_t pos = 0;
    while (pos < last) {
        if (oracle.fits(slice(pos, last), budget)) {
            append_chunk(out, slice(pos, last));
            return;
        }

        // Largest end index confirmed to fit; pos means none so far. The full remainder is known not to fit.
        size_t left = pos;
        size_t right = last;
        size_t best = pos;
        while (left + 1 < right) {
            const size_t mid = left + (right - left) / 2;
            if (oracle.fits(slice(pos, mid), budget)) {
                best = mid;
                left = mid;
            } else {
                right = mid;
            }
        }

        bool over_budget = false;
        if (best == pos) {
            best = std::min(pos + kFloorChars, last);
            over_budget = true;
            std::cerr << "[chunkwise] no prefix fits budget " << budget << "; emitting " << (best - pos)
                      << " characters over budget at byte offset " << bounds[pos] << std::endl;
        }

        append_chunk(out, slice(pos, best), over_budget);
        pos = best;
        while (pos < last && UnicodeProcessor::is_blank(slice(pos, pos + 1))) ++pos;
    }
}

} // namespace chunkwise
