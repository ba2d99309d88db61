#include "greedy_packer.hpp"

#include <utility>

namespace chunkwise {

void GreedyPacker::flush(std::string& accumulator) {
    if (accumulator.empty()) return;
    append_chunk(_out, accumulator);
    accumulator.clear();
}

void GreedyPacker::pack(
    const std::vector<std::string_view>& units,
    const EscapeFn& on_oversized,
    const EscapeFn& on_oversized_tail)
{
    std::string accumulator;

    for (const auto& unit : units) {
        if (_options.measure_unit_first && !_oracle.fits(unit, _budget)) {
            flush(accumulator);
            on_oversized(unit);
            continue;
        }

        std::string candidate;
        if (accumulator.empty()) {
            candidate = std::string(unit);
        } else {
            candidate.reserve(accumulator.size() + _options.separator.size() + unit.size());
            candidate.append(accumulator).append(_options.separator).append(unit);
        }

        if (_oracle.fits(candidate, _budget)) {
            accumulator = std::move(candidate);
            continue;
        }

        if (accumulator.empty()) {
            // Already measured alone: keep it, the tail check catches an inconsistent oracle.
            if (_options.measure_unit_first) accumulator = std::move(candidate);
            else on_oversized(unit);
            continue;
        }

        flush(accumulator);
        if (_options.measure_unit_first || _oracle.fits(unit, _budget)) {
            accumulator = std::string(unit);
        } else {
            on_oversized(unit);
        }
    }

    if (accumulator.empty()) return;
    if (_options.verify_tail && !_oracle.fits(accumulator, _budget)) {
        const EscapeFn& escape = on_oversized_tail ? on_oversized_tail : on_oversized;
        escape(accumulator);
        return;
    }
    flush(accumulator);
}

} // namespace chunkwise
