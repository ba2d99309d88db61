#pragma once

#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "chunk.hpp"
#include "token_oracle.hpp"

namespace chunkwise {

struct PackOptions {
    std::string_view separator;
    // Measure every unit alone before trying it against the accumulator (paragraph level).
    // Otherwise a unit is measured alone only once its candidate has overflowed (sentence level).
    bool measure_unit_first = false;
    // Re-measure the trailing accumulator before emitting it.
    bool verify_tail = false;
};

/*
 * Greedy packing of units (paragraphs, sentences) into chunks under a token budget.
 * Units are joined with the separator while the oracle says the joined text fits; a unit that does
 * not fit on its own is handed to on_oversized and never merged with its neighbours.
 */
class GreedyPacker {
public:
    using EscapeFn = std::function<void(std::string_view unit)>;

    GreedyPacker(int budget, OracleSession& oracle, std::vector<Chunk>& out, PackOptions options)
        : _budget(budget), _oracle(oracle), _out(out), _options(options) {}

    // on_oversized_tail is only consulted with verify_tail; it defaults to on_oversized.
    void pack(const std::vector<std::string_view>& units,
              const EscapeFn& on_oversized,
              const EscapeFn& on_oversized_tail = nullptr);

private:
    void flush(std::string& accumulator);

    int _budget;
    OracleSession& _oracle;
    std::vector<Chunk>& _out;
    PackOptions _options;
};

} // namespace chunkwise
