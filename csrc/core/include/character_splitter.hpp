#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

#include "chunk.hpp"
#include "token_oracle.hpp"

namespace chunkwise {

// Characters taken when not even one character fits the budget.
constexpr size_t kFloorChars = 10;

/**
 *  @brief Split text that has no usable semantic boundary into budget-sized prefixes.
 *
 *  @details
 *  While text remains: if the remainder fits, emit it and stop. Otherwise binary-search the
 *  grapheme-cluster boundaries for the longest prefix the oracle accepts, emit it and continue
 *  with the trimmed suffix. O(log n) oracle calls per emitted chunk.
 *
 *  When no non-empty prefix fits, kFloorChars characters are emitted anyway with
 *  Chunk::over_budget set, so the loop always makes progress.
 */
void split_by_characters(std::string_view text, int budget, OracleSession& oracle, std::vector<Chunk>& out);

} // namespace chunkwise
