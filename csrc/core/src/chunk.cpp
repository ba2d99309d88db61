#include "chunk.hpp"
#include "unicode_processor.hpp"

#include <utility>

namespace chunkwise {

void append_chunk(std::vector<Chunk>& out, std::string_view text, bool over_budget) {
    auto trimmed = UnicodeProcessor::trim(text);
    if (trimmed.empty()) return;

    Chunk chunk;
    chunk.text = std::string(trimmed);
    chunk.index = out.size();
    chunk.over_budget = over_budget;
    chunk.content_hash = evaluate_text_hash(chunk.text);
    out.push_back(std::move(chunk));
}

} // namespace chunkwise
