#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <xxhash.h>

namespace chunkwise {

struct Chunk {
    std::string text;
    size_t index = 0;
    // Set only by the character-level floor case: the chunk may exceed the budget.
    bool over_budget = false;
    uint64_t content_hash = 0;
};

struct ChunkStats {
    size_t count = 0;
    size_t min_chars = 0;
    size_t max_chars = 0;
    size_t avg_chars = 0;
};

struct ChunkResult {
    std::vector<Chunk> chunks;
    size_t oracle_calls = 0;

    bool empty() const { return chunks.empty(); }
    size_t size() const { return chunks.size(); }

    bool has_over_budget() const {
        for (const auto& chunk : chunks)
            if (chunk.over_budget) return true;
        return false;
    }

    std::vector<std::string> texts() const {
        std::vector<std::string> out;
        out.reserve(chunks.size());
        for (const auto& chunk : chunks) out.push_back(chunk.text);
        return out;
    }

    ChunkStats stats() const {
        ChunkStats s;
        if (chunks.empty()) return s;
        s.count = chunks.size();
        s.min_chars = chunks.front().text.size();
        size_t total = 0;
        for (const auto& chunk : chunks) {
            const size_t len = chunk.text.size();
            if (len < s.min_chars) s.min_chars = len;
            if (len > s.max_chars) s.max_chars = len;
            total += len;
        }
        s.avg_chars = total / chunks.size();
        return s;
    }
};

inline uint64_t evaluate_text_hash(std::string_view text) {
    return static_cast<uint64_t>(XXH64(text.data(), text.size(), 0));
}

// Trims, drops empty text and numbers the chunk by its output position.
void append_chunk(std::vector<Chunk>& out, std::string_view text, bool over_budget = false);

} // namespace chunkwise
