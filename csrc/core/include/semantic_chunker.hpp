#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "chunk.hpp"
#include "map_params.hpp"
#include "token_oracle.hpp"
#include "tokenizer.hpp"

namespace chunkwise {

constexpr std::string_view kParagraphSeparator = "\n\n";
constexpr std::string_view kSentenceSeparator = " ";

// Packs whole paragraphs; a paragraph over budget goes to split_oversized_paragraph.
void pack_paragraphs(std::string_view text, int budget, OracleSession& oracle, std::vector<Chunk>& out);

// Packs the sentences of one paragraph; a sentence over budget goes to split_by_characters.
void split_oversized_paragraph(
    std::string_view paragraph, int budget, OracleSession& oracle, std::vector<Chunk>& out);

ChunkResult chunk(std::string_view text, int max_tokens, const TokenOracle& oracle);
ChunkResult chunk(std::string_view text, int max_tokens, const TokenCounter& counter);

class SemanticChunker {
public:
    explicit SemanticChunker(
        std::optional<int> max_tokens = std::nullopt,
        std::optional<int> num_workers = std::nullopt,
        std::optional<std::string> encoding_name = std::nullopt);

    SemanticChunker& from_tiktoken_encoding(const std::string& encoding_name);
    SemanticChunker& from_sentencepiece_model(const std::string& model_path);
    SemanticChunker& set_tokenizer(const std::shared_ptr<const Tokenizer>& tokenizer);
    SemanticChunker& set_token_counter(TokenCounter counter);
    SemanticChunker& set_oracle(std::shared_ptr<const TokenOracle> oracle);

    /*
     * split_text
     * ----------
     * Chunk one document against max_tokens - reserved_tokens. The reservation leaves room for a
     * prefix the caller adds to every chunk afterwards (see reserved_tokens(prefix)).
     * Throws std::invalid_argument when no oracle is set or the effective budget is not positive.
     */
    ChunkResult split_text(const std::string_view& text, int reserved_tokens = 0) const;
    ChunkResult chunk(const std::string_view& text) const { return split_text(text, 0); }

    // Results are in input order. With num_workers > 0 documents run concurrently, so the oracle
    // must be safe to call from several threads.
    std::vector<ChunkResult> chunk_batch(const std::vector<std::string>& texts, int reserved_tokens = 0) const;

    int reserved_tokens(const std::string_view& prefix) const;

    int max_tokens() const { return _max_tokens; }
    int num_workers() const { return _num_workers; }
    const std::shared_ptr<const TokenOracle>& oracle() const { return _oracle; }

    static MapParams _default_params;

private:
    const TokenOracle& require_oracle() const;

    int _max_tokens = 384;
    int _num_workers = 0;
    std::shared_ptr<const TokenOracle> _oracle;
};

} // namespace chunkwise
