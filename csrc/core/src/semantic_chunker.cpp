#include "semantic_chunker.hpp"

#include <algorithm>
#include <future>
#include <stdexcept>
#include <utility>

#include "character_splitter.hpp"
#include "greedy_packer.hpp"
#include "thread_pool.hpp"
#include "unicode_processor.hpp"

namespace chunkwise {

MapParams SemanticChunker::_default_params;

void split_oversized_paragraph(
    std::string_view paragraph, int budget, OracleSession& oracle, std::vector<Chunk>& out)
{
    GreedyPacker packer(budget, oracle, out, PackOptions{kSentenceSeparator, false, false});
    packer.pack(
        UnicodeProcessor(paragraph).split_sentences(),
        [&](std::string_view sentence) { split_by_characters(sentence, budget, oracle, out); });
}

void pack_paragraphs(std::string_view text, int budget, OracleSession& oracle, std::vector<Chunk>& out) {
    GreedyPacker packer(budget, oracle, out, PackOptions{kParagraphSeparator, true, true});
    packer.pack(
        UnicodeProcessor(text).split_paragraphs(),
        [&](std::string_view paragraph) { split_oversized_paragraph(paragraph, budget, oracle, out); },
        [&](std::string_view tail) { split_by_characters(tail, budget, oracle, out); });
}

ChunkResult chunk(std::string_view text, int max_tokens, const TokenOracle& oracle) {
    if (max_tokens <= 0)
        throw std::invalid_argument("max_tokens should be > 0, got " + std::to_string(max_tokens) + ".");

    ChunkResult result;
    OracleSession session(oracle);
    pack_paragraphs(text, max_tokens, session, result.chunks);
    result.oracle_calls = session.calls();
    return result;
}

ChunkResult chunk(std::string_view text, int max_tokens, const TokenCounter& counter) {
    FunctionTokenOracle oracle(counter);
    return chunk(text, max_tokens, oracle);
}

SemanticChunker::SemanticChunker(
    std::optional<int> max_tokens,
    std::optional<int> num_workers,
    std::optional<std::string> encoding_name)
    : _max_tokens(_default_params.get_param_value<int>("max_tokens", max_tokens, 384)),
      _num_workers(_default_params.get_param_value<int>("num_workers", num_workers, 0))
{
    if (_max_tokens <= 0)
        throw std::invalid_argument("max_tokens should be > 0, got " + std::to_string(_max_tokens) + ".");
    if (_num_workers < 0)
        throw std::invalid_argument("num_workers should be >= 0, got " + std::to_string(_num_workers) + ".");

    const auto encoding = _default_params.get_param_value<std::string>("encoding_name", encoding_name, "");
    if (!encoding.empty()) {
        from_tiktoken_encoding(encoding);
        return;
    }
    const auto model_path =
        _default_params.get_param_value<std::string>("sentencepiece_model", std::nullopt, "");
    if (!model_path.empty()) from_sentencepiece_model(model_path);
}

SemanticChunker& SemanticChunker::from_tiktoken_encoding(const std::string& encoding_name) {
    return set_tokenizer(std::make_shared<TiktokenTokenizer>(encoding_name));
}

SemanticChunker& SemanticChunker::from_sentencepiece_model(const std::string& model_path) {
    return set_tokenizer(std::make_shared<SentencePieceTokenizer>(model_path));
}

SemanticChunker& SemanticChunker::set_tokenizer(const std::shared_ptr<const Tokenizer>& tokenizer) {
    return set_oracle(std::make_shared<TokenizerOracle>(tokenizer));
}

SemanticChunker& SemanticChunker::set_token_counter(TokenCounter counter) {
    return set_oracle(std::make_shared<FunctionTokenOracle>(std::move(counter)));
}

SemanticChunker& SemanticChunker::set_oracle(std::shared_ptr<const TokenOracle> oracle) {
    if (!oracle) throw std::invalid_argument("Token oracle must not be null.");
    _oracle = std::move(oracle);
    return *this;
}

const TokenOracle& SemanticChunker::require_oracle() const {
    if (!_oracle) throw std::invalid_argument("Token oracle not initialized.");
    return *_oracle;
}

ChunkResult SemanticChunker::split_text(const std::string_view& text, int reserved_tokens) const {
    const TokenOracle& oracle = require_oracle();
    if (reserved_tokens < 0)
        throw std::invalid_argument("reserved_tokens should be >= 0, got " + std::to_string(reserved_tokens) + ".");

    const int effective_budget = _max_tokens - reserved_tokens;
    if (effective_budget <= 0) {
        throw std::invalid_argument(
            "Reserved length (" + std::to_string(reserved_tokens) +
            ") is not smaller than max_tokens (" + std::to_string(_max_tokens) +
            "). Consider increasing max_tokens or shortening the chunk prefix.");
    }
    return chunkwise::chunk(text, effective_budget, oracle);
}

std::vector<ChunkResult> SemanticChunker::chunk_batch(
    const std::vector<std::string>& texts, int reserved_tokens) const
{
    require_oracle();
    std::vector<ChunkResult> results;
    results.reserve(texts.size());

    if (_num_workers == 0 || texts.size() < 2) {
        for (const auto& text : texts) results.push_back(split_text(text, reserved_tokens));
        return results;
    }

    ThreadPool pool(std::min(static_cast<size_t>(_num_workers), texts.size()));
    std::vector<std::future<ChunkResult>> futures;
    futures.reserve(texts.size());
    for (const auto& text : texts) {
        futures.emplace_back(pool.enqueue(
            [this, &text, reserved_tokens] { return split_text(text, reserved_tokens); }));
    }
    for (auto& fut : futures) results.push_back(fut.get());
    return results;
}

int SemanticChunker::reserved_tokens(const std::string_view& prefix) const {
    OracleSession session(require_oracle());
    return session.count(prefix);
}

} // namespace chunkwise
