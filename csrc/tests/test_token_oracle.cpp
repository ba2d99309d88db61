#include <gtest/gtest.h>

#include <future>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "token_oracle.hpp"
#include "tokenizer.hpp"

namespace chunkwise {

namespace {

// One id per whitespace-separated word; ids are word lengths.
class WordLengthTokenizer final : public Tokenizer {
public:
    std::vector<int> encode(const std::string_view& view) const override {
        std::istringstream in{std::string(view)};
        std::vector<int> ids;
        std::string word;
        while (in >> word) ids.push_back(static_cast<int>(word.size()));
        return ids;
    }

    std::string decode(const std::vector<int>& token_ids) const override {
        std::string out;
        for (int id : token_ids) {
            if (!out.empty()) out += ' ';
            out += std::string(static_cast<size_t>(id), 'w');
        }
        return out;
    }
};

} // namespace

TEST(TokenOracle, FunctionOracle) {
    FunctionTokenOracle oracle([](std::string_view text) { return static_cast<int>(text.size()) * 2; });
    EXPECT_EQ(oracle.count("abc"), 6);
    EXPECT_EQ(oracle.count(""), 0);
    EXPECT_THROW(FunctionTokenOracle(TokenCounter{}), std::invalid_argument);
}

TEST(TokenOracle, AsyncOracleWaitsForResult) {
    AsyncFunctionTokenOracle oracle([](std::string_view text) {
        std::promise<int> promise;
        promise.set_value(static_cast<int>(text.size()));
        return promise.get_future();
    });
    EXPECT_EQ(oracle.count("hello"), 5);
}

TEST(TokenOracle, AsyncOracleRethrowsFailure) {
    AsyncFunctionTokenOracle oracle([](std::string_view) {
        return std::async(std::launch::deferred, []() -> int { throw std::runtime_error("remote tokenizer down"); });
    });
    EXPECT_THROW(oracle.count("hello"), std::runtime_error);
    EXPECT_THROW(AsyncFunctionTokenOracle(AsyncTokenCounter{}), std::invalid_argument);
}

TEST(TokenOracle, TokenizerOracleCountsIds) {
    TokenizerOracle oracle(std::make_shared<WordLengthTokenizer>());
    EXPECT_EQ(oracle.count("three little words"), 3);
    EXPECT_EQ(oracle.count(""), 0);
    EXPECT_THROW(TokenizerOracle(nullptr), std::invalid_argument);
}

TEST(TokenOracle, SessionCountsCalls) {
    FunctionTokenOracle oracle([](std::string_view text) { return static_cast<int>(text.size()); });
    OracleSession session(oracle);
    EXPECT_TRUE(session.fits("abc", 3));
    EXPECT_FALSE(session.fits("abcd", 3));
    EXPECT_EQ(session.count("ab"), 2);
    EXPECT_EQ(session.calls(), 3u);
}

TEST(TokenOracle, SessionRejectsNegativeCount) {
    FunctionTokenOracle oracle([](std::string_view) { return -3; });
    OracleSession session(oracle);
    EXPECT_THROW(session.count("x"), std::runtime_error);
}

TEST(TiktokenTokenizer, EncodingNames) {
    EXPECT_EQ(TiktokenTokenizer::parse_tiktoken_model(""), LanguageModel::R50K_BASE);
    EXPECT_EQ(TiktokenTokenizer::parse_tiktoken_model("gpt2"), LanguageModel::R50K_BASE);
    EXPECT_EQ(TiktokenTokenizer::parse_tiktoken_model("p50k"), LanguageModel::P50K_BASE);
    EXPECT_EQ(TiktokenTokenizer::parse_tiktoken_model("p50k_edit"), LanguageModel::P50K_EDIT);
    EXPECT_EQ(TiktokenTokenizer::parse_tiktoken_model("cl100k_base"), LanguageModel::CL100K_BASE);
    EXPECT_EQ(TiktokenTokenizer::parse_tiktoken_model("o200k"), LanguageModel::O200K_BASE);
    EXPECT_EQ(TiktokenTokenizer::parse_tiktoken_model("qwen_base"), LanguageModel::QWEN_BASE);
    EXPECT_EQ(TiktokenTokenizer::parse_tiktoken_model("qwen"), LanguageModel::QWEN_BASE);
    EXPECT_EQ(TiktokenTokenizer::parse_tiktoken_model("r50k"), LanguageModel::R50K_BASE);
    EXPECT_EQ(TiktokenTokenizer::parse_tiktoken_model("cl100k"), LanguageModel::CL100K_BASE);
    EXPECT_THROW(TiktokenTokenizer::parse_tiktoken_model("CL100K"), std::invalid_argument);
}

TEST(SentencePieceTokenizer, MissingModelThrows) {
    EXPECT_THROW(SentencePieceTokenizer("/nonexistent/chunkwise.model"), std::runtime_error);
}

} // namespace chunkwise
