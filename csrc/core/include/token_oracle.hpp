#pragma once

#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "tokenizer.hpp"

namespace chunkwise {

using TokenCounter = std::function<int(std::string_view)>;
using AsyncTokenCounter = std::function<std::future<int>(std::string_view)>;

// Text -> token count. Must accept the empty string and be deterministic for a given text
// for the duration of one chunking call.
class TokenOracle {
public:
    virtual ~TokenOracle() = default;
    virtual int count(std::string_view text) const = 0;
};

class FunctionTokenOracle final : public TokenOracle {
public:
    explicit FunctionTokenOracle(TokenCounter counter) : _counter(std::move(counter)) {
        if (!_counter) throw std::invalid_argument("Token counter must not be empty.");
    }

    int count(std::string_view text) const override { return _counter(text); }

private:
    TokenCounter _counter;
};

// Waits on each future before returning, so an asynchronous counter is still queried one text at a time.
class AsyncFunctionTokenOracle final : public TokenOracle {
public:
    explicit AsyncFunctionTokenOracle(AsyncTokenCounter counter) : _counter(std::move(counter)) {
        if (!_counter) throw std::invalid_argument("Token counter must not be empty.");
    }

    int count(std::string_view text) const override {
        std::future<int> pending = _counter(text);
        if (!pending.valid()) throw std::runtime_error("Token counter returned an invalid future.");
        return pending.get();
    }

private:
    AsyncTokenCounter _counter;
};

class TokenizerOracle final : public TokenOracle {
public:
    explicit TokenizerOracle(std::shared_ptr<const Tokenizer> tokenizer) : _tokenizer(std::move(tokenizer)) {
        if (!_tokenizer) throw std::invalid_argument("Tokenizer must not be null.");
    }

    int count(std::string_view text) const override {
        return static_cast<int>(_tokenizer->count_tokens(text));
    }

    const std::shared_ptr<const Tokenizer>& tokenizer() const { return _tokenizer; }

private:
    std::shared_ptr<const Tokenizer> _tokenizer;
};

// Per-call wrapper: validates every answer and counts queries.
class OracleSession {
public:
    explicit OracleSession(const TokenOracle& oracle) : _oracle(oracle) {}

    int count(std::string_view text) {
        ++_calls;
        const int tokens = _oracle.count(text);
        if (tokens < 0)
            throw std::runtime_error("Token oracle returned a negative count: " + std::to_string(tokens));
        return tokens;
    }

    bool fits(std::string_view text, int budget) { return count(text) <= budget; }

    size_t calls() const { return _calls; }

private:
    const TokenOracle& _oracle;
    size_t _calls = 0;
};

} // namespace chunkwise
