#pragma once

#include <array>
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <encoding.h>
#include <modelparams.h>
#include <sentencepiece_processor.h>

namespace chunkwise {

class Tokenizer {
public:
    virtual ~Tokenizer() = default;
    virtual std::vector<int> encode(const std::string_view& view) const = 0;
    virtual std::string decode(const std::vector<int>& token_ids) const = 0;

    // Token count of a chunk candidate. The empty string has no tokens.
    virtual size_t count_tokens(std::string_view text) const {
        if (text.empty()) return 0;
        return encode(text).size();
    }
};

class TiktokenTokenizer final : public Tokenizer {
public:
    explicit TiktokenTokenizer(std::string_view encoding_name)
        : _model(parse_tiktoken_model(encoding_name)),
          _encoding(GptEncoding::get_encoding(_model)) {}

    std::vector<int> encode(const std::string_view& view) const override {
        return _encoding->encode(std::string(view));
    }

    std::string decode(const std::vector<int>& token_ids) const override {
        return _encoding->decode(token_ids);
    }

    LanguageModel model() const { return _model; }

    // Empty selects gpt2 (r50k_base). Names are case sensitive.
    static LanguageModel parse_tiktoken_model(std::string_view name) {
        static const std::array<std::pair<std::string_view, LanguageModel>, 13> kEncodings = {{
            {"", LanguageModel::R50K_BASE},
            {"gpt2", LanguageModel::R50K_BASE},
            {"r50k_base", LanguageModel::R50K_BASE},
            {"r50k", LanguageModel::R50K_BASE},
            {"p50k_base", LanguageModel::P50K_BASE},
            {"p50k", LanguageModel::P50K_BASE},
            {"p50k_edit", LanguageModel::P50K_EDIT},
            {"cl100k_base", LanguageModel::CL100K_BASE},
            {"cl100k", LanguageModel::CL100K_BASE},
            {"o200k_base", LanguageModel::O200K_BASE},
            {"o200k", LanguageModel::O200K_BASE},
            {"qwen_base", LanguageModel::QWEN_BASE},
            {"qwen", LanguageModel::QWEN_BASE},
        }};
        for (const auto& [known, model] : kEncodings)
            if (known == name) return model;

        throw std::invalid_argument(
            "Unknown tiktoken encoding name: " + std::string(name) +
            ". Expected one of: gpt2, r50k_base, p50k_base, p50k_edit, cl100k_base, o200k_base, qwen_base.");
    }

private:
    LanguageModel _model;
    std::shared_ptr<GptEncoding> _encoding;
};

class SentencePieceTokenizer final : public Tokenizer {
public:
    explicit SentencePieceTokenizer(const std::string& model_path) {
        auto status = _processor.Load(model_path);
        if (!status.ok())
            throw std::runtime_error("Failed to load sentencepiece model " + model_path + ": " + status.ToString());
    }

    std::vector<int> encode(const std::string_view& view) const override {
        std::vector<int> ids;
        auto status = _processor.Encode(std::string(view), &ids);
        if (!status.ok()) throw std::runtime_error(status.ToString());
        return ids;
    }

    std::string decode(const std::vector<int>& token_ids) const override {
        std::string text;
        auto status = _processor.Decode(token_ids, &text);
        if (!status.ok()) throw std::runtime_error(status.ToString());
        return text;
    }

private:
    sentencepiece::SentencePieceProcessor _processor;
};

} // namespace chunkwise
