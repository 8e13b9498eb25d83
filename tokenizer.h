#pragma once

#include <string>
#include <functional>
#include <stdexcept>

/// @brief Abstract base class for token counting
/// The memory core only needs counts; any deterministic counter can be plugged in
class Tokenizer {
public:
    virtual ~Tokenizer() = default;

    /// @brief Count tokens in text
    /// @param text Text to tokenize
    /// @return Number of tokens
    /// @throws TokenizerError if the text cannot be tokenized
    virtual int count_tokens(const std::string& text) = 0;

    /// @brief Get the tokenizer name/type
    /// @return Tokenizer identifier
    virtual std::string get_tokenizer_name() const = 0;
};

/// @brief Exception thrown by tokenizers
class TokenizerError : public std::runtime_error {
public:
    explicit TokenizerError(const std::string& message)
        : std::runtime_error("Tokenizer: " + message) {}
};

/// @brief Estimates tokens from byte length (ceil(bytes / chars_per_token))
/// Same heuristic the API server uses when a backend reports no counts
class EstimatingTokenizer : public Tokenizer {
public:
    explicit EstimatingTokenizer(int chars_per_token = 4);

    int count_tokens(const std::string& text) override;
    std::string get_tokenizer_name() const override { return "estimate"; }

    int get_chars_per_token() const { return chars_per_token_; }

private:
    int chars_per_token_;
};

/// @brief Counts whitespace-separated words
class WordTokenizer : public Tokenizer {
public:
    int count_tokens(const std::string& text) override;
    std::string get_tokenizer_name() const override { return "words"; }
};

/// @brief Adapts an arbitrary counting function (e.g. a real BPE encoder)
class CallbackTokenizer : public Tokenizer {
public:
    using CountFunction = std::function<int(const std::string&)>;

    CallbackTokenizer(CountFunction fn, std::string name = "callback");

    int count_tokens(const std::string& text) override;
    std::string get_tokenizer_name() const override { return name_; }

private:
    CountFunction fn_;
    std::string name_;
};
