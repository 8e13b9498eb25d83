#include "tokenizer.h"
#include <cctype>
#include <utility>

EstimatingTokenizer::EstimatingTokenizer(int chars_per_token)
    : chars_per_token_(chars_per_token) {
    if (chars_per_token_ < 1) {
        throw TokenizerError("chars_per_token must be at least 1 (got " +
                             std::to_string(chars_per_token_) + ")");
    }
}

int EstimatingTokenizer::count_tokens(const std::string& text) {
    if (text.empty()) {
        return 0;
    }
    return static_cast<int>((text.length() + chars_per_token_ - 1) / chars_per_token_);
}

int WordTokenizer::count_tokens(const std::string& text) {
    int words = 0;
    bool in_word = false;
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            in_word = false;
            continue;
        }
        if (!in_word) {
            ++words;
            in_word = true;
        }
    }
    return words;
}

CallbackTokenizer::CallbackTokenizer(CountFunction fn, std::string name)
    : fn_(std::move(fn)), name_(std::move(name)) {
    if (!fn_) {
        throw TokenizerError("CallbackTokenizer requires a counting function");
    }
}

int CallbackTokenizer::count_tokens(const std::string& text) {
    return fn_(text);
}
