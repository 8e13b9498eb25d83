#pragma once

#include <string>
#include <vector>
#include <cstddef>
#include "message.h"
#include "tokenizer.h"

/// @brief Outcome of bounding a message sequence to a token budget
struct TruncationResult {
    std::vector<Message> messages;  // Longest suffix of the input within budget
    int tokens_kept = 0;            // Token total of messages
    size_t dropped = 0;             // Oldest messages removed
    bool over_budget = false;       // Newest message alone exceeds the budget (kept anyway)
};

/// @brief Count tokens for one message
/// A tokenizer failure (a std::exception or a negative count) is charged the worst case:
/// the content's byte length, at least 1. Anything thrown that does not derive from
/// std::exception propagates to the caller.
int count_message_tokens(Tokenizer& tokenizer, const Message& message);

/// @brief Sum of count_message_tokens over a sequence
int count_sequence_tokens(Tokenizer& tokenizer, const std::vector<Message>& messages);

/// @brief Keep the newest messages whose total fits within max_tokens
/// @param messages Sequence in conversation order (oldest first)
/// @param max_tokens Budget, expected >= 1
/// @param tokenizer Counter used for every message
/// @return Contiguous suffix of messages; never empty for non-empty input
TruncationResult truncate_to_budget(const std::vector<Message>& messages, int max_tokens, Tokenizer& tokenizer);

/// @brief Human-readable soft warning for an over-budget result
std::string describe_over_budget(const TruncationResult& result, int max_tokens);
