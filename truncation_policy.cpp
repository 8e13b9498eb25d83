#include "inkwell.h"
#include "truncation_policy.h"

int count_message_tokens(Tokenizer& tokenizer, const Message& message) {
    const std::string& content = message.content();
    int worst_case = content.empty() ? 1 : static_cast<int>(content.length());

    try {
        int tokens = tokenizer.count_tokens(content);
        if (tokens >= 0) {
            return tokens;
        }
        LOG_WARN_FMT("Tokenizer '{}' returned {} tokens, charging worst case {}",
                     tokenizer.get_tokenizer_name(), tokens, worst_case);
    } catch (const std::exception& e) {
        LOG_WARN_FMT("Token counting failed ({}), charging worst case {} tokens for {} message",
                     e.what(), worst_case, message.get_role());
    }
    return worst_case;
}

int count_sequence_tokens(Tokenizer& tokenizer, const std::vector<Message>& messages) {
    int total = 0;
    for (const auto& msg : messages) {
        total += count_message_tokens(tokenizer, msg);
    }
    return total;
}

TruncationResult truncate_to_budget(const std::vector<Message>& messages, int max_tokens, Tokenizer& tokenizer) {
    TruncationResult result;
    if (messages.empty()) {
        return result;
    }

    // Walk from newest to oldest; keep_from is the first index of the kept suffix
    size_t keep_from = messages.size();
    for (size_t i = messages.size(); i-- > 0;) {
        int msg_tokens = count_message_tokens(tokenizer, messages[i]);

        if (result.tokens_kept + msg_tokens > max_tokens) {
            if (i == messages.size() - 1) {
                // Newest message alone is over budget: keep it, flag it
                keep_from = i;
                result.tokens_kept = msg_tokens;
                result.over_budget = true;
            }
            break;
        }

        result.tokens_kept += msg_tokens;
        keep_from = i;
    }

    result.dropped = keep_from;
    result.messages.assign(messages.begin() + static_cast<std::ptrdiff_t>(keep_from), messages.end());

    dprintf(2, "truncate_to_budget: kept=%zu dropped=%zu tokens=%d/%d over=%d",
            result.messages.size(), result.dropped, result.tokens_kept, max_tokens, result.over_budget);

    return result;
}

std::string describe_over_budget(const TruncationResult& result, int max_tokens) {
    const Message& newest = result.messages.back();
    return "Newest " + newest.get_role() + " message uses " + std::to_string(result.tokens_kept) +
           " tokens, exceeding the " + std::to_string(max_tokens) +
           " token context budget; it was kept without older history";
}
