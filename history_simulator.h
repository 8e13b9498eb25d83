#pragma once

#include <string>
#include <vector>
#include <memory>
#include "message.h"
#include "history_store.h"
#include "tokenizer.h"

/// @brief Seeds conversation memory from previously written narrative
///
/// Loaded text has no real dialogue turns, so the last few chunks are replayed
/// as (simulated prompt, chunk) pairs. Only the tail seeds memory; every chunk
/// stays canon in the story itself.
class HistorySimulator {
public:
    static constexpr size_t DEFAULT_MAX_CHUNKS = 5;
    static constexpr const char* DEFAULT_PROMPT = "(continue)";

    explicit HistorySimulator(std::string simulated_prompt = DEFAULT_PROMPT);

    /// @brief User/Assistant pairs for the last min(max_chunks, chunks.size()) chunks, in order
    std::vector<Message> simulate(const std::vector<std::string>& chunks, size_t max_chunks) const;

    /// @brief Fresh Clean store whose committed history is the truncated simulation
    std::unique_ptr<HistoryStore> build(const std::vector<std::string>& chunks, size_t max_chunks,
                                        int max_tokens, std::shared_ptr<Tokenizer> tokenizer) const;

    /// @brief Reset an existing store to the truncated simulation
    void seed(HistoryStore& store, const std::vector<std::string>& chunks, size_t max_chunks) const;

    const std::string& get_simulated_prompt() const { return simulated_prompt_; }

private:
    std::string simulated_prompt_;
};

/// @brief Split story text into chunks on blank lines, trimming each and dropping empties
std::vector<std::string> split_canon_text(const std::string& text);

/// @brief Join chunks with a blank line between them
std::string join_canon_text(const std::vector<std::string>& chunks);
