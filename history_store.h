#pragma once

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <optional>
#include <functional>
#include <stdexcept>
#include "message.h"
#include "tokenizer.h"
#include "nlohmann/json.hpp"

class HistoryStoreError : public std::runtime_error {
public:
    explicit HistoryStoreError(const std::string& message) : std::runtime_error(message) {}
};

/// @brief Token-budgeted conversation memory with a proposal/commit/discard workflow
///
/// Two states:
///   Clean    - only the committed sequence exists; it is what the model sees
///   Proposed - a proposal sequence (started as a copy of committed) is active
///
/// New messages always land in the proposal so an unconfirmed exchange never
/// touches the committed record. The active sequence (proposal if pending, else
/// committed) is kept within max_tokens after every mutation.
///
/// Every public method takes the internal mutex, so a UI thread may commit or
/// discard while a worker waits on the model. Callers must not hold references
/// into the store across a model call: active_messages() returns a copy.
class HistoryStore {
public:
    /// Receives soft warnings (newest message alone exceeds the budget)
    using WarningCallback = std::function<void(const std::string& warning)>;

    static constexpr int DEFAULT_MAX_TOKENS = 12000;

    /// @throws HistoryStoreError if tokenizer is null or max_tokens < 1
    explicit HistoryStore(std::shared_ptr<Tokenizer> tokenizer, int max_tokens = DEFAULT_MAX_TOKENS);

    HistoryStore(const HistoryStore&) = delete;
    HistoryStore& operator=(const HistoryStore&) = delete;

    // State machine

    /// @brief Append to the proposal (starting one from committed if Clean), then truncate
    void add_message(const Message& message);

    /// @brief Append a batch to the proposal; truncation runs once after the batch
    void add_messages(const std::vector<Message>& messages);

    /// @brief Replace the proposal wholesale (truncated); enters Proposed
    void replace_proposal(const std::vector<Message>& messages);

    /// @brief Freeze what is about to be sent: committed := active, back to Clean
    /// @return The frozen sequence, taken under the same lock as the freeze
    std::vector<Message> prepare_for_response();

    /// @brief committed := proposal; no-op when Clean
    void commit_proposal();

    /// @brief Drop the proposal, reverting to committed; no-op when Clean
    void discard_proposal();

    /// @brief Swap the content of the proposal's last message if it is an Assistant message
    /// @return false (nothing changed) when Clean or the proposal does not end with one
    bool replace_last_assistant(const std::string& content);

    /// @brief Replace committed (truncated) and drop any proposal
    void reset(const std::vector<Message>& messages);

    /// @brief reset({})
    void clear();

    // Read-only access

    /// @brief Snapshot of the active sequence (proposal if pending, else committed)
    std::vector<Message> active_messages() const;

    /// @brief Snapshot of the committed sequence
    std::vector<Message> committed_messages() const;

    bool has_pending_proposal() const;

    /// @brief Tokens used by the active sequence
    int get_token_count() const;

    size_t get_message_count() const;

    /// @brief Active tokens / max_tokens (may exceed 1.0 for an oversized single message)
    double get_context_utilization() const;

    int get_max_tokens() const;

    /// @brief Change the budget and re-truncate both sequences immediately
    /// @throws HistoryStoreError if max_tokens < 1 (previous value kept)
    void set_max_tokens(int max_tokens);

    void set_warning_callback(WarningCallback callback);

    Tokenizer& get_tokenizer() const { return *tokenizer_; }

    // Serialization

    /// @brief {"max_tokens", "messages_committed", "messages_proposal", "has_pending_proposal"}
    nlohmann::json to_json() const;

    /// @throws HistoryStoreError on malformed input
    static std::unique_ptr<HistoryStore> from_json(const nlohmann::json& j, std::shared_ptr<Tokenizer> tokenizer);

private:
    const std::vector<Message>& active_locked() const;

    /// Truncate seq in place; returns a warning string if the newest message is over budget
    std::string apply_budget(std::vector<Message>& seq);

    void notify_warning(const std::string& warning);

    std::shared_ptr<Tokenizer> tokenizer_;
    int max_tokens_;

    std::vector<Message> committed_;
    // Present exactly while a proposal is pending
    std::optional<std::vector<Message>> proposal_;

    WarningCallback warning_callback_;
    mutable std::mutex mutex_;
};
