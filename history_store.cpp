#include "inkwell.h"
#include "history_store.h"
#include "truncation_policy.h"

HistoryStore::HistoryStore(std::shared_ptr<Tokenizer> tokenizer, int max_tokens)
    : tokenizer_(std::move(tokenizer)), max_tokens_(max_tokens) {

    if (!tokenizer_) {
        throw HistoryStoreError("HistoryStore requires a tokenizer");
    }
    if (max_tokens_ < 1) {
        throw HistoryStoreError("Invalid max_tokens: " + std::to_string(max_tokens_) +
                                " (must be at least 1)");
    }

    LOG_DEBUG_FMT("HistoryStore created with {} max tokens ({} tokenizer)",
                  max_tokens_, tokenizer_->get_tokenizer_name());
}

const std::vector<Message>& HistoryStore::active_locked() const {
    return proposal_ ? *proposal_ : committed_;
}

std::string HistoryStore::apply_budget(std::vector<Message>& seq) {
    TruncationResult result = truncate_to_budget(seq, max_tokens_, *tokenizer_);

    if (result.dropped > 0) {
        LOG_DEBUG_FMT("Truncated {} oldest messages, {} kept ({}/{} tokens)",
                      result.dropped, result.messages.size(), result.tokens_kept, max_tokens_);
    }

    std::string warning;
    if (result.over_budget) {
        warning = describe_over_budget(result, max_tokens_);
        LOG_WARN(warning);
    }

    seq = std::move(result.messages);
    return warning;
}

void HistoryStore::notify_warning(const std::string& warning) {
    if (warning.empty()) {
        return;
    }

    WarningCallback callback;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callback = warning_callback_;
    }
    // Called without the lock so the callback may query the store
    if (callback) {
        callback(warning);
    }
}

void HistoryStore::add_message(const Message& message) {
    add_messages({message});
}

void HistoryStore::add_messages(const std::vector<Message>& messages) {
    std::string warning;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (!proposal_) {
            // Start a new proposal from the committed state
            proposal_ = committed_;
            dprintf(1, "proposal started from %zu committed messages", committed_.size());
        }

        proposal_->insert(proposal_->end(), messages.begin(), messages.end());
        warning = apply_budget(*proposal_);

        LOG_DEBUG_FMT("Added {} message(s) to proposal, now {} messages", messages.size(), proposal_->size());
    }
    notify_warning(warning);
}

void HistoryStore::replace_proposal(const std::vector<Message>& messages) {
    std::string warning;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        proposal_ = messages;
        warning = apply_budget(*proposal_);
        LOG_DEBUG_FMT("Proposal replaced with {} messages", proposal_->size());
    }
    notify_warning(warning);
}

std::vector<Message> HistoryStore::prepare_for_response() {
    std::lock_guard<std::mutex> lock(mutex_);

    // Whatever is active is what the model is about to see; freeze it
    if (proposal_) {
        committed_ = std::move(*proposal_);
        proposal_.reset();
    }

    LOG_DEBUG_FMT("Prepared for response, committed {} messages", committed_.size());
    return committed_;
}

void HistoryStore::commit_proposal() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!proposal_) {
        LOG_DEBUG("Commit called with no pending proposal");
        return;
    }

    committed_ = *proposal_;
    proposal_.reset();
    LOG_DEBUG_FMT("Committed proposal, {} messages", committed_.size());
}

void HistoryStore::discard_proposal() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!proposal_) {
        LOG_DEBUG("Discard called with no pending proposal");
        return;
    }

    size_t dropped = proposal_->size();
    proposal_.reset();
    LOG_DEBUG_FMT("Discarded proposal of {} messages, reverted to {} committed", dropped, committed_.size());
}

bool HistoryStore::replace_last_assistant(const std::string& content) {
    std::string warning;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (!proposal_ || proposal_->empty() || !proposal_->back().is_assistant()) {
            LOG_DEBUG("No pending assistant message to replace");
            return false;
        }

        proposal_->back() = Message(Message::ASSISTANT, content);
        warning = apply_budget(*proposal_);
        LOG_DEBUG_FMT("Replaced last assistant message ({} chars)", content.length());
    }
    notify_warning(warning);
    return true;
}

void HistoryStore::reset(const std::vector<Message>& messages) {
    std::string warning;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        committed_ = messages;
        proposal_.reset();
        warning = apply_budget(committed_);
        LOG_DEBUG_FMT("History reset to {} messages", committed_.size());
    }
    notify_warning(warning);
}

void HistoryStore::clear() {
    reset({});
}

std::vector<Message> HistoryStore::active_messages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_locked();
}

std::vector<Message> HistoryStore::committed_messages() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return committed_;
}

bool HistoryStore::has_pending_proposal() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return proposal_.has_value();
}

int HistoryStore::get_token_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return count_sequence_tokens(*tokenizer_, active_locked());
}

size_t HistoryStore::get_message_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_locked().size();
}

double HistoryStore::get_context_utilization() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<double>(count_sequence_tokens(*tokenizer_, active_locked())) /
           static_cast<double>(max_tokens_);
}

int HistoryStore::get_max_tokens() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return max_tokens_;
}

void HistoryStore::set_max_tokens(int max_tokens) {
    if (max_tokens < 1) {
        throw HistoryStoreError("Invalid max_tokens: " + std::to_string(max_tokens) +
                                " (must be at least 1)");
    }

    std::string warning;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        max_tokens_ = max_tokens;

        // Committed is re-truncated too so a later discard still lands within budget
        std::string committed_warning = apply_budget(committed_);
        if (proposal_) {
            warning = apply_budget(*proposal_);
        } else {
            warning = committed_warning;
        }

        LOG_DEBUG_FMT("Updated max tokens to {}", max_tokens_);
    }
    notify_warning(warning);
}

void HistoryStore::set_warning_callback(WarningCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    warning_callback_ = std::move(callback);
}

nlohmann::json HistoryStore::to_json() const {
    std::lock_guard<std::mutex> lock(mutex_);

    nlohmann::json committed = nlohmann::json::array();
    for (const auto& msg : committed_) {
        committed.push_back(msg.to_json());
    }

    nlohmann::json proposal = nullptr;
    if (proposal_) {
        proposal = nlohmann::json::array();
        for (const auto& msg : *proposal_) {
            proposal.push_back(msg.to_json());
        }
    }

    return nlohmann::json{
        {"max_tokens", max_tokens_},
        {"messages_committed", committed},
        {"messages_proposal", proposal},
        {"has_pending_proposal", proposal_.has_value()}
    };
}

static std::vector<Message> messages_from_json(const nlohmann::json& j, const std::string& key) {
    std::vector<Message> messages;
    if (!j.is_array()) {
        throw HistoryStoreError("'" + key + "' must be an array");
    }
    for (const auto& item : j) {
        try {
            messages.push_back(Message::from_json(item));
        } catch (const std::invalid_argument& e) {
            throw HistoryStoreError("Invalid message in '" + key + "': " + std::string(e.what()));
        }
    }
    return messages;
}

std::unique_ptr<HistoryStore> HistoryStore::from_json(const nlohmann::json& j, std::shared_ptr<Tokenizer> tokenizer) {
    if (!j.is_object()) {
        throw HistoryStoreError("History JSON must be an object");
    }

    int max_tokens = DEFAULT_MAX_TOKENS;
    if (j.contains("max_tokens")) {
        if (!j["max_tokens"].is_number_integer()) {
            throw HistoryStoreError("'max_tokens' must be an integer");
        }
        max_tokens = j["max_tokens"].get<int>();
    }

    auto store = std::make_unique<HistoryStore>(std::move(tokenizer), max_tokens);

    std::vector<Message> committed;
    if (j.contains("messages_committed")) {
        committed = messages_from_json(j["messages_committed"], "messages_committed");
    }
    store->reset(committed);

    bool pending = j.contains("has_pending_proposal") && j["has_pending_proposal"].is_boolean() &&
                   j["has_pending_proposal"].get<bool>();
    bool has_proposal = j.contains("messages_proposal") && !j["messages_proposal"].is_null();

    // A proposal is only meaningful while flagged pending; anything else loads Clean
    if (pending && has_proposal) {
        store->replace_proposal(messages_from_json(j["messages_proposal"], "messages_proposal"));
    } else if (pending || has_proposal) {
        LOG_WARN("Inconsistent proposal state in history JSON, loading committed history only");
    }

    return store;
}
